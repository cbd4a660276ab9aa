#include <cmath>
#include <map>
#include <string>
#include <gtest/gtest.h>
#include "brainmf/models/deco2018.hpp"

typedef Deco2018Model::P P;

namespace {

gsl_matrix * make_state(int n_rois, double Se, double Si) {
    gsl_matrix * state = gsl_matrix_alloc(2, n_rois);
    for (int j = 0; j < n_rois; j++) {
        gsl_matrix_set(state, 0, j, Se);
        gsl_matrix_set(state, 1, j, Si);
    }
    return state;
}

// 3 regions, all-to-all connected with unit weights
gsl_matrix * make_sc3() {
    gsl_matrix * sc = gsl_matrix_alloc(3, 3);
    gsl_matrix_set_all(sc, 1.0);
    for (int j = 0; j < 3; j++) {
        gsl_matrix_set(sc, j, j, 0.0);
    }
    return sc;
}

}

TEST(Clip, Idempotent) {
    for (double x : {-2.0, -0.0, 0.0, 0.3, 1.0, 1.5}) {
        EXPECT_EQ(clip01(clip01(x)), clip01(x));
        EXPECT_GE(clip01(x), 0.0);
        EXPECT_LE(clip01(x), 1.0);
    }
}

TEST(Rate, FiniteAtSingularity) {
    EXPECT_EQ(rate(0.0, 0.16), 1.0 / 0.16);
    double eps = 1e-9;
    EXPECT_FALSE(std::isnan(rate(eps, 0.16)));
    EXPECT_NEAR(rate(eps, 0.16), 1.0 / 0.16, 1e-6);
    EXPECT_NEAR(rate(-eps, 0.16), 1.0 / 0.16, 1e-6);
}

TEST(Rate, AccurateJustAboveSeriesThreshold) {
    // |d*y| = 1.6e-6, evaluated by the closed form; the series
    // is exact to double precision there
    const double d = 0.16, y = 1e-5;
    const double series = 1.0 / d + y * (0.5 + d * y / 12.0);
    EXPECT_NEAR(rate(y, d), series, 1e-13);
    EXPECT_NEAR(rate(-y, d), 1.0 / d - y * (0.5 - d * y / 12.0), 1e-13);
}

TEST(Rate, MatchesClosedForm) {
    double y = 310.0 * 0.5 - 125.0;
    EXPECT_NEAR(rate(y, 0.16), y / (1.0 - std::exp(-0.16 * y)), 1e-12);
}

TEST(Deco2018, Sizes) {
    Deco2018Model model(4);
    EXPECT_STREQ(model.get_name(), "Deco2018");
    EXPECT_EQ(model.get_n_state_vars(), 2);
    EXPECT_EQ(model.get_n_observable_vars(), 2);
    EXPECT_EQ(model.get_n_params(), 20);
    EXPECT_EQ(model.param_index("w_gain_i"), P::w_gain_i);
}

TEST(Deco2018, InitialState) {
    Deco2018Model model(4);
    gsl_matrix * state = model.initial_state();
    EXPECT_EQ(state->size1, 2u);
    EXPECT_EQ(state->size2, 4u);
    for (int j = 0; j < 4; j++) {
        EXPECT_EQ(gsl_matrix_get(state, 0, j), 0.001);
        EXPECT_EQ(gsl_matrix_get(state, 1, j), 0.001);
    }
    gsl_matrix_free(state);
}

TEST(Deco2018, DfunAtRest) {
    Deco2018Model model(1);
    ASSERT_TRUE(model.init_dependant());
    gsl_matrix * state = make_state(1, 0.1, 0.05);
    gsl_matrix * coupling = gsl_matrix_calloc(1, 1);
    gsl_matrix * dstate = gsl_matrix_alloc(2, 1);
    gsl_matrix * observed = model.initial_observed();
    model.dfun(state, coupling, dstate, observed);

    double Ie = 1.0 * 0.382 + 1.4 * 0.15 * 0.1 - 1.0 * 0.05;
    double Ii = 0.7 * 0.382 + 0.15 * 0.1 - 0.05;
    double re = rate(310.0 * Ie - 125.0, 0.16);
    double ri = rate(615.0 * Ii - 177.0, 0.087);
    EXPECT_NEAR(gsl_matrix_get(observed, 0, 0), Ie, 1e-12);
    EXPECT_NEAR(gsl_matrix_get(observed, 1, 0), re, 1e-9);
    EXPECT_NEAR(gsl_matrix_get(dstate, 0, 0), -0.1 / 100.0 + 0.641 * 0.9 * re / 1000.0, 1e-12);
    EXPECT_NEAR(gsl_matrix_get(dstate, 1, 0), -0.05 / 10.0 + ri / 1000.0, 1e-12);

    gsl_matrix_free(state);
    gsl_matrix_free(coupling);
    gsl_matrix_free(dstate);
    gsl_matrix_free(observed);
}

TEST(Deco2018, ClipsStateWithoutMutatingIt) {
    Deco2018Model model(2);
    ASSERT_TRUE(model.init_dependant());
    gsl_matrix * over = make_state(2, 1.7, -0.3);
    gsl_matrix * clipped = make_state(2, 1.0, 0.0);
    gsl_matrix * coupling = gsl_matrix_calloc(1, 2);
    gsl_matrix * d_over = gsl_matrix_alloc(2, 2);
    gsl_matrix * d_clipped = gsl_matrix_alloc(2, 2);
    gsl_matrix * o_over = model.initial_observed();
    gsl_matrix * o_clipped = model.initial_observed();
    model.dfun(over, coupling, d_over, o_over);
    model.dfun(clipped, coupling, d_clipped, o_clipped);
    EXPECT_TRUE(gsl_matrix_equal(d_over, d_clipped));
    EXPECT_TRUE(gsl_matrix_equal(o_over, o_clipped));
    EXPECT_EQ(gsl_matrix_get(over, 0, 0), 1.7);
    EXPECT_EQ(gsl_matrix_get(over, 1, 1), -0.3);
    gsl_matrix_free(over);
    gsl_matrix_free(clipped);
    gsl_matrix_free(coupling);
    gsl_matrix_free(d_over);
    gsl_matrix_free(d_clipped);
    gsl_matrix_free(o_over);
    gsl_matrix_free(o_clipped);
}

TEST(Deco2018, ZeroReceptorIgnoresGain) {
    Deco2018Model plain(3);
    Deco2018Model gained(3);
    ASSERT_TRUE(gained.set_param("w_gain_e", ParamValue(0.8)));
    ASSERT_TRUE(gained.set_param("w_gain_i", ParamValue(-0.4)));
    ASSERT_TRUE(plain.init_dependant());
    ASSERT_TRUE(gained.init_dependant());
    gsl_matrix * state = make_state(3, 0.2, 0.1);
    gsl_matrix * coupling = gsl_matrix_alloc(1, 3);
    gsl_matrix_set_all(coupling, 0.05);
    gsl_matrix * d1 = gsl_matrix_alloc(2, 3);
    gsl_matrix * d2 = gsl_matrix_alloc(2, 3);
    gsl_matrix * o1 = plain.initial_observed();
    gsl_matrix * o2 = gained.initial_observed();
    plain.dfun(state, coupling, d1, o1);
    gained.dfun(state, coupling, d2, o2);
    EXPECT_TRUE(gsl_matrix_equal(d1, d2));
    EXPECT_TRUE(gsl_matrix_equal(o1, o2));
    gsl_matrix_free(state);
    gsl_matrix_free(coupling);
    gsl_matrix_free(d1);
    gsl_matrix_free(d2);
    gsl_matrix_free(o1);
    gsl_matrix_free(o2);
}

TEST(Deco2018, ReceptorGainRaisesExcitatoryRate) {
    Deco2018Model model(2);
    ASSERT_TRUE(model.set_param("receptor", ParamValue(std::vector<double>{0.0, 1.0})));
    ASSERT_TRUE(model.set_param("w_gain_e", ParamValue(0.5)));
    ASSERT_TRUE(model.init_dependant());
    // strongly driven so that the rate is far above 1/de
    gsl_matrix * state = make_state(2, 0.5, 0.0);
    gsl_matrix * coupling = gsl_matrix_alloc(1, 2);
    gsl_matrix_set_all(coupling, 0.5);
    gsl_matrix * dstate = gsl_matrix_alloc(2, 2);
    gsl_matrix * observed = model.initial_observed();
    model.dfun(state, coupling, dstate, observed);
    EXPECT_GT(gsl_matrix_get(observed, 1, 1), gsl_matrix_get(observed, 1, 0));
    EXPECT_EQ(gsl_matrix_get(observed, 0, 1), gsl_matrix_get(observed, 0, 0));
    gsl_matrix_free(state);
    gsl_matrix_free(coupling);
    gsl_matrix_free(dstate);
    gsl_matrix_free(observed);
}

TEST(Deco2018, CouplingUsesFirstRowOnly) {
    Deco2018Model model(2);
    ASSERT_TRUE(model.init_dependant());
    gsl_matrix * state = make_state(2, 0.1, 0.1);
    gsl_matrix * c1 = gsl_matrix_alloc(1, 2);
    gsl_matrix * c2 = gsl_matrix_alloc(2, 2);
    gsl_matrix_set_all(c1, 0.2);
    gsl_matrix_set_all(c2, 0.2);
    gsl_matrix_set(c2, 1, 0, 99.0);
    gsl_matrix_set(c2, 1, 1, -99.0);
    gsl_matrix * d1 = gsl_matrix_alloc(2, 2);
    gsl_matrix * d2 = gsl_matrix_alloc(2, 2);
    gsl_matrix * o1 = model.initial_observed();
    gsl_matrix * o2 = model.initial_observed();
    model.dfun(state, c1, d1, o1);
    model.dfun(state, c2, d2, o2);
    EXPECT_TRUE(gsl_matrix_equal(d1, d2));
    gsl_matrix_free(state);
    gsl_matrix_free(c1);
    gsl_matrix_free(c2);
    gsl_matrix_free(d1);
    gsl_matrix_free(d2);
    gsl_matrix_free(o1);
    gsl_matrix_free(o2);
}

TEST(Deco2018, AutoFicHerzog) {
    Deco2018Model model(3);
    gsl_matrix * sc = make_sc3();
    model.set_connectivity(sc, 2.0);
    gsl_matrix_free(sc);
    model.set_conf({{"auto_fic", "1"}});
    ASSERT_TRUE(model.init_dependant());
    // 0.75 * G * in-strength + 1
    for (int j = 0; j < 3; j++) {
        EXPECT_DOUBLE_EQ(model.par(P::J, j), 4.0);
    }
    EXPECT_FALSE(model.is_param_set(P::J));
}

TEST(Deco2018, ExplicitJOverridesFic) {
    Deco2018Model model(3);
    gsl_matrix * sc = make_sc3();
    model.set_connectivity(sc, 2.0);
    gsl_matrix_free(sc);
    model.set_conf({{"auto_fic", "1"}});
    ASSERT_TRUE(model.set_param("J", ParamValue(1.5)));
    ASSERT_TRUE(model.init_dependant());
    for (int j = 0; j < 3; j++) {
        EXPECT_EQ(model.par(P::J, j), 1.5);
    }
}

TEST(Deco2018, AutoFicNeedsConnectivity) {
    Deco2018Model model(3);
    model.set_conf({{"auto_fic", "1"}});
    EXPECT_FALSE(model.init_dependant());
    EXPECT_TRUE(model.params_stale);
    EXPECT_EQ(model.m, nullptr);
}

TEST(Deco2018, AutoFicRejectsWrongShape) {
    Deco2018Model model(4);
    gsl_matrix * sc = make_sc3();
    model.set_connectivity(sc, 1.0);
    gsl_matrix_free(sc);
    model.set_conf({{"auto_fic", "1"}});
    EXPECT_FALSE(model.init_dependant());
    EXPECT_TRUE(model.params_stale);
    EXPECT_EQ(model.m, nullptr);
}

TEST(Deco2018, FailedFicAfterSuccessfulInitIsStale) {
    Deco2018Model model(3);
    ASSERT_TRUE(model.init_dependant());
    EXPECT_FALSE(model.params_stale);
    model.set_conf({{"auto_fic", "1"}});
    EXPECT_FALSE(model.init_dependant());
    EXPECT_TRUE(model.params_stale);
}

TEST(Deco2018, AutoFicUnknownMethod) {
    Deco2018Model model(3);
    gsl_matrix * sc = make_sc3();
    model.set_connectivity(sc, 1.0);
    gsl_matrix_free(sc);
    model.set_conf({{"auto_fic", "1"}, {"fic_method", "nope"}});
    EXPECT_FALSE(model.init_dependant());
    EXPECT_TRUE(model.params_stale);
}
