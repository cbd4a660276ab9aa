#include <cmath>
#include <gtest/gtest.h>
#include "brainmf/fic.hpp"
#include "brainmf/models/deco2018.hpp"

typedef Deco2018Model::P P;

namespace {

double square_minus_two(double x, void * params) {
    return x * x - 2.0;
}

gsl_matrix * make_sc(int nodes, double weight) {
    gsl_matrix * sc = gsl_matrix_alloc(nodes, nodes);
    gsl_matrix_set_all(sc, weight);
    for (int j = 0; j < nodes; j++) {
        gsl_matrix_set(sc, j, j, 0.0);
    }
    return sc;
}

}

TEST(FsolveTest, FindsRoot) {
    gsl_function F;
    F.function = &square_minus_two;
    F.params = nullptr;
    double root = 0;
    ASSERT_TRUE(gsl_fsolve(F, 0.0, 2.0, &root));
    EXPECT_NEAR(root, std::sqrt(2.0), 1e-9);
}

TEST(FsolveTest, NoSignChange) {
    gsl_function F;
    F.function = &square_minus_two;
    F.params = nullptr;
    double root = 0;
    EXPECT_FALSE(gsl_fsolve(F, 2.0, 3.0, &root));
}

TEST(FICFactory, KnownAndUnknownMethods) {
    std::unique_ptr<FICMethod> herzog = make_fic_method("herzog2022");
    ASSERT_TRUE(herzog);
    EXPECT_STREQ(herzog->get_name(), "herzog2022");
    std::unique_ptr<FICMethod> demirtas = make_fic_method("demirtas2019");
    ASSERT_TRUE(demirtas);
    EXPECT_STREQ(demirtas->get_name(), "demirtas2019");
    EXPECT_FALSE(make_fic_method("deco2014"));
}

TEST(FICHerzog, UsesInStrength) {
    Deco2018Model model(3);
    ASSERT_TRUE(model.init_dependant());
    // asymmetric: only 0 -> 1 and 0 -> 2 are connected
    gsl_matrix * sc = gsl_matrix_calloc(3, 3);
    gsl_matrix_set(sc, 0, 1, 0.4);
    gsl_matrix_set(sc, 0, 2, 0.2);
    gsl_vector * J = gsl_vector_alloc(3);
    FICHerzog2022 fic;
    ASSERT_TRUE(fic.compute_J(sc, 2.0, model.m, J));
    EXPECT_DOUBLE_EQ(gsl_vector_get(J, 0), 1.0);
    EXPECT_DOUBLE_EQ(gsl_vector_get(J, 1), 0.75 * 2.0 * 0.4 + 1.0);
    EXPECT_DOUBLE_EQ(gsl_vector_get(J, 2), 0.75 * 2.0 * 0.2 + 1.0);
    gsl_matrix_free(sc);
    gsl_vector_free(J);
}

TEST(FICDemirtas, IsolatedNodesNeedUnitFeedback) {
    Deco2018Model model(2);
    ASSERT_TRUE(model.init_dependant());
    gsl_matrix * sc = make_sc(2, 1.0);
    gsl_vector * J = gsl_vector_alloc(2);
    FICDemirtas2019 fic;
    ASSERT_TRUE(fic.compute_J(sc, 0.0, model.m, J));
    EXPECT_NEAR(gsl_vector_get(J, 0), 1.0, 0.05);
    EXPECT_DOUBLE_EQ(gsl_vector_get(J, 0), gsl_vector_get(J, 1));
    gsl_matrix_free(sc);
    gsl_vector_free(J);
}

TEST(FICDemirtas, GrowsWithCoupling) {
    Deco2018Model model(3);
    ASSERT_TRUE(model.init_dependant());
    gsl_matrix * sc = make_sc(3, 1.0);
    gsl_vector * J_low = gsl_vector_alloc(3);
    gsl_vector * J_high = gsl_vector_alloc(3);
    FICDemirtas2019 fic;
    ASSERT_TRUE(fic.compute_J(sc, 0.5, model.m, J_low));
    ASSERT_TRUE(fic.compute_J(sc, 2.0, model.m, J_high));
    for (int j = 0; j < 3; j++) {
        EXPECT_GT(gsl_vector_get(J_high, j), gsl_vector_get(J_low, j));
    }
    gsl_matrix_free(sc);
    gsl_vector_free(J_low);
    gsl_vector_free(J_high);
}

TEST(FICDemirtas, UnstableFallsBackToUnitJ) {
    Deco2018Model model(2);
    ASSERT_TRUE(model.set_param("I_external", ParamValue(-1.0)));
    gsl_matrix * sc = make_sc(2, 1.0);
    model.set_connectivity(sc, 0.0);
    gsl_matrix_free(sc);
    model.set_conf({{"auto_fic", "1"}, {"fic_method", "demirtas2019"}});
    ASSERT_TRUE(model.init_dependant());
    EXPECT_EQ(model.par(P::J, 0), 1.0);
    EXPECT_EQ(model.par(P::J, 1), 1.0);
}
