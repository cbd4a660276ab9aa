#include "brainmf/models/naskar2021.hpp"

const char * const Naskar2021Model::param_names[Naskar2021Model::n_params] = {
    "t_glu", "t_gaba", "We", "Wi", "I0", "w", "J_NMDA",
    "M_e", "ae", "be", "de", "M_i", "ai", "bi", "di",
    "alfa_e", "alfa_i", "B_e", "B_i", "gamma", "rho"
};

void Naskar2021Model::set_default_params() {
    params[P::t_glu] = 7.46; // concentration of glutamate
    params[P::t_gaba] = 1.82; // concentration of GABA
    params[P::We] = 1.0; // scaling of external input for excitatory pool
    params[P::Wi] = 0.7; // scaling of external input for inhibitory pool
    params[P::I0] = 0.382; // (nA) overall effective external input
    params[P::w] = 1.4; // local excitatory recurrence
    params[P::J_NMDA] = 0.15; // (nA) NMDA current
    params[P::M_e] = 1.0; // gain of excitatory transfer function
    params[P::ae] = 310.0; // (n/C)
    params[P::be] = 125.0; // (Hz)
    params[P::de] = 0.16; // (s)
    params[P::M_i] = 1.0; // gain of inhibitory transfer function
    params[P::ai] = 615.0; // (n/C)
    params[P::bi] = 177.0; // (Hz)
    params[P::di] = 0.087; // (s)
    params[P::alfa_e] = 0.072; // forward rate constant for NMDA gating
    params[P::alfa_i] = 0.53; // forward rate constant for GABA gating
    params[P::B_e] = 0.0066; // (1/ms) backward rate constant for NMDA gating
    params[P::B_i] = 0.18; // (1/ms) backward rate constant for GABA gating
    params[P::gamma] = 1.0; // learning rate of inhibitory plasticity
    params[P::rho] = 3.0; // (Hz) target excitatory firing rate
}

gsl_matrix * Naskar2021Model::initial_state() {
    gsl_matrix * state = gsl_matrix_alloc(n_state_vars, n_rois);
    gsl_vector_view S_e = gsl_matrix_row(state, SV::S_e);
    gsl_vector_view S_i = gsl_matrix_row(state, SV::S_i);
    gsl_vector_view J = gsl_matrix_row(state, SV::J);
    gsl_vector_set_all(&S_e.vector, 0.001);
    gsl_vector_set_all(&S_i.vector, 0.001);
    gsl_vector_set_all(&J.vector, 1.0);
    return state;
}

void Naskar2021Model::dfun(
        const gsl_matrix * state, const gsl_matrix * coupling,
        gsl_matrix * dstate, gsl_matrix * observed
    ) {
    for (int j = 0; j < n_rois; j++) {
        const double Se = clip01(gsl_matrix_get(state, SV::S_e, j));
        const double Si = clip01(gsl_matrix_get(state, SV::S_i, j));
        const double J = gsl_matrix_get(state, SV::J, j);
        // Eq for I^E (5). I_external = 0 => resting state condition
        const double Ie = par(P::We, j) * par(P::I0, j)
            + par(P::w, j) * par(P::J_NMDA, j) * Se
            + par(P::J_NMDA, j) * gsl_matrix_get(coupling, 0, j)
            - J * Si;
        // Eq for I^I (6). No long-range feedforward inhibition
        const double Ii = par(P::Wi, j) * par(P::I0, j)
            + par(P::J_NMDA, j) * Se
            - Si;
        const double re = rate(par(P::M_e, j) * (par(P::ae, j) * Ie - par(P::be, j)), par(P::de, j));
        const double ri = rate(par(P::M_i, j) * (par(P::ai, j) * Ii - par(P::bi, j)), par(P::di, j));
        // rates are in Hz, divide by 1000 to express everything in ms
        gsl_matrix_set(dstate, SV::S_e, j,
            -Se * par(P::B_e, j) + par(P::alfa_e, j) * par(P::t_glu, j) * (1.0 - Se) * re / 1000.0);
        gsl_matrix_set(dstate, SV::S_i, j,
            -Si * par(P::B_i, j) + par(P::alfa_i, j) * par(P::t_gaba, j) * (1.0 - Si) * ri / 1000.0);
        // local inhibitory plasticity drives re towards rho
        gsl_matrix_set(dstate, SV::J, j,
            par(P::gamma, j) * ri / 1000.0 * (re - par(P::rho, j)) / 1000.0);
        gsl_matrix_set(observed, OV::Ie, j, Ie);
        gsl_matrix_set(observed, OV::re, j, re);
    }
}
