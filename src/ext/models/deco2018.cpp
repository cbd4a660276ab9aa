#include <iostream>
#include "brainmf/models/deco2018.hpp"
#include "brainmf/fic.hpp"

const char * const Deco2018Model::param_names[Deco2018Model::n_params] = {
    "taon", "taog", "gamma_e", "gamma_i", "I0", "w", "J_NMDA",
    "Jext_e", "Jext_i", "ae", "be", "de", "ai", "bi", "di",
    "J", "I_external", "receptor", "w_gain_e", "w_gain_i"
};

void Deco2018Model::set_default_params() {
    params[P::taon] = 100.0; // (ms) Time constant of NMDA (excitatory)
    params[P::taog] = 10.0; // (ms) Time constant of GABA (inhibitory)
    params[P::gamma_e] = 0.641; // kinetic parameter of excitatory population
    params[P::gamma_i] = 1.0; // kinetic parameter of inhibitory population
    params[P::I0] = 0.382; // (nA) overall effective external input
    params[P::w] = 1.4; // local excitatory recurrence
    params[P::J_NMDA] = 0.15; // (nA) NMDA current
    params[P::Jext_e] = 1.0; // scaling of external input for excitatory pool
    params[P::Jext_i] = 0.7; // scaling of external input for inhibitory pool
    params[P::ae] = 310.0; // (n/C)
    params[P::be] = 125.0; // (Hz)
    params[P::de] = 0.16; // (s)
    params[P::ai] = 615.0; // (n/C)
    params[P::bi] = 177.0; // (Hz)
    params[P::di] = 0.087; // (s)
    params[P::J] = 1.0; // local feedback inhibition (FIC)
    params[P::I_external] = 0.0; // (nA) external stimulation, 0 at rest
    params[P::receptor] = 0.0; // receptor density
    params[P::w_gain_e] = 0.0; // receptor gain of excitatory pool
    params[P::w_gain_i] = 0.0; // receptor gain of inhibitory pool
}

void Deco2018Model::set_conf(std::map<std::string, std::string> config_map) {
    set_base_conf(config_map);
    for (const auto& pair : config_map) {
        if (pair.first == "auto_fic") {
            this->conf.auto_fic = (bool)std::stoi(pair.second);
            this->params_stale = true;
        } else if (pair.first == "fic_method") {
            this->conf.fic_method = pair.second;
            this->params_stale = true;
        }
    }
}

void Deco2018Model::set_connectivity(const gsl_matrix * weights, double G) {
    if (sc != nullptr) {
        gsl_matrix_free(sc);
    }
    sc = gsl_matrix_alloc(weights->size1, weights->size2);
    gsl_matrix_memcpy(sc, weights);
    this->G = G;
    this->params_stale = true;
}

bool Deco2018Model::init_dependant() {
    if (!BaseModel::init_dependant()) {
        return false;
    }
    // J given by the user takes precedence over FIC
    if (!(this->conf.auto_fic) || is_param_set(P::J)) {
        return true;
    }
    // on failure the table without J is dropped and left stale
    if (sc == nullptr) {
        std::cerr << "Error: auto_fic requires the structural connectivity" << std::endl;
        free_params();
        return false;
    }
    if (((int)sc->size1 != n_rois) || ((int)sc->size2 != n_rois)) {
        std::cerr << "Error: SC shape (" << sc->size1 << ", " << sc->size2
            << ") does not match " << n_rois << " regions" << std::endl;
        free_params();
        return false;
    }
    std::unique_ptr<FICMethod> fic = make_fic_method(this->conf.fic_method);
    if (!fic) {
        free_params();
        return false;
    }
    gsl_vector * J = gsl_vector_alloc(n_rois);
    if (!fic->compute_J(sc, G, m, J)) {
        std::cout << "FIC (" << fic->get_name() << ") solution is unstable. "
            << "Setting J to 1 in all nodes" << std::endl;
        gsl_vector_set_all(J, 1.0);
    }
    gsl_matrix_set_row(m, P::J, J);
    // keep the parameter in sync with the table, without
    // marking it as explicitly set
    params[P::J] = ParamValue(J->data, n_rois);
    if (base_conf.verbose) {
        std::cout << "J computed by FIC (" << fic->get_name() << ")" << std::endl;
    }
    gsl_vector_free(J);
    return true;
}

gsl_matrix * Deco2018Model::initial_state() {
    gsl_matrix * state = gsl_matrix_alloc(n_state_vars, n_rois);
    gsl_vector_view S_e = gsl_matrix_row(state, SV::S_e);
    gsl_vector_view S_i = gsl_matrix_row(state, SV::S_i);
    gsl_vector_set_all(&S_e.vector, 0.001);
    gsl_vector_set_all(&S_i.vector, 0.001);
    return state;
}

void Deco2018Model::dfun(
        const gsl_matrix * state, const gsl_matrix * coupling,
        gsl_matrix * dstate, gsl_matrix * observed
    ) {
    for (int j = 0; j < n_rois; j++) {
        // clipped copies, the state itself is left as is
        const double Se = clip01(gsl_matrix_get(state, SV::S_e, j));
        const double Si = clip01(gsl_matrix_get(state, SV::S_i, j));
        // Eq for I^E. I_external = 0 => resting state condition
        const double Ie = par(P::Jext_e, j) * par(P::I0, j)
            + par(P::w, j) * par(P::J_NMDA, j) * Se
            + par(P::J_NMDA, j) * gsl_matrix_get(coupling, 0, j)
            - par(P::J, j) * Si
            + par(P::I_external, j);
        // Eq for I^I. No long-range feedforward inhibition
        const double Ii = par(P::Jext_i, j) * par(P::I0, j)
            + par(P::J_NMDA, j) * Se
            - Si;
        // g_E * (I - I_thr) is distributed as a*I - b and then scaled
        // by the receptor gain
        const double re = rate(
            (par(P::ae, j) * Ie - par(P::be, j)) * (1.0 + par(P::receptor, j) * par(P::w_gain_e, j)),
            par(P::de, j));
        const double ri = rate(
            (par(P::ai, j) * Ii - par(P::bi, j)) * (1.0 + par(P::receptor, j) * par(P::w_gain_i, j)),
            par(P::di, j));
        // rates are in Hz, divide by 1000 to express everything in ms
        gsl_matrix_set(dstate, SV::S_e, j,
            -Se / par(P::taon, j) + par(P::gamma_e, j) * (1.0 - Se) * re / 1000.0);
        gsl_matrix_set(dstate, SV::S_i, j,
            -Si / par(P::taog, j) + par(P::gamma_i, j) * ri / 1000.0);
        gsl_matrix_set(observed, OV::Ie, j, Ie);
        gsl_matrix_set(observed, OV::re, j, re);
    }
}
