/*
Feedback Inhibition Control (FIC)
Calculates J needed in each node to maintain excitatory
firing rate of ~3 Hz.

The analytical solution is based on https://github.com/murraylab/hbnm
*/
#include <iostream>
#include <gsl/gsl_blas.h>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_roots.h>
#include "brainmf/fic.hpp"
#include "brainmf/models/deco2018.hpp"

typedef Deco2018Model::P P;

bool FICHerzog2022::compute_J(
        const gsl_matrix * sc, double G, const gsl_matrix * params,
        gsl_vector * J_out
    ) {
    int nodes = sc->size2;
    // J = 0.75 * G * (in-strength) + 1
    for (int j = 0; j < nodes; j++) {
        gsl_vector_const_view sc_col = gsl_matrix_const_column(sc, j);
        double strength = 0;
        for (int k = 0; k < (int)sc->size1; k++) {
            strength += gsl_vector_get(&sc_col.vector, k);
        }
        gsl_vector_set(J_out, j, 0.75 * G * strength + 1.0);
    }
    return true;
}

bool gsl_fsolve(gsl_function F, double x_lo, double x_hi, double * root) {
    // Based on https://www.gnu.org/software/gsl/doc/html/roots.html#examples
    int status;
    int iter = 0, max_iter = 100;
    gsl_root_fsolver *s = gsl_root_fsolver_alloc(gsl_root_fsolver_brent);
    // do not abort on a bracket without sign change, report it instead
    gsl_error_handler_t *old_handler = gsl_set_error_handler_off();
    status = gsl_root_fsolver_set(s, &F, x_lo, x_hi);
    while (status == GSL_SUCCESS || status == GSL_CONTINUE) {
        iter++;
        status = gsl_root_fsolver_iterate(s);
        if (status != GSL_SUCCESS) {
            break;
        }
        *root = gsl_root_fsolver_root(s);
        x_lo = gsl_root_fsolver_x_lower(s);
        x_hi = gsl_root_fsolver_x_upper(s);
        status = gsl_root_test_interval(x_lo, x_hi, 1e-12, 1e-10);
        if ((status == GSL_SUCCESS) || (iter >= max_iter)) {
            break;
        }
    }
    gsl_set_error_handler(old_handler);
    gsl_root_fsolver_free(s);
    if (status != GSL_SUCCESS) {
        std::cerr << "Root solver did not converge" << std::endl;
        return false;
    }
    return true;
}

struct inh_curr_params {
    double I0_I, w_EI, S_E_ss, w_II, gamma_I_s, tau_I_s, a_I, b_I, d_I, gain_I;
};

/* Eq.10 in Demirtas which is solved by `gsl_fsolve`
 to find the steady-state inhibitory current */
double _inh_curr_fixed_pts(double x, void * params) {
    struct inh_curr_params *p = (struct inh_curr_params *) params;
    double r_I = rate((p->a_I * x - p->b_I) * p->gain_I, p->d_I);
    return p->I0_I + p->w_EI * p->S_E_ss -
            p->w_II * p->gamma_I_s * p->tau_I_s * r_I - x;
}

bool FICDemirtas2019::compute_J(
        const gsl_matrix * sc, double G, const gsl_matrix * params,
        gsl_vector * J_out
    ) {
    int nodes = sc->size2;

    // K_EE (target, source) = G * J_NMDA * sc^T + diag(w * J_NMDA)
    gsl_matrix *K_EE = gsl_matrix_alloc(nodes, nodes);
    gsl_matrix_transpose_memcpy(K_EE, sc);
    gsl_matrix_scale(K_EE, G);
    for (int j = 0; j < nodes; j++) {
        double J_NMDA = gsl_matrix_get(params, P::J_NMDA, j);
        gsl_vector_view K_EE_row = gsl_matrix_row(K_EE, j);
        gsl_vector_scale(&K_EE_row.vector, J_NMDA);
        gsl_matrix_set(K_EE, j, j,
            gsl_matrix_get(K_EE, j, j) + gsl_matrix_get(params, P::w, j) * J_NMDA);
    }
    gsl_vector *S_E_ss = gsl_vector_alloc(nodes);
    gsl_vector_set_all(S_E_ss, mc.S_E_ss);
    gsl_vector *K_EE_dot_S_E_ss = gsl_vector_alloc(nodes);
    gsl_blas_dgemv(CblasNoTrans, 1.0, K_EE, S_E_ss, 0.0, K_EE_dot_S_E_ss);

    gsl_function F;
    F.function = &_inh_curr_fixed_pts;
    bool stable = true;
    for (int j = 0; j < nodes; j++) {
        struct inh_curr_params p = {
            gsl_matrix_get(params, P::Jext_i, j) * gsl_matrix_get(params, P::I0, j), // I0_I
            gsl_matrix_get(params, P::J_NMDA, j), // w_EI
            mc.S_E_ss, mc.w_II,
            gsl_matrix_get(params, P::gamma_i, j),
            gsl_matrix_get(params, P::taog, j) / 1000.0, // ms -> s
            gsl_matrix_get(params, P::ai, j),
            gsl_matrix_get(params, P::bi, j),
            gsl_matrix_get(params, P::di, j),
            1.0 + gsl_matrix_get(params, P::receptor, j) * gsl_matrix_get(params, P::w_gain_i, j)
        };
        F.params = &p;
        double I_I_ss;
        if (!gsl_fsolve(F, 0.0, 2.0, &I_I_ss)) {
            stable = false;
            break;
        }
        double r_I_ss = rate((p.a_I * I_I_ss - p.b_I) * p.gain_I, p.d_I);
        double S_I_ss = r_I_ss * p.tau_I_s * p.gamma_I_s;
        double I0_E = gsl_matrix_get(params, P::Jext_e, j) * gsl_matrix_get(params, P::I0, j);
        double J = (-1 / S_I_ss) *
                    (mc.I_E_ss -
                    gsl_matrix_get(params, P::I_external, j) -
                    I0_E -
                    gsl_vector_get(K_EE_dot_S_E_ss, j));
        if (J < 0) {
            stable = false;
            break;
        }
        gsl_vector_set(J_out, j, J);
    }

    gsl_matrix_free(K_EE);
    gsl_vector_free(S_E_ss);
    gsl_vector_free(K_EE_dot_S_E_ss);
    return stable;
}

std::unique_ptr<FICMethod> make_fic_method(const std::string& method) {
    if (method == "herzog2022") {
        return std::unique_ptr<FICMethod>(new FICHerzog2022());
    } else if (method == "demirtas2019") {
        return std::unique_ptr<FICMethod>(new FICDemirtas2019());
    }
    std::cerr << "Error: FIC method " << method << " not found" << std::endl;
    return nullptr;
}
