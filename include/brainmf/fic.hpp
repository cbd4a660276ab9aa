#ifndef FIC_HPP
#define FIC_HPP
#include <memory>
#include <string>
#include <gsl/gsl_math.h>
#include <gsl/gsl_matrix_double.h>
#include <gsl/gsl_vector_double.h>

/*
Feedback Inhibition Control (FIC): computes the local inhibitory
feedback weight J of each region so that its excitatory firing
rate stays around ~3 Hz given the long-range excitation it receives.

All methods take the structural connectivity with shape
(source, target), the global coupling G and the parameter table
of Deco2018 (n_params, nodes). They return false if the
solution is unstable.
*/
class FICMethod {
public:
    virtual ~FICMethod() = default;
    virtual const char * get_name() = 0;
    virtual bool compute_J(
        const gsl_matrix * sc, double G, const gsl_matrix * params,
        gsl_vector * J_out) = 0;
};

// linear approximation of the FIC solution
// [Herzog_2022] R. Herzog et al. Neural mass modeling for the masses:
//      Democratizing access to whole-brain biophysical modeling. 2022
class FICHerzog2022 : public FICMethod {
public:
    const char * get_name() override {
        return "herzog2022";
    }
    bool compute_J(
        const gsl_matrix * sc, double G, const gsl_matrix * params,
        gsl_vector * J_out) override;
};

// analytical FIC based on the steady state of the isolated node
// [Demirtas_2019] M. Demirtas et al. Hierarchical heterogeneity across
//      human cortex shapes large-scale neural dynamics. Neuron 2019
class FICDemirtas2019 : public FICMethod {
public:
    // steady-state solutions of the isolated node
    struct Constants {
        double I_E_ss{0.3773805650}; // nA
        double S_E_ss{0.1647572075}; // dimensionless
        double w_II{1.0}; // I.I self-coupling
    };
    Constants mc;

    const char * get_name() override {
        return "demirtas2019";
    }
    bool compute_J(
        const gsl_matrix * sc, double G, const gsl_matrix * params,
        gsl_vector * J_out) override;
};

extern std::unique_ptr<FICMethod> make_fic_method(const std::string& method);

extern bool gsl_fsolve(gsl_function F, double x_lo, double x_hi, double * root);

#endif
