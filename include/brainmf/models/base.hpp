#ifndef BASE_HPP
#define BASE_HPP
#include <cmath>
#include <map>
#include <string>
#include <vector>
#include <gsl/gsl_matrix_double.h>
#include "brainmf/defines.h"
#include "brainmf/params.hpp"
#include "brainmf/models/boilerplate.hpp"

// clip a synaptic gating variable to [0, 1]
inline double clip01(double x) {
    return fmax(0.0, fmin(1.0, x));
}

// sigmoidal rate transfer function y / (1 - exp(-d*y)) where y = a*I - b
// (optionally scaled by a gain). At y = 0 it has a removable singularity
// with the limit 1/d, which is approached via its series expansion
inline double rate(double y, double d) {
    const double dy = d * y;
    if (fabs(dy) < RATE_SERIES_EPS) {
        return 1.0 / d + y * (0.5 + dy / 12.0);
    }
    return y / -EXPM1(-dy);
}

class BaseModel {
public:
    BaseModel(int n_rois) : n_rois{n_rois} {};
    // free the parameter table
    virtual ~BaseModel() {
        free_params();
    }

    static constexpr const char *name = "Base";

    int n_rois{0};
    // parameter table (n_params, n_rois), owned by the model
    gsl_matrix *m{nullptr};
    // set when a parameter has changed after the table was built
    bool params_stale{true};

    struct Config {
        bool verbose{false};
    };

    Config base_conf;

    void print_config();

    virtual void set_conf(std::map<std::string, std::string> config_map) {
        set_base_conf(config_map);
    }

    // the number of state variables, observables and parameters
    // are static members of the derived models, the getters
    // are defined by DEFINE_DERIVED_MODEL
    virtual int get_n_state_vars() = 0;
    virtual int get_n_observable_vars() = 0;
    virtual int get_n_params() = 0;
    virtual const char * get_name() {
        return name;
    }
    virtual const char * const * get_param_names() = 0;
    virtual ParamValue * get_param_values() = 0;

    int param_index(const std::string& param_name);
    bool set_param(const std::string& param_name, const ParamValue& value);
    bool set_param(int p, const ParamValue& value);
    bool is_param_set(int p) const;

    // builds the parameter table once the configuration is final
    // derived models may add dependent initializations (e.g. FIC)
    virtual bool init_dependant();

    virtual gsl_matrix * initial_state() = 0;
    gsl_matrix * initial_observed();

    // state (n_state_vars, n_rois) and coupling (>=1, n_rois) are read-only
    // dstate (n_state_vars, n_rois) and observed (n_observable_vars, n_rois)
    // are written. Shapes are not checked
    virtual void dfun(
        const gsl_matrix * state, const gsl_matrix * coupling,
        gsl_matrix * dstate, gsl_matrix * observed) = 0;

    // value of parameter p in region j
    inline double par(int p, int j) const {
        return m->data[p * m->tda + j];
    }

protected:
    void set_base_conf(std::map<std::string, std::string> config_map) {
        for (const auto& pair : config_map) {
            if (pair.first == "verbose") {
                this->base_conf.verbose = (bool)std::stoi(pair.second);
            }
        }
    }
    void free_params();

    // parameters explicitly set by the user (rather than defaults)
    std::vector<bool> explicit_params;
};

#endif
