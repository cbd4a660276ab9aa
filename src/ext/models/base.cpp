#include <iostream>
#include "brainmf/models/base.hpp"

void BaseModel::print_config() {
    std::cout << "model: " << get_name() << std::endl;
    std::cout << "n_rois: " << n_rois << std::endl;
    std::cout << "verbose: " << base_conf.verbose << std::endl;
    const char * const * names = get_param_names();
    ParamValue * values = get_param_values();
    for (int p = 0; p < get_n_params(); p++) {
        std::cout << names[p] << ": ";
        if (values[p].is_regional()) {
            std::cout << "(" << values[p].regional.size() << " regional values)";
        } else {
            std::cout << values[p].scalar;
        }
        std::cout << std::endl;
    }
}

int BaseModel::param_index(const std::string& param_name) {
    const char * const * names = get_param_names();
    for (int p = 0; p < get_n_params(); p++) {
        if (param_name == names[p]) {
            return p;
        }
    }
    return -1;
}

bool BaseModel::set_param(const std::string& param_name, const ParamValue& value) {
    int p = param_index(param_name);
    if (p < 0) {
        std::cerr << "Error: model " << get_name() << " has no parameter "
            << param_name << std::endl;
        return false;
    }
    return set_param(p, value);
}

bool BaseModel::set_param(int p, const ParamValue& value) {
    if ((p < 0) || (p >= get_n_params())) {
        std::cerr << "Error: parameter index " << p << " out of range" << std::endl;
        return false;
    }
    if (value.is_regional() && ((int)value.regional.size() != n_rois)) {
        std::cerr << "Error: parameter " << get_param_names()[p] << " has "
            << value.regional.size() << " values but the model has "
            << n_rois << " regions" << std::endl;
        return false;
    }
    get_param_values()[p] = value;
    if ((int)explicit_params.size() != get_n_params()) {
        explicit_params.resize(get_n_params(), false);
    }
    explicit_params[p] = true;
    // the current table (if any) no longer reflects the parameters
    params_stale = true;
    return true;
}

bool BaseModel::is_param_set(int p) const {
    return (p < (int)explicit_params.size()) && explicit_params[p];
}

bool BaseModel::init_dependant() {
    free_params();
    m = build_param_table(get_param_values(), get_n_params(), n_rois, get_param_names());
    if (m == nullptr) {
        std::cerr << "Error: building parameters of " << get_name() << " failed" << std::endl;
        return false;
    }
    params_stale = false;
    if (base_conf.verbose) {
        print_config();
    }
    return true;
}

gsl_matrix * BaseModel::initial_observed() {
    return gsl_matrix_calloc(get_n_observable_vars(), n_rois);
}

void BaseModel::free_params() {
    if (m != nullptr) {
        gsl_matrix_free(m);
        m = nullptr;
    }
    params_stale = true;
}
