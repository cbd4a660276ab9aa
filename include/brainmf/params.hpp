#ifndef PARAMS_HPP
#define PARAMS_HPP
#include <vector>
#include <gsl/gsl_matrix_double.h>

// A model parameter given either as one value shared by
// all regions or as one value per region
struct ParamValue {
    ParamValue() : scalar{0.0} {}
    ParamValue(double value) : scalar{value} {}
    // regional values, which must have one value per region (an
    // empty vector is a regional parameter with zero values)
    ParamValue(const std::vector<double>& values) : scalar{0.0}, regional(values), per_region{true} {}
    ParamValue(const double* values, int size) : scalar{0.0}, regional(values, values + size), per_region{true} {}

    bool is_regional() const {
        return per_region;
    }
    double at(int j) const {
        return per_region ? regional[j] : scalar;
    }

    double scalar;
    std::vector<double> regional;
    bool per_region{false};
};

extern bool fill_param_row(
    gsl_matrix * m, int row, const ParamValue& value,
    const char * name = nullptr);

extern gsl_matrix * build_param_table(
    const ParamValue * values, int n_params, int n_regions,
    const char * const * names = nullptr);

#endif
