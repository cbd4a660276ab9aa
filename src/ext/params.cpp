/*
Packing of (scalar or regional) model parameters into
the parameter table used by the dynamics functions.
The table has one row per parameter and one column per region.
*/
#include <iostream>
#include <string>
#include "brainmf/params.hpp"

bool fill_param_row(gsl_matrix * m, int row, const ParamValue& value, const char * name) {
    int n_regions = m->size2;
    if (value.is_regional()) {
        if ((int)value.regional.size() != n_regions) {
            std::cerr << "Error: parameter " << (name ? name : std::to_string(row))
                << " has " << value.regional.size() << " values but there are "
                << n_regions << " regions" << std::endl;
            return false;
        }
        for (int j = 0; j < n_regions; j++) {
            gsl_matrix_set(m, row, j, value.regional[j]);
        }
    } else {
        // broadcast the scalar across regions
        gsl_vector_view m_row = gsl_matrix_row(m, row);
        gsl_vector_set_all(&m_row.vector, value.scalar);
    }
    return true;
}

gsl_matrix * build_param_table(
        const ParamValue * values, int n_params, int n_regions,
        const char * const * names
    ) {
    if ((n_params <= 0) || (n_regions <= 0)) {
        std::cerr << "Error: cannot build a parameter table of shape ("
            << n_params << ", " << n_regions << ")" << std::endl;
        return nullptr;
    }
    gsl_matrix * m = gsl_matrix_alloc(n_params, n_regions);
    for (int p = 0; p < n_params; p++) {
        if (!fill_param_row(m, p, values[p], names ? names[p] : nullptr)) {
            gsl_matrix_free(m);
            return nullptr;
        }
    }
    return m;
}
