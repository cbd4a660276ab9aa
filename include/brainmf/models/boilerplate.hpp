/*
This macro creates the repetitive part of the definition of a derived
model, so that adding a new model mostly consists of defining its
parameters, initial state and dfun.

Usage:

// include/brainmf/models/derived_model.hpp

class derivedModel : public BaseModel {
public:
    struct P { enum { ..., count }; }; // parameter rows of the table
    struct SV { enum { ... }; }; // state variable rows
    struct OV { enum { ... }; }; // observable rows
    struct Config {}; // this is required even if empty

    DEFINE_DERIVED_MODEL(<args>) // see below the arguments

    // declare functions that need to be overridden in addition to
    // set_default_params, initial_state and dfun which are always
    // defined by the derived model
    ...
};

The implementation must be in `src/ext/models/derived_model.cpp` and
must include the definition of `param_names` (in the order of P) and of
`set_default_params` which sets the default value of every parameter.

See Naskar2021 for a simple example and Deco2018 for a model with
dependent parameters.
*/

#define DEFINE_DERIVED_MODEL(CLASS_NAME, NAME, STATE_VARS, OBSERVABLE_VARS, PARAMS) \
    CLASS_NAME(int n_rois) : BaseModel(n_rois) { \
        set_default_params(); \
    } \
    static constexpr const char* name = NAME; \
    static constexpr int n_state_vars = STATE_VARS; \
    static constexpr int n_observable_vars = OBSERVABLE_VARS; \
    static constexpr int n_params = PARAMS; \
    static_assert(P::count == PARAMS, "parameter enum does not match n_params"); \
    static const char * const param_names[PARAMS]; \
    ParamValue params[PARAMS]; \
    Config conf; \
    void set_default_params(); \
    gsl_matrix * initial_state() override final; \
    void dfun( \
        const gsl_matrix * state, const gsl_matrix * coupling, \
        gsl_matrix * dstate, gsl_matrix * observed) override final; \
    int get_n_state_vars() override final { \
        return n_state_vars; \
    } \
    int get_n_observable_vars() override final { \
        return n_observable_vars; \
    } \
    int get_n_params() override final { \
        return n_params; \
    } \
    const char * get_name() override final { \
        return name; \
    } \
    const char * const * get_param_names() override final { \
        return param_names; \
    } \
    ParamValue * get_param_values() override final { \
        return params; \
    }
