#ifndef DECO2018_HPP
#define DECO2018_HPP
#include "brainmf/models/base.hpp"

/*
Dynamic Mean Field (reduced Wong-Wang) model with
serotonergic receptor gain modulation

[Deco_2018] G. Deco, J. Cruzat, J. Cabral et al.
    Whole-brain multimodal neuroimaging model using serotonin
    receptor maps explains non-linear functional effects of LSD.
    Current Biology 28 (2018), pp. 3065-3074
*/
class Deco2018Model : public BaseModel {
public:
    // rows of the parameter table
    struct P {
        enum {
            taon, taog, gamma_e, gamma_i, I0, w, J_NMDA,
            Jext_e, Jext_i, ae, be, de, ai, bi, di,
            J, I_external, receptor, w_gain_e, w_gain_i,
            count
        };
    };
    struct SV {
        enum { S_e, S_i };
    };
    struct OV {
        enum { Ie, re };
    };
    struct Config {
        // compute J by FIC when it is not set explicitly
        bool auto_fic{false};
        std::string fic_method{"herzog2022"};
    };

    DEFINE_DERIVED_MODEL(
        Deco2018Model, // CLASS_NAME
        "Deco2018", // NAME
        2, // STATE_VARS
        2, // OBSERVABLE_VARS
        20 // PARAMS
    )

    ~Deco2018Model() {
        if (sc != nullptr) {
            gsl_matrix_free(sc);
        }
    }

    // structural connectivity (source, target) and global coupling
    // used by FIC, copied into the model
    void set_connectivity(const gsl_matrix * weights, double G);

    void set_conf(std::map<std::string, std::string> config_map) override;
    bool init_dependant() override final;

    gsl_matrix *sc{nullptr};
    double G{0.0};
};

#endif
