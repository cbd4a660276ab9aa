#ifndef NASKAR2021_HPP
#define NASKAR2021_HPP
#include "brainmf/models/base.hpp"

/*
Multiscale Dynamic Mean Field (MDMF) model with local inhibitory
plasticity as the Feedback Inhibition Control mechanism

[Naskar_2021] A. Naskar, A. Vattikonda, G. Deco, D. Roy, A. Banerjee.
    Multiscale dynamic mean field (MDMF) model relates resting-state
    brain dynamics with local cortical excitatory-inhibitory
    neurotransmitter homeostasis. Network Neuroscience 5 (2021), 757-782
[Vogels_2011] T. P. Vogels et al. Inhibitory plasticity balances excitation
    and inhibition in sensory pathways and memory networks.
    Science 334 (2011), 1569-1573

J is a state variable rather than a parameter.
*/
class Naskar2021Model : public BaseModel {
public:
    struct P {
        enum {
            t_glu, t_gaba, We, Wi, I0, w, J_NMDA,
            M_e, ae, be, de, M_i, ai, bi, di,
            alfa_e, alfa_i, B_e, B_i, gamma, rho,
            count
        };
    };
    struct SV {
        enum { S_e, S_i, J };
    };
    struct OV {
        enum { Ie, re };
    };
    struct Config {
    };

    DEFINE_DERIVED_MODEL(
        Naskar2021Model, // CLASS_NAME
        "Naskar2021", // NAME
        3, // STATE_VARS
        2, // OBSERVABLE_VARS
        21 // PARAMS
    )
};

#endif
