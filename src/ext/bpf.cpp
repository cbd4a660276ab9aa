/*
Band-pass filtering of BOLD time series before spectral analysis
*/
#include <cmath>
#include <iostream>
#include <algorithm>
#include <vector>
#include <gsl/gsl_complex.h>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_fit.h>
#include <gsl/gsl_statistics_double.h>
#include "brainmf/defines.h"
#include "brainmf/bpf.hpp"

void ButterworthBandPassFilter::set_conf(std::map<std::string, std::string> config_map) {
    for (const auto& pair : config_map) {
        if (pair.first == "flp") {
            this->conf.flp = std::stod(pair.second);
        } else if (pair.first == "fhi") {
            this->conf.fhi = std::stod(pair.second);
        } else if (pair.first == "k") {
            this->conf.k = std::stoi(pair.second);
        } else if (pair.first == "demean") {
            this->conf.demean = (bool)std::stoi(pair.second);
        } else if (pair.first == "detrend") {
            this->conf.detrend = (bool)std::stoi(pair.second);
        } else if (pair.first == "remove_artefacts") {
            this->conf.remove_artefacts = (bool)std::stoi(pair.second);
        }
    }
}

void ButterworthBandPassFilter::print_config() {
    std::cout << "TR: " << TR << std::endl;
    std::cout << "flp: " << conf.flp << std::endl;
    std::cout << "fhi: " << conf.fhi << std::endl;
    std::cout << "k: " << conf.k << std::endl;
    std::cout << "demean: " << conf.demean << std::endl;
    std::cout << "detrend: " << conf.detrend << std::endl;
    std::cout << "remove_artefacts: " << conf.remove_artefacts << std::endl;
}

std::vector<ButterworthBandPassFilter::Biquad> ButterworthBandPassFilter::design(
        double fs, double flp, double fhi, int order
    ) {
    std::vector<Biquad> sections;
    const double fs2 = 2.0 * fs;
    // prewarped analog band edges (rad/s)
    const double wl = fs2 * tan(PI * flp / fs);
    const double wh = fs2 * tan(PI * fhi / fs);
    const double bw = wh - wl;
    const double w0 = SQRT(wl * wh);

    // Each pole p of the analog low-pass prototype gives two band-pass
    // poles p*bw/2 +- sqrt((p*bw/2)^2 - w0^2), which are mapped to z by
    // the bilinear transform. The zeros are at z = 1 and z = -1, one
    // of each per section
    std::vector<gsl_complex> upper; // complex poles with Im > 0
    std::vector<double> real;
    for (int k = 0; k < order; k++) {
        const double theta = PI * (2 * k - order + 1) / (2.0 * order);
        gsl_complex p = gsl_complex_rect(-COS(theta) * bw / 2.0, -SIN(theta) * bw / 2.0);
        gsl_complex disc = gsl_complex_sqrt(gsl_complex_sub_real(gsl_complex_mul(p, p), w0 * w0));
        gsl_complex analog[2] = {gsl_complex_add(p, disc), gsl_complex_sub(p, disc)};
        for (int s = 0; s < 2; s++) {
            gsl_complex pz = gsl_complex_div(
                gsl_complex_add_real(analog[s], fs2),
                gsl_complex_sub(gsl_complex_rect(fs2, 0.0), analog[s]));
            if (fabs(GSL_IMAG(pz)) <= 1e-12) {
                real.push_back(GSL_REAL(pz));
            } else if (GSL_IMAG(pz) > 0) {
                upper.push_back(pz);
            }
        }
    }
    if ((upper.size() + real.size() / 2 != (size_t)order) || (real.size() % 2 != 0)) {
        std::cerr << "Error: Butterworth design failed to pair the poles" << std::endl;
        return sections;
    }
    for (const gsl_complex& pz : upper) {
        Biquad bi;
        bi.a1 = -2.0 * GSL_REAL(pz);
        bi.a2 = gsl_complex_abs2(pz);
        sections.push_back(bi);
    }
    std::sort(real.begin(), real.end());
    for (size_t i = 0; i < real.size(); i += 2) {
        Biquad bi;
        bi.a1 = -(real[i] + real[i+1]);
        bi.a2 = real[i] * real[i+1];
        sections.push_back(bi);
    }

    // unit gain of every section at the digital image of w0, where
    // the analog band-pass has its unit peak
    const double wc = 2.0 * atan(w0 / fs2);
    for (Biquad& bi : sections) {
        const double den_re = 1.0 + bi.a1 * COS(wc) + bi.a2 * COS(2.0 * wc);
        const double den_im = -(bi.a1 * SIN(wc) + bi.a2 * SIN(2.0 * wc));
        const double g = SQRT(den_re * den_re + den_im * den_im) / (2.0 * fabs(SIN(wc)));
        bi.b0 = g;
        bi.b1 = 0.0;
        bi.b2 = -g;
    }
    return sections;
}

// runs the cascade over x in place (transposed direct form II)
static void run_cascade(const std::vector<ButterworthBandPassFilter::Biquad>& sections, std::vector<double>& x) {
    for (const auto& bi : sections) {
        double z1 = 0.0, z2 = 0.0;
        for (size_t i = 0; i < x.size(); i++) {
            double in = x[i];
            double out = in * bi.b0 + z1;
            z1 = in * bi.b1 + z2 - bi.a1 * out;
            z2 = in * bi.b2 - bi.a2 * out;
            x[i] = out;
        }
    }
}

bool ButterworthBandPassFilter::filter(const gsl_matrix * ts, gsl_matrix * out) const {
    if (!(TR > 0)) {
        std::cerr << "Error: TR must be positive (TR = " << TR << ")" << std::endl;
        return false;
    }
    const double fs = 1.0 / TR;
    const double fnq = fs / 2.0; // Nyquist frequency
    if (!((conf.flp > 0) && (conf.flp < conf.fhi) && (conf.fhi < fnq))) {
        std::cerr << "Error: invalid band [" << conf.flp << ", " << conf.fhi
            << "] Hz for Nyquist frequency " << fnq << " Hz" << std::endl;
        return false;
    }
    if (conf.k < 1) {
        std::cerr << "Error: filter order must be positive" << std::endl;
        return false;
    }
    if ((ts->size1 != out->size1) || (ts->size2 != out->size2)) {
        std::cerr << "Error: filter output shape does not match input" << std::endl;
        return false;
    }
    const int n_t = ts->size1;
    const int nodes = ts->size2;
    if (n_t < 3) {
        std::cerr << "Error: time series too short to filter (" << n_t << " samples)" << std::endl;
        return false;
    }

    std::vector<Biquad> sections = design(fs, conf.flp, conf.fhi, conf.k);
    if (sections.empty()) {
        return false;
    }

    gsl_matrix_memcpy(out, ts);
    std::vector<double> t(n_t), x(n_t);
    for (int i = 0; i < n_t; i++) {
        t[i] = i;
    }
    for (int j = 0; j < nodes; j++) {
        gsl_vector_view col = gsl_matrix_column(out, j);
        double *data = col.vector.data;
        const size_t stride = col.vector.stride;
        if (conf.demean) {
            gsl_vector_add_constant(&col.vector, -gsl_stats_mean(data, stride, n_t));
        }
        if (conf.detrend) {
            double c0, c1, cov00, cov01, cov11, sumsq;
            gsl_fit_linear(t.data(), 1, data, stride, n_t, &c0, &c1, &cov00, &cov01, &cov11, &sumsq);
            for (int i = 0; i < n_t; i++) {
                data[i * stride] -= c0 + c1 * t[i];
            }
        }
        if (conf.remove_artefacts) {
            double sd3 = 3.0 * gsl_stats_sd(data, stride, n_t);
            for (int i = 0; i < n_t; i++) {
                data[i * stride] = std::max(-sd3, std::min(sd3, data[i * stride]));
            }
        }
        for (int i = 0; i < n_t; i++) {
            x[i] = data[i * stride];
        }
        // forward and backward pass => zero phase
        run_cascade(sections, x);
        std::reverse(x.begin(), x.end());
        run_cascade(sections, x);
        std::reverse(x.begin(), x.end());
        for (int i = 0; i < n_t; i++) {
            data[i * stride] = x[i];
        }
    }
    return true;
}
