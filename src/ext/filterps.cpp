/*
Power spectra of band-pass filtered BOLD signals and the
frequency of maximal power in each region, which is compared
against the same measure of empirical data.
*/
#ifdef OMP_ENABLED
    #include <omp.h>
#endif
#include <cmath>
#include <iostream>
#include <algorithm>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_fft_real.h>
#include <gsl/gsl_statistics_double.h>
#include "brainmf/defines.h"
#include "brainmf/filterps.hpp"

gsl_vector * conv(const gsl_vector * u, const gsl_vector * v) {
    const int nu = u->size;
    const int nv = v->size;
    // keep the central part of the full convolution, with the
    // odd remainder trimmed from the front
    const int npad = nv - 1;
    const int first = npad - npad / 2;
    gsl_vector * out = gsl_vector_alloc(nu);
    for (int i = 0; i < nu; i++) {
        const int n = first + i;
        const int k_lo = std::max(0, n - npad);
        const int k_hi = std::min(nu - 1, n);
        double s = 0.0;
        for (int k = k_lo; k <= k_hi; k++) {
            s += gsl_vector_get(u, k) * gsl_vector_get(v, n - k);
        }
        gsl_vector_set(out, i, s);
    }
    return out;
}

gsl_vector * gaussfilt(const gsl_vector * t, const gsl_vector * z, double sigma) {
    if (sigma <= 0) {
        std::cerr << "Error: gaussfilt sigma must be positive" << std::endl;
        return nullptr;
    }
    const int n_t = t->size;
    if (n_t < 2) {
        std::cerr << "Error: gaussfilt needs at least two positions" << std::endl;
        return nullptr;
    }
    const int n = z->size;
    const double a = 1.0 / (SQRT(2.0 * PI) * sigma); // height of Gaussian
    const double sigma2 = sigma * sigma;
    // only uniform spacing is supported
    const double dt = gsl_vector_get(t, 1) - gsl_vector_get(t, 0);
    const double mean_t = gsl_stats_mean(t->data, t->stride, n_t);

    // drop the negligible tails of the kernel
    std::vector<double> kernel;
    kernel.reserve(n_t);
    for (int i = 0; i < n_t; i++) {
        double x = gsl_vector_get(t, i) - mean_t;
        double coef = dt * a * EXP(-0.5 * (x * x) / sigma2);
        if (!(coef < dt * a * 1e-6)) {
            kernel.push_back(coef);
        }
    }
    if (kernel.empty()) {
        std::cerr << "Error: gaussfilt kernel is empty (sigma = " << sigma
            << " is too small for spacing " << dt << ")" << std::endl;
        return nullptr;
    }
    gsl_vector_const_view filter = gsl_vector_const_view_array(kernel.data(), kernel.size());

    gsl_vector * zfilt = conv(z, &filter.vector);
    // remove edge effect from conv; the central tap of the kernel always
    // overlaps the signal so the denominator is not zero
    gsl_vector * ones = gsl_vector_alloc(n);
    gsl_vector_set_all(ones, 1.0);
    gsl_vector * ones_filt = conv(ones, &filter.vector);
    gsl_vector_div(zfilt, ones_filt);

    gsl_vector_free(ones);
    gsl_vector_free(ones_filt);
    return zfilt;
}

// power spectra of the first tmax samples of signal (regions, time)
static gsl_matrix * _filt_pow_spectra(
        const gsl_matrix * signal, int tmax, double TR, const BandPassFilter * bpf
    ) {
    if (bpf == nullptr) {
        std::cerr << "Error: a band-pass filter is required" << std::endl;
        return nullptr;
    }
    if (!(TR > 0)) {
        std::cerr << "Error: TR must be positive (TR = " << TR << ")" << std::endl;
        return nullptr;
    }
    const int nodes = signal->size1;
    const int n_freqs = tmax / 2;
    if ((n_freqs < 1) || (tmax > (int)signal->size2)) {
        std::cerr << "Error: invalid number of time points " << tmax << std::endl;
        return nullptr;
    }
    // filter on (time, regions)
    gsl_matrix_const_view sig = gsl_matrix_const_submatrix(signal, 0, 0, nodes, tmax);
    gsl_matrix * ts = gsl_matrix_alloc(tmax, nodes);
    gsl_matrix_transpose_memcpy(ts, &sig.matrix);
    gsl_matrix * ts_filt = gsl_matrix_alloc(tmax, nodes);
    bool filtered = bpf->filter(ts, ts_filt);
    gsl_matrix_free(ts);
    if (!filtered) {
        std::cerr << "Error: band-pass filtering failed" << std::endl;
        gsl_matrix_free(ts_filt);
        return nullptr;
    }

    gsl_matrix * pow_spect = gsl_matrix_alloc(n_freqs, nodes);
    gsl_fft_real_wavetable * wavetable = gsl_fft_real_wavetable_alloc(tmax);
    gsl_fft_real_workspace * workspace = gsl_fft_real_workspace_alloc(tmax);
    std::vector<double> data(tmax);
    const double norm = ((double)tmax / 2.0) / TR;
    bool ok = true;
    for (int j = 0; j < nodes; j++) {
        for (int i = 0; i < tmax; i++) {
            data[i] = gsl_matrix_get(ts_filt, i, j);
        }
        if (gsl_fft_real_transform(data.data(), 1, tmax, wavetable, workspace) != GSL_SUCCESS) {
            std::cerr << "Error: FFT failed in region " << j << std::endl;
            ok = false;
            break;
        }
        // halfcomplex layout: data[0] = Re(c0), data[2k-1] = Re(ck), data[2k] = Im(ck)
        gsl_matrix_set(pow_spect, 0, j, data[0] * data[0] / norm);
        for (int k = 1; k < n_freqs; k++) {
            gsl_matrix_set(pow_spect, k, j,
                (data[2*k-1] * data[2*k-1] + data[2*k] * data[2*k]) / norm);
        }
    }
    gsl_fft_real_wavetable_free(wavetable);
    gsl_fft_real_workspace_free(workspace);
    gsl_matrix_free(ts_filt);
    if (!ok) {
        gsl_matrix_free(pow_spect);
        return nullptr;
    }
    return pow_spect;
}

gsl_matrix * filt_pow_spectra(const gsl_matrix * signal, double TR, const BandPassFilter * bpf) {
    return _filt_pow_spectra(signal, signal->size2, TR, bpf);
}

// averages the power spectra across subjects (truncated to the
// shortest recording), smooths them and finds the peak frequencies
static gsl_vector * _peak_frequencies(
        const std::vector<const gsl_matrix *>& subjects, double TR,
        const BandPassFilter * bpf, double sigma
    ) {
    const int n_subjects = subjects.size();
    if (n_subjects == 0) {
        std::cerr << "Error: no subjects given" << std::endl;
        return nullptr;
    }
    if (!(TR > 0)) {
        std::cerr << "Error: TR must be positive (TR = " << TR << ")" << std::endl;
        return nullptr;
    }
    const int nodes = subjects[0]->size1;
    int tmax = subjects[0]->size2;
    for (const gsl_matrix * s : subjects) {
        if ((int)s->size1 != nodes) {
            std::cerr << "Error: subjects have different number of regions ("
                << nodes << " vs " << s->size1 << ")" << std::endl;
            return nullptr;
        }
        tmax = std::min(tmax, (int)s->size2);
    }
    const int n_freqs = tmax / 2;

    std::vector<gsl_matrix *> pow_spects(n_subjects, nullptr);
    #ifdef OMP_ENABLED
    #pragma omp parallel for
    #endif
    for (int s = 0; s < n_subjects; s++) {
        pow_spects[s] = _filt_pow_spectra(subjects[s], tmax, TR, bpf);
    }
    // mean across subjects, summed in subject order
    gsl_matrix * pow_mean = nullptr;
    bool ok = true;
    for (int s = 0; s < n_subjects; s++) {
        if (pow_spects[s] == nullptr) {
            ok = false;
            continue;
        }
        if (ok) {
            if (pow_mean == nullptr) {
                pow_mean = gsl_matrix_alloc(n_freqs, nodes);
                gsl_matrix_memcpy(pow_mean, pow_spects[s]);
            } else {
                gsl_matrix_add(pow_mean, pow_spects[s]);
            }
        }
        gsl_matrix_free(pow_spects[s]);
    }
    if (!ok) {
        if (pow_mean != nullptr) {
            gsl_matrix_free(pow_mean);
        }
        return nullptr;
    }
    gsl_matrix_scale(pow_mean, 1.0 / n_subjects);

    const double Ts = tmax * TR;
    gsl_vector * freqs = gsl_vector_alloc(n_freqs);
    for (int k = 0; k < n_freqs; k++) {
        gsl_vector_set(freqs, k, k / Ts);
    }
    gsl_vector * f_peak = gsl_vector_alloc(nodes);
    gsl_vector * pow_region = gsl_vector_alloc(n_freqs);
    for (int j = 0; j < nodes; j++) {
        gsl_matrix_get_col(pow_region, pow_mean, j);
        gsl_vector * pow_smoothed = gaussfilt(freqs, pow_region, sigma);
        if (pow_smoothed == nullptr) {
            ok = false;
            break;
        }
        gsl_vector_set(f_peak, j, gsl_vector_get(freqs, gsl_vector_max_index(pow_smoothed)));
        gsl_vector_free(pow_smoothed);
    }
    gsl_vector_free(pow_region);
    gsl_vector_free(freqs);
    gsl_matrix_free(pow_mean);
    if (!ok) {
        gsl_vector_free(f_peak);
        return nullptr;
    }
    return f_peak;
}

gsl_vector * filt_pow_spectra_multiple_subjects(
        const gsl_matrix * signal, double TR, const BandPassFilter * bpf, double sigma
    ) {
    std::vector<const gsl_matrix *> subjects(1, signal);
    return _peak_frequencies(subjects, TR, bpf, sigma);
}

gsl_vector * filt_pow_spectra_multiple_subjects(
        const std::vector<gsl_matrix *>& signals, double TR, const BandPassFilter * bpf, double sigma
    ) {
    std::vector<const gsl_matrix *> subjects(signals.begin(), signals.end());
    return _peak_frequencies(subjects, TR, bpf, sigma);
}

gsl_vector * filt_pow_spectra_multiple_subjects(
        const std::map<std::string, gsl_matrix *>& signals, double TR, const BandPassFilter * bpf, double sigma
    ) {
    std::vector<const gsl_matrix *> subjects;
    for (const auto& pair : signals) {
        subjects.push_back(pair.second);
    }
    return _peak_frequencies(subjects, TR, bpf, sigma);
}

gsl_vector * filt_pow_spectra_multiple_subjects(
        const double * data, int n_subjects, int nodes, int tmax,
        double TR, const BandPassFilter * bpf, double sigma
    ) {
    if ((data == nullptr) || (n_subjects <= 0) || (nodes <= 0) || (tmax <= 0)) {
        std::cerr << "Error: invalid stacked signal of shape (" << n_subjects
            << ", " << nodes << ", " << tmax << ")" << std::endl;
        return nullptr;
    }
    // views on the subjects (no copy)
    std::vector<gsl_matrix_const_view> views;
    views.reserve(n_subjects);
    std::vector<const gsl_matrix *> subjects(n_subjects);
    for (int s = 0; s < n_subjects; s++) {
        views.push_back(gsl_matrix_const_view_array(
            data + (size_t)s * nodes * tmax, nodes, tmax));
        subjects[s] = &views[s].matrix;
    }
    return _peak_frequencies(subjects, TR, bpf, sigma);
}
