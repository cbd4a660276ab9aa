#ifndef FILTERPS_HPP
#define FILTERPS_HPP
#include <map>
#include <string>
#include <vector>
#include <gsl/gsl_matrix_double.h>
#include <gsl/gsl_vector_double.h>
#include "brainmf/bpf.hpp"

/*
Power spectra of narrowly band-pass filtered BOLD signals and
the frequency of maximal power in each region.

All returned gsl objects are allocated by the functions and must
be freed by the caller. nullptr is returned on failure.
*/

// same as MATLAB conv(u, v, 'same')
extern gsl_vector * conv(const gsl_vector * u, const gsl_vector * v);

// Gaussian smoothing of z(t) with standard deviation sigma, corrected
// for the edge effect of the convolution.
// Note: t must be uniformly spaced, which is not checked
extern gsl_vector * gaussfilt(const gsl_vector * t, const gsl_vector * z, double sigma);

// signal: (regions, time), TR: sampling interval (s)
// returns the power spectra (floor(time/2), regions)
extern gsl_matrix * filt_pow_spectra(
    const gsl_matrix * signal, double TR, const BandPassFilter * bpf);

// frequency of maximal (subject-averaged and smoothed) power
// in each region, returns (regions,)
extern gsl_vector * filt_pow_spectra_multiple_subjects(
    const gsl_matrix * signal, double TR, const BandPassFilter * bpf,
    double sigma = 0.01);

extern gsl_vector * filt_pow_spectra_multiple_subjects(
    const std::vector<gsl_matrix *>& signals, double TR, const BandPassFilter * bpf,
    double sigma = 0.01);

extern gsl_vector * filt_pow_spectra_multiple_subjects(
    const std::map<std::string, gsl_matrix *>& signals, double TR, const BandPassFilter * bpf,
    double sigma = 0.01);

// stacked subjects in a C-contiguous (subjects, regions, time) buffer
extern gsl_vector * filt_pow_spectra_multiple_subjects(
    const double * data, int n_subjects, int nodes, int tmax,
    double TR, const BandPassFilter * bpf, double sigma = 0.01);

#endif
