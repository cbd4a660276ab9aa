#ifndef BPF_HPP
#define BPF_HPP
#include <map>
#include <string>
#include <vector>
#include <gsl/gsl_matrix_double.h>

// Filters time series (time, regions) along the time axis
class BandPassFilter {
public:
    virtual ~BandPassFilter() = default;
    // ts and out have the same shape; returns false on failure
    virtual bool filter(const gsl_matrix * ts, gsl_matrix * out) const = 0;
};

/*
Zero-phase Butterworth band-pass filter of order k (same as
scipy.signal.butter(k, [flp, fhi], 'band') applied by filtfilt):
the analog prototype is transformed to a band-pass and discretized
by the bilinear transform with prewarped band edges, then run as
k second-order sections forward and then backward in time. The
resulting gain is 1 at the center of the band and 1/2 at flp and fhi.
Optionally the time series are demeaned, linearly detrended and
clipped to +-3 SD (strong artefacts) before filtering.
*/
class ButterworthBandPassFilter : public BandPassFilter {
public:
    struct Config {
        double flp{0.01}; // (Hz) lowpass frequency of filter
        double fhi{0.1}; // (Hz) highpass frequency of filter
        int k{2}; // filter order
        bool demean{true};
        bool detrend{true};
        bool remove_artefacts{false};
    };

    // TR: sampling interval in seconds
    ButterworthBandPassFilter(double TR) : TR{TR} {};
    ButterworthBandPassFilter(double TR, double flp, double fhi, int k = 2) : TR{TR} {
        conf.flp = flp;
        conf.fhi = fhi;
        conf.k = k;
    };

    double TR;
    Config conf;

    // may throw std::invalid_argument on values that are not numbers
    void set_conf(std::map<std::string, std::string> config_map);
    void print_config();

    bool filter(const gsl_matrix * ts, gsl_matrix * out) const override;

    // b = [b0, b1, b2], a = [1, a1, a2]
    struct Biquad {
        double b0{0}, b1{0}, b2{0}, a1{0}, a2{0};
    };
    // second-order sections of the band-pass of the given order
    // at sampling frequency fs, empty if the design fails
    static std::vector<Biquad> design(double fs, double flp, double fhi, int order);
};

#endif
