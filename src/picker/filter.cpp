#include "seisstream/picker/filter.hpp"
#include <cmath>
#include <complex>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace seisstream {

void IIRFilter::appendSections(IIRFilter& filter, int order, double cutoff,
                               double sample_rate, bool highpass) {
    double nyq = sample_rate / 2.0;
    if (order < 1) {
        throw std::invalid_argument("IIRFilter: order must be >= 1");
    }
    if (!(cutoff > 0 && cutoff < nyq)) {
        throw std::invalid_argument("IIRFilter: cutoff " + std::to_string(cutoff) +
                                    " Hz outside (0, " + std::to_string(nyq) + ")");
    }

    double w0 = 2.0 * M_PI * cutoff / sample_rate;
    double cs = std::cos(w0);
    double sn = std::sin(w0);

    // Conjugate pole pairs of the analog prototype
    for (int k = 0; k < order / 2; k++) {
        double q = 1.0 / (2.0 * std::sin((2.0 * k + 1.0) * M_PI / (2.0 * order)));
        double alpha = sn / (2.0 * q);
        double a0 = 1.0 + alpha;

        Section s;
        if (highpass) {
            s.b0 = (1.0 + cs) / 2.0 / a0;
            s.b1 = -(1.0 + cs) / a0;
            s.b2 = (1.0 + cs) / 2.0 / a0;
        } else {
            s.b0 = (1.0 - cs) / 2.0 / a0;
            s.b1 = (1.0 - cs) / a0;
            s.b2 = (1.0 - cs) / 2.0 / a0;
        }
        s.a1 = -2.0 * cs / a0;
        s.a2 = (1.0 - alpha) / a0;
        filter.sections_.push_back(s);
    }

    // Real pole for odd orders
    if (order % 2 == 1) {
        double k = std::tan(w0 / 2.0);
        Section s;
        if (highpass) {
            s.b0 = 1.0 / (1.0 + k);
            s.b1 = -1.0 / (1.0 + k);
        } else {
            s.b0 = k / (1.0 + k);
            s.b1 = k / (1.0 + k);
        }
        s.b2 = 0.0;
        s.a1 = (k - 1.0) / (k + 1.0);
        s.a2 = 0.0;
        filter.sections_.push_back(s);
    }
}

IIRFilter IIRFilter::butterworth(int order, double low_freq, double high_freq,
                                 double sample_rate) {
    if (!(low_freq < high_freq)) {
        throw std::invalid_argument("IIRFilter: low corner must be below high corner");
    }
    IIRFilter filter;
    appendSections(filter, order, low_freq, sample_rate, true);
    appendSections(filter, order, high_freq, sample_rate, false);
    return filter;
}

IIRFilter IIRFilter::butterworthLowpass(int order, double cutoff, double sample_rate) {
    IIRFilter filter;
    appendSections(filter, order, cutoff, sample_rate, false);
    return filter;
}

IIRFilter IIRFilter::butterworthHighpass(int order, double cutoff, double sample_rate) {
    IIRFilter filter;
    appendSections(filter, order, cutoff, sample_rate, true);
    return filter;
}

void IIRFilter::apply(SampleVector& data) const {
    for (const auto& s : sections_) {
        // Direct form II transposed
        double z1 = 0.0, z2 = 0.0;
        for (auto& x : data) {
            double y = s.b0 * x + z1;
            z1 = s.b1 * x - s.a1 * y + z2;
            z2 = s.b2 * x - s.a2 * y;
            x = y;
        }
    }
}

SampleVector IIRFilter::filter(const SampleVector& data) const {
    SampleVector result = data;
    apply(result);
    return result;
}

SampleVector IIRFilter::filtfilt(const SampleVector& data) const {
    SampleVector result = data;
    apply(result);
    std::reverse(result.begin(), result.end());
    apply(result);
    std::reverse(result.begin(), result.end());
    return result;
}

double IIRFilter::gain(double freq, double sample_rate) const {
    std::complex<double> z = std::polar(1.0, -2.0 * M_PI * freq / sample_rate);
    std::complex<double> h(1.0, 0.0);
    for (const auto& s : sections_) {
        std::complex<double> num = s.b0 + s.b1 * z + s.b2 * z * z;
        std::complex<double> den = 1.0 + s.a1 * z + s.a2 * z * z;
        h *= num / den;
    }
    return std::abs(h);
}

} // namespace seisstream
