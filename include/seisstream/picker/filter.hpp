#pragma once

#include "seisstream/core/types.hpp"
#include <vector>

namespace seisstream {

/**
 * IIRFilter - Butterworth filter as a cascade of second-order sections
 *
 * Sections are designed with the bilinear transform and frequency
 * prewarping. Filtering always starts from zero state, so the output
 * depends only on the input.
 */
class IIRFilter {
public:
    struct Section {
        double b0, b1, b2;
        double a1, a2;   // a0 normalized to 1
    };

    IIRFilter() = default;

    // Butterworth bandpass: highpass at low_freq cascaded with lowpass at high_freq
    static IIRFilter butterworth(int order, double low_freq, double high_freq,
                                 double sample_rate);

    static IIRFilter butterworthLowpass(int order, double cutoff, double sample_rate);

    static IIRFilter butterworthHighpass(int order, double cutoff, double sample_rate);

    // Causal filtering (in-place)
    void apply(SampleVector& data) const;

    // Causal filtering (copy)
    SampleVector filter(const SampleVector& data) const;

    // Zero-phase filtering (forward-backward)
    SampleVector filtfilt(const SampleVector& data) const;

    // Magnitude response at a frequency
    double gain(double freq, double sample_rate) const;

    const std::vector<Section>& sections() const { return sections_; }
    bool empty() const { return sections_.empty(); }

private:
    std::vector<Section> sections_;

    static void appendSections(IIRFilter& filter, int order, double cutoff,
                               double sample_rate, bool highpass);
};

} // namespace seisstream
