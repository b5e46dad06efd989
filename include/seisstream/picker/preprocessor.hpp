#pragma once

#include "seisstream/core/types.hpp"
#include "seisstream/core/config.hpp"
#include "seisstream/stream/chunked_reader.hpp"
#include "filter.hpp"
#include <string>

namespace seisstream {

enum class FilterType {
    None,
    Bandpass,
    Highpass,
    Lowpass
};

std::string filterTypeToString(FilterType type);
FilterType stringToFilterType(const std::string& s);

struct PreprocessConfig {
    bool demean = true;
    bool detrend = true;
    double taper_length = 2.0;        // Seconds at each edge
    FilterType filter = FilterType::Bandpass;
    double freq_min = 1.0;            // Hz
    double freq_max = 20.0;           // Hz, capped below Nyquist
    int order = 4;
    bool zero_phase = false;

    static PreprocessConfig fromConfig(const Config& config);
};

/**
 * Preprocessor - Conditions a chunk before inference
 *
 * Per trace: demean, remove the linear trend, taper both edges, then
 * filter. The taper keeps filter transients inside the overlap margins.
 * Output has the same channels, start times and sample counts as the
 * input, and identical input always yields identical output.
 */
class Preprocessor {
public:
    explicit Preprocessor(const PreprocessConfig& config = PreprocessConfig());

    Chunk process(const Chunk& chunk) const;
    Trace process(const Trace& trace) const;

    const PreprocessConfig& config() const { return config_; }

private:
    PreprocessConfig config_;

    IIRFilter designFilter(double sample_rate) const;
};

} // namespace seisstream
