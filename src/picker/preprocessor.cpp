#include "seisstream/picker/preprocessor.hpp"
#include <algorithm>
#include <iostream>

namespace seisstream {

std::string filterTypeToString(FilterType type) {
    switch (type) {
        case FilterType::Bandpass: return "bandpass";
        case FilterType::Highpass: return "highpass";
        case FilterType::Lowpass: return "lowpass";
        default: return "none";
    }
}

FilterType stringToFilterType(const std::string& s) {
    if (s == "bandpass") return FilterType::Bandpass;
    if (s == "highpass") return FilterType::Highpass;
    if (s == "lowpass") return FilterType::Lowpass;
    return FilterType::None;
}

PreprocessConfig PreprocessConfig::fromConfig(const Config& config) {
    PreprocessConfig pc;
    pc.demean = config.getBool("preprocess.demean", pc.demean);
    pc.detrend = config.getBool("preprocess.detrend", pc.detrend);
    pc.taper_length = config.getDouble("preprocess.taper_length", pc.taper_length);
    pc.filter = stringToFilterType(config.getString("preprocess.filter",
                                                    filterTypeToString(pc.filter)));
    pc.freq_min = config.getDouble("preprocess.freq_min", pc.freq_min);
    pc.freq_max = config.getDouble("preprocess.freq_max", pc.freq_max);
    pc.order = config.getInt("preprocess.order", pc.order);
    pc.zero_phase = config.getBool("preprocess.zero_phase", pc.zero_phase);
    return pc;
}

Preprocessor::Preprocessor(const PreprocessConfig& config)
    : config_(config)
{
}

IIRFilter Preprocessor::designFilter(double sample_rate) const {
    double nyq = sample_rate / 2.0;
    double high = std::min(config_.freq_max, nyq - 0.1);

    switch (config_.filter) {
        case FilterType::Bandpass:
            if (config_.freq_min < high) {
                return IIRFilter::butterworth(config_.order, config_.freq_min, high, sample_rate);
            }
            std::cerr << "Preprocessor: band " << config_.freq_min << "-" << config_.freq_max
                      << " Hz does not fit " << sample_rate << " Hz data, using highpass"
                      << std::endl;
            return IIRFilter::butterworthHighpass(config_.order, config_.freq_min, sample_rate);
        case FilterType::Highpass:
            return IIRFilter::butterworthHighpass(config_.order, config_.freq_min, sample_rate);
        case FilterType::Lowpass:
            return IIRFilter::butterworthLowpass(config_.order, high, sample_rate);
        default:
            return IIRFilter();
    }
}

Trace Preprocessor::process(const Trace& trace) const {
    Trace result = trace;
    if (result.empty()) return result;

    if (config_.demean) result.demean();
    if (config_.detrend) result.detrend();
    result.taper(config_.taper_length);

    IIRFilter filter = designFilter(result.sampleRate());
    if (!filter.empty()) {
        if (config_.zero_phase) {
            result.data() = filter.filtfilt(result.data());
        } else {
            filter.apply(result.data());
        }
    }
    return result;
}

Chunk Preprocessor::process(const Chunk& chunk) const {
    Chunk result;
    result.index = chunk.index;
    result.core = chunk.core;
    result.span = chunk.span;
    result.overlap = chunk.overlap;
    result.last = chunk.last;
    result.traces.reserve(chunk.traces.size());

    for (const auto& trace : chunk.traces) {
        result.traces.push_back(process(trace));
    }
    return result;
}

} // namespace seisstream
