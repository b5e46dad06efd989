#pragma once

#include "types.hpp"
#include <memory>
#include <algorithm>
#include <numeric>
#include <cmath>
#include <map>

namespace seisstream {

/**
 * Trace - Continuous samples of a single channel
 */
class Trace {
public:
    Trace() : sample_rate_(0) {}

    Trace(const StreamID& id, double sample_rate, TimePoint start_time)
        : stream_id_(id), sample_rate_(sample_rate), start_time_(start_time) {}

    Trace(const StreamID& id, double sample_rate, TimePoint start_time, SampleVector data)
        : stream_id_(id), sample_rate_(sample_rate), start_time_(start_time)
        , data_(std::move(data)) {}

    // Accessors
    const StreamID& streamId() const { return stream_id_; }
    double sampleRate() const { return sample_rate_; }
    TimePoint startTime() const { return start_time_; }

    // Time just past the last sample
    TimePoint endTime() const { return timeAt(data_.size()); }

    size_t sampleCount() const { return data_.size(); }
    bool empty() const { return data_.empty(); }
    double duration() const { return sample_rate_ > 0 ? data_.size() / sample_rate_ : 0.0; }

    // Data access
    const SampleVector& data() const { return data_; }
    SampleVector& data() { return data_; }

    Sample operator[](size_t idx) const { return data_[idx]; }
    Sample& operator[](size_t idx) { return data_[idx]; }

    void append(const SampleVector& samples) {
        data_.insert(data_.end(), samples.begin(), samples.end());
    }

    // Get time for index
    TimePoint timeAt(size_t idx) const {
        auto dur = Duration(static_cast<int64_t>(std::llround(idx * 1e6 / sample_rate_)));
        return start_time_ + std::chrono::duration_cast<TimePoint::duration>(dur);
    }

    // Smallest index whose sample time is >= t (may equal sampleCount())
    size_t firstIndexAtOrAfter(TimePoint t) const;

    // Statistical operations
    Sample mean() const {
        if (data_.empty()) return 0;
        return std::accumulate(data_.begin(), data_.end(), 0.0) / data_.size();
    }

    Sample min() const {
        if (data_.empty()) return 0;
        return *std::min_element(data_.begin(), data_.end());
    }

    Sample max() const {
        if (data_.empty()) return 0;
        return *std::max_element(data_.begin(), data_.end());
    }

    // Processing operations
    void demean() {
        Sample m = mean();
        for (auto& s : data_) s -= m;
    }

    // Remove least-squares linear trend
    void detrend();

    // Cosine taper over `seconds` at both ends, capped at half the trace
    void taper(double seconds);

    // Samples whose time lies in [start, end)
    Trace slice(TimePoint start, TimePoint end) const;

    // Linear interpolation to a new rate
    Trace resample(double new_rate) const;

private:
    StreamID stream_id_;
    double sample_rate_;
    TimePoint start_time_;
    SampleVector data_;
};

/**
 * Waveform - Immutable multi-channel recording
 *
 * Channels are kept in StreamID order. All channels of one station must
 * share a sample rate; construction throws FormatError otherwise.
 */
class Waveform {
public:
    explicit Waveform(std::vector<Trace> traces);

    const std::vector<Trace>& traces() const { return traces_; }
    size_t channelCount() const { return traces_.size(); }

    TimePoint startTime() const { return start_time_; }
    TimePoint endTime() const { return end_time_; }
    double totalDuration() const { return secondsBetween(end_time_, start_time_); }

    // Station keys ("NET.STA") in sorted order
    std::vector<std::string> stations() const;

    std::vector<const Trace*> tracesForStation(const std::string& station_key) const;
    const Trace* find(const StreamID& id) const;

    // Common sample rate of a station's channels, 0 if unknown
    double sampleRate(const std::string& station_key) const;

private:
    std::vector<Trace> traces_;
    std::map<std::string, double> station_rates_;
    TimePoint start_time_;
    TimePoint end_time_;
};

using WaveformPtr = std::shared_ptr<const Waveform>;

} // namespace seisstream
