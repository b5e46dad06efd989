#include "seisstream/core/waveform.hpp"
#include "seisstream/core/errors.hpp"
#include <cmath>
#include <algorithm>
#include <ctime>
#include <cstdio>

namespace seisstream {

std::string formatTime(TimePoint t) {
    auto us = std::chrono::duration_cast<Duration>(t.time_since_epoch()).count();
    int64_t secs = us / 1000000;
    int64_t frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }
    std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                  static_cast<int>(frac / 1000));
    return buf;
}

std::string TimeRange::toString() const {
    return formatTime(start) + " - " + formatTime(end);
}

size_t Trace::firstIndexAtOrAfter(TimePoint t) const {
    if (data_.empty() || t <= start_time_) return 0;
    double offset = secondsBetween(t, start_time_);
    int64_t guess = static_cast<int64_t>(std::ceil(offset * sample_rate_));
    if (guess < 0) guess = 0;
    size_t idx = static_cast<size_t>(guess);
    // Correct for rounding in timeAt()
    while (idx > 0 && timeAt(idx - 1) >= t) idx--;
    while (idx < data_.size() && timeAt(idx) < t) idx++;
    return std::min(idx, data_.size());
}

void Trace::detrend() {
    if (data_.size() < 2) return;
    size_t n = data_.size();
    double sx = 0, sy = 0, sxy = 0, sxx = 0;
    for (size_t i = 0; i < n; i++) {
        double x = static_cast<double>(i);
        sx += x;
        sy += data_[i];
        sxy += x * data_[i];
        sxx += x * x;
    }
    double denom = n * sxx - sx * sx;
    if (denom == 0) return;
    double slope = (n * sxy - sx * sy) / denom;
    double intercept = (sy - slope * sx) / n;
    for (size_t i = 0; i < n; i++) {
        data_[i] -= (slope * i + intercept);
    }
}

void Trace::taper(double seconds) {
    if (data_.empty() || seconds <= 0) return;
    size_t taper_len = static_cast<size_t>(seconds * sample_rate_);
    taper_len = std::min(taper_len, data_.size() / 2);
    if (taper_len < 1) return;

    for (size_t i = 0; i < taper_len; i++) {
        double w = 0.5 * (1.0 - std::cos(M_PI * i / taper_len));
        data_[i] *= w;
        data_[data_.size() - 1 - i] *= w;
    }
}

Trace Trace::slice(TimePoint start, TimePoint end) const {
    size_t s = firstIndexAtOrAfter(start);
    size_t e = firstIndexAtOrAfter(end);
    Trace result(stream_id_, sample_rate_, timeAt(s));
    if (s < e) {
        result.data_.assign(data_.begin() + s, data_.begin() + e);
    }
    return result;
}

Trace Trace::resample(double new_rate) const {
    if (data_.empty() || new_rate <= 0 || new_rate == sample_rate_) {
        return *this;
    }

    Trace result(stream_id_, new_rate, start_time_);

    double ratio = sample_rate_ / new_rate;
    size_t new_size = static_cast<size_t>(data_.size() / ratio);
    result.data_.resize(new_size);

    for (size_t i = 0; i < new_size; i++) {
        double src_idx = i * ratio;
        size_t idx0 = static_cast<size_t>(src_idx);
        size_t idx1 = idx0 + 1;
        double frac = src_idx - idx0;

        if (idx1 >= data_.size()) {
            result.data_[i] = data_.back();
        } else {
            result.data_[i] = data_[idx0] * (1.0 - frac) + data_[idx1] * frac;
        }
    }

    return result;
}

Waveform::Waveform(std::vector<Trace> traces)
    : traces_(std::move(traces))
{
    if (traces_.empty()) {
        throw FormatError("Waveform: no channels");
    }

    std::sort(traces_.begin(), traces_.end(),
              [](const Trace& a, const Trace& b) { return a.streamId() < b.streamId(); });

    for (size_t i = 1; i < traces_.size(); i++) {
        if (traces_[i].streamId() == traces_[i - 1].streamId()) {
            throw FormatError("Waveform: duplicate channel " + traces_[i].streamId().toString());
        }
    }

    start_time_ = traces_.front().startTime();
    end_time_ = traces_.front().endTime();

    for (const auto& trace : traces_) {
        if (!(trace.sampleRate() > 0)) {
            throw FormatError("Waveform: invalid sample rate on " +
                              trace.streamId().toString());
        }

        std::string key = trace.streamId().stationKey();
        auto it = station_rates_.find(key);
        if (it == station_rates_.end()) {
            station_rates_[key] = trace.sampleRate();
        } else if (std::abs(it->second - trace.sampleRate()) > 1e-9) {
            throw FormatError("Waveform: inconsistent sample rates within station " + key +
                              " (" + std::to_string(it->second) + " vs " +
                              std::to_string(trace.sampleRate()) + " Hz)");
        }

        start_time_ = std::min(start_time_, trace.startTime());
        end_time_ = std::max(end_time_, trace.endTime());
    }
}

std::vector<std::string> Waveform::stations() const {
    std::vector<std::string> result;
    for (const auto& [key, rate] : station_rates_) {
        result.push_back(key);
    }
    return result;
}

std::vector<const Trace*> Waveform::tracesForStation(const std::string& station_key) const {
    std::vector<const Trace*> result;
    for (const auto& trace : traces_) {
        if (trace.streamId().stationKey() == station_key) {
            result.push_back(&trace);
        }
    }
    return result;
}

const Trace* Waveform::find(const StreamID& id) const {
    for (const auto& trace : traces_) {
        if (trace.streamId() == id) return &trace;
    }
    return nullptr;
}

double Waveform::sampleRate(const std::string& station_key) const {
    auto it = station_rates_.find(station_key);
    return it != station_rates_.end() ? it->second : 0.0;
}

} // namespace seisstream
