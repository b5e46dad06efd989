#include "seisstream/playback/playback_scheduler.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace seisstream {

namespace {

constexpr double DISPLAY_MARGIN = 0.1;

std::pair<double, double> paddedRange(double lo, double hi) {
    double span = hi - lo;
    if (span <= 0) {
        double pad = std::max(1.0, std::abs(lo) * DISPLAY_MARGIN);
        return {lo - pad, hi + pad};
    }
    return {lo - span * DISPLAY_MARGIN, hi + span * DISPLAY_MARGIN};
}

} // namespace

std::string playbackStateToString(PlaybackState state) {
    switch (state) {
        case PlaybackState::Stopped: return "stopped";
        case PlaybackState::Loaded: return "loaded";
        case PlaybackState::Playing: return "playing";
        case PlaybackState::Paused: return "paused";
        case PlaybackState::Seeking: return "seeking";
    }
    return "unknown";
}

PlaybackOptions PlaybackOptions::fromConfig(const Config& config) {
    PlaybackOptions opts;
    opts.window_length = config.getDouble("playback.window_length", opts.window_length);
    opts.frame_interval = config.getDouble("playback.frame_interval", opts.frame_interval);
    opts.speed = config.getDouble("playback.speed", opts.speed);
    opts.fast_step = config.getDouble("playback.fast_step", opts.fast_step);
    opts.loop = config.getBool("playback.loop", opts.loop);
    opts.auto_scale = config.getBool("playback.auto_scale", opts.auto_scale);
    return opts;
}

const std::vector<double>& PlaybackScheduler::speedPresets() {
    static const std::vector<double> presets = {0.25, 0.5, 1.0, 2.0, 4.0, 10.0};
    return presets;
}

PlaybackScheduler::PlaybackScheduler(const PlaybackOptions& options, PlaybackClockPtr clock)
    : options_(options)
    , clock_(std::move(clock))
    , state_(PlaybackState::Stopped)
    , position_(0)
    , total_(0)
    , speed_(options.speed > 0 ? options.speed : 1.0)
    , unlimited_(false)
    , window_length_(options.window_length > 0 ? options.window_length : 30.0)
    , sequence_(0)
    , position_emitted_(false)
    , last_emit_(0)
{
    if (!clock_) {
        clock_ = std::make_shared<SteadyPlaybackClock>();
    }
}

bool PlaybackScheduler::load(WaveformPtr waveform, CatalogPtr catalog) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != PlaybackState::Stopped || !waveform) return false;

    waveform_ = std::move(waveform);
    catalog_ = std::move(catalog);
    total_ = std::max<int64_t>(
        1, static_cast<int64_t>(secondsToDuration(waveform_->totalDuration()).count()));
    position_ = 0;
    position_emitted_ = false;
    sequence_ = 0;

    channels_.clear();
    display_range_.clear();
    for (const auto& trace : waveform_->traces()) {
        channels_.push_back(trace.streamId());
        display_range_[trace.streamId()] = paddedRange(trace.min(), trace.max());
    }

    state_ = PlaybackState::Loaded;
    return true;
}

bool PlaybackScheduler::unload() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PlaybackState::Stopped) return false;

    waveform_.reset();
    catalog_.reset();
    channels_.clear();
    display_range_.clear();
    position_ = 0;
    total_ = 0;
    position_emitted_ = false;
    state_ = PlaybackState::Stopped;
    return true;
}

bool PlaybackScheduler::play() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != PlaybackState::Loaded && state_ != PlaybackState::Paused) return false;

    state_ = PlaybackState::Playing;
    last_emit_ = clock_->now();
    return true;
}

bool PlaybackScheduler::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != PlaybackState::Playing) return false;

    state_ = PlaybackState::Paused;
    return true;
}

bool PlaybackScheduler::seek(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PlaybackState::Stopped || state_ == PlaybackState::Seeking) return false;
    if (std::isnan(seconds)) return false;

    PlaybackState resume = state_;
    state_ = PlaybackState::Seeking;

    double clamped = std::max(0.0, std::min(seconds, static_cast<double>(total_) / 1e6));
    position_ = std::min(static_cast<int64_t>(secondsToDuration(clamped).count()), total_ - 1);
    position_emitted_ = false;
    last_emit_ = clock_->now();

    state_ = resume;
    return true;
}

bool PlaybackScheduler::setSpeed(double multiplier) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PlaybackState::Seeking) return false;
    if (!(multiplier > 0.0 && multiplier <= 1000.0)) return false;

    speed_ = multiplier;
    unlimited_ = false;
    return true;
}

bool PlaybackScheduler::setUnlimitedSpeed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PlaybackState::Seeking) return false;

    unlimited_ = true;
    return true;
}

bool PlaybackScheduler::setChannels(const std::vector<StreamID>& channels) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PlaybackState::Stopped || state_ == PlaybackState::Seeking) return false;

    if (channels.empty()) {
        channels_.clear();
        for (const auto& trace : waveform_->traces()) {
            channels_.push_back(trace.streamId());
        }
        return true;
    }

    for (const auto& id : channels) {
        if (!waveform_->find(id)) return false;
    }
    channels_ = channels;
    return true;
}

bool PlaybackScheduler::setWindowLength(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PlaybackState::Seeking) return false;
    if (!(seconds > 0.0)) return false;

    window_length_ = seconds;
    return true;
}

void PlaybackScheduler::setLoop(bool loop) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.loop = loop;
}

int64_t PlaybackScheduler::stepMicros() const {
    double step = unlimited_ ? options_.fast_step : options_.frame_interval * speed_;
    return std::max<int64_t>(1, static_cast<int64_t>(secondsToDuration(step).count()));
}

PlaybackFrame PlaybackScheduler::render(int64_t position, uint64_t sequence) const {
    PlaybackFrame frame;
    frame.sequence = sequence;
    frame.virtual_time = position / 1e6;
    frame.time = waveform_->startTime() +
                 std::chrono::duration_cast<TimePoint::duration>(Duration(position));
    frame.window = TimeRange(addSeconds(frame.time, -window_length_), frame.time);
    frame.at_end = position >= total_ - 1;

    std::set<std::string> stations;
    for (const auto& id : channels_) {
        const Trace* trace = waveform_->find(id);
        if (!trace) continue;
        stations.insert(id.stationKey());

        Trace window = trace->slice(frame.window.start, frame.window.end);

        ChannelWindow cw;
        cw.id = id;
        cw.sample_rate = trace->sampleRate();
        cw.start = window.startTime();
        cw.samples = window.data();

        std::pair<double, double> range = display_range_.at(id);
        if (options_.auto_scale && !window.empty()) {
            range = paddedRange(window.min(), window.max());
        }
        cw.display_min = range.first;
        cw.display_max = range.second;
        frame.channels.push_back(std::move(cw));
    }

    if (catalog_) {
        for (const auto& pick : catalog_->picksBetween(frame.window.start, frame.window.end)) {
            if (stations.count(pick->stationKey())) frame.picks.push_back(pick);
        }
        frame.events = catalog_->eventsBetween(frame.window.start, frame.window.end);
    }
    return frame;
}

std::optional<PlaybackFrame> PlaybackScheduler::nextFrame() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != PlaybackState::Playing) return std::nullopt;

    Duration now = clock_->now();

    // First frame after load or seek shows the position itself. The pacing
    // anchor stays where play() or seek() put it.
    if (!position_emitted_) {
        position_emitted_ = true;
        return render(position_, sequence_++);
    }

    int64_t step = stepMicros();
    if (unlimited_) {
        last_emit_ = now;
    } else {
        // Virtual time follows clock time x speed however often we are polled
        Duration interval(std::max<int64_t>(
            1, static_cast<int64_t>(secondsToDuration(options_.frame_interval).count())));
        int64_t due = (now - last_emit_) / interval;
        if (due <= 0) {
            return std::nullopt;
        }
        last_emit_ += interval * due;
        step = due > (total_ / step) ? total_ : step * due;
    }

    int64_t next = position_ + step;
    if (next >= total_) {
        if (options_.loop) {
            next = 0;
        } else if (position_ >= total_ - 1) {
            state_ = PlaybackState::Paused;
            return std::nullopt;
        } else {
            next = total_ - 1;
        }
    }

    position_ = next;

    PlaybackFrame frame = render(position_, sequence_++);
    if (frame.at_end && !options_.loop) {
        state_ = PlaybackState::Paused;
    }
    return frame;
}

std::optional<PlaybackFrame> PlaybackScheduler::currentFrame() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == PlaybackState::Stopped) return std::nullopt;
    return render(position_, sequence_);
}

PlaybackState PlaybackScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

double PlaybackScheduler::virtualTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_ / 1e6;
}

double PlaybackScheduler::totalDuration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_ / 1e6;
}

double PlaybackScheduler::speed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return speed_;
}

bool PlaybackScheduler::isUnlimited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unlimited_;
}

double PlaybackScheduler::windowLength() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_length_;
}

std::vector<StreamID> PlaybackScheduler::channels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_;
}

} // namespace seisstream
