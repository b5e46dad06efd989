#pragma once

#include "seisstream/core/config.hpp"
#include "seisstream/core/waveform.hpp"
#include "seisstream/catalog/catalog.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace seisstream {

enum class PlaybackState {
    Stopped,
    Loaded,
    Playing,
    Paused,
    Seeking
};

std::string playbackStateToString(PlaybackState state);

/**
 * PlaybackClock - Monotonic time source used to pace frames
 */
class PlaybackClock {
public:
    virtual ~PlaybackClock() = default;
    virtual Duration now() const = 0;
};

using PlaybackClockPtr = std::shared_ptr<PlaybackClock>;

class SteadyPlaybackClock : public PlaybackClock {
public:
    Duration now() const override {
        return std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now().time_since_epoch());
    }
};

// Clock advanced by hand, for tests and headless stepping
class ManualPlaybackClock : public PlaybackClock {
public:
    ManualPlaybackClock() : now_(0) {}

    Duration now() const override { return now_; }
    void advance(double seconds) { now_ += secondsToDuration(seconds); }

private:
    Duration now_;
};

struct PlaybackOptions {
    double window_length = 30.0;     // Visible seconds per frame
    double frame_interval = 0.1;     // Wall seconds between frames
    double speed = 1.0;
    double fast_step = 10.0;         // Virtual seconds per frame at unlimited speed
    bool loop = false;               // Restart at 0 instead of pausing at the end
    bool auto_scale = false;         // Display range from the visible window

    static PlaybackOptions fromConfig(const Config& config);
};

/**
 * ChannelWindow - Samples of one channel inside a frame's window
 */
struct ChannelWindow {
    StreamID id;
    double sample_rate = 0;
    TimePoint start;                 // Time of the first sample
    SampleVector samples;
    double display_min = 0;
    double display_max = 0;
};

/**
 * PlaybackFrame - Everything a front end needs to draw one frame
 */
struct PlaybackFrame {
    uint64_t sequence = 0;
    double virtual_time = 0;         // Seconds from the waveform start
    TimePoint time;
    TimeRange window;                // [time - window_length, time)
    std::vector<ChannelWindow> channels;
    std::vector<PickPtr> picks;
    std::vector<EventPtr> events;
    bool at_end = false;
};

/**
 * PlaybackScheduler - Virtual clock replaying a loaded waveform
 *
 * Pull based: the front end calls nextFrame() from its own loop and draws
 * whatever comes back. While playing, a frame is due every frame_interval
 * of clock time and virtual time advances by the elapsed whole intervals
 * x frame_interval x speed, so playback keeps pace with the clock even when
 * polled late. In unlimited mode every call yields a frame advanced by
 * fast_step. Virtual time is kept in integer microseconds, so seeking to
 * the same position always renders the same window.
 *
 * Commands return false and leave the state unchanged when they are not
 * valid in the current state or get an invalid argument. Channel and
 * window changes apply from the next rendered frame.
 *
 * All methods are thread-safe. The catalog is only read.
 */
class PlaybackScheduler {
public:
    explicit PlaybackScheduler(const PlaybackOptions& options = PlaybackOptions(),
                               PlaybackClockPtr clock = std::make_shared<SteadyPlaybackClock>());

    bool load(WaveformPtr waveform, CatalogPtr catalog = nullptr);
    bool unload();

    bool play();
    bool pause();
    bool seek(double seconds);
    bool reset() { return seek(0.0); }

    bool setSpeed(double multiplier);
    bool setUnlimitedSpeed();
    bool setChannels(const std::vector<StreamID>& channels);
    bool setWindowLength(double seconds);
    void setLoop(bool loop);

    // Next frame when one is due while playing
    std::optional<PlaybackFrame> nextFrame();
    // Frame at the current position without advancing
    std::optional<PlaybackFrame> currentFrame() const;

    PlaybackState state() const;
    double virtualTime() const;
    double totalDuration() const;
    double speed() const;
    bool isUnlimited() const;
    double windowLength() const;
    std::vector<StreamID> channels() const;

    static const std::vector<double>& speedPresets();

private:
    mutable std::mutex mutex_;
    PlaybackOptions options_;
    PlaybackClockPtr clock_;

    WaveformPtr waveform_;
    CatalogPtr catalog_;
    PlaybackState state_;

    int64_t position_;               // Virtual time (us from start)
    int64_t total_;                  // Waveform length (us)
    double speed_;
    bool unlimited_;
    double window_length_;
    std::vector<StreamID> channels_;
    std::map<StreamID, std::pair<double, double>> display_range_;

    uint64_t sequence_;
    bool position_emitted_;          // Frame at position_ already handed out
    Duration last_emit_;

    int64_t stepMicros() const;
    PlaybackFrame render(int64_t position, uint64_t sequence) const;
};

} // namespace seisstream
