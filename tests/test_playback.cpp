/**
 * Unit tests for waveform playback
 */

#include "test_framework.hpp"
#include "seisstream/playback/playback_scheduler.hpp"
#include <cmath>
#include <limits>

using namespace seisstream;
using namespace seisstream::test;

namespace {

TimePoint t0() {
    return std::chrono::system_clock::from_time_t(1700000000);
}

const StreamID kVertical("XX", "A", "00", "HHZ");
const StreamID kNorth("XX", "A", "00", "HHN");

// 120 s at 10 Hz; samples hold their own index
WaveformPtr testWaveform() {
    std::vector<Trace> traces;
    for (const StreamID& id : {kVertical, kNorth}) {
        SampleVector data(1200);
        for (size_t i = 0; i < data.size(); i++) data[i] = static_cast<double>(i);
        traces.emplace_back(id, 10.0, t0(), data);
    }
    return std::make_shared<const Waveform>(traces);
}

struct Fixture {
    std::shared_ptr<ManualPlaybackClock> clock = std::make_shared<ManualPlaybackClock>();
    PlaybackScheduler scheduler;

    explicit Fixture(const PlaybackOptions& options = PlaybackOptions())
        : scheduler(options, clock)
    {
    }
};

} // namespace

// ============================================================================
// State Machine Tests
// ============================================================================

TEST(PlaybackScheduler, StateMachine) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;

    ASSERT_TRUE(s.state() == PlaybackState::Stopped);
    ASSERT_FALSE(s.play());
    ASSERT_FALSE(s.seek(10.0));
    ASSERT_FALSE(s.currentFrame().has_value());

    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.state() == PlaybackState::Loaded);
    ASSERT_FALSE(s.load(testWaveform()));
    ASSERT_FALSE(s.pause());

    ASSERT_TRUE(s.play());
    ASSERT_TRUE(s.state() == PlaybackState::Playing);
    ASSERT_FALSE(s.play());

    ASSERT_TRUE(s.pause());
    ASSERT_TRUE(s.state() == PlaybackState::Paused);
    ASSERT_FALSE(s.pause());

    ASSERT_TRUE(s.play());
    ASSERT_TRUE(s.unload());
    ASSERT_TRUE(s.state() == PlaybackState::Stopped);
    ASSERT_FALSE(s.unload());
}

TEST(PlaybackScheduler, LoadRejectsNull) {
    Fixture f;
    ASSERT_FALSE(f.scheduler.load(nullptr));
    ASSERT_TRUE(f.scheduler.state() == PlaybackState::Stopped);
}

TEST(PlaybackScheduler, StateNames) {
    ASSERT_EQ(playbackStateToString(PlaybackState::Stopped), std::string("stopped"));
    ASSERT_EQ(playbackStateToString(PlaybackState::Playing), std::string("playing"));
    ASSERT_EQ(playbackStateToString(PlaybackState::Seeking), std::string("seeking"));
}

// ============================================================================
// Timing Tests
// ============================================================================

TEST(PlaybackScheduler, FramesFollowClock) {
    PlaybackOptions opts;
    opts.frame_interval = 0.1;
    Fixture f(opts);
    PlaybackScheduler& s = f.scheduler;

    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.play());

    auto first = s.nextFrame();
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->sequence, 0u);
    ASSERT_NEAR(first->virtual_time, 0.0, 1e-12);

    ASSERT_FALSE(s.nextFrame().has_value());

    f.clock->advance(0.1);
    auto second = s.nextFrame();
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second->sequence, 1u);
    ASSERT_NEAR(second->virtual_time, 0.1, 1e-9);

    ASSERT_TRUE(s.setSpeed(4.0));
    f.clock->advance(0.1);
    auto third = s.nextFrame();
    ASSERT_TRUE(third.has_value());
    ASSERT_NEAR(third->virtual_time, 0.5, 1e-9);
}

TEST(PlaybackScheduler, SlowPollingKeepsPace) {
    PlaybackOptions opts;
    opts.frame_interval = 0.1;
    Fixture f(opts);
    PlaybackScheduler& s = f.scheduler;

    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.play());
    ASSERT_TRUE(s.nextFrame().has_value());

    // A front end that only draws once a second still plays at 1x
    for (int i = 0; i < 10; i++) {
        f.clock->advance(1.0);
        ASSERT_TRUE(s.nextFrame().has_value());
    }
    ASSERT_NEAR(s.virtualTime(), 10.0, 1e-6);

    // Polls between frame boundaries carry the remainder forward
    ASSERT_TRUE(s.setSpeed(2.0));
    for (int i = 0; i < 40; i++) {
        f.clock->advance(0.25);
        s.nextFrame();
    }
    ASSERT_NEAR(s.virtualTime(), 30.0, 1e-6);
}

TEST(PlaybackScheduler, ClockBeforeFirstFrameCounts) {
    PlaybackOptions opts;
    opts.frame_interval = 0.1;
    Fixture f(opts);
    PlaybackScheduler& s = f.scheduler;

    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.seek(5.0));
    ASSERT_TRUE(s.play());
    f.clock->advance(2.0);

    auto first = s.nextFrame();
    ASSERT_TRUE(first.has_value());
    ASSERT_NEAR(first->virtual_time, 5.0, 1e-9);

    auto second = s.nextFrame();
    ASSERT_TRUE(second.has_value());
    ASSERT_NEAR(second->virtual_time, 7.0, 1e-6);
}

TEST(PlaybackScheduler, PauseHoldsPosition) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;
    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.seek(20.0));
    ASSERT_TRUE(s.play());
    s.nextFrame();
    ASSERT_TRUE(s.pause());

    f.clock->advance(5.0);
    ASSERT_FALSE(s.nextFrame().has_value());
    ASSERT_NEAR(s.virtualTime(), 20.0, 1e-9);
}

TEST(PlaybackScheduler, SpeedValidation) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;
    ASSERT_FALSE(s.setSpeed(0.0));
    ASSERT_FALSE(s.setSpeed(-1.0));
    ASSERT_FALSE(s.setSpeed(5000.0));
    ASSERT_FALSE(s.setSpeed(std::numeric_limits<double>::quiet_NaN()));
    ASSERT_NEAR(s.speed(), 1.0, 1e-12);

    ASSERT_TRUE(s.setUnlimitedSpeed());
    ASSERT_TRUE(s.isUnlimited());
    ASSERT_TRUE(s.setSpeed(2.0));
    ASSERT_FALSE(s.isUnlimited());
    ASSERT_EQ(PlaybackScheduler::speedPresets().size(), 6u);
}

TEST(PlaybackScheduler, UnlimitedRunsToEnd) {
    PlaybackOptions opts;
    opts.fast_step = 10.0;
    Fixture f(opts);
    PlaybackScheduler& s = f.scheduler;

    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.setUnlimitedSpeed());
    ASSERT_TRUE(s.play());

    int frames = 0;
    bool saw_end = false;
    while (s.state() == PlaybackState::Playing && frames < 100) {
        auto frame = s.nextFrame();
        if (!frame) break;
        frames++;
        if (frame->at_end) saw_end = true;
    }

    // 0, 10, ..., 110 and the final position just before the end
    ASSERT_EQ(frames, 13);
    ASSERT_TRUE(saw_end);
    ASSERT_TRUE(s.state() == PlaybackState::Paused);
    ASSERT_LT(s.virtualTime(), 120.0);
    ASSERT_GT(s.virtualTime(), 119.99);
}

TEST(PlaybackScheduler, LoopWrapsAround) {
    PlaybackOptions opts;
    opts.fast_step = 50.0;
    opts.loop = true;
    Fixture f(opts);
    PlaybackScheduler& s = f.scheduler;

    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.setUnlimitedSpeed());
    ASSERT_TRUE(s.play());

    std::vector<double> times;
    for (int i = 0; i < 5; i++) {
        auto frame = s.nextFrame();
        ASSERT_TRUE(frame.has_value());
        times.push_back(frame->virtual_time);
    }

    ASSERT_NEAR(times[1], 50.0, 1e-9);
    ASSERT_NEAR(times[2], 100.0, 1e-9);
    ASSERT_NEAR(times[3], 0.0, 1e-9);
    ASSERT_TRUE(s.state() == PlaybackState::Playing);
}

// ============================================================================
// Seek and Rendering Tests
// ============================================================================

TEST(PlaybackScheduler, SeekClamps) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;
    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_NEAR(s.totalDuration(), 120.0, 1e-9);

    ASSERT_TRUE(s.seek(-5.0));
    ASSERT_NEAR(s.virtualTime(), 0.0, 1e-12);

    ASSERT_TRUE(s.seek(1000.0));
    ASSERT_LT(s.virtualTime(), 120.0);
    ASSERT_GT(s.virtualTime(), 119.99);

    ASSERT_FALSE(s.seek(std::numeric_limits<double>::quiet_NaN()));
    ASSERT_TRUE(s.state() == PlaybackState::Loaded);
}

TEST(PlaybackScheduler, SeekIsDeterministic) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;
    ASSERT_TRUE(s.load(testWaveform()));

    ASSERT_TRUE(s.seek(42.0));
    auto a = s.currentFrame();
    ASSERT_TRUE(s.seek(10.0));
    ASSERT_TRUE(s.seek(42.0));
    auto b = s.currentFrame();

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(a->channels.size(), 2u);
    ASSERT_TRUE(a->channels[0].samples == b->channels[0].samples);
    ASSERT_TRUE(a->window.start == b->window.start);

    // Window [12, 42) at 10 Hz
    ASSERT_EQ(a->channels[0].samples.size(), 300u);
    ASSERT_NEAR(a->channels[0].samples.front(), 120.0, 1e-12);
    ASSERT_TRUE(a->channels[0].start == addSeconds(t0(), 12.0));
}

TEST(PlaybackScheduler, SeekWhilePlayingShowsPosition) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;
    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.play());
    s.nextFrame();

    ASSERT_TRUE(s.seek(60.0));
    ASSERT_TRUE(s.state() == PlaybackState::Playing);
    auto frame = s.nextFrame();
    ASSERT_TRUE(frame.has_value());
    ASSERT_NEAR(frame->virtual_time, 60.0, 1e-9);
}

TEST(PlaybackScheduler, ChannelChangeOnNextFrame) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;
    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_TRUE(s.play());

    auto before = s.nextFrame();
    ASSERT_EQ(before->channels.size(), 2u);

    ASSERT_TRUE(s.setChannels({kNorth}));
    f.clock->advance(0.1);
    auto after = s.nextFrame();
    ASSERT_TRUE(after.has_value());
    ASSERT_EQ(after->channels.size(), 1u);
    ASSERT_TRUE(after->channels[0].id == kNorth);

    // Unknown channel leaves the selection alone
    ASSERT_FALSE(s.setChannels({StreamID("XX", "Z", "00", "HHZ")}));
    ASSERT_EQ(s.channels().size(), 1u);

    // Empty selection restores every channel
    ASSERT_TRUE(s.setChannels({}));
    ASSERT_EQ(s.channels().size(), 2u);
}

TEST(PlaybackScheduler, WindowLength) {
    Fixture f;
    PlaybackScheduler& s = f.scheduler;
    ASSERT_TRUE(s.load(testWaveform()));
    ASSERT_FALSE(s.setWindowLength(0.0));
    ASSERT_FALSE(s.setWindowLength(-3.0));
    ASSERT_TRUE(s.setWindowLength(10.0));
    ASSERT_NEAR(s.windowLength(), 10.0, 1e-12);

    ASSERT_TRUE(s.seek(50.0));
    auto frame = s.currentFrame();
    ASSERT_EQ(frame->channels[0].samples.size(), 100u);
}

TEST(PlaybackScheduler, DisplayRange) {
    PlaybackOptions opts;
    Fixture fixed(opts);
    ASSERT_TRUE(fixed.scheduler.load(testWaveform()));
    ASSERT_TRUE(fixed.scheduler.seek(42.0));
    auto a = fixed.scheduler.currentFrame();
    ASSERT_LT(a->channels[0].display_min, 0.0);
    ASSERT_GT(a->channels[0].display_max, 1199.0);

    opts.auto_scale = true;
    Fixture scaled(opts);
    ASSERT_TRUE(scaled.scheduler.load(testWaveform()));
    ASSERT_TRUE(scaled.scheduler.seek(42.0));
    auto b = scaled.scheduler.currentFrame();
    ASSERT_GT(b->channels[0].display_min, 80.0);
    ASSERT_LT(b->channels[0].display_max, 460.0);
}

TEST(PlaybackScheduler, CatalogOverlay) {
    auto catalog = std::make_shared<Catalog>();

    Pick visible;
    visible.stream_id = kVertical;
    visible.phase_type = PhaseType::P;
    visible.time = addSeconds(t0(), 30.0);
    visible.probability = 0.9;

    Pick other_station = visible;
    other_station.stream_id = StreamID("XX", "B", "00", "HHZ");

    Pick outside = visible;
    outside.time = addSeconds(t0(), 80.0);

    auto stored = catalog->addPicks({visible, other_station, outside});

    Event event("ev000001");
    Origin origin;
    origin.time = addSeconds(t0(), 28.0);
    event.setOrigin(origin);
    event.setPickIds({stored[0]->id});
    catalog->upsertEvent(event);

    Fixture f;
    ASSERT_TRUE(f.scheduler.load(testWaveform(), catalog));
    ASSERT_TRUE(f.scheduler.seek(40.0));
    auto frame = f.scheduler.currentFrame();

    ASSERT_EQ(frame->picks.size(), 1u);
    ASSERT_EQ(frame->picks[0]->id, stored[0]->id);
    ASSERT_EQ(frame->events.size(), 1u);
    ASSERT_EQ(frame->events[0]->id(), std::string("ev000001"));

    // Picks added later show up without reloading
    Pick late = visible;
    late.time = addSeconds(t0(), 35.0);
    late.phase_type = PhaseType::S;
    catalog->addPicks({late});
    frame = f.scheduler.currentFrame();
    ASSERT_EQ(frame->picks.size(), 2u);
}

TEST(PlaybackScheduler, FromConfig) {
    Config config;
    config.parse("[playback]\nwindow_length = 45\nspeed = 2\nloop = true\n");
    PlaybackOptions opts = PlaybackOptions::fromConfig(config);
    ASSERT_NEAR(opts.window_length, 45.0, 1e-12);
    ASSERT_NEAR(opts.speed, 2.0, 1e-12);
    ASSERT_TRUE(opts.loop);
    ASSERT_FALSE(opts.auto_scale);
}
