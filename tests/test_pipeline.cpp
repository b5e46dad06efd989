/**
 * Integration tests for the streaming detection pipeline
 */

#include "test_framework.hpp"
#include "seisstream/pipeline/detection_pipeline.hpp"
#include "seisstream/core/errors.hpp"
#include "seisstream/core/synthetic.hpp"
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

using namespace seisstream;
using namespace seisstream::test;

namespace {

TimePoint t0() {
    return std::chrono::system_clock::from_time_t(1700000000);
}

StationInventory scenarioStations() {
    StationInventory inv;
    inv.addStation(std::make_shared<Station>("XX", "A", 34.0, -118.0, 0.0));
    inv.addStation(std::make_shared<Station>("XX", "B", 34.1, -118.0, 0.0));
    inv.addStation(std::make_shared<Station>("XX", "C", 40.0, -110.0, 0.0));
    return inv;
}

// Ten minutes of noise with P onsets at A (120.0 s, on a chunk boundary)
// and B (121.5 s); C records noise only
WaveformPtr scenarioWaveform() {
    SyntheticWaveformBuilder builder(t0(), 600.0, 100.0, 42);
    builder.setNoiseLevel(1.0);
    builder.addStation("XX", "A");
    builder.addStation("XX", "B");
    builder.addStation("XX", "C");
    builder.addArrival("XX.A", PhaseType::P, 120.0, 50.0, 5.0, 2.0);
    builder.addArrival("XX.B", PhaseType::P, 121.5, 50.0, 5.0, 2.0);
    return builder.build();
}

PipelineConfig scenarioConfig() {
    PipelineConfig config;
    config.reader.chunk_length = 60.0;
    config.reader.overlap = 5.0;
    config.detection.model = "PhaseNet";
    config.detection.threshold = 0.5;
    config.associator.min_stations = 2;
    config.associator.min_picks = 2;
    return config;
}

// Zero-probability backend; throws when it sees a sample above 1e6 and
// can be slowed down to keep a background run alive
class QuietBackend : public InferenceBackend {
public:
    explicit QuietBackend(int delay_ms = 0) : delay_ms_(delay_ms) {}

    std::string id() const override { return "Quiet"; }
    BackendFamily family() const override { return BackendFamily::Custom; }
    InputShape inputShape() const override { return {1, 1000, 100.0}; }
    double receptiveField() const override { return 1.0; }

    PhaseProbabilities infer(const InferenceWindow& window) override {
        if (delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        }
        for (double v : window.channels[0]) {
            if (std::abs(v) > 1e6) throw InferenceError("Quiet: input out of range");
        }
        PhaseProbabilities out;
        out.p.assign(window.sampleCount(), 0.0);
        out.s.assign(window.sampleCount(), 0.0);
        return out;
    }

private:
    int delay_ms_;
};

InferenceRegistryPtr quietRegistry(int delay_ms = 0) {
    auto registry = InferenceRegistry::withBuiltins();
    registry->registerBackend("Quiet", [delay_ms] { return std::make_shared<QuietBackend>(delay_ms); });
    return registry;
}

PipelineConfig quietConfig() {
    PipelineConfig config = scenarioConfig();
    config.detection.model = "Quiet";
    return config;
}

// Built-in PhaseNet slowed down per window so a background run can be
// cancelled while picks are flowing
class SlowBackend : public InferenceBackend {
public:
    SlowBackend(InferenceBackendPtr inner, int delay_ms)
        : inner_(std::move(inner))
        , delay_ms_(delay_ms)
    {
    }

    std::string id() const override { return inner_->id(); }
    BackendFamily family() const override { return inner_->family(); }
    InputShape inputShape() const override { return inner_->inputShape(); }
    double receptiveField() const override { return inner_->receptiveField(); }

    PhaseProbabilities infer(const InferenceWindow& window) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        return inner_->infer(window);
    }

private:
    InferenceBackendPtr inner_;
    int delay_ms_;
};

InferenceRegistryPtr slowRegistry(int delay_ms) {
    auto registry = InferenceRegistry::withBuiltins();
    InferenceBackendPtr phasenet = registry->get("PhaseNet");
    registry->registerBackend("SlowPhaseNet", [phasenet, delay_ms] {
        return std::make_shared<SlowBackend>(phasenet, delay_ms);
    });
    return registry;
}

int countPicks(const Catalog& catalog, const std::string& station, PhaseType phase) {
    int n = 0;
    for (const auto& pick : catalog.activePicks()) {
        if (pick->stationKey() == station && pick->phase_type == phase) n++;
    }
    return n;
}

// Active picks of one station and phase closer than tolerance
int closePairs(const Catalog& catalog, double tolerance) {
    std::vector<PickPtr> picks = catalog.activePicks();
    int n = 0;
    for (size_t i = 0; i < picks.size(); i++) {
        for (size_t j = i + 1; j < picks.size(); j++) {
            if (picks[i]->stationKey() != picks[j]->stationKey()) continue;
            if (picks[i]->phase_type != picks[j]->phase_type) continue;
            if (std::abs(secondsBetween(picks[i]->time, picks[j]->time)) < tolerance) n++;
        }
    }
    return n;
}

} // namespace

// ============================================================================
// End-to-end Tests
// ============================================================================

TEST(DetectionPipeline, DetectsAndLocatesScenario) {
    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(scenarioWaveform(), stations, catalog);

    int callbacks = 0;
    bool saw_final = false;
    pipeline.setEventCallback([&](const Event& event) {
        callbacks++;
        if (event.isFinalized()) saw_final = true;
    });

    size_t chunks = pipeline.run(scenarioConfig());
    ASSERT_EQ(chunks, 10u);

    // One P pick per recording station, despite the chunk boundary at 120 s
    ASSERT_EQ(countPicks(*catalog, "XX.A", PhaseType::P), 1);
    ASSERT_EQ(countPicks(*catalog, "XX.B", PhaseType::P), 1);
    ASSERT_EQ(countPicks(*catalog, "XX.C", PhaseType::P), 0);

    PickPtr a, b;
    for (const auto& pick : catalog->activePicks()) {
        if (pick->stationKey() == "XX.A" && pick->phase_type == PhaseType::P) a = pick;
        if (pick->stationKey() == "XX.B" && pick->phase_type == PhaseType::P) b = pick;
    }
    ASSERT_TRUE(a != nullptr);
    ASSERT_TRUE(b != nullptr);
    ASSERT_TIME_NEAR(a->time, addSeconds(t0(), 120.0), 0.1);
    ASSERT_TIME_NEAR(b->time, addSeconds(t0(), 121.5), 0.1);
    ASSERT_GE(a->probability, 0.5);
    ASSERT_EQ(a->backend, std::string("PhaseNet"));

    ASSERT_EQ(catalog->eventCount(), 1u);
    EventPtr event = catalog->allEvents().front();
    ASSERT_TRUE(event->references(a->id));
    ASSERT_TRUE(event->references(b->id));
    ASSERT_TRUE(event->originTime() < addSeconds(t0(), 120.0));
    ASSERT_TRUE(event->isFinalized());
    ASSERT_EQ(event->id(), std::string("ev000001"));

    ASSERT_TRUE(saw_final);
    ASSERT_GE(callbacks, 2);

    PipelineProgress progress = pipeline.progress();
    ASSERT_EQ(progress.chunks_done, 10u);
    ASSERT_EQ(progress.chunk_count, 10u);
    ASSERT_EQ(progress.events, 1u);
    ASSERT_FALSE(progress.running);
    ASSERT_FALSE(progress.cancelled);
    ASSERT_TRUE(pipeline.diagnostics().empty());
}

TEST(DetectionPipeline, BackgroundRunMatchesSynchronous) {
    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(scenarioWaveform(), stations, catalog);

    ASSERT_TRUE(pipeline.start(scenarioConfig()));
    pipeline.wait();

    ASSERT_FALSE(pipeline.isRunning());
    ASSERT_EQ(pipeline.progress().chunks_done, 10u);
    ASSERT_EQ(catalog->eventCount(), 1u);
    ASSERT_EQ(countPicks(*catalog, "XX.A", PhaseType::P), 1);
}

TEST(DetectionPipeline, RerunAddsNothingNew) {
    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(scenarioWaveform(), stations, catalog);

    ASSERT_THROW(pipeline.rerun(TimeRange(t0(), addSeconds(t0(), 60.0))), std::logic_error);

    pipeline.run(scenarioConfig());
    size_t picks = catalog->pickCount();
    size_t events = catalog->eventCount();

    size_t chunks = pipeline.rerun(TimeRange(addSeconds(t0(), 100.0), addSeconds(t0(), 200.0)));
    ASSERT_EQ(chunks, 3u);
    ASSERT_EQ(catalog->pickCount(), picks);
    ASSERT_EQ(catalog->eventCount(), events);
}

TEST(DetectionPipeline, RerunJoinsCatalogPicks) {
    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();

    // Station B is missing from the first pass, so A alone forms no event
    SyntheticWaveformBuilder partial(t0(), 600.0, 100.0, 42);
    partial.setNoiseLevel(1.0);
    partial.addStation("XX", "A");
    partial.addArrival("XX.A", PhaseType::P, 120.0, 50.0, 5.0, 2.0);
    DetectionPipeline first(partial.build(), stations, catalog);
    first.run(scenarioConfig());
    ASSERT_EQ(countPicks(*catalog, "XX.A", PhaseType::P), 1);
    ASSERT_EQ(catalog->eventCount(), 0u);

    // B's data arrives; re-running the interval pairs it with the stored A pick
    DetectionPipeline second(scenarioWaveform(), stations, catalog);
    size_t chunks = second.run(scenarioConfig(),
                               TimeRange(addSeconds(t0(), 100.0), addSeconds(t0(), 140.0)));
    ASSERT_EQ(chunks, 2u);
    ASSERT_EQ(countPicks(*catalog, "XX.A", PhaseType::P), 1);
    ASSERT_EQ(countPicks(*catalog, "XX.B", PhaseType::P), 1);
    ASSERT_EQ(catalog->eventCount(), 1u);

    EventPtr event = catalog->allEvents().front();
    for (const auto& pick : catalog->activePicks()) {
        if (pick->phase_type == PhaseType::P) {
            ASSERT_TRUE(event->references(pick->id));
        }
    }
    ASSERT_TRUE(event->isFinalized());
    ASSERT_EQ(event->id(), std::string("ev000001"));
}

// ============================================================================
// Failure Handling Tests
// ============================================================================

TEST(DetectionPipeline, FailedChunkIsRecordedAndSkipped) {
    SyntheticWaveformBuilder builder(t0(), 600.0, 100.0, 5);
    builder.addStation("XX", "A");
    std::vector<Trace> traces = builder.buildTraces();
    for (auto& trace : traces) {
        if (trace.streamId().component() == 'Z') {
            // Spike inside the core of chunk 3 only
            trace.data()[21000] = 1e9;
        }
    }
    auto waveform = std::make_shared<const Waveform>(traces);

    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(waveform, stations, catalog, quietRegistry());

    size_t chunks = pipeline.run(quietConfig());
    ASSERT_EQ(chunks, 10u);

    auto diagnostics = pipeline.diagnostics();
    ASSERT_EQ(diagnostics.size(), 1u);
    ASSERT_EQ(diagnostics[0].chunk_index, 3u);
    ASSERT_TRUE(diagnostics[0].stage == PipelineStage::Detect);
    ASSERT_TRUE(diagnostics[0].range.start == addSeconds(t0(), 180.0));
    ASSERT_TRUE(diagnostics[0].range.end == addSeconds(t0(), 240.0));
    ASSERT_FALSE(diagnostics[0].message.empty());
    ASSERT_EQ(pipeline.progress().skipped_chunks, 1u);
}

TEST(DetectionPipeline, RerunKeepsOtherDiagnostics) {
    SyntheticWaveformBuilder builder(t0(), 600.0, 100.0, 5);
    builder.addStation("XX", "A");
    std::vector<Trace> traces = builder.buildTraces();
    for (auto& trace : traces) {
        if (trace.streamId().component() == 'Z') {
            trace.data()[21000] = 1e9;
            trace.data()[45000] = 1e9;
        }
    }
    auto waveform = std::make_shared<const Waveform>(traces);

    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(waveform, stations, catalog, quietRegistry());

    pipeline.run(quietConfig());
    ASSERT_EQ(pipeline.diagnostics().size(), 2u);

    // A clean interval leaves both records alone
    pipeline.rerun(TimeRange(t0(), addSeconds(t0(), 60.0)));
    ASSERT_EQ(pipeline.diagnostics().size(), 2u);

    // Chunk 3 fails again and is recorded once; chunk 7 is still listed
    pipeline.rerun(TimeRange(addSeconds(t0(), 170.0), addSeconds(t0(), 250.0)));
    auto diagnostics = pipeline.diagnostics();
    ASSERT_EQ(diagnostics.size(), 2u);
    size_t chunk3 = 0;
    size_t chunk7 = 0;
    for (const auto& d : diagnostics) {
        if (d.chunk_index == 3) chunk3++;
        if (d.chunk_index == 7) chunk7++;
    }
    ASSERT_EQ(chunk3, 1u);
    ASSERT_EQ(chunk7, 1u);
}

TEST(DetectionPipeline, ValidatesConfiguration) {
    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(scenarioWaveform(), stations, catalog);

    PipelineConfig bad_threshold = scenarioConfig();
    bad_threshold.detection.threshold = 1.5;
    ASSERT_THROW(pipeline.run(bad_threshold), std::invalid_argument);
    ASSERT_THROW(pipeline.start(bad_threshold), std::invalid_argument);

    PipelineConfig unknown = scenarioConfig();
    unknown.detection.model = "GPD";
    ASSERT_THROW(pipeline.run(unknown), InferenceError);

    // PhaseNet looks 1.9 s around each sample
    PipelineConfig narrow = scenarioConfig();
    narrow.reader.overlap = 1.0;
    ASSERT_THROW(pipeline.run(narrow), std::invalid_argument);

    ASSERT_FALSE(pipeline.isRunning());
    ASSERT_EQ(catalog->pickCount(), 0u);
}

TEST(DetectionPipeline, RequiresInputs) {
    StationInventory stations = scenarioStations();
    ASSERT_THROW(DetectionPipeline p(nullptr, stations, std::make_shared<Catalog>()),
                 std::invalid_argument);
    ASSERT_THROW(DetectionPipeline p(scenarioWaveform(), stations, nullptr),
                 std::invalid_argument);
}

// ============================================================================
// Cancellation Tests
// ============================================================================

TEST(DetectionPipeline, CancelStopsBetweenChunks) {
    SyntheticWaveformBuilder builder(t0(), 600.0, 100.0, 9);
    builder.addStation("XX", "A");
    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(builder.build(), stations, catalog, quietRegistry(20));

    ASSERT_TRUE(pipeline.start(quietConfig()));
    ASSERT_TRUE(pipeline.isRunning());

    // A second run cannot start while the first is active
    ASSERT_FALSE(pipeline.start(quietConfig()));
    ASSERT_THROW(pipeline.run(quietConfig()), std::logic_error);

    while (pipeline.progress().chunks_done < 1 && pipeline.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    pipeline.cancel();
    pipeline.wait();

    PipelineProgress progress = pipeline.progress();
    ASSERT_FALSE(pipeline.isRunning());
    ASSERT_FALSE(progress.running);
    ASSERT_TRUE(progress.cancelled);
    ASSERT_GE(progress.chunks_done, 1u);
    ASSERT_LT(progress.chunks_done, progress.chunk_count);

    // A new run can start after cancellation
    ASSERT_TRUE(pipeline.restart(quietConfig()));
    pipeline.cancel();
    pipeline.wait();
    ASSERT_FALSE(pipeline.isRunning());
}

TEST(DetectionPipeline, CancelKeepsCatalogConsistent) {
    StationInventory stations = scenarioStations();
    auto catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(scenarioWaveform(), stations, catalog, slowRegistry(20));

    PipelineConfig config = scenarioConfig();
    config.detection.model = "SlowPhaseNet";
    ASSERT_TRUE(pipeline.start(config));

    // Stop while the chunk holding both onsets is in flight
    while (pipeline.progress().chunks_done < 2 && pipeline.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    pipeline.cancel();
    pipeline.wait();

    PipelineProgress progress = pipeline.progress();
    ASSERT_TRUE(progress.cancelled);
    ASSERT_LT(progress.chunks_done, progress.chunk_count);

    for (const auto& event : catalog->allEvents()) {
        ASSERT_TRUE(event->isFinalized());
        for (uint64_t id : event->pickIds()) {
            ASSERT_TRUE(catalog->getPick(id) != nullptr);
        }
    }
    ASSERT_EQ(closePairs(*catalog, 0.5), 0);

    // A full run afterwards completes the catalog without duplicating it
    pipeline.run(scenarioConfig());
    ASSERT_EQ(countPicks(*catalog, "XX.A", PhaseType::P), 1);
    ASSERT_EQ(countPicks(*catalog, "XX.B", PhaseType::P), 1);
    ASSERT_EQ(catalog->eventCount(), 1u);
    ASSERT_TRUE(catalog->allEvents().front()->isFinalized());
    ASSERT_EQ(closePairs(*catalog, 0.5), 0);
}

TEST(DetectionPipeline, StageNames) {
    ASSERT_EQ(pipelineStageToString(PipelineStage::Detect), std::string("detect"));
    ASSERT_EQ(pipelineStageToString(PipelineStage::Associate), std::string("associate"));
}

TEST(DetectionPipeline, FromConfig) {
    Config config;
    config.parse("[stream]\nchunk_length = 30\noverlap = 4\n"
                 "[detection]\nmodel = PickBlue\n"
                 "[associator]\nmin_stations = 2\nquiescence = 90\n");
    PipelineConfig pc = PipelineConfig::fromConfig(config);
    ASSERT_NEAR(pc.reader.chunk_length, 30.0, 1e-12);
    ASSERT_NEAR(pc.reader.overlap, 4.0, 1e-12);
    ASSERT_EQ(pc.detection.model, std::string("PickBlue"));
    ASSERT_EQ(pc.associator.min_stations, 2);
    ASSERT_NEAR(pc.association.quiescence, 90.0, 1e-12);
}
