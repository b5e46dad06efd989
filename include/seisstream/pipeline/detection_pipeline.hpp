#pragma once

#include "seisstream/core/config.hpp"
#include "seisstream/core/station.hpp"
#include "seisstream/core/waveform.hpp"
#include "seisstream/stream/chunked_reader.hpp"
#include "seisstream/picker/preprocessor.hpp"
#include "seisstream/picker/detection_adapter.hpp"
#include "seisstream/picker/pick_merger.hpp"
#include "seisstream/associator/association_adapter.hpp"
#include "seisstream/associator/travel_time_associator.hpp"
#include "seisstream/catalog/catalog.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace seisstream {

enum class PipelineStage {
    Read,
    Preprocess,
    Detect,
    Associate,
    Catalog
};

std::string pipelineStageToString(PipelineStage stage);

/**
 * ChunkDiagnostic - Record of a chunk that lost detections
 */
struct ChunkDiagnostic {
    size_t chunk_index;
    TimeRange range;
    PipelineStage stage;
    std::string message;
};

struct PipelineConfig {
    ReaderOptions reader;
    PreprocessConfig preprocess;
    DetectionOptions detection;
    MergeConfig merge;
    TravelTimeAssociatorConfig associator;
    AssociationOptions association;
    bool verbose = false;

    static PipelineConfig fromConfig(const Config& config);
};

struct PipelineProgress {
    size_t chunks_done = 0;
    size_t chunk_count = 0;
    size_t picks = 0;            // Picks committed to the catalog by this run
    size_t events = 0;           // Events created by this run
    size_t skipped_chunks = 0;
    bool running = false;
    bool cancelled = false;
};

/**
 * DetectionPipeline - Chunked detection and association over a waveform
 *
 * Chunks are processed strictly in stream order: condition, detect, keep
 * candidates from the inner half of the overlap margins, stitch across
 * chunk boundaries, commit to the catalog and associate. A chunk whose
 * inference fails is skipped and recorded; the run continues.
 *
 * start() runs the same sequence on a worker thread. cancel() stops
 * issuing chunks: the chunk in flight completes, candidates not yet
 * committed are discarded and open events are finalized.
 */
class DetectionPipeline {
public:
    using EventCallback = std::function<void(const Event&)>;

    DetectionPipeline(WaveformPtr waveform, const StationInventory& stations, CatalogPtr catalog,
                      InferenceRegistryPtr registry = InferenceRegistry::withBuiltins(),
                      AssociationBackendPtr backend = nullptr);
    ~DetectionPipeline();

    // Prevent copying
    DetectionPipeline(const DetectionPipeline&) = delete;
    DetectionPipeline& operator=(const DetectionPipeline&) = delete;

    // Synchronous run over the whole waveform; returns chunks processed
    size_t run(const PipelineConfig& config);
    // Synchronous run over the chunks overlapping range. Catalog picks no
    // event claims, within pending_window of range, take part in association.
    // Diagnostics of chunks outside range are kept.
    size_t run(const PipelineConfig& config, const TimeRange& range);
    // Re-run an interval with the configuration of the previous run
    size_t rerun(const TimeRange& range);

    // Background run; false if a run is already active
    bool start(const PipelineConfig& config);
    void cancel();
    void wait();
    // Cancel the active run and start over with a new configuration
    bool restart(const PipelineConfig& config);

    bool isRunning() const { return running_; }
    PipelineProgress progress() const;
    std::vector<ChunkDiagnostic> diagnostics() const;

    // Called from the processing thread for each new or revised event
    void setEventCallback(EventCallback cb) { event_callback_ = std::move(cb); }

    CatalogPtr catalog() const { return catalog_; }

private:
    WaveformPtr waveform_;
    const StationInventory& stations_;
    CatalogPtr catalog_;
    InferenceRegistryPtr registry_;
    AssociationBackendPtr backend_;

    std::thread worker_;
    std::atomic<bool> running_;
    std::atomic<bool> cancel_requested_;

    mutable std::mutex mutex_;
    std::vector<ChunkDiagnostic> diagnostics_;
    PipelineProgress progress_;
    std::optional<PipelineConfig> last_config_;

    EventCallback event_callback_;

    void validate(const PipelineConfig& config) const;
    size_t process(const PipelineConfig& config, const std::optional<TimeRange>& range);
    std::vector<PickPtr> unassociatedPicks(const TimeRange& window) const;
    void commit(const std::vector<Pick>& picks, std::vector<PickPtr>& carried,
                AssociationAdapter& associator, AssociationSession& session, const Chunk& chunk);
    void publish(const std::vector<Event>& events, const Chunk& chunk);
    void record(const Chunk& chunk, PipelineStage stage, const std::string& message);
};

} // namespace seisstream
