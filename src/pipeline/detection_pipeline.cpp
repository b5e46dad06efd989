#include "seisstream/pipeline/detection_pipeline.hpp"
#include "seisstream/core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace seisstream {

std::string pipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Read: return "read";
        case PipelineStage::Preprocess: return "preprocess";
        case PipelineStage::Detect: return "detect";
        case PipelineStage::Associate: return "associate";
        case PipelineStage::Catalog: return "catalog";
    }
    return "unknown";
}

PipelineConfig PipelineConfig::fromConfig(const Config& config) {
    PipelineConfig pc;
    pc.reader.chunk_length = config.getDouble("stream.chunk_length", pc.reader.chunk_length);
    pc.reader.overlap = config.getDouble("stream.overlap", pc.reader.overlap);
    pc.preprocess = PreprocessConfig::fromConfig(config);
    pc.detection = DetectionOptions::fromConfig(config);
    pc.merge = MergeConfig::fromConfig(config);
    pc.associator = TravelTimeAssociatorConfig::fromConfig(config);
    pc.association = AssociationOptions::fromConfig(config);
    pc.verbose = config.getBool("pipeline.verbose", pc.verbose);
    return pc;
}

DetectionPipeline::DetectionPipeline(WaveformPtr waveform, const StationInventory& stations,
                                     CatalogPtr catalog, InferenceRegistryPtr registry,
                                     AssociationBackendPtr backend)
    : waveform_(std::move(waveform))
    , stations_(stations)
    , catalog_(std::move(catalog))
    , registry_(std::move(registry))
    , backend_(std::move(backend))
    , running_(false)
    , cancel_requested_(false)
{
    if (!waveform_ || !catalog_ || !registry_) {
        throw std::invalid_argument("DetectionPipeline: waveform, catalog and registry are required");
    }
}

DetectionPipeline::~DetectionPipeline() {
    cancel();
    wait();
}

void DetectionPipeline::validate(const PipelineConfig& config) const {
    if (config.detection.threshold < 0.0 || config.detection.threshold > 1.0) {
        throw std::invalid_argument("DetectionPipeline: threshold must be within [0, 1]");
    }

    // Throws InferenceError for an unknown model
    InferenceBackendPtr backend = registry_->get(config.detection.model);
    if (config.reader.overlap < backend->receptiveField()) {
        throw std::invalid_argument("DetectionPipeline: overlap of " +
                                    std::to_string(config.reader.overlap) +
                                    " s is shorter than the receptive field of " +
                                    backend->id() + " (" +
                                    std::to_string(backend->receptiveField()) + " s)");
    }
}

void DetectionPipeline::record(const Chunk& chunk, PipelineStage stage, const std::string& message) {
    std::cerr << "DetectionPipeline: chunk " << chunk.index << " " << chunk.core.toString()
              << " " << pipelineStageToString(stage) << " failed: " << message << std::endl;

    ChunkDiagnostic diag;
    diag.chunk_index = chunk.index;
    diag.range = chunk.core;
    diag.stage = stage;
    diag.message = message;

    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics_.push_back(diag);
}

void DetectionPipeline::publish(const std::vector<Event>& events, const Chunk& chunk) {
    for (const auto& event : events) {
        try {
            catalog_->upsertEvent(event);
        } catch (const std::invalid_argument& e) {
            record(chunk, PipelineStage::Catalog, e.what());
            continue;
        }

        if (event.revision() == 1) {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.events++;
        }
        if (event_callback_) {
            event_callback_(event);
        }
    }
}

std::vector<PickPtr> DetectionPipeline::unassociatedPicks(const TimeRange& window) const {
    std::vector<EventPtr> events = catalog_->allEvents();
    std::vector<PickPtr> result;
    for (const auto& pick : catalog_->picksBetween(window.start, window.end)) {
        bool claimed = std::any_of(events.begin(), events.end(),
                                   [&pick](const EventPtr& e) { return e->references(pick->id); });
        if (!claimed) result.push_back(pick);
    }
    return result;
}

void DetectionPipeline::commit(const std::vector<Pick>& picks, std::vector<PickPtr>& carried,
                               AssociationAdapter& associator, AssociationSession& session,
                               const Chunk& chunk) {
    std::vector<PickPtr> stored = catalog_->addPicks(picks);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.picks += stored.size();
    }

    // Pending picks replaced by a stronger duplicate leave the session
    for (const auto& pick : session.pendingPicks()) {
        if (catalog_->isSuperseded(pick->id)) session.withdraw(pick->id);
    }
    for (const auto& pick : carried) {
        if (!catalog_->isSuperseded(pick->id)) stored.push_back(pick);
    }
    carried.clear();

    AssociationResult result = associator.associate(stored, session, chunk.core.end);
    if (result.error) {
        record(chunk, PipelineStage::Associate, *result.error);
    }
    publish(result.updated, chunk);
    publish(result.finalized, chunk);
}

size_t DetectionPipeline::process(const PipelineConfig& config, const std::optional<TimeRange>& range) {
    ChunkedStreamReader reader(waveform_, config.reader);
    Preprocessor preprocessor(config.preprocess);
    DetectionAdapter detector(registry_, config.detection);
    PickMerger merger(config.merge);
    PickStitcher stitcher(merger);

    AssociationBackendPtr backend = backend_;
    if (!backend) {
        backend = std::make_shared<TravelTimeAssociator>(config.associator);
    }
    AssociationAdapter associator(backend, stations_, config.association);
    AssociationSession session(catalog_->eventCount() + 1);

    // Catalog picks no event claims can still join events formed in range
    std::vector<PickPtr> carried;
    if (range) {
        reader.seek(range->start);
        double margin = config.association.pending_window;
        carried = unassociatedPicks(TimeRange(addSeconds(range->start, -margin),
                                              addSeconds(range->end, margin)));
    }

    size_t total = 0;
    for (size_t i = reader.position(); i < reader.chunkCount(); i++) {
        if (range && reader.coreRange(i).start >= range->end) break;
        total++;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_ = PipelineProgress();
        progress_.chunk_count = total;
        progress_.running = true;

        // Failures in intervals this run repeats are recorded again if they recur
        if (range) {
            const TimeRange& repeated = *range;
            diagnostics_.erase(std::remove_if(diagnostics_.begin(), diagnostics_.end(),
                                              [&repeated](const ChunkDiagnostic& d) {
                                                  return d.range.overlaps(repeated);
                                              }),
                               diagnostics_.end());
        } else {
            diagnostics_.clear();
        }
    }

    // Candidates outside the inner half of each margin belong to a neighbour
    double half = config.reader.overlap / 2.0;
    size_t processed = 0;
    Chunk last_chunk;

    while (processed < total && !cancel_requested_) {
        std::optional<Chunk> chunk = reader.nextChunk();
        if (!chunk) break;
        bool final_chunk = chunk->last || processed + 1 == total;

        std::vector<Pick> candidates;
        try {
            Chunk conditioned = preprocessor.process(*chunk);
            candidates = detector.detect(conditioned, config.detection.model,
                                         config.detection.threshold);
        } catch (const InferenceError& e) {
            record(*chunk, PipelineStage::Detect, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.skipped_chunks++;
        } catch (const std::invalid_argument& e) {
            record(*chunk, PipelineStage::Preprocess, e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.skipped_chunks++;
        }

        TimePoint keep_from = addSeconds(chunk->core.start, -half);
        TimePoint keep_to = addSeconds(chunk->core.end, half);
        size_t detected = candidates.size();
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [keep_from, keep_to](const Pick& p) {
                                            return p.time < keep_from || p.time >= keep_to;
                                        }),
                         candidates.end());

        std::vector<Pick> ready = stitcher.push(candidates, addSeconds(chunk->core.end, -half));
        if (final_chunk) {
            std::vector<Pick> rest = stitcher.flush();
            ready.insert(ready.end(), rest.begin(), rest.end());
        }

        commit(ready, carried, associator, session, *chunk);
        processed++;
        last_chunk.index = chunk->index;
        last_chunk.core = chunk->core;
        last_chunk.span = chunk->span;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            progress_.chunks_done = processed;
        }

        if (config.verbose) {
            std::cout << "DetectionPipeline: chunk " << processed << "/" << total << " "
                      << chunk->core.toString() << ": " << detected << " candidates, "
                      << ready.size() << " picks, " << session.openEvents().size()
                      << " open events" << std::endl;
        }
        if (final_chunk) break;
    }

    bool cancelled = cancel_requested_ && processed < total;
    if (cancelled) {
        stitcher.discard();
        std::cout << "DetectionPipeline: cancelled after " << processed << " of "
                  << total << " chunks" << std::endl;
    }

    AssociationResult closing = associator.finalize(session);
    publish(closing.finalized, last_chunk);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.running = false;
        progress_.cancelled = cancelled;

        if (config.verbose) {
            std::cout << "DetectionPipeline: " << processed << " chunks, "
                      << progress_.picks << " picks, " << progress_.events << " events, "
                      << progress_.skipped_chunks << " skipped" << std::endl;
        }
    }
    return processed;
}

size_t DetectionPipeline::run(const PipelineConfig& config) {
    return run(config, TimeRange(waveform_->startTime(), waveform_->endTime()));
}

size_t DetectionPipeline::run(const PipelineConfig& config, const TimeRange& range) {
    validate(config);

    if (running_.exchange(true)) {
        throw std::logic_error("DetectionPipeline: a run is already active");
    }
    cancel_requested_ = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_config_ = config;
    }

    size_t processed = 0;
    try {
        processed = process(config, range);
    } catch (...) {
        running_ = false;
        throw;
    }
    running_ = false;
    return processed;
}

size_t DetectionPipeline::rerun(const TimeRange& range) {
    PipelineConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!last_config_) {
            throw std::logic_error("DetectionPipeline: nothing to re-run");
        }
        config = *last_config_;
    }
    return run(config, range);
}

bool DetectionPipeline::start(const PipelineConfig& config) {
    validate(config);

    if (running_.exchange(true)) {
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    cancel_requested_ = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_config_ = config;
    }

    worker_ = std::thread([this, config]() {
        try {
            process(config, std::nullopt);
        } catch (const std::exception& e) {
            std::cerr << "DetectionPipeline: run aborted: " << e.what() << std::endl;
            std::lock_guard<std::mutex> lock(mutex_);
            ChunkDiagnostic diag;
            diag.chunk_index = progress_.chunks_done;
            diag.range = TimeRange(waveform_->startTime(), waveform_->endTime());
            diag.stage = PipelineStage::Read;
            diag.message = e.what();
            diagnostics_.push_back(diag);
            progress_.running = false;
        }
        running_ = false;
    });
    return true;
}

void DetectionPipeline::cancel() {
    cancel_requested_ = true;
}

void DetectionPipeline::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool DetectionPipeline::restart(const PipelineConfig& config) {
    cancel();
    wait();
    return start(config);
}

PipelineProgress DetectionPipeline::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::vector<ChunkDiagnostic> DetectionPipeline::diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostics_;
}

} // namespace seisstream
