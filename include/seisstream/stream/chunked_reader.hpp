#pragma once

#include "seisstream/core/types.hpp"
#include "seisstream/core/waveform.hpp"
#include <optional>
#include <string>
#include <vector>

namespace seisstream {

/**
 * Chunk - Bounded slice of a waveform
 *
 * The core region is the part this chunk is authoritative for. The span
 * adds an overlap margin on each side (clamped to the recording) that is
 * only used to suppress edge effects.
 */
struct Chunk {
    size_t index;
    TimeRange core;
    TimeRange span;
    double overlap;          // Requested margin per side (seconds)
    bool last;
    std::vector<Trace> traces;

    Chunk() : index(0), overlap(0), last(false) {}

    TimePoint coreCenter() const {
        return core.start + (core.end - core.start) / 2;
    }

    double distanceFromCoreCenter(TimePoint t) const {
        return std::abs(secondsBetween(t, coreCenter()));
    }

    std::vector<std::string> stations() const;
    std::vector<const Trace*> tracesForStation(const std::string& station_key) const;
};

struct ReaderOptions {
    double chunk_length = 60.0;   // Core length (seconds)
    double overlap = 5.0;         // Margin per side (seconds)
};

/**
 * ChunkedStreamReader - Sequential chunk access to a waveform
 *
 * Core boundaries sit on a fixed grid of integer microseconds from the
 * recording start, so cores are contiguous and never overlap. Each sample
 * belongs to exactly one core.
 */
class ChunkedStreamReader {
public:
    explicit ChunkedStreamReader(WaveformPtr waveform,
                                 const ReaderOptions& options = ReaderOptions());

    // Next chunk in stream order; nullopt at end of stream
    std::optional<Chunk> nextChunk();

    // Position so that the chunk whose core contains t is returned next
    void seek(TimePoint t);
    void seekOffset(double seconds);

    double totalDuration() const { return waveform_->totalDuration(); }
    size_t chunkCount() const { return chunk_count_; }
    size_t position() const { return next_index_; }
    bool atEnd() const { return next_index_ >= chunk_count_; }

    TimeRange coreRange(size_t index) const;
    Chunk chunkAt(size_t index) const;

    const ReaderOptions& options() const { return options_; }
    WaveformPtr waveform() const { return waveform_; }

private:
    WaveformPtr waveform_;
    ReaderOptions options_;
    Duration chunk_length_;
    Duration overlap_;
    size_t chunk_count_;
    size_t next_index_;
};

} // namespace seisstream
