#include "seisstream/stream/chunked_reader.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace seisstream {

std::vector<std::string> Chunk::stations() const {
    std::set<std::string> keys;
    for (const auto& trace : traces) {
        keys.insert(trace.streamId().stationKey());
    }
    return std::vector<std::string>(keys.begin(), keys.end());
}

std::vector<const Trace*> Chunk::tracesForStation(const std::string& station_key) const {
    std::vector<const Trace*> result;
    for (const auto& trace : traces) {
        if (trace.streamId().stationKey() == station_key) {
            result.push_back(&trace);
        }
    }
    return result;
}

ChunkedStreamReader::ChunkedStreamReader(WaveformPtr waveform, const ReaderOptions& options)
    : waveform_(std::move(waveform))
    , options_(options)
    , chunk_length_(secondsToDuration(options.chunk_length))
    , overlap_(secondsToDuration(options.overlap))
    , chunk_count_(0)
    , next_index_(0)
{
    if (!waveform_) {
        throw std::invalid_argument("ChunkedStreamReader: no waveform");
    }
    if (chunk_length_.count() <= 0) {
        throw std::invalid_argument("ChunkedStreamReader: chunk length must be positive");
    }
    if (overlap_.count() < 0 || overlap_ > chunk_length_) {
        throw std::invalid_argument("ChunkedStreamReader: overlap must be in [0, chunk length]");
    }

    auto total = std::chrono::duration_cast<Duration>(
        waveform_->endTime() - waveform_->startTime());
    if (total.count() > 0) {
        chunk_count_ = static_cast<size_t>(
            (total.count() + chunk_length_.count() - 1) / chunk_length_.count());
    }
}

TimeRange ChunkedStreamReader::coreRange(size_t index) const {
    auto to_tp = [](Duration d) {
        return std::chrono::duration_cast<TimePoint::duration>(d);
    };
    TimePoint start = waveform_->startTime() + to_tp(chunk_length_ * static_cast<int64_t>(index));
    TimePoint end = std::min(start + to_tp(chunk_length_), waveform_->endTime());
    return TimeRange(start, end);
}

Chunk ChunkedStreamReader::chunkAt(size_t index) const {
    auto margin = std::chrono::duration_cast<TimePoint::duration>(overlap_);

    Chunk chunk;
    chunk.index = index;
    chunk.core = coreRange(index);
    chunk.span = TimeRange(std::max(chunk.core.start - margin, waveform_->startTime()),
                           std::min(chunk.core.end + margin, waveform_->endTime()));
    chunk.overlap = options_.overlap;
    chunk.last = index + 1 >= chunk_count_;

    for (const auto& trace : waveform_->traces()) {
        Trace piece = trace.slice(chunk.span.start, chunk.span.end);
        if (!piece.empty()) {
            chunk.traces.push_back(std::move(piece));
        }
    }
    return chunk;
}

std::optional<Chunk> ChunkedStreamReader::nextChunk() {
    if (next_index_ >= chunk_count_) {
        return std::nullopt;
    }
    return chunkAt(next_index_++);
}

void ChunkedStreamReader::seek(TimePoint t) {
    if (t <= waveform_->startTime()) {
        next_index_ = 0;
        return;
    }
    auto offset = std::chrono::duration_cast<Duration>(t - waveform_->startTime());
    next_index_ = std::min(static_cast<size_t>(offset.count() / chunk_length_.count()),
                           chunk_count_);
}

void ChunkedStreamReader::seekOffset(double seconds) {
    seek(addSeconds(waveform_->startTime(), seconds));
}

} // namespace seisstream
