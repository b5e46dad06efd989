#pragma once

#include "seisstream/core/event.hpp"
#include "seisstream/core/config.hpp"
#include <string>
#include <vector>

namespace seisstream {

struct MergeConfig {
    double tolerance = 0.5;              // Seconds; same station/phase within this is one arrival
    double probability_epsilon = 0.0;    // Probabilities closer than this compare equal
    std::vector<std::string> backend_priority;  // Preferred backends first on ties

    static MergeConfig fromConfig(const Config& config);
};

/**
 * PickMerger - Collapses duplicate picks from overlapping chunks
 *
 * Candidates are resolved greedily in preference order: higher
 * probability, then closer to the source chunk's core centre, then
 * backend priority, then earlier onset, then lower chunk index. Each kept
 * pick removes every other candidate of the same station and phase
 * within the tolerance. Output is ordered by onset time, station and
 * phase. The merge is stateless: merging a merged set returns it
 * unchanged.
 */
class PickMerger {
public:
    explicit PickMerger(const MergeConfig& config = MergeConfig());

    std::vector<Pick> merge(std::vector<Pick> candidates) const;

    // True when a should be kept over b
    bool prefer(const Pick& a, const Pick& b) const;

    static bool outputOrder(const Pick& a, const Pick& b);

    const MergeConfig& config() const { return config_; }

private:
    MergeConfig config_;

    int backendRank(const std::string& backend) const;
};

/**
 * PickStitcher - Streaming front end of the merger
 *
 * push() takes a chunk's candidates plus the horizon before which no
 * later chunk can produce candidates, and returns the picks that are
 * final. Candidates near the horizon wait for the next chunk.
 */
class PickStitcher {
public:
    explicit PickStitcher(const PickMerger& merger);

    std::vector<Pick> push(const std::vector<Pick>& candidates, TimePoint horizon);
    std::vector<Pick> flush();

    // Drop buffered candidates without emitting them
    void discard();

    size_t pendingCount() const { return pending_.size(); }

private:
    PickMerger merger_;
    std::vector<Pick> pending_;
    std::vector<Pick> emitted_;    // Recently emitted, kept to reject late duplicates

    std::vector<Pick> emit(std::vector<Pick> merged);
    bool duplicatesEmitted(const Pick& pick) const;
};

} // namespace seisstream
