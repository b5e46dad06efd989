#include "seisstream/picker/pick_merger.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace seisstream {

MergeConfig MergeConfig::fromConfig(const Config& config) {
    MergeConfig mc;
    mc.tolerance = config.getDouble("merge.tolerance", mc.tolerance);
    mc.probability_epsilon = config.getDouble("merge.probability_epsilon", mc.probability_epsilon);
    mc.backend_priority = config.getStringList("merge.backend_priority");
    return mc;
}

PickMerger::PickMerger(const MergeConfig& config)
    : config_(config)
{
}

int PickMerger::backendRank(const std::string& backend) const {
    auto it = std::find(config_.backend_priority.begin(), config_.backend_priority.end(), backend);
    return static_cast<int>(it - config_.backend_priority.begin());
}

bool PickMerger::prefer(const Pick& a, const Pick& b) const {
    double pa = a.probability;
    double pb = b.probability;
    if (config_.probability_epsilon > 0) {
        pa = std::floor(pa / config_.probability_epsilon);
        pb = std::floor(pb / config_.probability_epsilon);
    }
    if (pa != pb) return pa > pb;
    if (a.core_distance != b.core_distance) return a.core_distance < b.core_distance;

    int ra = backendRank(a.backend);
    int rb = backendRank(b.backend);
    if (ra != rb) return ra < rb;

    if (a.time != b.time) return a.time < b.time;
    if (a.chunk_index != b.chunk_index) return a.chunk_index < b.chunk_index;
    if (a.backend != b.backend) return a.backend < b.backend;
    if (a.stream_id != b.stream_id) return a.stream_id < b.stream_id;
    return a.phase_type < b.phase_type;
}

bool PickMerger::outputOrder(const Pick& a, const Pick& b) {
    if (a.time != b.time) return a.time < b.time;
    if (a.stationKey() != b.stationKey()) return a.stationKey() < b.stationKey();
    if (a.phase_type != b.phase_type) return a.phase_type < b.phase_type;
    if (a.backend != b.backend) return a.backend < b.backend;
    return a.probability > b.probability;
}

std::vector<Pick> PickMerger::merge(std::vector<Pick> candidates) const {
    std::sort(candidates.begin(), candidates.end(),
              [this](const Pick& a, const Pick& b) { return prefer(a, b); });

    Duration tolerance = secondsToDuration(config_.tolerance);
    std::map<std::pair<std::string, PhaseType>, std::multiset<TimePoint>> kept_times;
    std::vector<Pick> kept;

    for (auto& pick : candidates) {
        auto& times = kept_times[{pick.stationKey(), pick.phase_type}];

        // Any kept onset within [t - tol, t + tol] makes this a duplicate
        auto lo = pick.time - std::chrono::duration_cast<TimePoint::duration>(tolerance);
        auto it = times.lower_bound(lo);
        bool duplicate = it != times.end() &&
                         *it - pick.time <= std::chrono::duration_cast<TimePoint::duration>(tolerance);
        if (duplicate) continue;

        times.insert(pick.time);
        kept.push_back(std::move(pick));
    }

    std::sort(kept.begin(), kept.end(), outputOrder);
    return kept;
}

PickStitcher::PickStitcher(const PickMerger& merger)
    : merger_(merger)
{
}

bool PickStitcher::duplicatesEmitted(const Pick& pick) const {
    double tol = merger_.config().tolerance;
    for (const auto& prev : emitted_) {
        if (prev.stationKey() == pick.stationKey() && prev.phase_type == pick.phase_type &&
            std::abs(secondsBetween(prev.time, pick.time)) <= tol) {
            return true;
        }
    }
    return false;
}

std::vector<Pick> PickStitcher::emit(std::vector<Pick> merged) {
    std::vector<Pick> result;
    for (auto& pick : merged) {
        if (duplicatesEmitted(pick)) continue;
        emitted_.push_back(pick);
        result.push_back(std::move(pick));
    }
    return result;
}

std::vector<Pick> PickStitcher::push(const std::vector<Pick>& candidates, TimePoint horizon) {
    pending_.insert(pending_.end(), candidates.begin(), candidates.end());

    TimePoint cutoff = addSeconds(horizon, -merger_.config().tolerance);
    std::vector<Pick> merged = merger_.merge(pending_);

    std::vector<Pick> ready;
    for (auto& pick : merged) {
        if (pick.time < cutoff) ready.push_back(std::move(pick));
    }

    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [cutoff](const Pick& p) { return p.time < cutoff; }),
                   pending_.end());

    std::vector<Pick> result = emit(std::move(ready));

    TimePoint keep_from = addSeconds(cutoff, -merger_.config().tolerance);
    emitted_.erase(std::remove_if(emitted_.begin(), emitted_.end(),
                                  [keep_from](const Pick& p) { return p.time < keep_from; }),
                   emitted_.end());
    return result;
}

std::vector<Pick> PickStitcher::flush() {
    std::vector<Pick> result = emit(merger_.merge(std::move(pending_)));
    pending_.clear();
    emitted_.clear();
    return result;
}

void PickStitcher::discard() {
    pending_.clear();
    emitted_.clear();
}

} // namespace seisstream
