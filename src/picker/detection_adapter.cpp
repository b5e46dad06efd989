#include "seisstream/picker/detection_adapter.hpp"
#include "seisstream/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <set>
#include <stdexcept>

namespace seisstream {

namespace {

int componentRank(char component) {
    switch (component) {
        case 'Z': case '3': return 0;
        case 'N': case '1': return 1;
        case 'E': case '2': return 2;
        default: return 3;
    }
}

} // namespace

DetectionOptions DetectionOptions::fromConfig(const Config& config) {
    DetectionOptions opts;
    opts.model = config.getString("detection.model", opts.model);
    opts.threshold = config.getDouble("detection.threshold", opts.threshold);
    opts.min_separation = config.getDouble("detection.min_separation", opts.min_separation);
    opts.window_stride = config.getDouble("detection.window_stride", opts.window_stride);
    return opts;
}

DetectionAdapter::DetectionAdapter(InferenceRegistryPtr registry, const DetectionOptions& options)
    : registry_(std::move(registry))
    , options_(options)
{
    if (!registry_) {
        throw std::invalid_argument("DetectionAdapter: no inference registry");
    }
}

std::vector<size_t> DetectionAdapter::findPeaks(const SampleVector& prob, double threshold,
                                                size_t min_separation) {
    std::vector<size_t> candidates;
    size_t n = prob.size();

    // Runs of equal values count as one peak located at the run midpoint
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && prob[j + 1] == prob[i]) j++;

        double value = prob[i];
        double left = i > 0 ? prob[i - 1] : -std::numeric_limits<double>::infinity();
        double right = j + 1 < n ? prob[j + 1] : -std::numeric_limits<double>::infinity();
        if (value >= threshold && value > left && value > right) {
            candidates.push_back(i + (j - i) / 2);
        }
        i = j + 1;
    }

    std::stable_sort(candidates.begin(), candidates.end(), [&prob](size_t a, size_t b) {
        return prob[a] > prob[b];
    });

    std::set<size_t> accepted;
    for (size_t idx : candidates) {
        auto next = accepted.lower_bound(idx);
        bool clear = true;
        if (next != accepted.end() && *next - idx < min_separation) clear = false;
        if (next != accepted.begin() && idx - *std::prev(next) < min_separation) clear = false;
        if (clear) accepted.insert(idx);
    }

    return std::vector<size_t>(accepted.begin(), accepted.end());
}

std::vector<Pick> DetectionAdapter::detectStation(InferenceBackend& backend, const Chunk& chunk,
                                                  std::vector<const Trace*> traces,
                                                  double threshold) const {
    std::stable_sort(traces.begin(), traces.end(), [](const Trace* a, const Trace* b) {
        int ra = componentRank(a->streamId().component());
        int rb = componentRank(b->streamId().component());
        if (ra != rb) return ra < rb;
        return a->streamId().channel < b->streamId().channel;
    });

    InputShape shape = backend.inputShape();
    double rate = shape.sample_rate;

    std::vector<Trace> prepared;
    for (const auto* trace : traces) {
        if (prepared.size() >= shape.channels) break;
        prepared.push_back(trace->resample(rate));
    }

    TimePoint t0 = prepared.front().startTime();
    for (const auto& trace : prepared) {
        t0 = std::min(t0, trace.startTime());
    }

    // Align components on a common sample grid, zero-filling gaps
    std::vector<size_t> offsets;
    size_t n = 0;
    for (const auto& trace : prepared) {
        auto offset = static_cast<size_t>(std::llround(secondsBetween(trace.startTime(), t0) * rate));
        offsets.push_back(offset);
        n = std::max(n, offset + trace.sampleCount());
    }

    std::vector<SampleVector> aligned(shape.channels, SampleVector(n, 0.0));
    for (size_t c = 0; c < prepared.size(); c++) {
        const auto& data = prepared[c].data();
        std::copy(data.begin(), data.end(), aligned[c].begin() + offsets[c]);
    }

    size_t window = shape.samples;
    auto stride = std::max<size_t>(1, static_cast<size_t>(window * options_.window_stride));
    std::vector<size_t> starts;
    if (n <= window) {
        starts.push_back(0);
    } else {
        for (size_t s = 0; s + window < n; s += stride) starts.push_back(s);
        starts.push_back(n - window);
    }

    SampleVector p_stack(n, 0.0), s_stack(n, 0.0);
    for (size_t start : starts) {
        InferenceWindow input;
        input.sample_rate = rate;
        input.channels.assign(shape.channels, SampleVector(window, 0.0));
        size_t count = std::min(window, n - start);
        for (size_t c = 0; c < shape.channels; c++) {
            std::copy(aligned[c].begin() + start, aligned[c].begin() + start + count,
                      input.channels[c].begin());
        }

        PhaseProbabilities probs = backend.infer(input);
        if (probs.p.size() != window || probs.s.size() != window) {
            throw InferenceError(backend.id() + ": output length does not match window");
        }

        for (size_t k = 0; k < count; k++) {
            p_stack[start + k] = std::max(p_stack[start + k], probs.p[k]);
            s_stack[start + k] = std::max(s_stack[start + k], probs.s[k]);
        }
    }

    std::vector<std::string> channel_codes;
    for (const auto& trace : prepared) {
        channel_codes.push_back(trace.streamId().channel);
    }

    auto min_sep = static_cast<size_t>(std::llround(options_.min_separation * rate));
    Trace grid(prepared.front().streamId(), rate, t0);

    std::vector<Pick> picks;
    for (PhaseType phase : {PhaseType::P, PhaseType::S}) {
        const SampleVector& curve = phase == PhaseType::P ? p_stack : s_stack;
        for (size_t idx : findPeaks(curve, threshold, min_sep)) {
            Pick pick;
            pick.stream_id = prepared.front().streamId();
            pick.channels = channel_codes;
            pick.phase_type = phase;
            pick.time = grid.timeAt(idx);
            pick.probability = curve[idx];
            pick.backend = backend.id();
            pick.chunk_index = chunk.index;
            pick.core_distance = chunk.distanceFromCoreCenter(pick.time);
            picks.push_back(pick);
        }
    }
    return picks;
}

std::vector<Pick> DetectionAdapter::detect(const Chunk& chunk, const std::string& model_id,
                                           double threshold) {
    if (threshold < 0.0 || threshold > 1.0) {
        throw std::invalid_argument("DetectionAdapter: threshold must be within [0, 1]");
    }

    std::vector<Pick> picks;
    try {
        InferenceBackendPtr backend = registry_->get(model_id);

        for (const auto& station : chunk.stations()) {
            auto traces = chunk.tracesForStation(station);
            if (traces.empty()) continue;
            auto station_picks = detectStation(*backend, chunk, traces, threshold);
            picks.insert(picks.end(), station_picks.begin(), station_picks.end());
        }
    } catch (const InferenceError& e) {
        if (e.hasRange()) throw;
        throw InferenceError(e.what(), chunk.span);
    } catch (const std::exception& e) {
        throw InferenceError(std::string("backend failure: ") + e.what(), chunk.span);
    }

    std::stable_sort(picks.begin(), picks.end(), [](const Pick& a, const Pick& b) {
        if (a.time != b.time) return a.time < b.time;
        return a.stationKey() < b.stationKey();
    });
    return picks;
}

} // namespace seisstream
