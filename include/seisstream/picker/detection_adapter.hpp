#pragma once

#include "seisstream/core/event.hpp"
#include "seisstream/core/config.hpp"
#include "seisstream/stream/chunked_reader.hpp"
#include "inference_backend.hpp"
#include <string>
#include <vector>

namespace seisstream {

struct DetectionOptions {
    std::string model = "PhaseNet";
    double threshold = 0.5;          // Inclusive probability threshold
    double min_separation = 1.0;     // Seconds between picks of one phase
    double window_stride = 0.5;      // Fraction of the window length

    static DetectionOptions fromConfig(const Config& config);
};

/**
 * DetectionAdapter - Runs an inference backend over a conditioned chunk
 *
 * Per station the channels are ordered vertical first, resampled to the
 * backend rate and cut into fixed windows. Window outputs are stacked by
 * maximum, local maxima at or above the threshold become picks, and picks
 * closer than the minimum separation keep only the stronger one. The
 * adapter never retries; a failing backend surfaces as InferenceError
 * carrying the chunk time range.
 */
class DetectionAdapter {
public:
    explicit DetectionAdapter(InferenceRegistryPtr registry,
                              const DetectionOptions& options = DetectionOptions());

    std::vector<Pick> detect(const Chunk& chunk, const std::string& model_id, double threshold);
    std::vector<Pick> detect(const Chunk& chunk) {
        return detect(chunk, options_.model, options_.threshold);
    }

    // Indices of peaks with value >= threshold, at least min_separation apart
    static std::vector<size_t> findPeaks(const SampleVector& prob, double threshold,
                                         size_t min_separation);

    const DetectionOptions& options() const { return options_; }
    InferenceRegistryPtr registry() const { return registry_; }

private:
    InferenceRegistryPtr registry_;
    DetectionOptions options_;

    std::vector<Pick> detectStation(InferenceBackend& backend, const Chunk& chunk,
                                    std::vector<const Trace*> traces, double threshold) const;
};

} // namespace seisstream
