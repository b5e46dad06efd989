#pragma once

#include "inference_backend.hpp"

namespace seisstream {

/**
 * CharacteristicBackendParams - Shape and tuning of a built-in model
 */
struct CharacteristicBackendParams {
    std::string id;
    BackendFamily family;
    size_t window_samples;
    double sample_rate;
    double pre_window;      // Energy window before the sample (s)
    double post_window;     // Energy window after the sample (s)
    double sensitivity;     // Energy ratio excess giving probability 0.5

    static CharacteristicBackendParams eqTransformer();
    static CharacteristicBackendParams phaseNet();
    static CharacteristicBackendParams pickBlue();
    static CharacteristicBackendParams obsTransformer();
};

/**
 * CharacteristicBackend - Deterministic stand-in for neural pickers
 *
 * P probability comes from the vertical channel, S probability from the
 * horizontals. At each sample the mean energy in the post window is
 * compared with the mean energy in the pre window; the ratio R maps to
 * (R - 1) / (R - 1 + sensitivity), which peaks at an energy onset.
 * Samples without a full pre and post window get probability 0.
 */
class CharacteristicBackend : public InferenceBackend {
public:
    explicit CharacteristicBackend(const CharacteristicBackendParams& params);

    std::string id() const override { return params_.id; }
    BackendFamily family() const override { return params_.family; }
    InputShape inputShape() const override;
    double receptiveField() const override {
        return params_.pre_window + params_.post_window;
    }

    PhaseProbabilities infer(const InferenceWindow& window) override;

    const CharacteristicBackendParams& params() const { return params_; }

private:
    CharacteristicBackendParams params_;

    SampleVector energyRatioCurve(const SampleVector& energy) const;
};

// Register EQTransformer, PhaseNet, PickBlue and OBSTransformer
void registerBuiltinBackends(InferenceRegistry& registry);

} // namespace seisstream
