#include "seisstream/picker/builtin_backends.hpp"
#include "seisstream/core/errors.hpp"
#include <cmath>
#include <algorithm>

namespace seisstream {

// Window shapes follow the published models: 60 s for the transformer
// families, 30.01 s for the PhaseNet-style U-Nets, all at 100 Hz.

CharacteristicBackendParams CharacteristicBackendParams::eqTransformer() {
    return {"EQTransformer", BackendFamily::EQTransformer, 6000, 100.0, 2.0, 0.5, 9.0};
}

CharacteristicBackendParams CharacteristicBackendParams::phaseNet() {
    return {"PhaseNet", BackendFamily::PhaseNet, 3001, 100.0, 1.5, 0.4, 9.0};
}

CharacteristicBackendParams CharacteristicBackendParams::pickBlue() {
    return {"PickBlue", BackendFamily::PickBlue, 3001, 100.0, 2.5, 0.6, 12.0};
}

CharacteristicBackendParams CharacteristicBackendParams::obsTransformer() {
    return {"OBSTransformer", BackendFamily::OBSTransformer, 6000, 100.0, 3.0, 0.6, 12.0};
}

CharacteristicBackend::CharacteristicBackend(const CharacteristicBackendParams& params)
    : params_(params)
{
}

InputShape CharacteristicBackend::inputShape() const {
    return {3, params_.window_samples, params_.sample_rate};
}

SampleVector CharacteristicBackend::energyRatioCurve(const SampleVector& energy) const {
    size_t n = energy.size();
    SampleVector prob(n, 0.0);

    auto nb = static_cast<size_t>(std::llround(params_.pre_window * params_.sample_rate));
    auto na = static_cast<size_t>(std::llround(params_.post_window * params_.sample_rate));
    if (nb == 0 || na == 0 || nb + na > n) return prob;

    std::vector<double> cumsum(n + 1, 0.0);
    for (size_t i = 0; i < n; i++) {
        cumsum[i + 1] = cumsum[i] + energy[i];
    }

    // Keeps silent (zero-padded) stretches from producing huge ratios
    double floor = 1e-6 * cumsum[n] / n + 1e-30;

    for (size_t i = nb; i + na <= n; i++) {
        double before = (cumsum[i] - cumsum[i - nb]) / nb;
        double after = (cumsum[i + na] - cumsum[i]) / na;
        double ratio = after / (before + floor);
        if (ratio > 1.0) {
            prob[i] = (ratio - 1.0) / (ratio - 1.0 + params_.sensitivity);
        }
    }
    return prob;
}

PhaseProbabilities CharacteristicBackend::infer(const InferenceWindow& window) {
    InputShape shape = inputShape();
    if (window.channels.size() != shape.channels) {
        throw InferenceError(params_.id + ": expected " + std::to_string(shape.channels) +
                             " channels, got " + std::to_string(window.channels.size()));
    }
    if (std::abs(window.sample_rate - shape.sample_rate) > 1e-9) {
        throw InferenceError(params_.id + ": expected " + std::to_string(shape.sample_rate) +
                             " Hz input, got " + std::to_string(window.sample_rate));
    }
    for (const auto& channel : window.channels) {
        if (channel.size() != shape.samples) {
            throw InferenceError(params_.id + ": expected " + std::to_string(shape.samples) +
                                 " samples per channel, got " + std::to_string(channel.size()));
        }
        for (double v : channel) {
            if (!std::isfinite(v)) {
                throw InferenceError(params_.id + ": non-finite input sample");
            }
        }
    }

    size_t n = shape.samples;
    SampleVector vertical(n), horizontal(n);
    for (size_t i = 0; i < n; i++) {
        vertical[i] = window.channels[0][i] * window.channels[0][i];
        horizontal[i] = window.channels[1][i] * window.channels[1][i] +
                        window.channels[2][i] * window.channels[2][i];
    }

    PhaseProbabilities result;
    result.p = energyRatioCurve(vertical);
    result.s = energyRatioCurve(horizontal);
    return result;
}

void registerBuiltinBackends(InferenceRegistry& registry) {
    for (const auto& params : {CharacteristicBackendParams::eqTransformer(),
                               CharacteristicBackendParams::phaseNet(),
                               CharacteristicBackendParams::pickBlue(),
                               CharacteristicBackendParams::obsTransformer()}) {
        registry.registerBackend(params.id, [params]() {
            return std::make_shared<CharacteristicBackend>(params);
        });
    }
}

} // namespace seisstream
