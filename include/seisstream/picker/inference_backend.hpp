#pragma once

#include "seisstream/core/types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace seisstream {

// Model families the detection stage knows how to drive
enum class BackendFamily {
    EQTransformer,
    PhaseNet,
    PickBlue,
    OBSTransformer,
    Custom
};

std::string backendFamilyToString(BackendFamily family);

/**
 * InputShape - Fixed window a backend consumes
 */
struct InputShape {
    size_t channels;       // Components, vertical first
    size_t samples;        // Samples per window
    double sample_rate;    // Hz
};

/**
 * InferenceWindow - One fixed-shape block of multi-channel samples
 */
struct InferenceWindow {
    std::vector<SampleVector> channels;   // [component][sample]
    double sample_rate = 0;

    size_t sampleCount() const { return channels.empty() ? 0 : channels.front().size(); }
};

/**
 * PhaseProbabilities - Per-sample phase probability curves
 */
struct PhaseProbabilities {
    SampleVector p;
    SampleVector s;
};

/**
 * InferenceBackend - Capability interface for phase detection models
 *
 * infer() maps a window to P and S probability curves of the same
 * length. Failures, including a window of the wrong shape, are raised
 * as InferenceError.
 */
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    virtual std::string id() const = 0;
    virtual BackendFamily family() const = 0;
    virtual InputShape inputShape() const = 0;

    // Context (seconds) a sample's probability depends on
    virtual double receptiveField() const = 0;

    virtual PhaseProbabilities infer(const InferenceWindow& window) = 0;
};

using InferenceBackendPtr = std::shared_ptr<InferenceBackend>;

/**
 * InferenceRegistry - Model id to backend lookup
 *
 * Backends are created on first use and shared afterwards. New backends
 * register a factory; the detection stage never needs to change.
 */
class InferenceRegistry {
public:
    using Factory = std::function<InferenceBackendPtr()>;

    InferenceRegistry() = default;

    void registerBackend(const std::string& model_id, Factory factory);
    bool has(const std::string& model_id) const;
    std::vector<std::string> available() const;

    // Throws InferenceError for an unknown model or a failing factory
    InferenceBackendPtr get(const std::string& model_id);

    // Registry preloaded with the built-in model families
    static std::shared_ptr<InferenceRegistry> withBuiltins();

private:
    mutable std::mutex mutex_;
    std::map<std::string, Factory> factories_;
    std::map<std::string, InferenceBackendPtr> instances_;
};

using InferenceRegistryPtr = std::shared_ptr<InferenceRegistry>;

} // namespace seisstream
