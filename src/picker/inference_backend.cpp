#include "seisstream/picker/inference_backend.hpp"
#include "seisstream/picker/builtin_backends.hpp"
#include "seisstream/core/errors.hpp"
#include <iostream>

namespace seisstream {

std::string backendFamilyToString(BackendFamily family) {
    switch (family) {
        case BackendFamily::EQTransformer: return "EQTransformer";
        case BackendFamily::PhaseNet: return "PhaseNet";
        case BackendFamily::PickBlue: return "PickBlue";
        case BackendFamily::OBSTransformer: return "OBSTransformer";
        default: return "Custom";
    }
}

void InferenceRegistry::registerBackend(const std::string& model_id, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[model_id] = std::move(factory);
    instances_.erase(model_id);
}

bool InferenceRegistry::has(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(model_id) > 0;
}

std::vector<std::string> InferenceRegistry::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, factory] : factories_) {
        ids.push_back(id);
    }
    return ids;
}

InferenceBackendPtr InferenceRegistry::get(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cached = instances_.find(model_id);
    if (cached != instances_.end()) {
        return cached->second;
    }

    auto it = factories_.find(model_id);
    if (it == factories_.end()) {
        throw InferenceError("InferenceRegistry: model not found: " + model_id);
    }

    InferenceBackendPtr backend = it->second();
    if (!backend) {
        throw InferenceError("InferenceRegistry: failed to create model " + model_id);
    }

    std::cout << "InferenceRegistry: loaded " << model_id << " ("
              << backendFamilyToString(backend->family()) << ", "
              << backend->inputShape().samples << " samples @ "
              << backend->inputShape().sample_rate << " Hz)" << std::endl;

    instances_[model_id] = backend;
    return backend;
}

std::shared_ptr<InferenceRegistry> InferenceRegistry::withBuiltins() {
    auto registry = std::make_shared<InferenceRegistry>();
    registerBuiltinBackends(*registry);
    return registry;
}

} // namespace seisstream
