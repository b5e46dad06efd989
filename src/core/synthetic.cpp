#include "seisstream/core/synthetic.hpp"
#include <random>
#include <cmath>
#include <algorithm>

namespace seisstream {

SyntheticWaveformBuilder::SyntheticWaveformBuilder(TimePoint start, double duration,
                                                   double sample_rate, uint32_t seed)
    : start_(start)
    , duration_(duration)
    , sample_rate_(sample_rate)
    , seed_(seed)
    , noise_level_(1.0)
{
}

void SyntheticWaveformBuilder::addStation(const std::string& network, const std::string& code,
                                          const std::string& location, const std::string& band) {
    stations_.push_back({network, code, location, band});
}

void SyntheticWaveformBuilder::addArrival(const std::string& station_key, PhaseType phase,
                                          double offset, double amplitude,
                                          double frequency, double decay) {
    arrivals_.push_back({station_key, phase, offset, amplitude, frequency, decay});
}

void SyntheticWaveformBuilder::addEvent(const GeoPoint& hypocenter, double origin_offset,
                                        const StationInventory& inventory, double amplitude,
                                        double vp, double vs) {
    for (const auto& entry : stations_) {
        auto station = inventory.getStation(entry.network + "." + entry.code);
        if (!station) continue;

        double epi = hypocenter.distanceTo(station->location());
        double hypo = std::sqrt(epi * epi + hypocenter.depth * hypocenter.depth);

        // Geometric spreading relative to 10 km
        double scale = amplitude * 10.0 / std::max(hypo, 10.0);
        addArrival(station->key(), PhaseType::P, origin_offset + hypo / vp, scale, 6.0, 1.0);
        addArrival(station->key(), PhaseType::S, origin_offset + hypo / vs, 2.0 * scale, 3.0, 2.0);
    }
}

void SyntheticWaveformBuilder::inject(SampleVector& data, const SyntheticArrival& arrival,
                                      double phase_shift) const {
    auto first = static_cast<size_t>(std::llround(arrival.offset * sample_rate_));
    auto length = static_cast<size_t>(8.0 * arrival.decay * sample_rate_);
    double dt = 1.0 / sample_rate_;

    for (size_t i = 0; i < length && first + i < data.size(); i++) {
        double t = i * dt;
        double env = std::exp(-t / arrival.decay);
        data[first + i] += arrival.amplitude * env *
                           std::cos(2.0 * M_PI * arrival.frequency * t + phase_shift);
    }
}

std::vector<Trace> SyntheticWaveformBuilder::buildTraces() const {
    std::mt19937 gen(seed_);
    std::normal_distribution<> noise(0.0, noise_level_);
    auto n_samples = static_cast<size_t>(std::llround(duration_ * sample_rate_));

    std::vector<Trace> traces;
    for (const auto& entry : stations_) {
        std::string key = entry.network + "." + entry.code;

        for (char component : {'Z', 'N', 'E'}) {
            StreamID id(entry.network, entry.code, entry.location,
                        entry.band + std::string(1, component));
            SampleVector data(n_samples);
            for (auto& s : data) {
                s = noise(gen);
            }

            for (const auto& arrival : arrivals_) {
                if (arrival.station != key) continue;
                if (arrival.phase == PhaseType::P && component == 'Z') {
                    inject(data, arrival, 0.0);
                } else if (arrival.phase == PhaseType::S && component != 'Z') {
                    inject(data, arrival, component == 'N' ? 0.0 : M_PI / 3.0);
                }
            }

            traces.emplace_back(id, sample_rate_, start_, std::move(data));
        }
    }
    return traces;
}

WaveformPtr SyntheticWaveformBuilder::build() const {
    return std::make_shared<const Waveform>(buildTraces());
}

} // namespace seisstream
