#pragma once

#include "types.hpp"
#include "waveform.hpp"
#include "station.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace seisstream {

/**
 * SyntheticArrival - Phase arrival injected into a synthetic recording
 */
struct SyntheticArrival {
    std::string station;    // "NET.STA"
    PhaseType phase;
    double offset;          // Seconds after the recording start
    double amplitude;
    double frequency;       // Hz
    double decay;           // Envelope e-folding time (s)
};

/**
 * SyntheticWaveformBuilder - Reproducible three-component test recordings
 *
 * Each station gets Z/N/E channels of Gaussian noise from a seeded
 * generator. P arrivals are written to the vertical channel, S arrivals
 * to both horizontals, as exponentially decaying cosines starting at the
 * onset sample.
 */
class SyntheticWaveformBuilder {
public:
    SyntheticWaveformBuilder(TimePoint start, double duration,
                             double sample_rate = 100.0, uint32_t seed = 42);

    void setNoiseLevel(double stddev) { noise_level_ = stddev; }

    void addStation(const std::string& network, const std::string& code,
                    const std::string& location = "00",
                    const std::string& band = "HH");

    void addArrival(const std::string& station_key, PhaseType phase, double offset,
                    double amplitude, double frequency = 5.0, double decay = 1.0);

    // Straight-ray P and S arrivals from a hypocenter at every station
    // that is both in the builder and in the inventory
    void addEvent(const GeoPoint& hypocenter, double origin_offset,
                  const StationInventory& inventory, double amplitude,
                  double vp = 7.0, double vs = 4.0);

    const std::vector<SyntheticArrival>& arrivals() const { return arrivals_; }
    TimePoint startTime() const { return start_; }

    std::vector<Trace> buildTraces() const;
    WaveformPtr build() const;

private:
    struct StationEntry {
        std::string network;
        std::string code;
        std::string location;
        std::string band;
    };

    TimePoint start_;
    double duration_;
    double sample_rate_;
    uint32_t seed_;
    double noise_level_;
    std::vector<StationEntry> stations_;
    std::vector<SyntheticArrival> arrivals_;

    void inject(SampleVector& data, const SyntheticArrival& arrival, double phase_shift) const;
};

} // namespace seisstream
