#pragma once

#include "types.hpp"
#include <vector>
#include <memory>
#include <string>

namespace seisstream {

/**
 * Pick - A phase arrival detected by an inference backend
 *
 * Picks are immutable once stored in the catalog. The catalog assigns
 * the id; a pick with id 0 has not been stored yet.
 */
struct Pick {
    uint64_t id;
    StreamID stream_id;                 // Station plus the vertical channel used
    std::vector<std::string> channels;  // Channel codes fed to the backend
    PhaseType phase_type;
    TimePoint time;
    double probability;                 // Peak probability, 0..1

    std::string backend;                // Model that produced the pick
    size_t chunk_index;                 // Chunk the pick was detected in
    double core_distance;               // Seconds from the chunk's core centre

    Pick() : id(0), phase_type(PhaseType::Unknown), probability(0),
             chunk_index(0), core_distance(0) {}

    std::string stationKey() const { return stream_id.stationKey(); }
};

using PickPtr = std::shared_ptr<const Pick>;

/**
 * Arrival - Pick associated with an origin
 */
struct Arrival {
    uint64_t pick_id;
    std::string station;    // "NET.STA"
    PhaseType phase_type;
    double distance;        // Hypocentral distance (km)
    double residual;        // Observed - calculated time (seconds)

    Arrival() : pick_id(0), phase_type(PhaseType::Unknown), distance(0), residual(0) {}
};

/**
 * Origin - Hypocenter solution
 */
struct Origin {
    TimePoint time;
    GeoPoint location;

    double rms;              // RMS residual (seconds)
    int phase_count;
    int station_count;
    bool is_fixed_depth;
    std::string algorithm;

    std::vector<Arrival> arrivals;

    Origin() : rms(0), phase_count(0), station_count(0), is_fixed_depth(false) {}
};

/**
 * Event - Associated earthquake hypothesis
 *
 * The event references its picks by id only; the catalog owns them.
 * An event stays open for revision until it is finalized.
 */
class Event {
public:
    Event() : confidence_(0), finalized_(false), revision_(0) {}
    explicit Event(const std::string& id)
        : id_(id), confidence_(0), finalized_(false), revision_(0) {}

    const std::string& id() const { return id_; }
    void setId(const std::string& id) { id_ = id; }

    const Origin& origin() const { return origin_; }
    void setOrigin(const Origin& origin) { origin_ = origin; }

    TimePoint originTime() const { return origin_.time; }

    const std::vector<uint64_t>& pickIds() const { return pick_ids_; }
    void setPickIds(std::vector<uint64_t> ids) { pick_ids_ = std::move(ids); }
    bool references(uint64_t pick_id) const;

    // 0..1 quality score derived from station count and fit
    double confidence() const { return confidence_; }
    void setConfidence(double c) { confidence_ = c; }

    bool isFinalized() const { return finalized_; }
    void setFinalized(bool f) { finalized_ = f; }

    // Incremented on every published update
    uint32_t revision() const { return revision_; }
    void setRevision(uint32_t r) { revision_ = r; }

    std::string summary() const;

private:
    std::string id_;
    Origin origin_;
    std::vector<uint64_t> pick_ids_;
    double confidence_;
    bool finalized_;
    uint32_t revision_;
};

using EventPtr = std::shared_ptr<const Event>;

} // namespace seisstream
