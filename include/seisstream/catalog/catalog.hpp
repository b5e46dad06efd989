#pragma once

#include "seisstream/core/event.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace seisstream {

/**
 * ExportRecord - One row of the flattened catalog view
 *
 * Event rows carry the event; pick rows carry the pick, the id of the
 * event that references it (empty when unassociated) and whether a later
 * pick superseded it.
 */
struct ExportRecord {
    enum class Kind { Event, Pick };

    Kind kind;
    TimePoint time;
    std::string event_id;
    EventPtr event;
    PickPtr pick;
    bool superseded;

    ExportRecord() : kind(Kind::Pick), superseded(false) {}
};

/**
 * CatalogSnapshot - Consistent read of the whole catalog
 */
struct CatalogSnapshot {
    std::vector<PickPtr> picks;
    std::vector<EventPtr> events;
    uint64_t revision = 0;
};

/**
 * Catalog - Append-only store of picks and events
 *
 * Picks are immutable once added and are never removed; a pick that
 * duplicates a stored one of the same station and phase within the
 * tolerance either supersedes it (higher probability) or is dropped.
 * Events are replaced as a whole, so readers never see a partially
 * updated pick list. Iteration follows time order fixed when an item is
 * first inserted: later reads see a superset in the same relative order.
 *
 * All methods are thread-safe.
 */
class Catalog {
public:
    explicit Catalog(double duplicate_tolerance = 0.5);

    // Assigns ids; returns the picks actually stored, in input order
    std::vector<PickPtr> addPicks(const std::vector<Pick>& picks);

    // Throws std::invalid_argument for an empty id or unknown pick ids
    void upsertEvent(const Event& event);

    std::vector<PickPtr> allPicks() const;
    std::vector<PickPtr> activePicks() const;
    std::vector<EventPtr> allEvents() const;

    std::vector<ExportRecord> exportView() const;
    CatalogSnapshot snapshot() const;

    // Non-superseded picks with time in [start, end)
    std::vector<PickPtr> picksBetween(TimePoint start, TimePoint end) const;
    // Events with origin time in [start, end)
    std::vector<EventPtr> eventsBetween(TimePoint start, TimePoint end) const;

    PickPtr getPick(uint64_t id) const;
    EventPtr getEvent(const std::string& id) const;
    bool isSuperseded(uint64_t id) const;

    size_t pickCount() const;
    size_t eventCount() const;

    // Incremented by every change
    uint64_t revision() const;

    double duplicateTolerance() const { return tolerance_; }

private:
    struct EventEntry {
        TimePoint first_origin;   // Ordering key, fixed at first insertion
        std::string id;
        EventPtr event;
    };

    mutable std::mutex mutex_;
    double tolerance_;
    uint64_t next_pick_id_;
    uint64_t revision_;

    std::vector<PickPtr> picks_;                  // Time, station, phase, id order
    std::map<uint64_t, PickPtr> picks_by_id_;
    std::set<uint64_t> superseded_;
    std::vector<EventEntry> events_;

    static bool pickOrder(const PickPtr& a, const PickPtr& b);
    std::vector<PickPtr> duplicatesOf(const Pick& pick) const;
};

using CatalogPtr = std::shared_ptr<Catalog>;

} // namespace seisstream
