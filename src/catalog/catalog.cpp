#include "seisstream/catalog/catalog.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace seisstream {

Catalog::Catalog(double duplicate_tolerance)
    : tolerance_(duplicate_tolerance)
    , next_pick_id_(1)
    , revision_(0)
{
}

bool Catalog::pickOrder(const PickPtr& a, const PickPtr& b) {
    if (a->time != b->time) return a->time < b->time;
    if (a->stationKey() != b->stationKey()) return a->stationKey() < b->stationKey();
    if (a->phase_type != b->phase_type) return a->phase_type < b->phase_type;
    return a->id < b->id;
}

std::vector<PickPtr> Catalog::duplicatesOf(const Pick& pick) const {
    std::vector<PickPtr> result;

    TimePoint from = addSeconds(pick.time, -tolerance_);
    auto lo = std::lower_bound(picks_.begin(), picks_.end(), from,
                               [](const PickPtr& p, TimePoint t) { return p->time < t; });

    TimePoint hi = addSeconds(pick.time, tolerance_);
    for (auto it = lo; it != picks_.end() && (*it)->time <= hi; ++it) {
        const PickPtr& stored = *it;
        if (superseded_.count(stored->id)) continue;
        if (stored->stationKey() != pick.stationKey()) continue;
        if (stored->phase_type != pick.phase_type) continue;
        result.push_back(stored);
    }
    return result;
}

std::vector<PickPtr> Catalog::addPicks(const std::vector<Pick>& picks) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PickPtr> added;

    for (const auto& incoming : picks) {
        std::vector<PickPtr> duplicates = duplicatesOf(incoming);

        bool stronger = std::all_of(duplicates.begin(), duplicates.end(),
                                    [&incoming](const PickPtr& p) {
                                        return incoming.probability > p->probability;
                                    });
        if (!stronger) continue;

        for (const auto& dup : duplicates) {
            superseded_.insert(dup->id);
        }

        auto stored = std::make_shared<Pick>(incoming);
        stored->id = next_pick_id_++;
        PickPtr pick = stored;

        picks_.insert(std::upper_bound(picks_.begin(), picks_.end(), pick, pickOrder), pick);
        picks_by_id_[pick->id] = pick;
        added.push_back(pick);
        revision_++;
    }
    return added;
}

void Catalog::upsertEvent(const Event& event) {
    if (event.id().empty()) {
        throw std::invalid_argument("Catalog: event without id");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (uint64_t id : event.pickIds()) {
        if (!picks_by_id_.count(id)) {
            throw std::invalid_argument("Catalog: event " + event.id() +
                                        " references unknown pick " + std::to_string(id));
        }
    }

    auto ptr = std::make_shared<const Event>(event);

    auto it = std::find_if(events_.begin(), events_.end(),
                           [&event](const EventEntry& e) { return e.id == event.id(); });
    if (it != events_.end()) {
        it->event = ptr;
    } else {
        EventEntry entry;
        entry.first_origin = event.originTime();
        entry.id = event.id();
        entry.event = ptr;

        auto pos = std::upper_bound(events_.begin(), events_.end(), entry,
                                    [](const EventEntry& a, const EventEntry& b) {
                                        if (a.first_origin != b.first_origin) {
                                            return a.first_origin < b.first_origin;
                                        }
                                        return a.id < b.id;
                                    });
        events_.insert(pos, entry);
    }
    revision_++;
}

std::vector<PickPtr> Catalog::allPicks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return picks_;
}

std::vector<PickPtr> Catalog::activePicks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PickPtr> result;
    for (const auto& p : picks_) {
        if (!superseded_.count(p->id)) result.push_back(p);
    }
    return result;
}

std::vector<EventPtr> Catalog::allEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventPtr> result;
    for (const auto& e : events_) result.push_back(e.event);
    return result;
}

CatalogSnapshot Catalog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CatalogSnapshot snap;
    snap.picks = picks_;
    for (const auto& e : events_) snap.events.push_back(e.event);
    snap.revision = revision_;
    return snap;
}

std::vector<ExportRecord> Catalog::exportView() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<uint64_t, std::string> owner;
    for (const auto& e : events_) {
        for (uint64_t id : e.event->pickIds()) owner[id] = e.id;
    }

    std::vector<ExportRecord> rows;
    for (const auto& e : events_) {
        ExportRecord row;
        row.kind = ExportRecord::Kind::Event;
        row.time = e.first_origin;
        row.event_id = e.id;
        row.event = e.event;
        rows.push_back(row);
    }
    for (const auto& p : picks_) {
        ExportRecord row;
        row.kind = ExportRecord::Kind::Pick;
        row.time = p->time;
        auto it = owner.find(p->id);
        if (it != owner.end()) row.event_id = it->second;
        row.pick = p;
        row.superseded = superseded_.count(p->id) > 0;
        rows.push_back(row);
    }

    // Both inputs are already ordered; events sort before picks at equal times
    std::stable_sort(rows.begin(), rows.end(), [](const ExportRecord& a, const ExportRecord& b) {
        if (a.time != b.time) return a.time < b.time;
        return a.kind == ExportRecord::Kind::Event && b.kind == ExportRecord::Kind::Pick;
    });
    return rows;
}

std::vector<PickPtr> Catalog::picksBetween(TimePoint start, TimePoint end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PickPtr> result;
    auto lo = std::lower_bound(picks_.begin(), picks_.end(), start,
                               [](const PickPtr& p, TimePoint t) { return p->time < t; });
    for (auto it = lo; it != picks_.end() && (*it)->time < end; ++it) {
        if (!superseded_.count((*it)->id)) result.push_back(*it);
    }
    return result;
}

std::vector<EventPtr> Catalog::eventsBetween(TimePoint start, TimePoint end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventPtr> result;
    for (const auto& e : events_) {
        TimePoint t = e.event->originTime();
        if (t >= start && t < end) result.push_back(e.event);
    }
    return result;
}

PickPtr Catalog::getPick(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = picks_by_id_.find(id);
    return it != picks_by_id_.end() ? it->second : nullptr;
}

EventPtr Catalog::getEvent(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : events_) {
        if (e.id == id) return e.event;
    }
    return nullptr;
}

bool Catalog::isSuperseded(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return superseded_.count(id) > 0;
}

size_t Catalog::pickCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return picks_.size();
}

size_t Catalog::eventCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t Catalog::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

} // namespace seisstream
