#include "seisstream/associator/association_adapter.hpp"
#include "seisstream/core/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace seisstream {

AssociationOptions AssociationOptions::fromConfig(const Config& config) {
    AssociationOptions opts;
    opts.quiescence = config.getDouble("associator.quiescence", opts.quiescence);
    opts.pending_window = config.getDouble("associator.pending_window", opts.pending_window);
    opts.event_prefix = config.getString("associator.event_prefix", opts.event_prefix);
    return opts;
}

std::vector<PickPtr> AssociationSession::pendingPicks() const {
    std::vector<PickPtr> result;
    for (uint64_t id : pending_) {
        auto it = picks_.find(id);
        if (it != picks_.end()) result.push_back(it->second);
    }
    std::sort(result.begin(), result.end(), [](const PickPtr& a, const PickPtr& b) {
        if (a->time != b->time) return a->time < b->time;
        return a->id < b->id;
    });
    return result;
}

bool AssociationSession::withdraw(uint64_t pick_id) {
    if (!pending_.erase(pick_id)) return false;
    picks_.erase(pick_id);
    return true;
}

void AssociationSession::clear() {
    open_events_.clear();
    last_growth_.clear();
    picks_.clear();
    pending_.clear();
}

AssociationAdapter::AssociationAdapter(AssociationBackendPtr backend, const StationInventory& stations,
                                       const AssociationOptions& options)
    : backend_(std::move(backend))
    , stations_(stations)
    , options_(options)
{
    if (!backend_) {
        throw std::invalid_argument("AssociationAdapter: no association backend");
    }
}

std::string AssociationAdapter::nextEventId(AssociationSession& session) const {
    for (;;) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%06llu",
                      static_cast<unsigned long long>(session.next_sequence_++));
        std::string id = options_.event_prefix + buf;

        bool taken = std::any_of(session.open_events_.begin(), session.open_events_.end(),
                                 [&id](const Event& e) { return e.id() == id; });
        if (!taken) return id;
    }
}

void AssociationAdapter::applyCluster(const ClusterResult& cluster, AssociationSession& session,
                                      TimePoint stream_time, AssociationResult& result) {
    for (const auto& candidate : cluster.events) {
        Event event = candidate;
        event.setFinalized(false);

        auto existing = std::find_if(session.open_events_.begin(), session.open_events_.end(),
                                     [&event](const Event& e) {
                                         return !event.id().empty() && e.id() == event.id();
                                     });

        if (existing == session.open_events_.end()) {
            if (!event.id().empty()) {
                std::cerr << "AssociationAdapter: backend revised unknown event "
                          << event.id() << ", treating it as new" << std::endl;
            }
            event.setId(nextEventId(session));
            event.setRevision(1);
            session.open_events_.push_back(event);
            session.last_growth_[event.id()] = stream_time;
        } else {
            if (event.pickIds().size() > existing->pickIds().size()) {
                session.last_growth_[event.id()] = stream_time;
            }
            event.setRevision(existing->revision() + 1);
            *existing = event;
        }

        for (uint64_t id : event.pickIds()) {
            session.pending_.erase(id);
        }
        result.updated.push_back(event);
    }

    result.insufficient += cluster.insufficient.size();
}

void AssociationAdapter::prune(AssociationSession& session) const {
    std::set<uint64_t> keep(session.pending_.begin(), session.pending_.end());
    for (const auto& event : session.open_events_) {
        keep.insert(event.pickIds().begin(), event.pickIds().end());
    }
    for (auto it = session.picks_.begin(); it != session.picks_.end(); ) {
        if (keep.count(it->first)) {
            ++it;
        } else {
            it = session.picks_.erase(it);
        }
    }
}

AssociationResult AssociationAdapter::associate(const std::vector<PickPtr>& new_picks,
                                                AssociationSession& session, TimePoint stream_time) {
    AssociationResult result;

    for (const auto& pick : new_picks) {
        if (!pick) continue;
        if (session.picks_.count(pick->id)) continue;
        session.picks_[pick->id] = pick;
        session.pending_.insert(pick->id);
    }

    if (!session.pending_.empty()) {
        std::vector<PickPtr> input;
        for (const auto& entry : session.picks_) input.push_back(entry.second);

        try {
            ClusterResult cluster = backend_->cluster(input, stations_, session.open_events_);
            applyCluster(cluster, session, stream_time, result);
        } catch (const AssociationError& e) {
            // The batch stays pending and is retried with the next call
            std::cerr << "AssociationAdapter: " << backend_->name() << " failed: "
                      << e.what() << std::endl;
            result.error = e.what();
        }
    }

    // Close quiet events
    Duration quiet = secondsToDuration(options_.quiescence);
    for (auto it = session.open_events_.begin(); it != session.open_events_.end(); ) {
        TimePoint grown = session.last_growth_[it->id()];
        if (stream_time - grown > quiet) {
            Event closed = *it;
            closed.setFinalized(true);
            closed.setRevision(closed.revision() + 1);
            result.finalized.push_back(closed);
            session.last_growth_.erase(it->id());
            it = session.open_events_.erase(it);
        } else {
            ++it;
        }
    }

    // Age out picks nothing claimed
    TimePoint oldest = addSeconds(stream_time, -options_.pending_window);
    for (auto it = session.pending_.begin(); it != session.pending_.end(); ) {
        const PickPtr& pick = session.picks_[*it];
        if (pick->time < oldest) {
            result.expired.push_back(pick);
            it = session.pending_.erase(it);
        } else {
            ++it;
        }
    }

    prune(session);
    result.still_open = session.open_events_;
    return result;
}

AssociationResult AssociationAdapter::associate(const std::vector<PickPtr>& picks,
                                                const std::vector<Event>& open_events) {
    AssociationSession session;
    session.open_events_ = open_events;

    std::set<uint64_t> referenced;
    for (const auto& event : open_events) {
        referenced.insert(event.pickIds().begin(), event.pickIds().end());
    }
    for (const auto& pick : picks) {
        if (!pick) continue;
        session.picks_[pick->id] = pick;
        if (!referenced.count(pick->id)) session.pending_.insert(pick->id);
    }

    AssociationResult result;
    std::vector<PickPtr> input;
    TimePoint latest;
    for (const auto& entry : session.picks_) {
        input.push_back(entry.second);
        latest = std::max(latest, entry.second->time);
    }

    try {
        ClusterResult cluster = backend_->cluster(input, stations_, session.open_events_);
        applyCluster(cluster, session, latest, result);
    } catch (const AssociationError& e) {
        std::cerr << "AssociationAdapter: " << backend_->name() << " failed: "
                  << e.what() << std::endl;
        result.error = e.what();
    }

    result.still_open = session.open_events_;
    return result;
}

AssociationResult AssociationAdapter::finalize(AssociationSession& session) {
    AssociationResult result;
    for (const auto& event : session.open_events_) {
        Event closed = event;
        closed.setFinalized(true);
        closed.setRevision(closed.revision() + 1);
        result.finalized.push_back(closed);
    }
    for (uint64_t id : session.pending_) {
        result.expired.push_back(session.picks_[id]);
    }
    session.clear();
    return result;
}

} // namespace seisstream
