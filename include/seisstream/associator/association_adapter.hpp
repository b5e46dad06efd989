#pragma once

#include "association_backend.hpp"
#include "seisstream/core/config.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace seisstream {

struct AssociationOptions {
    double quiescence = 60.0;        // Stream seconds without new picks before an event closes
    double pending_window = 300.0;   // Unassociated picks older than this are dropped
    std::string event_prefix = "ev";

    static AssociationOptions fromConfig(const Config& config);
};

/**
 * AssociationSession - Association state carried across chunks
 *
 * Holds the open events, the picks that have not joined an event yet and
 * the event id sequence. One session belongs to one pipeline run.
 */
class AssociationSession {
public:
    explicit AssociationSession(uint64_t first_sequence = 1) : next_sequence_(first_sequence) {}

    const std::vector<Event>& openEvents() const { return open_events_; }
    std::vector<PickPtr> pendingPicks() const;
    size_t pendingCount() const { return pending_.size(); }

    // Forget a pick that has not joined an event; false if it is not pending
    bool withdraw(uint64_t pick_id);

    // Drop all state; the id sequence keeps counting
    void clear();

private:
    friend class AssociationAdapter;

    std::vector<Event> open_events_;
    std::map<std::string, TimePoint> last_growth_;   // Event id -> stream time of last new pick
    std::map<uint64_t, PickPtr> picks_;              // Pending picks plus picks of open events
    std::set<uint64_t> pending_;
    uint64_t next_sequence_;
};

/**
 * AssociationResult - Outcome of one association step
 */
struct AssociationResult {
    std::vector<Event> updated;      // New or revised open events
    std::vector<Event> finalized;    // Events closed by this step
    std::vector<Event> still_open;
    std::vector<PickPtr> expired;    // Pending picks that aged out
    size_t insufficient = 0;         // Candidate origins rejected for lack of stations
    std::optional<std::string> error;
};

/**
 * AssociationAdapter - Incremental event association
 *
 * Each call hands the session's pending picks and open events to the
 * backend. New events receive ids from the session sequence; revised
 * events keep their id and bump their revision. A backend failure leaves
 * the batch pending for the next call and is reported in the result.
 * Open events that gain no picks for the quiescence interval of stream
 * time are finalized.
 */
class AssociationAdapter {
public:
    AssociationAdapter(AssociationBackendPtr backend, const StationInventory& stations,
                       const AssociationOptions& options = AssociationOptions());

    AssociationResult associate(const std::vector<PickPtr>& new_picks,
                                AssociationSession& session, TimePoint stream_time);

    // Stateless form; picks must include those referenced by open_events
    AssociationResult associate(const std::vector<PickPtr>& picks,
                                const std::vector<Event>& open_events);

    // Close every open event, e.g. at the end of the stream
    AssociationResult finalize(AssociationSession& session);

    const AssociationBackend& backend() const { return *backend_; }
    const AssociationOptions& options() const { return options_; }

private:
    AssociationBackendPtr backend_;
    const StationInventory& stations_;
    AssociationOptions options_;

    std::string nextEventId(AssociationSession& session) const;
    void applyCluster(const ClusterResult& cluster, AssociationSession& session,
                      TimePoint stream_time, AssociationResult& result);
    void prune(AssociationSession& session) const;
};

} // namespace seisstream
