#pragma once

#include "seisstream/core/event.hpp"
#include "seisstream/core/station.hpp"
#include <memory>
#include <string>
#include <vector>

namespace seisstream {

/**
 * ClusterRejection - Candidate origin the backend could not support
 */
struct ClusterRejection {
    std::vector<uint64_t> pick_ids;
    std::string reason;
};

/**
 * ClusterResult - Output of one clustering pass
 *
 * Events with an empty id are new. Events carrying the id of an open
 * event replace that event.
 */
struct ClusterResult {
    std::vector<Event> events;
    std::vector<ClusterRejection> insufficient;
};

/**
 * AssociationBackend - Groups picks into event hypotheses
 *
 * The pick list contains every pick an open event references in addition
 * to the unassociated ones, so open events can be extended and relocated.
 * Backend failures are raised as AssociationError.
 */
class AssociationBackend {
public:
    virtual ~AssociationBackend() = default;

    virtual std::string name() const = 0;

    virtual ClusterResult cluster(const std::vector<PickPtr>& picks,
                                  const StationInventory& stations,
                                  const std::vector<Event>& open_events) = 0;
};

using AssociationBackendPtr = std::shared_ptr<AssociationBackend>;

} // namespace seisstream
