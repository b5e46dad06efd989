#include "seisstream/core/event.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace seisstream {

bool Event::references(uint64_t pick_id) const {
    return std::find(pick_ids_.begin(), pick_ids_.end(), pick_id) != pick_ids_.end();
}

std::string Event::summary() const {
    std::ostringstream oss;

    oss << std::fixed << std::setprecision(3);
    oss << "Event: " << id_ << (finalized_ ? " (final)" : " (open)")
        << " rev " << revision_ << "\n";
    oss << "  Time: " << formatTime(origin_.time) << "\n";
    oss << "  Location: " << origin_.location.latitude << " N, "
        << origin_.location.longitude << " E\n";
    oss << "  Depth: " << origin_.location.depth << " km"
        << (origin_.is_fixed_depth ? " (fixed)" : "") << "\n";
    oss << "  Picks: " << pick_ids_.size() << " from " << origin_.station_count
        << " stations, RMS=" << origin_.rms << "s, confidence="
        << std::setprecision(2) << confidence_ << "\n";

    return oss.str();
}

} // namespace seisstream
