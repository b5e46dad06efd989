#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <limits>
#include <tuple>

namespace seisstream {

// Time handling - using microsecond precision
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// Sample data type
using Sample = double;
using SampleVector = std::vector<Sample>;

inline Duration secondsToDuration(double seconds) {
    return Duration(static_cast<int64_t>(std::llround(seconds * 1e6)));
}

inline double durationToSeconds(Duration d) {
    return d.count() * 1e-6;
}

// Signed difference a - b in seconds
inline double secondsBetween(TimePoint a, TimePoint b) {
    return durationToSeconds(std::chrono::duration_cast<Duration>(a - b));
}

inline TimePoint addSeconds(TimePoint t, double seconds) {
    return t + std::chrono::duration_cast<TimePoint::duration>(secondsToDuration(seconds));
}

// ISO-8601 UTC with millisecond precision
std::string formatTime(TimePoint t);

namespace constants {
    constexpr double EARTH_RADIUS_KM = 6371.0;
    constexpr double DEG_TO_RAD = M_PI / 180.0;
    constexpr double RAD_TO_DEG = 180.0 / M_PI;
    constexpr double KM_PER_DEG = 111.195;  // Great-circle km per degree
}

/**
 * GeoPoint - Station or hypocenter position
 *
 * Depth is km below the surface; stations carry negative depth (elevation).
 */
struct GeoPoint {
    double latitude;
    double longitude;
    double depth;

    GeoPoint() : latitude(0), longitude(0), depth(0) {}
    GeoPoint(double lat, double lon, double dep = 0)
        : latitude(lat), longitude(lon), depth(dep) {}

    // Epicentral great-circle distance in km, depth ignored
    double distanceTo(const GeoPoint& other) const {
        double phi1 = latitude * constants::DEG_TO_RAD;
        double phi2 = other.latitude * constants::DEG_TO_RAD;
        double half_dphi = 0.5 * (phi2 - phi1);
        double half_dlambda = 0.5 * (other.longitude - longitude) * constants::DEG_TO_RAD;

        double h = std::pow(std::sin(half_dphi), 2) +
                   std::cos(phi1) * std::cos(phi2) * std::pow(std::sin(half_dlambda), 2);
        return 2.0 * constants::EARTH_RADIUS_KM * std::asin(std::min(1.0, std::sqrt(h)));
    }
};

// SEED stream identifier NET.STA.LOC.CHA
struct StreamID {
    std::string network;
    std::string station;
    std::string location;    // May be empty
    std::string channel;     // Band, instrument, component: HHZ

    StreamID() = default;
    StreamID(const std::string& net, const std::string& sta,
             const std::string& loc, const std::string& chan)
        : network(net), station(sta), location(loc), channel(chan) {}

    std::string toString() const {
        return network + "." + station + "." + location + "." + channel;
    }

    // "NET.STA", the key used for station-level grouping
    std::string stationKey() const {
        return network + "." + station;
    }

    // Last channel letter: Z/N/E or 1/2/3
    char component() const {
        return channel.empty() ? '?' : channel.back();
    }

    bool operator==(const StreamID& other) const {
        return std::tie(network, station, location, channel) ==
               std::tie(other.network, other.station, other.location, other.channel);
    }
    bool operator!=(const StreamID& other) const { return !(*this == other); }
    bool operator<(const StreamID& other) const {
        return std::tie(network, station, location, channel) <
               std::tie(other.network, other.station, other.location, other.channel);
    }
};

// Phase types
// Declaration order is the pick output order for equal time and station
enum class PhaseType {
    P,
    S,
    Unknown
};

inline std::string phaseTypeToString(PhaseType pt) {
    switch (pt) {
        case PhaseType::P: return "P";
        case PhaseType::S: return "S";
        default: return "?";
    }
}

inline PhaseType stringToPhaseType(const std::string& s) {
    if (s == "P") return PhaseType::P;
    if (s == "S") return PhaseType::S;
    return PhaseType::Unknown;
}

// Half-open interval [start, end)
struct TimeRange {
    TimePoint start;
    TimePoint end;

    TimeRange() = default;
    TimeRange(TimePoint s, TimePoint e) : start(s), end(e) {}

    bool contains(TimePoint t) const { return t >= start && t < end; }
    bool overlaps(const TimeRange& other) const { return start < other.end && other.start < end; }
    double duration() const { return secondsBetween(end, start); }
    std::string toString() const;
};

} // namespace seisstream
