#pragma once

#include "types.hpp"
#include <map>
#include <memory>
#include <vector>

namespace seisstream {

/**
 * Station - Recording site coordinates
 *
 * Depth is stored as negative elevation so station and hypocenter share
 * one GeoPoint convention.
 */
class Station {
public:
    Station() : elevation_(0) {}

    Station(const std::string& network, const std::string& code,
            double lat, double lon, double elev = 0)
        : network_(network), code_(code),
          location_(lat, lon, -elev/1000.0), elevation_(elev) {}

    // Accessors
    const std::string& network() const { return network_; }
    const std::string& code() const { return code_; }
    std::string key() const { return network_ + "." + code_; }
    const GeoPoint& location() const { return location_; }
    double latitude() const { return location_.latitude; }
    double longitude() const { return location_.longitude; }
    double elevation() const { return elevation_; }

    double distanceTo(const GeoPoint& point) const {
        return location_.distanceTo(point);
    }

private:
    std::string network_;
    std::string code_;
    GeoPoint location_;
    double elevation_;  // meters above sea level
};

using StationPtr = std::shared_ptr<Station>;

/**
 * StationInventory - Station geometry keyed by "NET.STA"
 *
 * The associator needs a location for every station it clusters; channels
 * from stations missing here are still detected but never associated.
 */
class StationInventory {
public:
    void addStation(StationPtr station) {
        stations_[station->key()] = station;
    }

    StationPtr getStation(const std::string& key) const {
        auto it = stations_.find(key);
        return it != stations_.end() ? it->second : nullptr;
    }

    StationPtr getStation(const StreamID& id) const {
        return getStation(id.stationKey());
    }

    // Keys from the list that have no coordinates, in input order
    std::vector<std::string> missing(const std::vector<std::string>& keys) const;

    const std::map<std::string, StationPtr>& stations() const { return stations_; }
    size_t size() const { return stations_.size(); }
    bool empty() const { return stations_.empty(); }

    // One station per line: network station latitude longitude [elevation],
    // separated by whitespace or commas. Lines with coordinates out of
    // range are skipped with a warning; a repeated key replaces the entry.
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

private:
    std::map<std::string, StationPtr> stations_;
};

} // namespace seisstream
