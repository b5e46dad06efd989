#include "seisstream/core/station.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace seisstream {

std::vector<std::string> StationInventory::missing(const std::vector<std::string>& keys) const {
    std::vector<std::string> result;
    for (const auto& key : keys) {
        if (!getStation(key)) result.push_back(key);
    }
    return result;
}

bool StationInventory::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "StationInventory: failed to open " << filename << std::endl;
        return false;
    }

    std::string line;
    int line_num = 0;
    size_t loaded = 0;
    size_t replaced = 0;

    while (std::getline(file, line)) {
        line_num++;
        std::replace(line.begin(), line.end(), ',', ' ');

        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        std::istringstream iss(line);
        std::string network, code;
        double lat, lon, elev = 0;

        if (!(iss >> network >> code >> lat >> lon)) {
            std::cerr << "StationInventory: parse error at " << filename
                      << ":" << line_num << std::endl;
            continue;
        }
        iss >> elev;

        if (std::abs(lat) > 90.0 || std::abs(lon) > 180.0) {
            std::cerr << "StationInventory: " << network << "." << code
                      << " has coordinates out of range at " << filename
                      << ":" << line_num << std::endl;
            continue;
        }

        auto station = std::make_shared<Station>(network, code, lat, lon, elev);
        if (getStation(station->key())) replaced++;
        addStation(station);
        loaded++;
    }

    std::cout << "StationInventory: loaded " << loaded << " stations from " << filename;
    if (replaced > 0) std::cout << " (" << replaced << " repeated)";
    std::cout << std::endl;
    return true;
}

bool StationInventory::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "StationInventory: cannot write " << filename << std::endl;
        return false;
    }

    file << "# network station latitude longitude elevation(m)\n";
    file << std::fixed;
    for (const auto& entry : stations_) {
        const Station& sta = *entry.second;
        file << sta.network() << " " << sta.code() << " "
             << std::setprecision(5) << sta.latitude() << " " << sta.longitude() << " "
             << std::setprecision(1) << sta.elevation() << "\n";
    }
    return true;
}

} // namespace seisstream
