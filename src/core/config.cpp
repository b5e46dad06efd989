#include "seisstream/core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace seisstream {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Drop a trailing comment that follows whitespace
std::string stripComment(const std::string& value) {
    for (size_t i = 1; i < value.size(); i++) {
        if ((value[i] == '#' || value[i] == ';') &&
            (value[i - 1] == ' ' || value[i - 1] == '\t')) {
            return value.substr(0, i);
        }
    }
    return value;
}

} // namespace

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Config: failed to open " << filename << std::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str(), filename);
    return true;
}

size_t Config::parse(const std::string& text, const std::string& origin) {
    std::istringstream in(text);
    std::string raw;
    std::string section;
    int line_num = 0;
    size_t malformed = 0;

    while (std::getline(in, raw)) {
        line_num++;
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                std::cerr << "Config: " << origin << ":" << line_num
                          << ": malformed section header" << std::endl;
                malformed++;
                continue;
            }
            section = trim(line.substr(1, line.size() - 2));
            if (std::find(sections_.begin(), sections_.end(), section) == sections_.end()) {
                sections_.push_back(section);
            }
            continue;
        }

        size_t pos = line.find('=');
        std::string key = pos != std::string::npos ? trim(line.substr(0, pos)) : "";
        if (key.empty()) {
            std::cerr << "Config: " << origin << ":" << line_num
                      << ": expected key = value" << std::endl;
            malformed++;
            continue;
        }

        std::string value = trim(stripComment(line.substr(pos + 1)));
        values_[section.empty() ? key : section + "." + key] = value;
    }
    return malformed;
}

std::string Config::getString(const std::string& key, const std::string& default_val) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : default_val;
}

int Config::getInt(const std::string& key, int default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    try {
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        return used == it->second.size() ? v : default_val;
    } catch (const std::logic_error&) {
        return default_val;
    }
}

double Config::getDouble(const std::string& key, double default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    try {
        size_t used = 0;
        double v = std::stod(it->second, &used);
        return used == it->second.size() ? v : default_val;
    } catch (const std::logic_error&) {
        return default_val;
    }
}

bool Config::getBool(const std::string& key, bool default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    return default_val;
}

std::vector<std::string> Config::getStringList(const std::string& key) const {
    std::vector<std::string> result;
    auto it = values_.find(key);
    if (it == values_.end()) return result;

    std::stringstream ss(it->second);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    values_[key] = buf;
}

} // namespace seisstream
