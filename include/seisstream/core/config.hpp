#pragma once

#include <map>
#include <string>
#include <vector>

namespace seisstream {

/**
 * Config - INI-style pipeline configuration
 *
 * Keys inside a [section] are stored as "section.key". A '#' or ';' at
 * the start of a line, or after whitespace inside a value, starts a
 * comment. Typed getters fall back to the default when a key is missing
 * or its value does not parse completely ("30s" is not a number).
 */
class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& filename);

    // Returns the number of malformed lines skipped; each one is reported
    // on std::cerr with its origin and line number
    size_t parse(const std::string& text, const std::string& origin = "config");

    std::string getString(const std::string& key, const std::string& default_val = "") const;
    int getInt(const std::string& key, int default_val = 0) const;
    double getDouble(const std::string& key, double default_val = 0.0) const;
    bool getBool(const std::string& key, bool default_val = false) const;

    // Comma separated, items trimmed, empty items dropped
    std::vector<std::string> getStringList(const std::string& key) const;

    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    void set(const std::string& key, const char* value) { values_[key] = value; }
    void set(const std::string& key, int value) { values_[key] = std::to_string(value); }
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value) { values_[key] = value ? "true" : "false"; }

    bool has(const std::string& key) const { return values_.count(key) > 0; }

    // Section names in order of first appearance
    const std::vector<std::string>& sections() const { return sections_; }

private:
    std::map<std::string, std::string> values_;
    std::vector<std::string> sections_;
};

} // namespace seisstream
