#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace seisstream {

/**
 * Error - Base of the pipeline error taxonomy
 *
 * Errors raised while processing a chunk carry the chunk's time range so
 * diagnostics can name the affected interval.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what)
        : std::runtime_error(what), has_range_(false) {}

    Error(const std::string& what, const TimeRange& range)
        : std::runtime_error(what + " [" + range.toString() + "]")
        , range_(range), has_range_(true) {}

    bool hasRange() const { return has_range_; }
    const TimeRange& range() const { return range_; }

private:
    TimeRange range_;
    bool has_range_;
};

// Unreadable or corrupt waveform data
class IOError : public Error {
public:
    using Error::Error;
};

// Inconsistent waveform metadata, e.g. mixed sample rates within a station
class FormatError : public Error {
public:
    using Error::Error;
};

// Inference backend failure, model not found, malformed input shape
class InferenceError : public Error {
public:
    using Error::Error;
};

// Association backend failure
class AssociationError : public Error {
public:
    using Error::Error;
};

} // namespace seisstream
