#pragma once

#include "types.hpp"
#include "waveform.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace seisstream {

/**
 * MiniSeedRecord - 256 to 8192 byte SEED data record
 */
class MiniSeedRecord {
public:
    static constexpr size_t HEADER_SIZE = 48;

    // Data encoding types
    enum class Encoding : uint8_t {
        ASCII = 0,
        INT16 = 1,
        INT24 = 2,
        INT32 = 3,
        FLOAT32 = 4,
        FLOAT64 = 5,
        STEIM1 = 10,
        STEIM2 = 11
    };

    MiniSeedRecord() : sample_rate_(0), sample_count_(0), record_length_(512),
                       encoding_(Encoding::STEIM2), big_endian_(true) {}

    // Record length announced by blockette 1000, 0 if the header is not SEED
    static size_t detectRecordLength(const uint8_t* data, size_t length);

    // Parse header and decode samples; false on corrupt or unsupported data
    bool parse(const uint8_t* data, size_t length);

    // Write a 512-byte record (INT32/FLOAT32/FLOAT64), returns samples written
    size_t serialize(std::vector<uint8_t>& out, size_t first_sample = 0) const;

    // Accessors
    const StreamID& streamId() const { return stream_id_; }
    TimePoint startTime() const { return start_time_; }
    double sampleRate() const { return sample_rate_; }
    size_t sampleCount() const { return sample_count_; }
    size_t recordLength() const { return record_length_; }
    Encoding encoding() const { return encoding_; }
    const SampleVector& samples() const { return samples_; }

    // Setters
    void setStreamId(const StreamID& id) { stream_id_ = id; }
    void setStartTime(TimePoint t) { start_time_ = t; }
    void setSampleRate(double rate) { sample_rate_ = rate; }
    void setSamples(const SampleVector& s) {
        samples_ = s;
        sample_count_ = s.size();
    }
    void setEncoding(Encoding e) { encoding_ = e; }

private:
    StreamID stream_id_;
    TimePoint start_time_;
    double sample_rate_;
    size_t sample_count_;
    size_t record_length_;
    Encoding encoding_;
    bool big_endian_;
    SampleVector samples_;

    bool decodeSteimData(const uint8_t* data, size_t length, int steim_level);
    bool decodeIntData(const uint8_t* data, size_t length, size_t width);
    bool decodeFloatData(const uint8_t* data, size_t length, size_t width);

    // BTIME structure
    static TimePoint parseTime(const uint8_t* btime, bool big_endian);
    static void writeTime(uint8_t* btime, TimePoint t);
};

/**
 * MiniSeedReader - Waveform source for MiniSEED files
 *
 * Unreadable files and corrupt records raise IOError. Records of one
 * channel are joined in time order; gaps are zero-filled and overlaps
 * trimmed. A sample rate change within a channel raises FormatError.
 */
class MiniSeedReader {
public:
    MiniSeedReader() = default;

    void open(const std::string& filename);
    void parse(const uint8_t* data, size_t length, const std::string& origin = "buffer");

    const std::vector<MiniSeedRecord>& records() const { return records_; }

    std::vector<Trace> toTraces() const;

private:
    std::vector<MiniSeedRecord> records_;
};

// Read one or more files into a validated Waveform
WaveformPtr readMiniSeed(const std::vector<std::string>& filenames);

// Write traces as INT32 records (FLOAT64 when samples are not integral)
bool writeMiniSeed(const std::string& filename, const std::vector<Trace>& traces);

} // namespace seisstream
