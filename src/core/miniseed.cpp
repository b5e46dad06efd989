#include "seisstream/core/miniseed.hpp"
#include "seisstream/core/errors.hpp"
#include <fstream>
#include <cstring>
#include <cstdio>
#include <cctype>
#include <iterator>
#include <cmath>
#include <ctime>
#include <iostream>
#include <algorithm>
#include <map>

namespace seisstream {

namespace {

uint16_t readU16(const uint8_t* p, bool big) {
    return big ? static_cast<uint16_t>((p[0] << 8) | p[1])
               : static_cast<uint16_t>((p[1] << 8) | p[0]);
}

uint32_t readU32(const uint8_t* p, bool big) {
    if (big) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | p[3];
    }
    return (static_cast<uint32_t>(p[3]) << 24) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[1]) << 8) | p[0];
}

uint64_t readU64(const uint8_t* p, bool big) {
    uint64_t hi = readU32(big ? p : p + 4, big);
    uint64_t lo = readU32(big ? p + 4 : p, big);
    return (hi << 32) | lo;
}

void writeU16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

void writeU32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[3] = static_cast<uint8_t>(v & 0xFF);
}

void writePadded(uint8_t* p, const std::string& s, size_t width) {
    for (size_t i = 0; i < width; i++) {
        p[i] = i < s.size() ? static_cast<uint8_t>(s[i]) : ' ';
    }
}

std::string readTrimmed(const uint8_t* p, size_t width) {
    std::string s(reinterpret_cast<const char*>(p), width);
    auto end = s.find_last_not_of(' ');
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

int32_t signExtend(uint32_t value, int bits) {
    uint32_t mask = 1u << (bits - 1);
    value &= (bits == 32) ? 0xFFFFFFFFu : ((1u << bits) - 1);
    return static_cast<int32_t>((value ^ mask) - mask);
}

bool headerLooksValid(const uint8_t* data) {
    for (int i = 0; i < 6; i++) {
        if (!std::isdigit(data[i]) && data[i] != ' ') return false;
    }
    char quality = static_cast<char>(data[6]);
    return quality == 'D' || quality == 'R' || quality == 'Q' || quality == 'M';
}

// Blockette 1000 location, or nullptr
const uint8_t* findBlockette1000(const uint8_t* data, size_t length, bool big) {
    uint8_t num_blockettes = data[39];
    uint16_t offset = readU16(data + 46, big);
    for (int i = 0; i < num_blockettes && offset >= 48 && offset + 8 <= length; i++) {
        const uint8_t* bp = data + offset;
        uint16_t type = readU16(bp, big);
        if (type == 1000) return bp;
        uint16_t next = readU16(bp + 2, big);
        if (next <= offset) break;
        offset = next;
    }
    return nullptr;
}

// Year field is sane in the native order; otherwise the header is little-endian
bool detectBigEndian(const uint8_t* data) {
    uint16_t year = readU16(data + 20, true);
    return year >= 1900 && year <= 2100;
}

} // namespace

TimePoint MiniSeedRecord::parseTime(const uint8_t* btime, bool big_endian) {
    // year (2), day of year (2), hour, min, sec, unused, 0.0001 s (2)
    uint16_t year = readU16(btime, big_endian);
    uint16_t doy = readU16(btime + 2, big_endian);
    uint16_t frac = readU16(btime + 8, big_endian);

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = 0;
    tm.tm_mday = doy;  // timegm normalizes day-of-year into month/day
    tm.tm_hour = btime[4];
    tm.tm_min = btime[5];
    tm.tm_sec = btime[6];

    time_t secs = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(secs);
    tp += std::chrono::microseconds(static_cast<int64_t>(frac) * 100);
    return tp;
}

void MiniSeedRecord::writeTime(uint8_t* btime, TimePoint t) {
    auto us = std::chrono::duration_cast<Duration>(t.time_since_epoch()).count();
    int64_t secs = us / 1000000;
    int64_t frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }
    time_t tt = static_cast<time_t>(secs);
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);

    writeU16(btime, static_cast<uint16_t>(tm_utc.tm_year + 1900));
    writeU16(btime + 2, static_cast<uint16_t>(tm_utc.tm_yday + 1));
    btime[4] = static_cast<uint8_t>(tm_utc.tm_hour);
    btime[5] = static_cast<uint8_t>(tm_utc.tm_min);
    btime[6] = static_cast<uint8_t>(tm_utc.tm_sec);
    btime[7] = 0;
    writeU16(btime + 8, static_cast<uint16_t>(frac / 100));
}

size_t MiniSeedRecord::detectRecordLength(const uint8_t* data, size_t length) {
    if (length < HEADER_SIZE || !headerLooksValid(data)) return 0;
    bool big = detectBigEndian(data);
    const uint8_t* b1000 = findBlockette1000(data, length, big);
    if (!b1000) return 512;
    uint8_t exponent = b1000[6];
    if (exponent < 8 || exponent > 16) return 0;
    return static_cast<size_t>(1) << exponent;
}

bool MiniSeedRecord::parse(const uint8_t* data, size_t length) {
    if (length < HEADER_SIZE || !headerLooksValid(data)) return false;

    big_endian_ = detectBigEndian(data);

    stream_id_.station = readTrimmed(data + 8, 5);
    stream_id_.location = readTrimmed(data + 13, 2);
    stream_id_.channel = readTrimmed(data + 15, 3);
    stream_id_.network = readTrimmed(data + 18, 2);

    start_time_ = parseTime(data + 20, big_endian_);
    sample_count_ = readU16(data + 30, big_endian_);

    double factor = static_cast<int16_t>(readU16(data + 32, big_endian_));
    double multiplier = static_cast<int16_t>(readU16(data + 34, big_endian_));

    if (factor > 0 && multiplier > 0) {
        sample_rate_ = factor * multiplier;
    } else if (factor > 0 && multiplier < 0) {
        sample_rate_ = -factor / multiplier;
    } else if (factor < 0 && multiplier > 0) {
        sample_rate_ = -multiplier / factor;
    } else if (factor < 0 && multiplier < 0) {
        sample_rate_ = 1.0 / (factor * multiplier);
    } else {
        sample_rate_ = 0;
    }

    uint16_t data_offset = readU16(data + 44, big_endian_);

    encoding_ = Encoding::STEIM2;
    record_length_ = length;
    if (const uint8_t* b1000 = findBlockette1000(data, length, big_endian_)) {
        encoding_ = static_cast<Encoding>(b1000[4]);
        big_endian_ = b1000[5] != 0;
        record_length_ = static_cast<size_t>(1) << b1000[6];
    }

    if (sample_count_ == 0) {
        samples_.clear();
        return true;
    }
    if (data_offset < HEADER_SIZE || data_offset >= length) return false;

    const uint8_t* dp = data + data_offset;
    size_t data_len = length - data_offset;

    switch (encoding_) {
        case Encoding::STEIM1:
            return decodeSteimData(dp, data_len, 1);
        case Encoding::STEIM2:
            return decodeSteimData(dp, data_len, 2);
        case Encoding::INT16:
            return decodeIntData(dp, data_len, 2);
        case Encoding::INT32:
            return decodeIntData(dp, data_len, 4);
        case Encoding::FLOAT32:
            return decodeFloatData(dp, data_len, 4);
        case Encoding::FLOAT64:
            return decodeFloatData(dp, data_len, 8);
        default:
            std::cerr << "MiniSeedRecord: unsupported encoding "
                      << static_cast<int>(encoding_) << std::endl;
            return false;
    }
}

bool MiniSeedRecord::decodeSteimData(const uint8_t* data, size_t length, int steim_level) {
    samples_.clear();
    samples_.reserve(sample_count_);

    if (length < 64) return false;

    // 64-byte frames: control word followed by 15 data words
    size_t num_frames = length / 64;
    std::vector<int32_t> diffs;
    diffs.reserve(sample_count_ + 8);
    int32_t x0 = 0;
    int32_t xn = 0;

    for (size_t frame = 0; frame < num_frames && diffs.size() < sample_count_; frame++) {
        const uint8_t* fp = data + frame * 64;
        uint32_t ctrl = readU32(fp, big_endian_);

        for (int word = 1; word < 16 && diffs.size() < sample_count_; word++) {
            uint32_t w = readU32(fp + word * 4, big_endian_);
            int nibble = (ctrl >> (30 - word * 2)) & 0x03;

            if (frame == 0 && word == 1) {
                x0 = static_cast<int32_t>(w);
                continue;
            }
            if (frame == 0 && word == 2) {
                xn = static_cast<int32_t>(w);
                continue;
            }

            auto unpack = [&](int count, int bits) {
                for (int i = 0; i < count; i++) {
                    int shift = (count - 1 - i) * bits;
                    diffs.push_back(signExtend(w >> shift, bits));
                }
            };

            if (nibble == 0) {
                continue;
            } else if (nibble == 1) {
                unpack(4, 8);
            } else if (nibble == 2) {
                if (steim_level == 1) {
                    unpack(2, 16);
                } else {
                    int dnib = (w >> 30) & 0x03;
                    if (dnib == 1) unpack(1, 30);
                    else if (dnib == 2) unpack(2, 15);
                    else if (dnib == 3) unpack(3, 10);
                    else return false;
                }
            } else {
                if (steim_level == 1) {
                    unpack(1, 32);
                } else {
                    int dnib = (w >> 30) & 0x03;
                    if (dnib == 0) unpack(5, 6);
                    else if (dnib == 1) unpack(6, 5);
                    else if (dnib == 2) unpack(7, 4);
                    else return false;
                }
            }
        }
    }

    if (diffs.size() < sample_count_) return false;

    // The first difference refers to the previous record and is not used
    int32_t x = x0;
    samples_.push_back(x);
    for (size_t i = 1; i < sample_count_; i++) {
        x += diffs[i];
        samples_.push_back(x);
    }

    // Reverse integration constant must match the last decoded sample
    return x == xn;
}

bool MiniSeedRecord::decodeIntData(const uint8_t* data, size_t length, size_t width) {
    if (length / width < sample_count_) return false;
    samples_.clear();
    samples_.reserve(sample_count_);

    for (size_t i = 0; i < sample_count_; i++) {
        if (width == 2) {
            samples_.push_back(static_cast<int16_t>(readU16(data + i * 2, big_endian_)));
        } else {
            samples_.push_back(static_cast<int32_t>(readU32(data + i * 4, big_endian_)));
        }
    }
    return true;
}

bool MiniSeedRecord::decodeFloatData(const uint8_t* data, size_t length, size_t width) {
    if (length / width < sample_count_) return false;
    samples_.clear();
    samples_.reserve(sample_count_);

    for (size_t i = 0; i < sample_count_; i++) {
        if (width == 4) {
            uint32_t bits = readU32(data + i * 4, big_endian_);
            float val;
            std::memcpy(&val, &bits, sizeof(float));
            samples_.push_back(val);
        } else {
            uint64_t bits = readU64(data + i * 8, big_endian_);
            double val;
            std::memcpy(&val, &bits, sizeof(double));
            samples_.push_back(val);
        }
    }
    return true;
}

size_t MiniSeedRecord::serialize(std::vector<uint8_t>& out, size_t first_sample) const {
    constexpr size_t RECORD_LENGTH = 512;
    constexpr size_t DATA_OFFSET = 64;

    size_t width = encoding_ == Encoding::FLOAT64 ? 8 : 4;
    size_t capacity = (RECORD_LENGTH - DATA_OFFSET) / width;
    size_t count = std::min(capacity, samples_.size() - std::min(first_sample, samples_.size()));

    std::vector<uint8_t> rec(RECORD_LENGTH, 0);

    char seq[7];
    std::snprintf(seq, sizeof(seq), "%06zu", (first_sample / capacity + 1) % 1000000);
    std::memcpy(rec.data(), seq, 6);
    rec[6] = 'D';
    rec[7] = ' ';
    writePadded(&rec[8], stream_id_.station, 5);
    writePadded(&rec[13], stream_id_.location, 2);
    writePadded(&rec[15], stream_id_.channel, 3);
    writePadded(&rec[18], stream_id_.network, 2);

    auto offset = secondsToDuration(first_sample / sample_rate_);
    writeTime(&rec[20], start_time_ + std::chrono::duration_cast<TimePoint::duration>(offset));
    writeU16(&rec[30], static_cast<uint16_t>(count));

    int16_t factor;
    int16_t multiplier;
    if (sample_rate_ >= 1.0 && sample_rate_ == std::floor(sample_rate_)) {
        factor = static_cast<int16_t>(sample_rate_);
        multiplier = 1;
    } else if (sample_rate_ >= 1.0) {
        factor = static_cast<int16_t>(std::lround(sample_rate_ * 100));
        multiplier = -100;
    } else {
        factor = static_cast<int16_t>(-std::lround(1.0 / sample_rate_));
        multiplier = 1;
    }
    writeU16(&rec[32], static_cast<uint16_t>(factor));
    writeU16(&rec[34], static_cast<uint16_t>(multiplier));
    rec[39] = 1;                          // one blockette
    writeU16(&rec[44], DATA_OFFSET);
    writeU16(&rec[46], 48);

    // Blockette 1000
    writeU16(&rec[48], 1000);
    writeU16(&rec[50], 0);
    rec[52] = static_cast<uint8_t>(encoding_);
    rec[53] = 1;                          // big-endian
    rec[54] = 9;                          // 2^9 = 512 bytes

    for (size_t i = 0; i < count; i++) {
        double v = samples_[first_sample + i];
        uint8_t* p = &rec[DATA_OFFSET + i * width];
        if (encoding_ == Encoding::FLOAT64) {
            uint64_t bits;
            std::memcpy(&bits, &v, sizeof(double));
            writeU32(p, static_cast<uint32_t>(bits >> 32));
            writeU32(p + 4, static_cast<uint32_t>(bits & 0xFFFFFFFFu));
        } else if (encoding_ == Encoding::FLOAT32) {
            float f = static_cast<float>(v);
            uint32_t bits;
            std::memcpy(&bits, &f, sizeof(float));
            writeU32(p, bits);
        } else {
            writeU32(p, static_cast<uint32_t>(static_cast<int32_t>(std::lround(v))));
        }
    }

    out.insert(out.end(), rec.begin(), rec.end());
    return count;
}

void MiniSeedReader::open(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("MiniSeedReader: cannot open " + filename);
    }

    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
    if (buffer.empty()) {
        throw IOError("MiniSeedReader: empty file " + filename);
    }

    parse(buffer.data(), buffer.size(), filename);
}

void MiniSeedReader::parse(const uint8_t* data, size_t length, const std::string& origin) {
    size_t offset = 0;
    while (offset < length) {
        size_t rec_len = MiniSeedRecord::detectRecordLength(data + offset, length - offset);
        if (rec_len == 0) {
            throw IOError("MiniSeedReader: corrupt record header in " + origin +
                          " at byte " + std::to_string(offset));
        }
        if (offset + rec_len > length) {
            throw IOError("MiniSeedReader: truncated record in " + origin +
                          " at byte " + std::to_string(offset));
        }

        MiniSeedRecord record;
        if (!record.parse(data + offset, rec_len)) {
            throw IOError("MiniSeedReader: undecodable data in " + origin +
                          " at byte " + std::to_string(offset));
        }
        records_.push_back(std::move(record));
        offset += rec_len;
    }
}

std::vector<Trace> MiniSeedReader::toTraces() const {
    std::map<StreamID, std::vector<const MiniSeedRecord*>> by_stream;
    for (const auto& rec : records_) {
        if (rec.sampleCount() == 0) continue;
        by_stream[rec.streamId()].push_back(&rec);
    }

    std::vector<Trace> result;
    for (auto& [id, recs] : by_stream) {
        std::stable_sort(recs.begin(), recs.end(),
                         [](const MiniSeedRecord* a, const MiniSeedRecord* b) {
                             return a->startTime() < b->startTime();
                         });

        double rate = recs.front()->sampleRate();
        Trace trace(id, rate, recs.front()->startTime());

        for (const auto* rec : recs) {
            if (std::abs(rec->sampleRate() - rate) > 1e-9) {
                throw FormatError("MiniSeedReader: sample rate changes within " +
                                  id.toString());
            }

            // Position of this record relative to what has been joined so far
            double offset = secondsBetween(rec->startTime(), trace.startTime()) * rate;
            int64_t expected = static_cast<int64_t>(trace.sampleCount());
            int64_t actual = static_cast<int64_t>(std::llround(offset));

            const SampleVector& samples = rec->samples();
            if (actual > expected) {
                trace.data().insert(trace.data().end(), actual - expected, 0.0);
                trace.append(samples);
            } else {
                size_t skip = static_cast<size_t>(expected - actual);
                if (skip < samples.size()) {
                    trace.data().insert(trace.data().end(), samples.begin() + skip, samples.end());
                }
            }
        }
        result.push_back(std::move(trace));
    }
    return result;
}

WaveformPtr readMiniSeed(const std::vector<std::string>& filenames) {
    MiniSeedReader reader;
    for (const auto& name : filenames) {
        reader.open(name);
    }
    auto traces = reader.toTraces();
    std::cout << "MiniSeedReader: " << reader.records().size() << " records, "
              << traces.size() << " channels" << std::endl;
    return std::make_shared<const Waveform>(std::move(traces));
}

bool writeMiniSeed(const std::string& filename, const std::vector<Trace>& traces) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "MiniSeedWriter: cannot create " << filename << std::endl;
        return false;
    }

    std::vector<uint8_t> buffer;
    for (const auto& trace : traces) {
        bool integral = std::all_of(trace.data().begin(), trace.data().end(), [](double v) {
            return v == std::floor(v) && std::abs(v) < 2147483647.0;
        });

        MiniSeedRecord record;
        record.setStreamId(trace.streamId());
        record.setStartTime(trace.startTime());
        record.setSampleRate(trace.sampleRate());
        record.setSamples(trace.data());
        record.setEncoding(integral ? MiniSeedRecord::Encoding::INT32
                                    : MiniSeedRecord::Encoding::FLOAT64);

        size_t written = 0;
        while (written < trace.sampleCount()) {
            written += record.serialize(buffer, written);
        }
    }

    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    return static_cast<bool>(file);
}

} // namespace seisstream
