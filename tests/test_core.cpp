/**
 * Unit tests for core components
 */

#include "test_framework.hpp"
#include "seisstream/core/types.hpp"
#include "seisstream/core/errors.hpp"
#include "seisstream/core/waveform.hpp"
#include "seisstream/core/station.hpp"
#include "seisstream/core/event.hpp"
#include "seisstream/core/config.hpp"
#include "seisstream/core/synthetic.hpp"
#include <cstdio>
#include <fstream>

using namespace seisstream;
using namespace seisstream::test;

namespace {

TimePoint epoch(double seconds) {
    return addSeconds(std::chrono::system_clock::from_time_t(1700000000), seconds);
}

Trace ramp(const StreamID& id, double rate, TimePoint start, size_t n) {
    SampleVector data(n);
    for (size_t i = 0; i < n; i++) data[i] = static_cast<double>(i);
    return Trace(id, rate, start, data);
}

} // namespace

// ============================================================================
// GeoPoint Tests
// ============================================================================

TEST(GeoPoint, Constructor) {
    GeoPoint p(34.5, -118.0, 10.0);
    ASSERT_NEAR(p.latitude, 34.5, 1e-10);
    ASSERT_NEAR(p.longitude, -118.0, 1e-10);
    ASSERT_NEAR(p.depth, 10.0, 1e-10);
}

TEST(GeoPoint, DistanceToSamePoint) {
    GeoPoint p1(34.5, -118.0);
    GeoPoint p2(34.5, -118.0);
    ASSERT_NEAR(p1.distanceTo(p2), 0.0, 1e-6);
}

TEST(GeoPoint, DistanceToNearby) {
    // Los Angeles to San Diego ~180 km
    GeoPoint la(34.05, -118.25);
    GeoPoint sd(32.72, -117.16);
    ASSERT_NEAR(la.distanceTo(sd), 180.0, 20.0);
}

TEST(GeoPoint, OneDegreeLatitude) {
    GeoPoint a(34.0, -118.0);
    GeoPoint b(34.1, -118.0);
    ASSERT_NEAR(a.distanceTo(b), 11.12, 0.05);
}

// ============================================================================
// Time Tests
// ============================================================================

TEST(Time, SecondsRoundTrip) {
    ASSERT_EQ(secondsToDuration(1.5).count(), 1500000);
    ASSERT_EQ(secondsToDuration(-0.25).count(), -250000);
    ASSERT_NEAR(durationToSeconds(Duration(2500)), 0.0025, 1e-12);
}

TEST(Time, SecondsBetweenIsSigned) {
    TimePoint a = epoch(10.0);
    TimePoint b = epoch(12.5);
    ASSERT_NEAR(secondsBetween(b, a), 2.5, 1e-9);
    ASSERT_NEAR(secondsBetween(a, b), -2.5, 1e-9);
}

TEST(Time, FormatTime) {
    TimePoint t = std::chrono::system_clock::from_time_t(0) +
                  std::chrono::duration_cast<TimePoint::duration>(Duration(1234567));
    ASSERT_EQ(formatTime(t), "1970-01-01T00:00:01.234Z");
}

TEST(TimeRange, HalfOpen) {
    TimeRange r(epoch(0), epoch(60));
    ASSERT_TRUE(r.contains(epoch(0)));
    ASSERT_TRUE(r.contains(epoch(59.999)));
    ASSERT_FALSE(r.contains(epoch(60)));
    ASSERT_FALSE(r.contains(epoch(-0.001)));
    ASSERT_NEAR(r.duration(), 60.0, 1e-9);
}

// ============================================================================
// StreamID Tests
// ============================================================================

TEST(StreamID, ToString) {
    StreamID id("IU", "ANMO", "00", "BHZ");
    ASSERT_EQ(id.toString(), "IU.ANMO.00.BHZ");
    ASSERT_EQ(id.stationKey(), "IU.ANMO");
    ASSERT_EQ(id.component(), 'Z');
}

TEST(StreamID, Equality) {
    StreamID id1("IU", "ANMO", "00", "BHZ");
    StreamID id2("IU", "ANMO", "00", "BHZ");
    StreamID id3("IU", "ANMO", "00", "BHN");
    ASSERT_TRUE(id1 == id2);
    ASSERT_FALSE(id1 == id3);
    ASSERT_TRUE(id1 != id3);
}

TEST(StreamID, Comparison) {
    StreamID id1("AA", "STA1", "00", "BHZ");
    StreamID id2("AB", "STA1", "00", "BHZ");
    StreamID id3("AA", "STA1", "00", "BHE");
    ASSERT_TRUE(id1 < id2);
    ASSERT_TRUE(id3 < id1);
}

// ============================================================================
// Trace Tests
// ============================================================================

TEST(Trace, TimeAtAndEnd) {
    Trace tr = ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 1000);
    ASSERT_NEAR(secondsBetween(tr.timeAt(150), epoch(0)), 1.5, 1e-9);
    ASSERT_NEAR(secondsBetween(tr.endTime(), epoch(0)), 10.0, 1e-9);
    ASSERT_NEAR(tr.duration(), 10.0, 1e-10);
}

TEST(Trace, SliceHalfOpen) {
    Trace tr = ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 1000);
    Trace s = tr.slice(epoch(1.0), epoch(2.0));

    ASSERT_EQ(s.sampleCount(), 100u);
    ASSERT_NEAR(s[0], 100.0, 1e-10);
    ASSERT_NEAR(s[99], 199.0, 1e-10);
    ASSERT_TRUE(s.startTime() == epoch(1.0));
}

TEST(Trace, SliceOutsideIsEmpty) {
    Trace tr = ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 100);
    ASSERT_TRUE(tr.slice(epoch(5.0), epoch(6.0)).empty());
}

TEST(Trace, FirstIndexAtOrAfter) {
    Trace tr = ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 100);
    ASSERT_EQ(tr.firstIndexAtOrAfter(epoch(-1.0)), 0u);
    ASSERT_EQ(tr.firstIndexAtOrAfter(epoch(0.5)), 50u);
    ASSERT_EQ(tr.firstIndexAtOrAfter(epoch(0.505)), 51u);
    ASSERT_EQ(tr.firstIndexAtOrAfter(epoch(3.0)), 100u);
}

TEST(Trace, Demean) {
    Trace tr(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), {10.0, 20.0, 30.0});
    tr.demean();
    ASSERT_NEAR(tr.mean(), 0.0, 1e-10);
    ASSERT_NEAR(tr[0], -10.0, 1e-10);
    ASSERT_NEAR(tr[2], 10.0, 1e-10);
}

TEST(Trace, DetrendRemovesLine) {
    Trace tr = ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 500);
    for (size_t i = 0; i < tr.sampleCount(); i++) tr[i] = 3.0 + 0.5 * tr[i];
    tr.detrend();
    ASSERT_NEAR(tr.min(), 0.0, 1e-6);
    ASSERT_NEAR(tr.max(), 0.0, 1e-6);
}

TEST(Trace, TaperZeroesEdges) {
    Trace tr(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), SampleVector(1000, 1.0));
    tr.taper(1.0);
    ASSERT_NEAR(tr[0], 0.0, 1e-12);
    ASSERT_NEAR(tr[999], 0.0, 1e-12);
    ASSERT_NEAR(tr[500], 1.0, 1e-12);
}

TEST(Trace, Resample) {
    Trace tr = ramp(StreamID("XX", "A", "00", "HHZ"), 200.0, epoch(0), 2000);
    Trace r = tr.resample(100.0);
    ASSERT_EQ(r.sampleCount(), 1000u);
    ASSERT_NEAR(r.sampleRate(), 100.0, 1e-12);
    ASSERT_NEAR(r[10], 20.0, 1e-9);
}

// ============================================================================
// Waveform Tests
// ============================================================================

TEST(Waveform, SortsChannelsAndSpansAll) {
    std::vector<Trace> traces;
    traces.push_back(ramp(StreamID("XX", "B", "00", "HHZ"), 100.0, epoch(5), 100));
    traces.push_back(ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 200));
    Waveform wf(traces);

    ASSERT_EQ(wf.channelCount(), 2u);
    ASSERT_EQ(wf.traces()[0].streamId().station, "A");
    ASSERT_TRUE(wf.startTime() == epoch(0));
    ASSERT_TRUE(wf.endTime() == epoch(6));
    ASSERT_NEAR(wf.totalDuration(), 6.0, 1e-9);
    ASSERT_EQ(wf.stations().size(), 2u);
    ASSERT_TRUE(wf.find(StreamID("XX", "B", "00", "HHZ")) != nullptr);
    ASSERT_TRUE(wf.find(StreamID("XX", "C", "00", "HHZ")) == nullptr);
}

TEST(Waveform, MixedRatesWithinStationRejected) {
    std::vector<Trace> traces;
    traces.push_back(ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 100));
    traces.push_back(ramp(StreamID("XX", "A", "00", "HHN"), 50.0, epoch(0), 50));
    ASSERT_THROW(Waveform wf(traces), FormatError);
}

TEST(Waveform, RatesMayDifferAcrossStations) {
    std::vector<Trace> traces;
    traces.push_back(ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 100));
    traces.push_back(ramp(StreamID("XX", "B", "00", "BHZ"), 40.0, epoch(0), 40));
    Waveform wf(traces);
    ASSERT_NEAR(wf.sampleRate("XX.B"), 40.0, 1e-12);
    ASSERT_NEAR(wf.sampleRate("XX.Z"), 0.0, 1e-12);
}

TEST(Waveform, EmptyOrDuplicateRejected) {
    ASSERT_THROW(Waveform wf(std::vector<Trace>{}), FormatError);

    std::vector<Trace> traces;
    traces.push_back(ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(0), 10));
    traces.push_back(ramp(StreamID("XX", "A", "00", "HHZ"), 100.0, epoch(1), 10));
    ASSERT_THROW(Waveform wf(traces), FormatError);
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(Error, CarriesRange) {
    TimeRange r(epoch(0), epoch(60));
    InferenceError with("backend failed", r);
    InferenceError without("backend failed");

    ASSERT_TRUE(with.hasRange());
    ASSERT_TRUE(with.range().start == r.start);
    ASSERT_FALSE(without.hasRange());
    ASSERT_TRUE(std::string(with.what()).find("backend failed") != std::string::npos);
}

TEST(Error, Hierarchy) {
    bool caught = false;
    try {
        throw AssociationError("no stations");
    } catch (const Error&) {
        caught = true;
    }
    ASSERT_TRUE(caught);
}

// ============================================================================
// Station Tests
// ============================================================================

TEST(Station, Constructor) {
    Station sta("IU", "ANMO", 34.946, -106.457, 1850);
    ASSERT_EQ(sta.key(), "IU.ANMO");
    ASSERT_NEAR(sta.latitude(), 34.946, 1e-10);
    ASSERT_NEAR(sta.elevation(), 1850.0, 1e-10);
    ASSERT_NEAR(sta.location().depth, -1.85, 1e-10);
}

TEST(StationInventory, AddAndGet) {
    StationInventory inv;
    inv.addStation(std::make_shared<Station>("CI", "PAS", 34.148, -118.171));
    inv.addStation(std::make_shared<Station>("CI", "USC", 34.019, -118.286));

    ASSERT_EQ(inv.size(), 2u);
    ASSERT_TRUE(inv.getStation("CI.PAS") != nullptr);
    ASSERT_TRUE(inv.getStation(StreamID("CI", "USC", "00", "HHZ")) != nullptr);
    ASSERT_TRUE(inv.getStation("CI.XYZ") == nullptr);
}

TEST(StationInventory, SaveAndLoad) {
    std::string path = "test_inventory_roundtrip.txt";
    StationInventory inv;
    inv.addStation(std::make_shared<Station>("CI", "PAS", 34.148, -118.171, 295));
    ASSERT_TRUE(inv.saveToFile(path));

    StationInventory loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    std::remove(path.c_str());

    StationPtr sta = loaded.getStation("CI.PAS");
    ASSERT_TRUE(sta != nullptr);
    ASSERT_NEAR(sta->longitude(), -118.171, 1e-6);
    ASSERT_NEAR(sta->elevation(), 295.0, 1e-6);
}

TEST(StationInventory, MissingFile) {
    StationInventory inv;
    ASSERT_FALSE(inv.loadFromFile("does/not/exist.txt"));
}

TEST(StationInventory, CommaSeparatedAndOutOfRange) {
    std::string path = "test_inventory_csv.txt";
    {
        std::ofstream out(path);
        out << "# stations\n"
            << "CI,PAS,34.148,-118.171,295\n"
            << "CI USC 34.019 -118.286\n"
            << "CI BAD 134.0 -118.0\n"
            << "  \n";
    }

    StationInventory inv;
    ASSERT_TRUE(inv.loadFromFile(path));
    std::remove(path.c_str());

    ASSERT_EQ(inv.size(), 2u);
    ASSERT_NEAR(inv.getStation("CI.PAS")->elevation(), 295.0, 1e-9);
    ASSERT_TRUE(inv.getStation("CI.BAD") == nullptr);
}

TEST(StationInventory, MissingKeys) {
    StationInventory inv;
    inv.addStation(std::make_shared<Station>("CI", "PAS", 34.148, -118.171));

    auto missing = inv.missing({"CI.USC", "CI.PAS", "CI.SVD"});
    ASSERT_EQ(missing.size(), 2u);
    ASSERT_EQ(missing[0], "CI.USC");
    ASSERT_EQ(missing[1], "CI.SVD");
}

// ============================================================================
// Config Tests
// ============================================================================

TEST(Config, SetAndGet) {
    Config cfg;

    cfg.set("key1", "value1");
    cfg.set("key2", 42);
    cfg.set("key3", 3.14);
    cfg.set("key4", true);

    ASSERT_EQ(cfg.getString("key1"), "value1");
    ASSERT_EQ(cfg.getInt("key2"), 42);
    ASSERT_NEAR(cfg.getDouble("key3"), 3.14, 1e-10);
    ASSERT_TRUE(cfg.getBool("key4"));
}

TEST(Config, DefaultValues) {
    Config cfg;

    ASSERT_EQ(cfg.getString("missing", "default"), "default");
    ASSERT_EQ(cfg.getInt("missing", 99), 99);
    ASSERT_NEAR(cfg.getDouble("missing", 1.5), 1.5, 1e-10);
    ASSERT_FALSE(cfg.getBool("missing", false));
}

TEST(Config, ParseSections) {
    Config cfg;
    cfg.parse("# comment\n"
              "[stream]\n"
              "chunk_length = 30\n"
              "; another comment\n"
              "[merge]\n"
              "backend_priority = EQTransformer, PhaseNet\n"
              "[detection]\n"
              "threshold = not-a-number\n");

    ASSERT_NEAR(cfg.getDouble("stream.chunk_length"), 30.0, 1e-12);
    ASSERT_EQ(cfg.getStringList("merge.backend_priority").size(), 2u);
    ASSERT_EQ(cfg.getStringList("merge.backend_priority")[1], "PhaseNet");
    ASSERT_NEAR(cfg.getDouble("detection.threshold", 0.5), 0.5, 1e-12);
    ASSERT_FALSE(cfg.has("chunk_length"));
}

TEST(Config, InlineCommentsAndStrictNumbers) {
    Config cfg;
    cfg.parse("[stream]\n"
              "overlap = 4.5   # seconds per side\n"
              "chunk_length = 30s\n"
              "[playback]\n"
              "loop = maybe\n"
              "[database]\n"
              "file = runs/a#1.db\n");

    ASSERT_NEAR(cfg.getDouble("stream.overlap"), 4.5, 1e-12);
    ASSERT_NEAR(cfg.getDouble("stream.chunk_length", 60.0), 60.0, 1e-12);
    ASSERT_TRUE(cfg.getBool("playback.loop", true));
    ASSERT_EQ(cfg.getString("database.file"), "runs/a#1.db");
}

TEST(Config, MalformedLinesReported) {
    Config cfg;
    size_t bad = cfg.parse("[stream\n"
                           "chunk_length 30\n"
                           "= 4\n"
                           "[detection]\n"
                           "model = PickBlue\n");
    ASSERT_EQ(bad, 3u);
    ASSERT_EQ(cfg.getString("detection.model"), "PickBlue");
    ASSERT_EQ(cfg.sections().size(), 1u);
}

TEST(Config, SectionsInOrder) {
    Config cfg;
    cfg.parse("[stream]\na = 1\n[merge]\nb = 2\n[stream]\nc = 3\n");
    ASSERT_EQ(cfg.sections().size(), 2u);
    ASSERT_EQ(cfg.sections()[0], "stream");
    ASSERT_EQ(cfg.sections()[1], "merge");
    ASSERT_EQ(cfg.getInt("stream.c"), 3);
}

TEST(Config, DoubleKeepsPrecision) {
    Config cfg;
    cfg.set("associator.p_velocity", 6.123456789);
    ASSERT_NEAR(cfg.getDouble("associator.p_velocity"), 6.123456789, 1e-12);
}

// ============================================================================
// PhaseType Tests
// ============================================================================

TEST(PhaseType, ToString) {
    ASSERT_EQ(phaseTypeToString(PhaseType::P), "P");
    ASSERT_EQ(phaseTypeToString(PhaseType::S), "S");
    ASSERT_EQ(phaseTypeToString(PhaseType::Unknown), "?");
}

TEST(PhaseType, FromString) {
    ASSERT_TRUE(stringToPhaseType("P") == PhaseType::P);
    ASSERT_TRUE(stringToPhaseType("S") == PhaseType::S);
    ASSERT_TRUE(stringToPhaseType("xxx") == PhaseType::Unknown);
}

// ============================================================================
// Event Tests
// ============================================================================

TEST(Event, CreateWithId) {
    Event event("ev000001");
    ASSERT_EQ(event.id(), "ev000001");
    ASSERT_EQ(event.revision(), 0u);
    ASSERT_FALSE(event.isFinalized());
}

TEST(Event, References) {
    Event event("ev000001");
    event.setPickIds({3, 7, 9});
    ASSERT_TRUE(event.references(7));
    ASSERT_FALSE(event.references(8));
}

TEST(Event, Summary) {
    Event event("ev000002");
    Origin origin;
    origin.time = epoch(100);
    origin.location = GeoPoint(34.05, -118.0, 10.0);
    origin.station_count = 2;
    origin.is_fixed_depth = true;
    event.setOrigin(origin);
    event.setPickIds({1, 2});
    event.setRevision(3);
    event.setFinalized(true);

    std::string s = event.summary();
    ASSERT_TRUE(s.find("ev000002") != std::string::npos);
    ASSERT_TRUE(s.find("(final)") != std::string::npos);
    ASSERT_TRUE(s.find("rev 3") != std::string::npos);
    ASSERT_TRUE(s.find("(fixed)") != std::string::npos);
}

// ============================================================================
// Synthetic Waveform Tests
// ============================================================================

TEST(SyntheticWaveform, Reproducible) {
    SyntheticWaveformBuilder a(epoch(0), 20.0, 100.0, 7);
    a.addStation("XX", "A");
    SyntheticWaveformBuilder b(epoch(0), 20.0, 100.0, 7);
    b.addStation("XX", "A");

    WaveformPtr wa = a.build();
    WaveformPtr wb = b.build();
    ASSERT_EQ(wa->channelCount(), 3u);
    ASSERT_TRUE(wa->traces()[0].data() == wb->traces()[0].data());
}

TEST(SyntheticWaveform, PArrivalOnVerticalOnly) {
    SyntheticWaveformBuilder builder(epoch(0), 20.0, 100.0, 1);
    builder.setNoiseLevel(0.0);
    builder.addStation("XX", "A");
    builder.addArrival("XX.A", PhaseType::P, 10.0, 50.0);

    WaveformPtr wf = builder.build();
    const Trace* z = wf->find(StreamID("XX", "A", "00", "HHZ"));
    const Trace* n = wf->find(StreamID("XX", "A", "00", "HHN"));
    ASSERT_TRUE(z != nullptr);
    ASSERT_TRUE(n != nullptr);

    ASSERT_NEAR(z->slice(epoch(0), epoch(9.99)).max(), 0.0, 1e-12);
    ASSERT_GT(z->slice(epoch(10.0), epoch(11.0)).max(), 10.0);
    ASSERT_NEAR(n->max(), 0.0, 1e-12);
}
