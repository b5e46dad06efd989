/**
 * SeisStream Simulator
 *
 * Generates synthetic three-component recordings for a small network,
 * writes them as MiniSEED and runs the streaming detection pipeline over
 * them so the located events can be compared with the injected ones.
 */

#include <iostream>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <filesystem>

#include "seisstream/core/types.hpp"
#include "seisstream/core/errors.hpp"
#include "seisstream/core/waveform.hpp"
#include "seisstream/core/station.hpp"
#include "seisstream/core/event.hpp"
#include "seisstream/core/miniseed.hpp"
#include "seisstream/core/synthetic.hpp"
#include "seisstream/catalog/catalog.hpp"
#include "seisstream/database/catalog_database.hpp"
#include "seisstream/pipeline/detection_pipeline.hpp"
#include "seisstream/playback/playback_scheduler.hpp"

using namespace seisstream;

struct SimulatedEvent {
    GeoPoint hypocenter;
    double origin_offset;    // Seconds after the recording start
    double amplitude;
};

class SeismicSimulator {
public:
    SeismicSimulator(double duration, uint32_t seed)
        : duration_(duration)
        , seed_(seed)
        , start_(std::chrono::system_clock::from_time_t(1700000000))
    {
    }

    // Create example station network around Southern California
    StationInventory createTestNetwork() {
        StationInventory inventory;

        double center_lat = 34.0;
        double center_lon = -118.0;

        std::vector<std::pair<double, double>> offsets = {
            {0.0, 0.0},
            {0.5, 0.3},
            {-0.4, 0.6},
            {0.3, -0.5},
            {-0.6, -0.3},
            {0.8, 0.1}
        };

        int i = 1;
        for (const auto& [dlat, dlon] : offsets) {
            std::string code = "S" + std::to_string(i);
            inventory.addStation(std::make_shared<Station>("CI", code,
                center_lat + dlat, center_lon + dlon, 100.0));
            i++;
        }

        return inventory;
    }

    void addEvent(double lat, double lon, double depth, double origin_offset,
                  double amplitude) {
        SimulatedEvent ev;
        ev.hypocenter = GeoPoint(lat, lon, depth);
        ev.origin_offset = origin_offset;
        ev.amplitude = amplitude;
        events_.push_back(ev);

        std::cout << "Event " << events_.size() << ": " << lat << "°N, " << lon << "°E, "
                  << depth << " km, origin at +" << origin_offset << " s" << std::endl;
    }

    WaveformPtr generate(const StationInventory& stations, double noise) {
        SyntheticWaveformBuilder builder(start_, duration_, 100.0, seed_);
        builder.setNoiseLevel(noise);

        for (const auto& [key, sta] : stations.stations()) {
            builder.addStation(sta->network(), sta->code(), "00", "HH");
        }
        for (const auto& ev : events_) {
            builder.addEvent(ev.hypocenter, ev.origin_offset, stations, ev.amplitude);
        }

        for (const auto& arr : builder.arrivals()) {
            std::cout << "  " << arr.station << " " << phaseTypeToString(arr.phase)
                      << " at +" << std::fixed << std::setprecision(2) << arr.offset
                      << " s" << std::endl;
        }
        return builder.build();
    }

    const std::vector<SimulatedEvent>& events() const { return events_; }
    TimePoint startTime() const { return start_; }

private:
    double duration_;
    uint32_t seed_;
    TimePoint start_;
    std::vector<SimulatedEvent> events_;
};

struct SimulationOptions {
    std::string output_dir = "sim_output";
    std::string model = "PhaseNet";
    double threshold = 0.5;
    double duration = 600.0;
    double noise = 1.0;
    uint32_t seed = 42;
    bool playback = false;
    bool verbose = false;
};

int runSimulation(const SimulationOptions& opts) {
    std::cout << "========================================" << std::endl;
    std::cout << "SeisStream Simulator" << std::endl;
    std::cout << "========================================" << std::endl;

    SeismicSimulator sim(opts.duration, opts.seed);

    StationInventory stations = sim.createTestNetwork();
    std::cout << "\nCreated network with " << stations.size() << " stations" << std::endl;

    std::cout << "\n=== Synthetic Events ===" << std::endl;
    sim.addEvent(34.2, -117.8, 12.0, 100.0, 60.0);
    sim.addEvent(33.8, -118.3, 8.0, 350.0, 40.0);
    WaveformPtr waveform = sim.generate(stations, opts.noise);

    // Write the scenario so it can be replayed with the main application
    std::filesystem::create_directories(opts.output_dir);
    std::string mseed_file = opts.output_dir + "/synthetic.mseed";
    std::string station_file = opts.output_dir + "/stations.txt";

    if (!writeMiniSeed(mseed_file, waveform->traces())) {
        std::cerr << "Failed to write " << mseed_file << std::endl;
        return 1;
    }
    if (!stations.saveToFile(station_file)) {
        std::cerr << "Failed to write " << station_file << std::endl;
        return 1;
    }
    std::cout << "\nWrote " << mseed_file << " and " << station_file << std::endl;

    // Read back through the MiniSEED path the main application uses
    WaveformPtr recorded;
    try {
        recorded = readMiniSeed({mseed_file});
    } catch (const Error& e) {
        std::cerr << "Failed to read back " << mseed_file << ": " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== Detection and Association ===" << std::endl;

    PipelineConfig config;
    config.detection.model = opts.model;
    config.detection.threshold = opts.threshold;
    config.verbose = opts.verbose;

    CatalogPtr catalog = std::make_shared<Catalog>();
    DetectionPipeline pipeline(recorded, stations, catalog);
    pipeline.setEventCallback([](const Event& event) {
        if (event.isFinalized()) {
            std::cout << event.summary() << std::endl;
        }
    });

    try {
        pipeline.run(config);
    } catch (const std::exception& e) {
        std::cerr << "Detection failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== Comparison ===" << std::endl;
    std::cout << "Picks:  " << catalog->activePicks().size() << std::endl;
    std::cout << "Events: " << catalog->eventCount() << " (injected "
              << sim.events().size() << ")" << std::endl;

    for (const auto& truth : sim.events()) {
        TimePoint true_time = addSeconds(sim.startTime(), truth.origin_offset);

        EventPtr best;
        double best_dt = 0;
        for (const auto& event : catalog->allEvents()) {
            double dt = std::abs(secondsBetween(true_time, event->originTime()));
            if (!best || dt < best_dt) {
                best = event;
                best_dt = dt;
            }
        }

        std::cout << "\n  True:   " << formatTime(true_time) << " "
                  << truth.hypocenter.latitude << "°N, "
                  << truth.hypocenter.longitude << "°E" << std::endl;
        if (!best) {
            std::cout << "  Not detected" << std::endl;
            continue;
        }
        const Origin& origin = best->origin();
        std::cout << "  Found:  " << best->id() << " " << formatTime(origin.time) << " "
                  << origin.location.latitude << "°N, "
                  << origin.location.longitude << "°E" << std::endl;
        std::cout << "  Origin time error: " << best_dt << " s" << std::endl;
        std::cout << "  Epicenter error:   "
                  << truth.hypocenter.distanceTo(origin.location) << " km" << std::endl;
    }

    std::string db_file = opts.output_dir + "/catalog.db";
    CatalogDatabase db;
    if (db.open(db_file) && db.createSchema() && db.storeCatalog(*catalog, "synthetic")) {
        std::cout << "\nCatalog stored in " << db_file << std::endl;
    } else {
        std::cerr << "Failed to store catalog: " << db.lastError() << std::endl;
    }

    if (opts.playback) {
        std::cout << "\n=== Playback ===" << std::endl;

        PlaybackOptions popts;
        popts.window_length = 60.0;
        popts.fast_step = 30.0;
        PlaybackScheduler scheduler(popts);
        scheduler.load(recorded, catalog);
        scheduler.setUnlimitedSpeed();
        scheduler.play();

        while (scheduler.state() == PlaybackState::Playing) {
            std::optional<PlaybackFrame> frame = scheduler.nextFrame();
            if (!frame) continue;
            std::cout << "  +" << std::setw(7) << frame->virtual_time << " s  "
                      << frame->picks.size() << " picks, "
                      << frame->events.size() << " events" << std::endl;
        }
    }

    std::cout << "\n========================================" << std::endl;
    std::cout << "Simulation complete" << std::endl;
    std::cout << "========================================" << std::endl;
    return 0;
}

void printUsage(const char* progname) {
    std::cout << "SeisStream Simulator\n\n";
    std::cout << "Generates a synthetic recording and runs the detection pipeline over it.\n\n";
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output <dir>     Output directory (default: sim_output)\n";
    std::cout << "  --model <name>         Detection model (default: PhaseNet)\n";
    std::cout << "  --threshold <p>        Pick threshold (default: 0.5)\n";
    std::cout << "  --duration <s>         Recording length (default: 600)\n";
    std::cout << "  --noise <sigma>        Noise standard deviation (default: 1.0)\n";
    std::cout << "  --seed <n>             Random seed (default: 42)\n";
    std::cout << "  --playback             Step through the result at fast speed\n";
    std::cout << "  -v, --verbose          Per-chunk progress output\n";
    std::cout << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    SimulationOptions opts;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                opts.output_dir = argv[++i];
            } else if (arg == "--model" && i + 1 < argc) {
                opts.model = argv[++i];
            } else if (arg == "--threshold" && i + 1 < argc) {
                opts.threshold = std::stod(argv[++i]);
            } else if (arg == "--duration" && i + 1 < argc) {
                opts.duration = std::stod(argv[++i]);
            } else if (arg == "--noise" && i + 1 < argc) {
                opts.noise = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                opts.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--playback") {
                opts.playback = true;
            } else if (arg == "-v" || arg == "--verbose") {
                opts.verbose = true;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return 1;
        }
    }

    return runSimulation(opts);
}
