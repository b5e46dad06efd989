/**
 * SeisStream - Streaming seismic phase detection and association
 *
 * Main application that:
 * 1. Loads MiniSEED recordings and a station inventory
 * 2. Runs a phase-detection model over the recording in overlapping chunks
 * 3. Merges chunk-boundary duplicates and associates picks into events
 * 4. Stores the resulting catalog in an SQLite database
 * 5. Optionally replays the recording with the catalog overlaid
 */

#include <iostream>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <filesystem>
#include <algorithm>
#include <iomanip>

#include "seisstream/core/types.hpp"
#include "seisstream/core/config.hpp"
#include "seisstream/core/errors.hpp"
#include "seisstream/core/station.hpp"
#include "seisstream/core/miniseed.hpp"
#include "seisstream/catalog/catalog.hpp"
#include "seisstream/database/catalog_database.hpp"
#include "seisstream/pipeline/detection_pipeline.hpp"
#include "seisstream/playback/playback_scheduler.hpp"

using namespace seisstream;

// Global shutdown flag
std::atomic<bool> g_running(true);

void signalHandler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_running = false;
}

void printUsage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>      Configuration file (default: seisstream.conf)\n";
    std::cout << "  -S, --stations <file>    Station inventory file\n";
    std::cout << "  -m, --miniseed <file>    MiniSEED file (may be repeated)\n";
    std::cout << "  -M, --miniseed-dir <dir> Directory of MiniSEED files\n";
    std::cout << "  -d, --database <file>    SQLite catalog output\n";
    std::cout << "  --model <name>           Detection model (default: PhaseNet)\n";
    std::cout << "  --threshold <p>          Pick probability threshold in [0, 1]\n";
    std::cout << "  --chunk-length <s>       Chunk length in seconds\n";
    std::cout << "  --overlap <s>            Chunk overlap in seconds\n";
    std::cout << "  --playback [speed]       Replay the recording after detection\n";
    std::cout << "                           (speed multiplier, 0 = fast as possible)\n";
    std::cout << "  --list-models            Show the available models and exit\n";
    std::cout << "  -v, --verbose            Per-chunk progress output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Models:\n";
    std::cout << "  EQTransformer, PhaseNet, PickBlue, OBSTransformer\n";
    std::cout << "\n";
    std::cout << "Database Output:\n";
    std::cout << "  The catalog is stored in a reduced CSS3.0 layout (SQLite database)\n";
    std::cout << "  Tables: event, origin, arrival, assoc\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progname << " -S stations.txt -m data.mseed -d catalog.db\n";
    std::cout << "  " << progname << " -S stations.txt -M day/ --model EQTransformer --threshold 0.3\n";
    std::cout << "  " << progname << " -S stations.txt -m data.mseed --playback 10\n";
}

/**
 * SeisStream Application
 */
class SeisStream {
public:
    SeisStream()
        : registry_(InferenceRegistry::withBuiltins())
        , catalog_(std::make_shared<Catalog>())
        , db_enabled_(false)
        , playback_enabled_(false)
    {
    }

    bool loadConfig(const std::string& filename) {
        if (!config_.loadFromFile(filename)) {
            std::cerr << "Failed to load config: " << filename << std::endl;
            return false;
        }
        std::cout << "Loaded configuration from " << filename << std::endl;
        return true;
    }

    const Config& config() const { return config_; }

    bool loadStations(const std::string& filename) {
        if (!stations_.loadFromFile(filename)) {
            std::cerr << "Failed to load stations: " << filename << std::endl;
            return false;
        }
        std::cout << "Loaded " << stations_.size() << " stations" << std::endl;
        return true;
    }

    bool openDatabase(const std::string& filename) {
        if (!database_.open(filename)) {
            std::cerr << "Failed to open database: " << filename << std::endl;
            return false;
        }
        if (!database_.createSchema()) {
            std::cerr << "Failed to create database schema" << std::endl;
            return false;
        }
        db_enabled_ = true;
        std::cout << "Database opened: " << filename << std::endl;
        return true;
    }

    void addMiniSeedFile(const std::string& filename) {
        miniseed_files_.push_back(filename);
    }

    bool addMiniSeedDirectory(const std::string& dirname) {
        namespace fs = std::filesystem;
        if (!fs::is_directory(dirname)) {
            std::cerr << "Not a directory: " << dirname << std::endl;
            return false;
        }

        std::vector<std::string> found;
        for (const auto& entry : fs::directory_iterator(dirname)) {
            if (!entry.is_regular_file()) continue;
            std::string ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
            if (ext == ".mseed" || ext == ".miniseed" || ext == ".ms") {
                found.push_back(entry.path().string());
            }
        }
        std::sort(found.begin(), found.end());

        if (found.empty()) {
            std::cerr << "No MiniSEED files in " << dirname << std::endl;
            return false;
        }
        miniseed_files_.insert(miniseed_files_.end(), found.begin(), found.end());
        return true;
    }

    bool loadWaveforms() {
        if (miniseed_files_.empty()) {
            std::cerr << "No MiniSEED input given" << std::endl;
            return false;
        }

        try {
            waveform_ = readMiniSeed(miniseed_files_);
        } catch (const Error& e) {
            std::cerr << "Failed to load waveforms: " << e.what() << std::endl;
            return false;
        }

        std::cout << "Loaded " << waveform_->traces().size() << " channels from "
                  << miniseed_files_.size() << " file(s), "
                  << std::fixed << std::setprecision(1) << waveform_->totalDuration()
                  << " s starting " << formatTime(waveform_->startTime()) << std::endl;

        for (const auto& key : stations_.missing(waveform_->stations())) {
            std::cerr << "Warning: " << key
                      << " is not in the inventory and will not be associated" << std::endl;
        }
        return true;
    }

    void enablePlayback(double speed) {
        playback_enabled_ = true;
        playback_speed_ = speed;
    }

    bool run(const PipelineConfig& config) {
        DetectionPipeline pipeline(waveform_, stations_, catalog_, registry_);

        pipeline.setEventCallback([](const Event& event) {
            std::cout << (event.isFinalized() ? "Event final:   " : "Event update:  ")
                      << event.summary() << std::endl;
        });

        std::cout << "Running " << config.detection.model << " (threshold "
                  << config.detection.threshold << ") over "
                  << config.reader.chunk_length << " s chunks with "
                  << config.reader.overlap << " s overlap" << std::endl;

        try {
            pipeline.start(config);
        } catch (const std::exception& e) {
            std::cerr << "Cannot start detection: " << e.what() << std::endl;
            return false;
        }

        size_t last_reported = 0;
        while (pipeline.isRunning()) {
            if (!g_running) {
                pipeline.cancel();
                break;
            }
            PipelineProgress progress = pipeline.progress();
            if (!config.verbose && progress.chunks_done >= last_reported + 10) {
                last_reported = progress.chunks_done;
                std::cout << "Progress: " << progress.chunks_done << "/"
                          << progress.chunk_count << " chunks, " << progress.picks
                          << " picks, " << progress.events << " events" << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        pipeline.wait();

        PipelineProgress progress = pipeline.progress();
        std::cout << "\n=== Detection Summary ===" << std::endl;
        std::cout << "Chunks:   " << progress.chunks_done << "/" << progress.chunk_count
                  << (progress.cancelled ? " (cancelled)" : "") << std::endl;
        std::cout << "Picks:    " << catalog_->activePicks().size() << std::endl;
        std::cout << "Events:   " << catalog_->eventCount() << std::endl;

        std::vector<ChunkDiagnostic> diagnostics = pipeline.diagnostics();
        if (!diagnostics.empty()) {
            std::cout << "Skipped:  " << diagnostics.size() << " chunk diagnostic(s)" << std::endl;
            for (const auto& diag : diagnostics) {
                std::cout << "  chunk " << diag.chunk_index << " "
                          << pipelineStageToString(diag.stage) << " "
                          << diag.range.toString() << ": " << diag.message << std::endl;
            }
        }
        return true;
    }

    bool storeCatalog(const std::string& vmodel) {
        if (!db_enabled_) return true;

        if (!database_.storeCatalog(*catalog_, vmodel)) {
            std::cerr << "Failed to store catalog in database" << std::endl;
            return false;
        }
        std::cout << "Catalog stored: " << database_.countEvents() << " events, "
                  << database_.countArrivals() << " arrivals" << std::endl;
        return true;
    }

    void playback(const PlaybackOptions& options) {
        if (!playback_enabled_) return;

        PlaybackScheduler scheduler(options);
        if (!scheduler.load(waveform_, catalog_)) {
            std::cerr << "Playback: failed to load waveform" << std::endl;
            return;
        }
        if (playback_speed_ <= 0) {
            scheduler.setUnlimitedSpeed();
        } else if (!scheduler.setSpeed(playback_speed_)) {
            std::cerr << "Playback: invalid speed " << playback_speed_ << std::endl;
            return;
        }

        std::cout << "\n=== Playback ===" << std::endl;
        scheduler.play();

        size_t last_picks = 0;
        size_t last_events = 0;
        while (g_running && scheduler.state() == PlaybackState::Playing) {
            std::optional<PlaybackFrame> frame = scheduler.nextFrame();
            if (!frame) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            // Report only when the overlay changes
            if (frame->picks.size() != last_picks || frame->events.size() != last_events) {
                last_picks = frame->picks.size();
                last_events = frame->events.size();
                std::cout << "[" << formatTime(frame->time) << "] "
                          << frame->channels.size() << " channels, "
                          << last_picks << " picks, " << last_events
                          << " events in view" << std::endl;
            }
        }
        std::cout << "Playback " << playbackStateToString(scheduler.state()) << " at "
                  << scheduler.virtualTime() << " s of " << scheduler.totalDuration()
                  << " s" << std::endl;
    }

    InferenceRegistryPtr registry() const { return registry_; }

private:
    Config config_;
    StationInventory stations_;
    InferenceRegistryPtr registry_;
    CatalogPtr catalog_;
    WaveformPtr waveform_;
    std::vector<std::string> miniseed_files_;

    CatalogDatabase database_;
    bool db_enabled_;

    bool playback_enabled_;
    double playback_speed_ = 1.0;
};

int main(int argc, char* argv[]) {
    // Set up signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    // Parse command line arguments
    std::string config_file = "seisstream.conf";
    std::string stations_file;
    std::string database_file;
    std::vector<std::string> miniseed_files;
    std::vector<std::string> miniseed_dirs;
    std::string model;
    double threshold = -1;
    double chunk_length = -1;
    double overlap = -1;
    bool playback = false;
    double playback_speed = 1.0;
    bool list_models = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        try {
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_file = argv[++i];
            } else if ((arg == "-S" || arg == "--stations") && i + 1 < argc) {
                stations_file = argv[++i];
            } else if ((arg == "-m" || arg == "--miniseed") && i + 1 < argc) {
                miniseed_files.push_back(argv[++i]);
            } else if ((arg == "-M" || arg == "--miniseed-dir") && i + 1 < argc) {
                miniseed_dirs.push_back(argv[++i]);
            } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
                database_file = argv[++i];
            } else if (arg == "--model" && i + 1 < argc) {
                model = argv[++i];
            } else if (arg == "--threshold" && i + 1 < argc) {
                threshold = std::stod(argv[++i]);
            } else if (arg == "--chunk-length" && i + 1 < argc) {
                chunk_length = std::stod(argv[++i]);
            } else if (arg == "--overlap" && i + 1 < argc) {
                overlap = std::stod(argv[++i]);
            } else if (arg == "--playback") {
                playback = true;
                if (i + 1 < argc && argv[i + 1][0] != '-') {
                    playback_speed = std::stod(argv[++i]);
                }
            } else if (arg == "--list-models") {
                list_models = true;
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return 1;
        }
    }

    std::cout << "==========================================\n";
    std::cout << "SeisStream - Streaming Phase Detection\n";
    std::cout << "==========================================\n\n";

    SeisStream app;

    if (list_models) {
        for (const auto& name : app.registry()->available()) {
            InferenceBackendPtr backend = app.registry()->get(name);
            InputShape shape = backend->inputShape();
            std::cout << "  " << std::left << std::setw(16) << name
                      << shape.samples << " samples x " << shape.channels
                      << " at " << shape.sample_rate << " Hz, receptive field "
                      << backend->receptiveField() << " s" << std::endl;
        }
        return 0;
    }

    // Missing config is not fatal; defaults apply
    if (std::filesystem::exists(config_file)) {
        app.loadConfig(config_file);
    }

    if (stations_file.empty()) {
        stations_file = app.config().getString("stations.file");
    }
    if (stations_file.empty()) {
        std::cerr << "A station inventory is required (-S)" << std::endl;
        return 1;
    }
    if (!app.loadStations(stations_file)) {
        return 1;
    }

    for (const auto& file : miniseed_files) {
        app.addMiniSeedFile(file);
    }
    for (const auto& dir : miniseed_dirs) {
        if (!app.addMiniSeedDirectory(dir)) {
            return 1;
        }
    }
    if (!app.loadWaveforms()) {
        return 1;
    }

    // Open database if provided via command line (overrides config)
    if (database_file.empty()) {
        database_file = app.config().getString("database.file");
    }
    if (!database_file.empty() && !app.openDatabase(database_file)) {
        return 1;
    }

    PipelineConfig pipeline_config = PipelineConfig::fromConfig(app.config());
    if (!model.empty()) pipeline_config.detection.model = model;
    if (threshold >= 0) pipeline_config.detection.threshold = threshold;
    if (chunk_length > 0) pipeline_config.reader.chunk_length = chunk_length;
    if (overlap >= 0) pipeline_config.reader.overlap = overlap;
    pipeline_config.verbose = pipeline_config.verbose || verbose;

    if (!app.run(pipeline_config)) {
        return 1;
    }

    if (!app.storeCatalog(pipeline_config.detection.model)) {
        return 1;
    }

    if (playback && g_running) {
        app.enablePlayback(playback_speed);
        app.playback(PlaybackOptions::fromConfig(app.config()));
    }

    std::cout << "SeisStream shutdown complete" << std::endl;
    return 0;
}
