#include "seisstream/associator/travel_time_associator.hpp"
#include "seisstream/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace seisstream {

namespace {

constexpr double MIN_DEPTH = 1.0;         // km, keeps travel times positive
constexpr double CONVERGENCE = 1e-6;
constexpr double MIN_WEIGHT = 0.05;

struct Observation {
    PickPtr pick;
    StationPtr station;
    double x;
    double y;
    double t;     // Seconds after the reference pick
    double w;
};

bool byTime(const PickPtr& a, const PickPtr& b) {
    if (a->time != b->time) return a->time < b->time;
    if (a->stationKey() != b->stationKey()) return a->stationKey() < b->stationKey();
    return a->id < b->id;
}

} // namespace

TravelTimeAssociatorConfig TravelTimeAssociatorConfig::fromConfig(const Config& config) {
    TravelTimeAssociatorConfig c;
    c.p_velocity = config.getDouble("associator.p_velocity", c.p_velocity);
    c.s_velocity = config.getDouble("associator.s_velocity", c.s_velocity);
    c.tolerance = config.getDouble("associator.tolerance", c.tolerance);
    c.cutoff_distance = config.getDouble("associator.cutoff_distance", c.cutoff_distance);
    c.min_stations = config.getInt("associator.min_stations", c.min_stations);
    c.min_picks = config.getInt("associator.min_picks", c.min_picks);
    c.min_p_and_s_stations = config.getInt("associator.min_p_and_s_stations", c.min_p_and_s_stations);
    c.default_depth = config.getDouble("associator.default_depth", c.default_depth);
    c.max_depth = config.getDouble("associator.max_depth", c.max_depth);
    c.free_depth_min_stations = config.getInt("associator.free_depth_min_stations",
                                              c.free_depth_min_stations);
    c.max_iterations = config.getInt("associator.max_iterations", c.max_iterations);
    c.damping = config.getDouble("associator.damping", c.damping);
    return c;
}

TravelTimeAssociator::TravelTimeAssociator(const TravelTimeAssociatorConfig& config)
    : config_(config)
{
}

double TravelTimeAssociator::travelTime(double distance_km, double depth_km, PhaseType phase) const {
    double v = phase == PhaseType::S ? config_.s_velocity : config_.p_velocity;
    return std::sqrt(distance_km * distance_km + depth_km * depth_km) / v;
}

double TravelTimeAssociator::residual(const Pick& pick, const Origin& origin,
                                      const StationInventory& stations) const {
    StationPtr sta = stations.getStation(pick.stream_id);
    if (!sta) {
        throw AssociationError("no station metadata for " + pick.stationKey());
    }
    double dist = sta->distanceTo(origin.location);
    double predicted = travelTime(dist, origin.location.depth, pick.phase_type);
    return secondsBetween(pick.time, origin.time) - predicted;
}

TravelTimeAssociator::LocalPoint TravelTimeAssociator::project(const GeoPoint& p,
                                                               const GeoPoint& ref) const {
    LocalPoint lp;
    lp.x = (p.longitude - ref.longitude) * constants::KM_PER_DEG *
           std::cos(ref.latitude * constants::DEG_TO_RAD);
    lp.y = (p.latitude - ref.latitude) * constants::KM_PER_DEG;
    return lp;
}

GeoPoint TravelTimeAssociator::unproject(const LocalPoint& p, const GeoPoint& ref, double depth) const {
    double lat = ref.latitude + p.y / constants::KM_PER_DEG;
    double lon = ref.longitude + p.x / (constants::KM_PER_DEG *
                                        std::cos(ref.latitude * constants::DEG_TO_RAD));
    return GeoPoint(lat, lon, depth);
}

Eigen::VectorXd TravelTimeAssociator::solveSystem(const Eigen::MatrixXd& G,
                                                  const Eigen::VectorXd& d,
                                                  const Eigen::VectorXd& w) const {
    // Weighted least squares: (G'WG + lambda*I)^-1 * G'Wd
    int m = static_cast<int>(G.cols());

    Eigen::MatrixXd GtWG = G.transpose() * w.asDiagonal() * G;

    // Levenberg-Marquardt damping scaled to the mean diagonal
    double mean_diag = GtWG.diagonal().sum() / m;
    double lambda = config_.damping * mean_diag;
    GtWG.diagonal().array() += lambda;

    Eigen::VectorXd GtWd = G.transpose() * w.asDiagonal() * d;
    return GtWG.ldlt().solve(GtWd);
}

bool TravelTimeAssociator::locate(const std::vector<PickPtr>& picks, const StationInventory& stations,
                                  Origin& origin) const {
    std::vector<PickPtr> sorted(picks.begin(), picks.end());
    std::sort(sorted.begin(), sorted.end(), byTime);

    std::vector<Observation> obs;
    std::set<std::string> station_keys;
    for (const auto& pick : sorted) {
        StationPtr sta = stations.getStation(pick->stream_id);
        if (!sta) continue;
        Observation o;
        o.pick = pick;
        o.station = sta;
        o.x = 0;
        o.y = 0;
        o.t = 0;
        o.w = std::max(MIN_WEIGHT, pick->probability);
        obs.push_back(o);
        station_keys.insert(pick->stationKey());
    }
    if (obs.size() < 2) return false;

    TimePoint reference = obs.front().pick->time;
    GeoPoint ref = obs.front().station->location();
    for (auto& o : obs) {
        LocalPoint lp = project(o.station->location(), ref);
        o.x = lp.x;
        o.y = lp.y;
        o.t = secondsBetween(o.pick->time, reference);
    }

    bool fixed_depth = static_cast<int>(station_keys.size()) < config_.free_depth_min_stations;
    int n_obs = static_cast<int>(obs.size());
    int n_params = fixed_depth ? 3 : 4;

    // Start beneath the first station to record the event
    double x = 0, y = 0;
    double z = std::max(MIN_DEPTH, config_.default_depth);
    double t0 = -travelTime(0, z, obs.front().pick->phase_type);

    auto velocity = [this](PhaseType phase) {
        return phase == PhaseType::S ? config_.s_velocity : config_.p_velocity;
    };

    for (int iter = 0; iter < config_.max_iterations; iter++) {
        Eigen::MatrixXd G(n_obs, n_params);
        Eigen::VectorXd d(n_obs);
        Eigen::VectorXd w(n_obs);

        for (int i = 0; i < n_obs; i++) {
            const auto& o = obs[i];
            double v = velocity(o.pick->phase_type);
            double dx = x - o.x;
            double dy = y - o.y;
            double r = std::max(1e-3, std::sqrt(dx * dx + dy * dy + z * z));

            G(i, 0) = dx / (v * r);
            G(i, 1) = dy / (v * r);
            if (!fixed_depth) G(i, 2) = z / (v * r);
            G(i, n_params - 1) = 1.0;

            d(i) = o.t - (t0 + r / v);
            w(i) = o.w;
        }

        Eigen::VectorXd dm = solveSystem(G, d, w);
        if (!dm.allFinite()) return false;

        x += dm(0);
        y += dm(1);
        if (!fixed_depth) {
            z = std::max(MIN_DEPTH, std::min(config_.max_depth, z + dm(2)));
        }
        t0 += dm(n_params - 1);

        // Diverged far outside the network
        if (std::abs(x) > 10 * config_.cutoff_distance || std::abs(y) > 10 * config_.cutoff_distance) {
            return false;
        }

        if (dm.norm() < CONVERGENCE) break;
    }

    std::vector<double> tt(n_obs);
    std::vector<double> dist(n_obs);
    for (int i = 0; i < n_obs; i++) {
        double dx = x - obs[i].x;
        double dy = y - obs[i].y;
        dist[i] = std::sqrt(dx * dx + dy * dy + z * z);
        tt[i] = dist[i] / velocity(obs[i].pick->phase_type);
    }

    // The origin must precede every arrival
    if (t0 >= 0) {
        double earliest = std::numeric_limits<double>::infinity();
        for (int i = 0; i < n_obs; i++) {
            earliest = std::min(earliest, obs[i].t - tt[i]);
        }
        t0 = earliest;
    }

    Origin result;
    result.time = addSeconds(reference, t0);
    result.location = unproject(LocalPoint{x, y}, ref, z);
    result.is_fixed_depth = fixed_depth;
    result.algorithm = name();
    result.phase_count = n_obs;
    result.station_count = static_cast<int>(station_keys.size());

    double sum_sq = 0, sum_w = 0;
    for (int i = 0; i < n_obs; i++) {
        Arrival arr;
        arr.pick_id = obs[i].pick->id;
        arr.station = obs[i].pick->stationKey();
        arr.phase_type = obs[i].pick->phase_type;
        arr.distance = dist[i];
        arr.residual = obs[i].t - (t0 + tt[i]);
        result.arrivals.push_back(arr);

        sum_sq += obs[i].w * arr.residual * arr.residual;
        sum_w += obs[i].w;
    }
    result.rms = sum_w > 0 ? std::sqrt(sum_sq / sum_w) : 0;

    if (!std::isfinite(result.rms)) return false;
    origin = result;
    return true;
}

bool TravelTimeAssociator::fitCluster(std::vector<PickPtr>& picks, const StationInventory& stations,
                                      Origin& origin) const {
    while (picks.size() >= 2) {
        Origin trial;
        if (!locate(picks, stations, trial)) return false;

        // Worst violation: residual beyond tolerance or station beyond cutoff
        double worst = 0;
        uint64_t worst_id = 0;
        bool found = false;
        for (const auto& arr : trial.arrivals) {
            double score = std::abs(arr.residual) / config_.tolerance;
            StationPtr sta = stations.getStation(arr.station);
            if (sta && sta->distanceTo(trial.location) > config_.cutoff_distance) {
                score = std::max(score, 1.0 + sta->distanceTo(trial.location) / config_.cutoff_distance);
            }
            if (score > 1.0 && score > worst) {
                worst = score;
                worst_id = arr.pick_id;
                found = true;
            }
        }

        if (!found) {
            origin = trial;
            return true;
        }

        picks.erase(std::remove_if(picks.begin(), picks.end(),
                                   [worst_id](const PickPtr& p) { return p->id == worst_id; }),
                    picks.end());
    }
    return false;
}

bool TravelTimeAssociator::supportsEvent(const std::vector<PickPtr>& picks, std::string& reason) const {
    std::map<std::string, std::set<PhaseType>> phases;
    for (const auto& p : picks) {
        phases[p->stationKey()].insert(p->phase_type);
    }

    int both = 0;
    for (const auto& entry : phases) {
        if (entry.second.count(PhaseType::P) && entry.second.count(PhaseType::S)) both++;
    }

    int n_sta = static_cast<int>(phases.size());
    int n_picks = static_cast<int>(picks.size());
    if (n_sta < config_.min_stations) {
        reason = std::to_string(n_sta) + " stations, need " + std::to_string(config_.min_stations);
        return false;
    }
    if (n_picks < config_.min_picks) {
        reason = std::to_string(n_picks) + " picks, need " + std::to_string(config_.min_picks);
        return false;
    }
    if (both < config_.min_p_and_s_stations) {
        reason = std::to_string(both) + " stations with P and S, need " +
                 std::to_string(config_.min_p_and_s_stations);
        return false;
    }
    return true;
}

double TravelTimeAssociator::confidence(const Origin& origin) const {
    double n = origin.station_count;
    double coverage = n / (n + 2.0);
    double fit = std::exp(-origin.rms / config_.tolerance);
    return std::max(0.0, std::min(1.0, coverage * fit));
}

Event TravelTimeAssociator::buildEvent(const std::string& id, const std::vector<PickPtr>& picks,
                                       const Origin& origin) const {
    std::vector<uint64_t> ids;
    for (const auto& p : picks) ids.push_back(p->id);
    std::sort(ids.begin(), ids.end());

    Event event(id);
    event.setOrigin(origin);
    event.setPickIds(ids);
    event.setConfidence(confidence(origin));
    return event;
}

ClusterResult TravelTimeAssociator::cluster(const std::vector<PickPtr>& picks,
                                            const StationInventory& stations,
                                            const std::vector<Event>& open_events) {
    ClusterResult result;

    std::map<uint64_t, PickPtr> by_id;
    for (const auto& p : picks) {
        if (!p || p->id == 0) {
            throw AssociationError("cannot associate a pick without a catalog id");
        }
        by_id[p->id] = p;
    }

    // Picks already owned by open events
    std::vector<std::vector<PickPtr>> event_picks(open_events.size());
    std::set<uint64_t> assigned;
    for (size_t k = 0; k < open_events.size(); k++) {
        for (uint64_t id : open_events[k].pickIds()) {
            auto it = by_id.find(id);
            if (it == by_id.end()) {
                throw AssociationError("event " + open_events[k].id() + " references pick " +
                                       std::to_string(id) + " that was not supplied");
            }
            event_picks[k].push_back(it->second);
            assigned.insert(id);
        }
    }

    std::vector<PickPtr> free_picks;
    for (const auto& entry : by_id) {
        if (assigned.count(entry.first)) continue;
        if (!stations.getStation(entry.second->stream_id)) continue;
        free_picks.push_back(entry.second);
    }
    std::sort(free_picks.begin(), free_picks.end(), byTime);

    // Extend open events with picks that fit their current origin
    std::vector<std::vector<PickPtr>> attached(open_events.size());
    std::vector<PickPtr> unattached;
    for (const auto& pick : free_picks) {
        int best = -1;
        double best_res = std::numeric_limits<double>::infinity();

        for (size_t k = 0; k < open_events.size(); k++) {
            const Origin& origin = open_events[k].origin();

            bool slot_taken = false;
            for (const auto& p : event_picks[k]) {
                if (p->stationKey() == pick->stationKey() && p->phase_type == pick->phase_type) {
                    slot_taken = true;
                }
            }
            for (const auto& p : attached[k]) {
                if (p->stationKey() == pick->stationKey() && p->phase_type == pick->phase_type) {
                    slot_taken = true;
                }
            }
            if (slot_taken) continue;

            StationPtr sta = stations.getStation(pick->stream_id);
            if (sta->distanceTo(origin.location) > config_.cutoff_distance) continue;

            double res = std::abs(residual(*pick, origin, stations));
            if (res <= config_.tolerance && res < best_res) {
                best_res = res;
                best = static_cast<int>(k);
            }
        }

        if (best >= 0) {
            attached[best].push_back(pick);
        } else {
            unattached.push_back(pick);
        }
    }

    for (size_t k = 0; k < open_events.size(); k++) {
        if (attached[k].empty()) continue;

        std::vector<PickPtr> all = event_picks[k];
        all.insert(all.end(), attached[k].begin(), attached[k].end());
        size_t expected = all.size();

        Origin origin;
        if (fitCluster(all, stations, origin) && all.size() == expected) {
            result.events.push_back(buildEvent(open_events[k].id(), all, origin));
        } else {
            // Relocation rejected the additions; they may still seed a new event
            unattached.insert(unattached.end(), attached[k].begin(), attached[k].end());
        }
    }
    std::sort(unattached.begin(), unattached.end(), byTime);

    // Nucleate new events from the earliest unused P picks
    double before = config_.cutoff_distance / config_.p_velocity;
    double after = config_.cutoff_distance / config_.s_velocity;
    std::set<uint64_t> used;
    std::set<uint64_t> rejected_seeds;

    for (const auto& seed : unattached) {
        if (seed->phase_type != PhaseType::P) continue;
        if (used.count(seed->id) || rejected_seeds.count(seed->id)) continue;

        std::map<std::pair<std::string, PhaseType>, PickPtr> slots;
        slots[{seed->stationKey(), seed->phase_type}] = seed;

        for (const auto& pick : unattached) {
            if (pick == seed || used.count(pick->id)) continue;
            double dt = secondsBetween(pick->time, seed->time);
            if (dt < -before || dt > after) continue;

            auto key = std::make_pair(pick->stationKey(), pick->phase_type);
            auto it = slots.find(key);
            if (it == slots.end()) {
                slots[key] = pick;
            } else if (it->second != seed &&
                       std::abs(dt) < std::abs(secondsBetween(it->second->time, seed->time))) {
                it->second = pick;
            }
        }

        std::vector<PickPtr> members;
        for (const auto& entry : slots) members.push_back(entry.second);

        // An S pick cannot precede the P pick of its own station
        members.erase(std::remove_if(members.begin(), members.end(), [&slots](const PickPtr& p) {
            if (p->phase_type != PhaseType::S) return false;
            auto it = slots.find({p->stationKey(), PhaseType::P});
            return it != slots.end() && it->second->time >= p->time;
        }), members.end());

        Origin origin;
        if (!fitCluster(members, stations, origin)) continue;

        std::string reason;
        if (!supportsEvent(members, reason)) {
            ClusterRejection rejection;
            for (const auto& p : members) {
                rejection.pick_ids.push_back(p->id);
                if (p->phase_type == PhaseType::P) rejected_seeds.insert(p->id);
            }
            std::sort(rejection.pick_ids.begin(), rejection.pick_ids.end());
            rejection.reason = reason;
            result.insufficient.push_back(rejection);
            continue;
        }

        for (const auto& p : members) used.insert(p->id);
        result.events.push_back(buildEvent("", members, origin));
    }

    return result;
}

} // namespace seisstream
