#pragma once

#include "association_backend.hpp"
#include "seisstream/core/config.hpp"
#include <Eigen/Dense>
#include <map>
#include <set>

namespace seisstream {

struct TravelTimeAssociatorConfig {
    double p_velocity = 7.0;          // km/s
    double s_velocity = 4.0;          // km/s
    double tolerance = 2.0;           // Max |residual| (s)
    double cutoff_distance = 250.0;   // Max epicentral distance (km)
    int min_stations = 3;
    int min_picks = 4;
    int min_p_and_s_stations = 0;     // Stations that need both phases
    double default_depth = 10.0;      // km, used while depth is fixed
    double max_depth = 200.0;
    int free_depth_min_stations = 4;  // Fewer stations fix the depth
    int max_iterations = 30;
    double damping = 0.01;            // Levenberg-Marquardt factor

    static TravelTimeAssociatorConfig fromConfig(const Config& config);
};

/**
 * TravelTimeAssociator - Homogeneous velocity model associator
 *
 * New picks first try to join an open event whose predicted arrival lies
 * within the tolerance. Remaining P picks seed candidate clusters of
 * nearby picks that are located by damped least squares; the worst
 * outlier is dropped until every residual fits. Clusters with too few
 * stations are reported as insufficient instead of becoming events.
 */
class TravelTimeAssociator : public AssociationBackend {
public:
    explicit TravelTimeAssociator(const TravelTimeAssociatorConfig& config = TravelTimeAssociatorConfig());

    std::string name() const override { return "TravelTime0D"; }

    ClusterResult cluster(const std::vector<PickPtr>& picks,
                          const StationInventory& stations,
                          const std::vector<Event>& open_events) override;

    // Locate picks; false when the picks cannot constrain a solution
    bool locate(const std::vector<PickPtr>& picks, const StationInventory& stations,
                Origin& origin) const;

    double travelTime(double distance_km, double depth_km, PhaseType phase) const;

    // Observed minus predicted arrival time for a pick and origin
    double residual(const Pick& pick, const Origin& origin, const StationInventory& stations) const;

    const TravelTimeAssociatorConfig& config() const { return config_; }

private:
    TravelTimeAssociatorConfig config_;

    struct LocalPoint {
        double x;   // km east
        double y;   // km north
    };

    LocalPoint project(const GeoPoint& p, const GeoPoint& ref) const;
    GeoPoint unproject(const LocalPoint& p, const GeoPoint& ref, double depth) const;

    Eigen::VectorXd solveSystem(const Eigen::MatrixXd& G, const Eigen::VectorXd& d,
                                const Eigen::VectorXd& w) const;

    double confidence(const Origin& origin) const;
    bool supportsEvent(const std::vector<PickPtr>& picks, std::string& reason) const;
    bool fitCluster(std::vector<PickPtr>& picks, const StationInventory& stations,
                    Origin& origin) const;
    Event buildEvent(const std::string& id, const std::vector<PickPtr>& picks,
                     const Origin& origin) const;
};

} // namespace seisstream
