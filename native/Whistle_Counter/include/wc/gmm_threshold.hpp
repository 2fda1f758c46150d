#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace wc {

// Quiet/loud split of a set of block levels
struct LevelSplit {
    double quiet_db;      // lower cluster mean
    double loud_db;       // upper cluster mean
    double threshold_db;  // midpoint of the two means
    double loud_share;    // mixture weight of the loud cluster, 0..1
    int    n_used;        // levels left after trimming
};

struct GmmConfig {
    double p_low  = 1.0, p_high = 99.0;  // percentile trim before fitting
    int    max_iter = 200;
    double eps      = 1e-6;
    double min_separation_db = 3.0;      // closer means count as one cluster
};

// Two-component 1-D Gaussian mixture over block levels in dB
class GmmThreshold {
public:
    static constexpr std::size_t kMinLevels = 8;

    explicit GmmThreshold(const GmmConfig& cfg = {}) : cfg_(cfg) {}

    // nullopt: too few levels, EM failure, or no distinct loud cluster
    std::optional<LevelSplit> split(const std::vector<double>& level_db) const;

private:
    GmmConfig cfg_;
};

} // namespace wc
