#pragma once
#include "wc/config.hpp"

namespace wc {

enum class FloorPhase {
    Seeding,    // block consumed to seed the floor
    WarmingUp,  // floor updated, detection suppressed
    Ready       // floor updated, usable for detection
};

// Exponentially smoothed ambient energy baseline
class NoiseFloorTracker {
public:
    explicit NoiseFloorTracker(const DetectorConfig& cfg);

    // now: seconds since the first block. in_whistle only matters when
    // freeze_floor_in_whistle is set.
    FloorPhase update(double energy, double now, bool in_whistle = false);

    double floor()  const { return floor_; }
    bool   seeded() const { return seeded_; }

private:
    double alpha_;
    double warmup_s_;
    bool   seed_first_;
    bool   freeze_in_whistle_;

    double floor_;
    bool   seeded_ = false;
};

} // namespace wc
