#include "wc/noise_floor.hpp"

namespace wc {

NoiseFloorTracker::NoiseFloorTracker(const DetectorConfig& cfg)
    : alpha_(cfg.alpha),
      warmup_s_(cfg.warmup_seconds),
      seed_first_(cfg.seed_from_first_block),
      freeze_in_whistle_(cfg.freeze_floor_in_whistle),
      floor_(cfg.seed_from_first_block ? 0.0 : cfg.initial_floor) {}

FloorPhase NoiseFloorTracker::update(double energy, double now, bool in_whistle) {
    if (!seeded_) {
        seeded_ = true;
        if (seed_first_) {
            floor_ = energy;
            return FloorPhase::Seeding;
        }
        // fixed seed: the first block is an ordinary block
    }

    if (!(freeze_in_whistle_ && in_whistle))
        floor_ = (1.0 - alpha_) * floor_ + alpha_ * energy;

    return (now < warmup_s_) ? FloorPhase::WarmingUp : FloorPhase::Ready;
}

} // namespace wc
