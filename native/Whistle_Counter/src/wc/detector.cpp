#include "wc/detector.hpp"
#include "wc/energy.hpp"
#include <stdexcept>
#include <string>

namespace wc {

static const DetectorConfig& checked(const DetectorConfig& cfg) {
    if (auto err = validate(cfg))
        throw std::invalid_argument("invalid detector config: " + *err);
    return cfg;
}

Detector::Detector(const DetectorConfig& cfg)
    : cfg_(checked(cfg)), floor_(cfg_), sm_(cfg_) {}

std::optional<WhistleEvent> Detector::process_block(const AudioBlock& blk) {
    if (blk.samples.empty())
        throw std::invalid_argument("empty audio block");
    if (blk.channels != 1)
        throw std::invalid_argument("audio block must be mono, got " +
                                    std::to_string(blk.channels) + " channels");
    return process_energy(block_energy(blk.samples), blk.timestamp);
}

std::optional<WhistleEvent> Detector::process_energy(double energy, double timestamp) {
    if (!origin_) {
        origin_ = timestamp;
    } else if (timestamp < last_ts_) {
        throw std::invalid_argument("block timestamp went backwards");
    }
    last_ts_     = timestamp;
    last_energy_ = energy;

    const double now = timestamp - *origin_;
    phase_ = floor_.update(energy, now, sm_.state() == WhistleState::InWhistle);
    if (phase_ != FloorPhase::Ready) return std::nullopt;

    return sm_.step(energy, floor_.floor(), now);
}

double Detector::elapsed(double timestamp) const {
    return origin_ ? timestamp - *origin_ : 0.0;
}

} // namespace wc
