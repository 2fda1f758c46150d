#pragma once
#include "wc/config.hpp"
#include "wc/source.hpp"
#include "wc/noise_floor.hpp"
#include "wc/whistle_state_machine.hpp"
#include <optional>

namespace wc {

// Per-block pipeline: energy -> noise floor -> state machine.
// Not thread safe; drive it from a single thread.
class Detector {
public:
    // Throws std::invalid_argument if cfg does not validate.
    explicit Detector(const DetectorConfig& cfg);

    // Throws std::invalid_argument on an empty block, a non-mono block or a
    // timestamp earlier than the previous block's.
    std::optional<WhistleEvent> process_block(const AudioBlock& blk);

    // Same as process_block with the energy already computed.
    std::optional<WhistleEvent> process_energy(double energy, double timestamp);

    // Seconds since the first block (0 before any block).
    double elapsed(double timestamp) const;

    const DetectorConfig& config() const { return cfg_; }
    WhistleState state()       const { return sm_.state(); }
    const std::optional<WhistleSession>& session() const { return sm_.session(); }
    int          count()       const { return sm_.count(); }
    double       floor()       const { return floor_.floor(); }
    FloorPhase   phase()       const { return phase_; }
    double       last_energy() const { return last_energy_; }

private:
    DetectorConfig      cfg_;
    NoiseFloorTracker   floor_;
    WhistleStateMachine sm_;

    std::optional<double> origin_;
    double     last_ts_     = 0.0;
    double     last_energy_ = 0.0;
    FloorPhase phase_       = FloorPhase::Seeding;
};

} // namespace wc
