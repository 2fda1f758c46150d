// wc/calibrator.hpp
#pragma once
#include "wc/source.hpp"
#include "wc/gmm_threshold.hpp"
#include <atomic>
#include <optional>
#include <utility>

namespace wc {

struct CalibConfig {
    double target_seconds = 10.0;  // stream time to collect
    bool   verbose        = true;
    int    log_every      = 100;   // progress line every N blocks
};

struct CalibResult {
    double quiet_db       = 0.0;   // ambient cluster mean
    double loud_db        = 0.0;   // loud cluster mean
    double threshold_db   = 0.0;
    double suggested_rise = 0.0;   // threshold / quiet, as an energy ratio
    double loud_share     = 0.0;   // fraction of time spent loud
    int    blocks_used    = 0;
};

// Records block energies and splits them into quiet/loud clusters.
// Purely informational: reports a rise multiplier, changes nothing.
class Calibrator {
public:
    Calibrator(ISource& src, GmmThreshold gmm, CalibConfig cfg)
      : src_(src), gmm_(std::move(gmm)), cfg_(cfg) {}

    // Collects until target_seconds of stream time or until stop is raised,
    // then fits whatever was gathered.
    std::optional<CalibResult> run(const std::atomic<bool>& stop);

private:
    ISource&      src_;
    GmmThreshold  gmm_;
    CalibConfig   cfg_;
};

} // namespace wc
