#pragma once
#include <optional>
#include <string>

namespace wc {

// Detector parameters, fixed at startup
struct DetectorConfig {
    int    sample_rate   = 16000;   // Hz
    int    block_size    = 1024;    // samples per block

    // Accepted whistle length (s)
    double min_duration  = 1.0;
    double max_duration  = 15.0;

    // Hysteresis band, multiples of the noise floor
    double rise          = 6.0;
    double fall          = 3.0;
    double hold_seconds  = 0.4;     // quiet dwell needed to close

    // Noise floor
    double alpha         = 0.02;    // EMA coefficient
    double warmup_seconds= 1.0;
    bool   seed_from_first_block = true;
    double initial_floor = 1e-6;    // used when seed_from_first_block == false
    bool   freeze_floor_in_whistle = false;

    double block_seconds() const {
        return static_cast<double>(block_size) / static_cast<double>(sample_rate);
    }
};

// Returns the first violated constraint, or nullopt when cfg is usable.
std::optional<std::string> validate(const DetectorConfig& cfg);

struct Params {
    DetectorConfig detector;

    // Logging
    bool   verbose          = false;
    int    log_every        = 50;     // per-block log stride in verbose mode

    // Calibration
    double calib_seconds    = 0.0;    // 0: disabled
    double calib_p_low      = 1.0;
    double calib_p_high     = 99.0;
    int    calib_max_iter   = 200;
    double calib_eps        = 1e-6;
};

} // namespace wc
