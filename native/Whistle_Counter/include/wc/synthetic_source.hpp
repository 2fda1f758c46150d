#pragma once
#include "wc/source.hpp"
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

namespace wc {

constexpr double kPi = 3.14159265358979323846;

struct ToneBurst {
    double start     = 0.0;    // s
    double length    = 1.0;    // s
    double amplitude = 0.1;    // peak
    double freq_hz   = 3000.0;
};

struct SyntheticConfig {
    int    sample_rate   = 16000;
    int    block_size    = 1024;
    double total_seconds = 10.0;
    double noise_std     = 0.001;
    std::vector<ToneBurst> bursts;
    uint32_t seed        = 12345;
};

// Gaussian ambient noise plus scripted tone bursts, deterministic per seed
class SyntheticSource : public ISource {
public:
    explicit SyntheticSource(const SyntheticConfig& cfg)
      : cfg_(cfg), rng_(cfg.seed),
        noise_(0.0, cfg.noise_std > 0.0 ? cfg.noise_std : 1.0) {}  // unused when noise_std <= 0

    bool get_block(AudioBlock& out) override {
        const double fs = static_cast<double>(cfg_.sample_rate);
        if (static_cast<double>(pos_) >= cfg_.total_seconds * fs) return false;

        out.samples.resize(static_cast<size_t>(cfg_.block_size));
        out.timestamp = static_cast<double>(pos_) / fs;
        out.channels  = 1;
        out.status    = CaptureStatus::Ok;

        for (int i = 0; i < cfg_.block_size; ++i) {
            const double t = static_cast<double>(pos_ + i) / fs;
            double x = cfg_.noise_std > 0.0 ? noise_(rng_) : 0.0;
            for (const auto& b : cfg_.bursts) {
                if (t >= b.start && t < b.start + b.length)
                    x += b.amplitude * std::sin(2.0 * kPi * b.freq_hz * t);
            }
            out.samples[static_cast<size_t>(i)] = static_cast<float>(x);
        }
        pos_ += static_cast<uint64_t>(cfg_.block_size);
        return true;
    }

private:
    SyntheticConfig cfg_;
    uint64_t pos_ = 0;
    std::mt19937 rng_;
    std::normal_distribution<double> noise_;
};

} // namespace wc
