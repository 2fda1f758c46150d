// wc/calibrator.cpp
#include "wc/calibrator.hpp"
#include "wc/energy.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

namespace wc {

std::optional<CalibResult> Calibrator::run(const std::atomic<bool>& stop) {
    CalibResult res{};
    const double Tgoal = std::max(0.1, cfg_.target_seconds);

    if (cfg_.verbose)
        std::printf("[CAL] Collecting block levels for %.2f s of audio...\n", Tgoal);

    AudioBlock blk;
    std::vector<double> level_db;
    bool   have_t0 = false;
    double t0 = 0.0;

    while (!stop.load(std::memory_order_acquire) && src_.get_block(blk)) {
        if (blk.samples.empty()) continue;
        if (!have_t0) { t0 = blk.timestamp; have_t0 = true; }
        if (blk.timestamp - t0 >= Tgoal) break;

        level_db.push_back(energy_db(block_energy(blk.samples)));

        if (cfg_.verbose && cfg_.log_every > 0 && (level_db.size() % cfg_.log_every == 0))
            std::printf("[CAL] progress: %zu blocks, t=%.2fs\n", level_db.size(), blk.timestamp - t0);
    }

    if (cfg_.verbose && stop.load(std::memory_order_acquire))
        std::printf("[CAL] Interrupted after %zu blocks.\n", level_db.size());

    res.blocks_used = static_cast<int>(level_db.size());
    if (level_db.size() < GmmThreshold::kMinLevels) {
        if (cfg_.verbose) std::printf("[CAL] Insufficient data (blocks=%d). Cancelled.\n", res.blocks_used);
        return std::nullopt;
    }

    auto g = gmm_.split(level_db);
    if (!g) {
        if (cfg_.verbose) std::printf("[CAL] No separate quiet/loud levels found. Cancelled.\n");
        return std::nullopt;
    }

    res.quiet_db       = g->quiet_db;
    res.loud_db        = g->loud_db;
    res.threshold_db   = g->threshold_db;
    res.loud_share     = g->loud_share;
    res.suggested_rise = std::pow(10.0, (g->threshold_db - g->quiet_db) / 20.0);

    if (cfg_.verbose) {
        std::printf("[CAL] GMM: quiet=%.1f dB  loud=%.1f dB (%.0f%% of blocks)  threshold=%.1f dB  (n=%d)\n",
                    res.quiet_db, res.loud_db, 100.0 * res.loud_share, res.threshold_db, g->n_used);
        std::printf("[CAL] Suggested --rise %.2f\n", res.suggested_rise);
    }
    return res;
}

} // namespace wc
