#include "wc/whistle_counter.hpp"
#include "wc/energy.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace wc {

static const char* phase_name(FloorPhase ph) {
    switch (ph) {
        case FloorPhase::Seeding:   return "seed";
        case FloorPhase::WarmingUp: return "warmup";
        case FloorPhase::Ready:     return "ready";
    }
    return "?";
}

WhistleCounter::WhistleCounter(ISource& src, const Params& p)
    : src_(src), p_(p), det_(p.detector) {}

RunSummary WhistleCounter::run(const std::atomic<bool>& stop) {
    RunSummary sum;
    try {
        pump(stop, sum);
    } catch (const std::invalid_argument& e) {
        // malformed block: still close out so the total is reported
        std::fprintf(stderr, "[ERR] block %ld rejected: %s\n", sum.blocks + 1, e.what());
        finish();
        throw;
    }
    finish();
    return sum;
}

void WhistleCounter::finish() {
    src_.release();
    for (auto* s : sinks_) s->on_shutdown();
}

void WhistleCounter::pump(const std::atomic<bool>& stop, RunSummary& sum) {
    AudioBlock blk;
    blk.samples.reserve(static_cast<size_t>(p_.detector.block_size));

    using clock = std::chrono::steady_clock;
    const double budget_ms = 1000.0 * p_.detector.block_seconds();

    while (!stop.load(std::memory_order_acquire)) {
        if (!src_.get_block(blk)) {
            std::printf("[INFO] Source exhausted/error.\n");
            sum.source_ended = true;
            break;
        }

        // report and keep going, detector state untouched
        if (blk.status != CaptureStatus::Ok) {
            ++sum.anomalies;
            const double at = det_.elapsed(blk.timestamp);
            for (auto* s : sinks_) s->on_capture_anomaly(blk.status, at);
        }

        const auto t0 = clock::now();
        const WhistleState before = det_.state();
        const auto ev = det_.process_block(blk);
        const double ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        ++sum.blocks;

        if (ms > budget_ms) {
            ++sum.overruns;
            if (p_.verbose)
                std::fprintf(stderr, "[WARN] block %ld took %.3f ms (budget %.3f ms)\n",
                             sum.blocks, ms, budget_ms);
        }

        if (before == WhistleState::Idle && det_.state() == WhistleState::InWhistle) {
            const double start = det_.session()->start_time;
            for (auto* s : sinks_) s->on_whistle_start(start);
        }

        if (ev) {
            if (ev->accepted) ++sum.accepted; else ++sum.rejected;
            for (auto* s : sinks_) s->on_event(*ev);
        }

        if (p_.verbose && p_.log_every > 0 && (sum.blocks % p_.log_every == 0))
            log_block(sum.blocks, blk);
    }
}

void WhistleCounter::log_block(long idx, const AudioBlock& blk) const {
    std::printf("[DBG] block %ld  t=%.2fs  energy=%.1f dB  floor=%.1f dB  %s/%s\n",
                idx, det_.elapsed(blk.timestamp),
                energy_db(det_.last_energy()), energy_db(det_.floor()),
                phase_name(det_.phase()), to_string(det_.state()));
}

} // namespace wc
