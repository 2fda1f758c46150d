#pragma once
#include "wc/source.hpp"
#include "wc/config.hpp"
#include "wc/detector.hpp"
#include "wc/event_sink.hpp"
#include <atomic>
#include <vector>

namespace wc {

struct RunSummary {
    long blocks    = 0;
    int  accepted  = 0;
    int  rejected  = 0;
    int  anomalies = 0;   // capture overflow/underflow reports
    int  overruns  = 0;   // blocks processed slower than real time
    bool source_ended = false;
};

// Capture loop: source -> detector -> sinks
class WhistleCounter {
public:
    // Throws std::invalid_argument if p.detector does not validate.
    WhistleCounter(ISource& src, const Params& p);

    void add_sink(IEventSink& sink) { sinks_.push_back(&sink); }

    // Runs until the source ends or stop is raised; checked between blocks.
    // The source is released and sinks see on_shutdown on every exit path;
    // a malformed block is rethrown as std::invalid_argument after that.
    RunSummary run(const std::atomic<bool>& stop);

    const Detector& detector() const { return det_; }

private:
    void pump(const std::atomic<bool>& stop, RunSummary& sum);
    void finish();
    void log_block(long idx, const AudioBlock& blk) const;

    ISource&                  src_;
    Params                    p_;
    Detector                  det_;
    std::vector<IEventSink*>  sinks_;
};

} // namespace wc
