#pragma once
#include "wc/event_sink.hpp"
#include <cstdio>

namespace wc {

// Human readable start/stop lines and the final total
class ConsoleSink : public IEventSink {
public:
    explicit ConsoleSink(std::FILE* out = stdout, std::FILE* err = stderr)
      : out_(out), err_(err) {}

    void on_whistle_start(double t) override;
    void on_event(const WhistleEvent& ev) override;
    void on_capture_anomaly(CaptureStatus st, double t) override;
    void on_shutdown() override;

    int accepted_total() const { return accepted_; }
    int rejected_total() const { return rejected_; }

private:
    std::FILE* out_;
    std::FILE* err_;
    int accepted_ = 0;
    int rejected_ = 0;
};

} // namespace wc
