#pragma once
#include "wc/source.hpp"
#include "wc/whistle_state_machine.hpp"

namespace wc {

// Receives detection output. Called on the capture thread, keep it cheap.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void on_whistle_start(double t) { (void)t; }
    virtual void on_event(const WhistleEvent& ev) = 0;
    virtual void on_capture_anomaly(CaptureStatus st, double t) { (void)st; (void)t; }
    virtual void on_shutdown() {}
};

} // namespace wc
