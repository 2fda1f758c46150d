#pragma once
#include "wc/config.hpp"
#include <optional>

namespace wc {

enum class WhistleState { Idle, InWhistle };

const char* to_string(WhistleState st);

// Open whistle; exists only while InWhistle
struct WhistleSession {
    double                start_time = 0.0;
    std::optional<double> low_since;      // first block of the current quiet run
};

struct WhistleEvent {
    double start_time = 0.0;   // s since stream start
    double end_time   = 0.0;
    double duration   = 0.0;
    bool   accepted   = false;
    int    count      = 0;     // running total if accepted, 0 otherwise
};

// Hysteresis + hold-time debounce. Emits one event per closed whistle.
class WhistleStateMachine {
public:
    explicit WhistleStateMachine(const DetectorConfig& cfg);

    std::optional<WhistleEvent> step(double energy, double floor, double now);

    WhistleState state() const { return state_; }
    const std::optional<WhistleSession>& session() const { return session_; }
    int count() const { return count_; }

private:
    WhistleEvent close(double now);

    double rise_;
    double fall_;
    double hold_s_;
    double min_s_;
    double max_s_;

    WhistleState                  state_ = WhistleState::Idle;
    std::optional<WhistleSession> session_;
    int                           count_ = 0;
};

} // namespace wc
