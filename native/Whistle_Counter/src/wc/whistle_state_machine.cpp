#include "wc/whistle_state_machine.hpp"

namespace wc {

const char* to_string(WhistleState st) {
    switch (st) {
        case WhistleState::Idle:      return "IDLE";
        case WhistleState::InWhistle: return "IN_WHISTLE";
    }
    return "?";
}

WhistleStateMachine::WhistleStateMachine(const DetectorConfig& cfg)
    : rise_(cfg.rise),
      fall_(cfg.fall),
      hold_s_(cfg.hold_seconds),
      min_s_(cfg.min_duration),
      max_s_(cfg.max_duration) {}

std::optional<WhistleEvent> WhistleStateMachine::step(double energy, double floor, double now) {
    if (state_ == WhistleState::Idle) {
        if (energy > rise_ * floor) {
            session_ = WhistleSession{now, std::nullopt};
            state_   = WhistleState::InWhistle;
        }
        return std::nullopt;
    }

    // InWhistle
    if (energy < fall_ * floor) {
        if (!session_->low_since) session_->low_since = now;
        if (now - *session_->low_since >= hold_s_)
            return close(now);
    } else {
        // bounced back: dwell timer restarts on the next dip
        session_->low_since.reset();
    }
    return std::nullopt;
}

WhistleEvent WhistleStateMachine::close(double now) {
    WhistleEvent ev;
    ev.start_time = session_->start_time;
    ev.end_time   = now;
    ev.duration   = now - session_->start_time;
    ev.accepted   = (min_s_ <= ev.duration && ev.duration <= max_s_);
    if (ev.accepted) ev.count = ++count_;

    session_.reset();
    state_ = WhistleState::Idle;
    return ev;
}

} // namespace wc
