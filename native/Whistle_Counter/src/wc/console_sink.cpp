#include "wc/console_sink.hpp"

namespace wc {

void ConsoleSink::on_whistle_start(double t) {
    std::fprintf(out_, "[%6.2fs] Whistle start\n", t);
    std::fflush(out_);
}

void ConsoleSink::on_event(const WhistleEvent& ev) {
    if (ev.accepted) {
        ++accepted_;
        std::fprintf(out_, "[%6.2fs] Whistle #%d  duration %.2fs\n",
                     ev.end_time, ev.count, ev.duration);
    } else {
        ++rejected_;
        std::fprintf(out_, "[%6.2fs] Ignored whistle (%.2fs out of range)\n",
                     ev.end_time, ev.duration);
    }
    std::fflush(out_);
}

void ConsoleSink::on_capture_anomaly(CaptureStatus st, double t) {
    std::fprintf(err_, "[WARN] [%6.2fs] %s\n", t, to_string(st));
}

void ConsoleSink::on_shutdown() {
    std::fprintf(out_, "\nStopped. Total whistles counted: %d\n", accepted_);
    std::fflush(out_);
}

} // namespace wc
