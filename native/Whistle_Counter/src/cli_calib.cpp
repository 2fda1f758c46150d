// cli_calib.cpp: --calibrate for the CLI (linked with whistle_calib)
#include "cli_features.hpp"
#include "wc/calibrator.hpp"
#include "wc/gmm_threshold.hpp"

#include <cstdio>

namespace wc {
namespace cli {

int run_calibration(ISource& src, const Params& p, const std::atomic<bool>& stop) {
    GmmConfig g;
    g.p_low    = p.calib_p_low;
    g.p_high   = p.calib_p_high;
    g.max_iter = p.calib_max_iter;
    g.eps      = p.calib_eps;

    Calibrator calib(src, GmmThreshold(g), {p.calib_seconds, true, p.log_every});
    const auto res = calib.run(stop);
    src.release();
    if (!res) { std::fprintf(stderr, "[ERR] Calibration failed.\n"); return 1; }
    return 0;
}

} // namespace cli
} // namespace wc
