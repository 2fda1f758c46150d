// cli_calib_off.cpp: linked when OpenCV was not found at configure time
#include "cli_features.hpp"

#include <cstdio>

namespace wc {
namespace cli {

int run_calibration(ISource& src, const Params&, const std::atomic<bool>&) {
    std::fprintf(stderr, "[ERR] Calibration not built (OpenCV core/ml missing).\n");
    src.release();
    return 1;
}

} // namespace cli
} // namespace wc
