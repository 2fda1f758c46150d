// cli_features.hpp: CLI pieces that depend on optional libraries.
// Each has a real unit and a "not built" unit; the build picks one.
#pragma once
#include "wc/config.hpp"
#include "wc/source.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace wc {
namespace cli {

struct IioInput {
    std::string uri;
    std::string device;
    std::string channel = "voltage0";
};

// nullptr when the device cannot be opened or IIO support is not built
std::unique_ptr<ISource> open_iio_source(const IioInput& in, const DetectorConfig& d);

// Process exit code: 0 on a usable split
int run_calibration(ISource& src, const Params& p, const std::atomic<bool>& stop);

} // namespace cli
} // namespace wc
