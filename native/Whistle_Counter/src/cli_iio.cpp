// cli_iio.cpp: IIO capture for the CLI (linked with whistle_iio)
#include "cli_features.hpp"
#include "wc/iio_source.hpp"

#include <cstdio>

namespace wc {
namespace cli {

std::unique_ptr<ISource> open_iio_source(const IioInput& in, const DetectorConfig& d) {
    IioConfig icfg;
    icfg.uri         = in.uri;
    icfg.device      = in.device;
    icfg.channel     = in.channel;
    icfg.sample_rate = d.sample_rate;
    icfg.block_size  = d.block_size;
    auto iio = std::make_unique<IioSource>(icfg);
    if (!iio->ok()) {
        std::fprintf(stderr, "[ERR] IIO capture could not be opened.\n");
        return nullptr;
    }
    return iio;
}

} // namespace cli
} // namespace wc
