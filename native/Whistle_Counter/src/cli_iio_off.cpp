// cli_iio_off.cpp: linked when libiio was not found at configure time
#include "cli_features.hpp"

#include <cstdio>

namespace wc {
namespace cli {

std::unique_ptr<ISource> open_iio_source(const IioInput&, const DetectorConfig&) {
    std::fprintf(stderr, "[ERR] IIO capture not built (libiio missing); use --wav or --simulate.\n");
    return nullptr;
}

} // namespace cli
} // namespace wc
