#include "wc/config.hpp"

namespace wc {

std::optional<std::string> validate(const DetectorConfig& c) {
    if (c.sample_rate <= 0)  return std::string("sample rate must be > 0");
    if (c.block_size <= 0)   return std::string("block size must be > 0");
    if (!(c.min_duration >= 0.0))
        return std::string("minimum whistle length must be >= 0");
    if (!(c.min_duration <= c.max_duration))
        return std::string("minimum whistle length must not exceed the maximum");
    if (!(c.rise > 0.0))     return std::string("rise multiplier must be > 0");
    if (!(c.fall > 0.0))     return std::string("fall multiplier must be > 0");
    if (!(c.fall < c.rise))
        return std::string("fall multiplier must be smaller than rise (hysteresis)");
    if (!(c.hold_seconds >= 0.0))   return std::string("hold time must be >= 0");
    if (!(c.alpha > 0.0 && c.alpha <= 1.0))
        return std::string("alpha must be in (0, 1]");
    if (!(c.warmup_seconds >= 0.0)) return std::string("warm-up time must be >= 0");
    if (!c.seed_from_first_block && !(c.initial_floor > 0.0))
        return std::string("initial floor must be > 0");
    return std::nullopt;
}

} // namespace wc
