#pragma once
#include <cstddef>
#include <vector>

namespace wc {

constexpr double kEnergyEps = 1e-12;

// sqrt(mean(x^2) + eps). n must be >= 1.
double block_energy(const float* samples, std::size_t n);

inline double block_energy(const std::vector<float>& samples) {
    return block_energy(samples.data(), samples.size());
}

// 20*log10(energy), for logs and calibration
double energy_db(double energy);

} // namespace wc
