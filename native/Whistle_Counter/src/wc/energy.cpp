#include "wc/energy.hpp"
#include <algorithm>
#include <cmath>

namespace wc {

double block_energy(const float* samples, std::size_t n) {
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double x = samples[i];
        acc += x * x;
    }
    return std::sqrt(acc / static_cast<double>(n) + kEnergyEps);
}

double energy_db(double energy) {
    return 20.0 * std::log10(std::max(energy, kEnergyEps));
}

} // namespace wc
