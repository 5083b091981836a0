#ifndef PLUVIO_COMMON_RANDOM_HPP
#define PLUVIO_COMMON_RANDOM_HPP
#include <cstdint>
#include <optional>
#include <random>

namespace Pluvio::Common {
    // Seeded when reproducibility is asked for, otherwise drawn from the device.
    inline std::mt19937_64 build_rng(const std::optional<std::uint64_t>& seed) {
        if (seed) {
            return std::mt19937_64(*seed);
        }
        std::random_device rd;
        return std::mt19937_64(rd());
    }
}

#endif // PLUVIO_COMMON_RANDOM_HPP
