#ifndef PLUVIO_DATA_LOAD_TYPES_HPP
#define PLUVIO_DATA_LOAD_TYPES_HPP
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Pluvio::Data::Type {

    // One link or gauge record: "timestamp,reading[,reading...]".
    struct SeriesSource {
        std::filesystem::path path;
        std::string identifier{};          // empty = file stem
        std::vector<double> metadata{};    // static per-series attributes (length, frequency, coordinates, ...)
    };

    struct WindowOptions {
        std::int64_t length{256};
        std::int64_t stride{256};
        double wet_threshold{0.0};         // readings above count towards the occurrence fraction
    };

    // Windowed domain in physical units.
    struct RawDomain {
        torch::Tensor signals;                 // [N, C, L]
        std::vector<std::string> identifiers;  // N
        torch::Tensor metadata;                // [N, M] or undefined
        torch::Tensor occurrence;              // [N] fraction of wet steps, or undefined
    };
}

#endif // PLUVIO_DATA_LOAD_TYPES_HPP
