#ifndef PLUVIO_DATA_TRANSFORM_NORMALIZATION_MINMAX_HPP
#define PLUVIO_DATA_TRANSFORM_NORMALIZATION_MINMAX_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Pluvio::Data::Transform::Normalization {

    // Per-channel extrema of a domain, kept so predictions can be mapped back to physical units.
    struct MinMaxStatistics {
        std::vector<double> min{};
        std::vector<double> max{};

        [[nodiscard]] std::size_t channels() const noexcept { return min.size(); }
    };

    namespace Details {
        inline void check_statistics(const MinMaxStatistics& statistics) {
            if (statistics.min.size() != statistics.max.size()) {
                throw std::invalid_argument("MinMax statistics carry " + std::to_string(statistics.min.size())
                                            + " minima but " + std::to_string(statistics.max.size()) + " maxima.");
            }
            if (statistics.min.empty()) {
                throw std::invalid_argument("MinMax statistics are empty.");
            }
        }

        // [C] for scalars and vectors, [1, C, 1, ...] for tensors with a channel axis at dim 1.
        inline torch::Tensor channel_view(const std::vector<double>& values, const torch::Tensor& like) {
            auto tensor = torch::tensor(values, torch::TensorOptions().dtype(torch::kDouble))
                              .to(like.device(), like.scalar_type());
            if (like.dim() < 2) {
                return tensor;
            }
            if (like.size(1) != static_cast<std::int64_t>(values.size())) {
                throw std::invalid_argument("MinMax statistics describe " + std::to_string(values.size())
                                            + " channels but the tensor has " + std::to_string(like.size(1)) + ".");
            }
            std::vector<std::int64_t> shape(static_cast<std::size_t>(like.dim()), 1);
            shape[1] = static_cast<std::int64_t>(values.size());
            return tensor.view(shape);
        }
    }

    // Fits per-channel extrema over every axis except dim 1 of a [N, C, L] tensor.
    [[nodiscard]] inline MinMaxStatistics FitMinMax(const torch::Tensor& x) {
        if (!x.defined() || x.dim() < 2) {
            throw std::invalid_argument("FitMinMax expects a tensor with a channel axis at dim 1.");
        }
        if (x.numel() == 0) {
            throw std::invalid_argument("FitMinMax cannot fit an empty tensor.");
        }
        auto channels_first = x.transpose(0, 1).reshape({x.size(1), -1}).to(torch::kDouble).cpu();
        auto minima = std::get<0>(channels_first.min(/*dim=*/1));
        auto maxima = std::get<0>(channels_first.max(/*dim=*/1));

        MinMaxStatistics statistics;
        statistics.min.reserve(static_cast<std::size_t>(x.size(1)));
        statistics.max.reserve(static_cast<std::size_t>(x.size(1)));
        for (std::int64_t c = 0; c < x.size(1); ++c) {
            statistics.min.push_back(minima[c].item<double>());
            statistics.max.push_back(maxima[c].item<double>());
        }
        return statistics;
    }

    // Physical units -> [-1, 1]. Constant channels map to -1.
    [[nodiscard]] inline torch::Tensor MinMax(const torch::Tensor& x, const MinMaxStatistics& statistics) {
        Details::check_statistics(statistics);
        auto lo = Details::channel_view(statistics.min, x);
        auto hi = Details::channel_view(statistics.max, x);
        return (x - lo) / (hi - lo).clamp_min(1e-12) * 2.0 - 1.0;
    }

    // [-1, 1] -> physical units: (x + 1) * (max - min) / 2 + min.
    [[nodiscard]] inline torch::Tensor MinMaxInverse(const torch::Tensor& x, const torch::Tensor& min, const torch::Tensor& max) {
        return (x + 1.0) * (max - min) * 0.5 + min;
    }

    [[nodiscard]] inline double MinMaxInverse(double x, double min, double max) {
        return (x + 1.0) * (max - min) * 0.5 + min;
    }

    [[nodiscard]] inline torch::Tensor MinMaxInverse(const torch::Tensor& x, const MinMaxStatistics& statistics) {
        Details::check_statistics(statistics);
        return MinMaxInverse(x, Details::channel_view(statistics.min, x), Details::channel_view(statistics.max, x));
    }

}

#endif // PLUVIO_DATA_TRANSFORM_NORMALIZATION_MINMAX_HPP
