#ifndef PLUVIO_LRSCHEDULER_COSINEANNEALING_HPP
#define PLUVIO_LRSCHEDULER_COSINEANNEALING_HPP
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
// "SGDR: Stochastic Gradient Descent with Warm Restarts" (cosine annealing) https://arxiv.org/pdf/1608.03983
#include <torch/torch.h>

#include "common.hpp"

namespace Pluvio::LrScheduler::Details {
    struct CosineAnnealingOptions {
        std::size_t T_max{1};
        double eta_min{0.0};
    };

    struct CosineAnnealingDescriptor {
        CosineAnnealingOptions options{};
    };

    // Anneals to eta_min over T_max epochs and stays there.
    class CosineAnnealingScheduler final : public EpochScheduler {
    public:
        CosineAnnealingScheduler(torch::optim::Optimizer& optimizer, CosineAnnealingOptions options)
            : EpochScheduler(optimizer), options_(options) {
            if (options_.T_max == 0) {
                throw std::invalid_argument("CosineAnnealingScheduler requires T_max to be greater than zero.");
            }
            apply(0);
        }

    private:
        [[nodiscard]] double compute_lr(double base_lr, std::size_t epoch) const override {
            const double clamped = static_cast<double>(std::min(epoch, options_.T_max));
            constexpr double kPi = 3.14159265358979323846;
            const double cosine = std::cos(kPi * clamped / static_cast<double>(options_.T_max));
            return options_.eta_min + (base_lr - options_.eta_min) * (1.0 + cosine) * 0.5;
        }

        CosineAnnealingOptions options_{};
    };
}

#endif // PLUVIO_LRSCHEDULER_COSINEANNEALING_HPP
