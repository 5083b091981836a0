#ifndef PLUVIO_LRSCHEDULER_LINEAR_HPP
#define PLUVIO_LRSCHEDULER_LINEAR_HPP
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

#include "common.hpp"

namespace Pluvio::LrScheduler::Details {
    struct LinearOptions {
        std::int64_t n_epochs{100};        // epochs at the initial rate
        std::int64_t n_epochs_decay{100};  // epochs to decay linearly to zero
        std::int64_t epoch_count{1};       // first epoch index, > 1 when resuming
    };

    struct LinearDescriptor {
        LinearOptions options{};
    };

    // factor(e) = 1 - max(0, e + epoch_count - n_epochs) / (n_epochs_decay + 1)
    class LinearScheduler final : public EpochScheduler {
    public:
        LinearScheduler(torch::optim::Optimizer& optimizer, LinearOptions options)
            : EpochScheduler(optimizer), options_(options) {
            if (options_.n_epochs < 0 || options_.n_epochs_decay < 0) {
                throw std::invalid_argument("LinearScheduler epoch counts must be non-negative.");
            }
            apply(0);
        }

    private:
        [[nodiscard]] double compute_lr(double base_lr, std::size_t epoch) const override {
            const auto elapsed = static_cast<std::int64_t>(epoch) + options_.epoch_count - options_.n_epochs;
            const double factor = 1.0 - static_cast<double>(std::max<std::int64_t>(0, elapsed))
                                        / static_cast<double>(options_.n_epochs_decay + 1);
            return base_lr * std::max(0.0, factor);
        }

        LinearOptions options_{};
    };
}

#endif // PLUVIO_LRSCHEDULER_LINEAR_HPP
