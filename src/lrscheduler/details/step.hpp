#ifndef PLUVIO_LRSCHEDULER_STEP_HPP
#define PLUVIO_LRSCHEDULER_STEP_HPP
#include <cmath>
#include <cstddef>
#include <stdexcept>

#include <torch/torch.h>

#include "common.hpp"

namespace Pluvio::LrScheduler::Details {
    struct StepOptions {
        std::size_t step_size{50};
        double gamma{0.1};
    };

    struct StepDescriptor {
        StepOptions options{};
    };

    class StepScheduler final : public EpochScheduler {
    public:
        StepScheduler(torch::optim::Optimizer& optimizer, StepOptions options)
            : EpochScheduler(optimizer), options_(options) {
            if (options_.step_size == 0) {
                throw std::invalid_argument("StepScheduler requires step_size to be greater than zero.");
            }
            if (options_.gamma <= 0.0) {
                throw std::invalid_argument("StepScheduler requires a positive gamma.");
            }
            apply(0);
        }

    private:
        [[nodiscard]] double compute_lr(double base_lr, std::size_t epoch) const override {
            return base_lr * std::pow(options_.gamma, static_cast<double>(epoch / options_.step_size));
        }

        StepOptions options_{};
    };
}

#endif // PLUVIO_LRSCHEDULER_STEP_HPP
