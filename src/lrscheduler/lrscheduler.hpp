#ifndef PLUVIO_LRSCHEDULER_HPP
#define PLUVIO_LRSCHEDULER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <variant>

#include "details/common.hpp"
#include "details/cosineannealing.hpp"
#include "details/linear.hpp"
#include "details/step.hpp"
#include "registry.hpp"

namespace Pluvio::LrScheduler {
    using Scheduler = Details::Scheduler;

    using LinearOptions = Details::LinearOptions;
    using LinearDescriptor = Details::LinearDescriptor;

    using StepOptions = Details::StepOptions;
    using StepDescriptor = Details::StepDescriptor;

    using CosineAnnealingOptions = Details::CosineAnnealingOptions;
    using CosineAnnealingDescriptor = Details::CosineAnnealingDescriptor;

    using Descriptor = std::variant<LinearDescriptor, StepDescriptor, CosineAnnealingDescriptor>;

    [[nodiscard]] constexpr auto Linear(const LinearOptions& options = {}) noexcept -> LinearDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto Step(const StepOptions& options = {}) noexcept -> StepDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto CosineAnnealing(const CosineAnnealingOptions& options = {}) noexcept
        -> CosineAnnealingDescriptor {
        return {options};
    }

    [[nodiscard]] inline std::unique_ptr<Scheduler> make(torch::optim::Optimizer& optimizer, const Descriptor& descriptor) {
        return std::visit([&optimizer](const auto& concrete) {
            return Details::build_scheduler(optimizer, concrete);
        }, descriptor);
    }
}

#endif // PLUVIO_LRSCHEDULER_HPP
