#ifndef PLUVIO_LRSCHEDULER_REGISTRY_HPP
#define PLUVIO_LRSCHEDULER_REGISTRY_HPP

#include <memory>
#include <type_traits>

#include <torch/torch.h>

#include "details/cosineannealing.hpp"
#include "details/linear.hpp"
#include "details/step.hpp"

namespace Pluvio::LrScheduler::Details {
    template <class Descriptor>
    std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported scheduler descriptor provided to build_scheduler.");
        return nullptr;
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const LinearDescriptor& descriptor) {
        return std::make_unique<LinearScheduler>(optimizer, descriptor.options);
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const StepDescriptor& descriptor) {
        return std::make_unique<StepScheduler>(optimizer, descriptor.options);
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const CosineAnnealingDescriptor& descriptor) {
        return std::make_unique<CosineAnnealingScheduler>(optimizer, descriptor.options);
    }
}

#endif // PLUVIO_LRSCHEDULER_REGISTRY_HPP
