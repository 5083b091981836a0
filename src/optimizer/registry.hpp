#ifndef PLUVIO_OPTIMIZER_REGISTRY_HPP
#define PLUVIO_OPTIMIZER_REGISTRY_HPP

#include <memory>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "details/adam.hpp"

namespace Pluvio::Optimizer::Details {
    template <class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor>, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamDescriptor& descriptor) {
        if (parameters.empty()) {
            throw std::invalid_argument("Cannot build an Adam optimizer over an empty parameter list.");
        }
        return std::make_unique<torch::optim::Adam>(std::move(parameters), to_torch_options(descriptor.options));
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamWDescriptor& descriptor) {
        if (parameters.empty()) {
            throw std::invalid_argument("Cannot build an AdamW optimizer over an empty parameter list.");
        }
        return std::make_unique<torch::optim::AdamW>(std::move(parameters), to_torch_options(descriptor.options));
    }
}

#endif // PLUVIO_OPTIMIZER_REGISTRY_HPP
