#ifndef PLUVIO_OPTIMIZER_HPP
#define PLUVIO_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "registry.hpp"
#include "details/adam.hpp"

namespace Pluvio::Optimizer {
    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using AdamWOptions = Details::AdamWOptions;
    using AdamWDescriptor = Details::AdamWDescriptor;

    using Descriptor = std::variant<AdamDescriptor, AdamWDescriptor>;

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    [[nodiscard]] inline constexpr auto AdamW(const AdamWOptions& options = {}) noexcept -> AdamWDescriptor {
        return AdamWDescriptor{.options = options};
    }

    [[nodiscard]] inline std::unique_ptr<torch::optim::Optimizer> make(std::vector<torch::Tensor> parameters, const Descriptor& descriptor) {
        return std::visit([&parameters](const auto& concrete) {
            return Details::build_optimizer(std::move(parameters), concrete);
        }, descriptor);
    }

    [[nodiscard]] inline double learning_rate(const Descriptor& descriptor) noexcept {
        return std::visit([](const auto& concrete) { return Details::learning_rate(concrete); }, descriptor);
    }

    [[nodiscard]] inline std::string name(const Descriptor& descriptor) {
        return std::holds_alternative<AdamDescriptor>(descriptor) ? "adam" : "adamw";
    }
}

#endif // PLUVIO_OPTIMIZER_HPP
