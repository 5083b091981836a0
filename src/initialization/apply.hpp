#ifndef PLUVIO_INITIALIZATION_APPLY_HPP
#define PLUVIO_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include "initialization.hpp"

namespace Pluvio::Initialization::Details {
    namespace detail {
        template <class Module>
        inline void zero_bias_if_present(Module& module) {
            if constexpr (requires { module.bias; }) {
                if (module.bias.defined()) {
                    torch::nn::init::zeros_(module.bias);
                }
            }
        }

        template <class Module>
        inline void initialize_weight(Module& module, const Descriptor& descriptor) {
            switch (descriptor.type) {
                case Type::Normal:
                    torch::nn::init::normal_(module.weight, 0.0, descriptor.gain);
                    break;
                case Type::XavierNormal:
                    torch::nn::init::xavier_normal_(module.weight, descriptor.gain);
                    break;
                case Type::KaimingNormal:
                    torch::nn::init::kaiming_normal_(module.weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                    break;
                case Type::Orthogonal:
                    torch::nn::init::orthogonal_(module.weight, descriptor.gain);
                    break;
                case Type::Dirac:
                    if (module.weight.dim() >= 3) {
                        torch::nn::init::dirac_(module.weight);
                    }
                    break;
                case Type::Default:
                default:
                    return;
            }
            zero_bias_if_present(module);
        }
    }  // namespace detail

    // Walks every submodule: weighted layers get `descriptor`, affine batch norms get N(1, gain).
    inline void apply_network_initialization(torch::nn::Module& network, const Descriptor& descriptor) {
        if (descriptor.type == Type::Default) {
            return;
        }

        torch::NoGradGuard no_grad;
        network.apply([&descriptor](torch::nn::Module& module) {
            if (auto* conv = module.as<torch::nn::Conv1d>()) {
                detail::initialize_weight(*conv, descriptor);
            } else if (auto* deconv = module.as<torch::nn::ConvTranspose1d>()) {
                detail::initialize_weight(*deconv, descriptor);
            } else if (auto* linear = module.as<torch::nn::Linear>()) {
                detail::initialize_weight(*linear, descriptor);
            } else if (auto* norm = module.as<torch::nn::BatchNorm1d>()) {
                if (norm->weight.defined()) {
                    torch::nn::init::normal_(norm->weight, 1.0, descriptor.gain);
                }
                if (norm->bias.defined()) {
                    torch::nn::init::zeros_(norm->bias);
                }
            }
        });
    }
}
#endif // PLUVIO_INITIALIZATION_APPLY_HPP
