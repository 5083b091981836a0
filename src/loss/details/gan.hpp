#ifndef PLUVIO_LOSS_GAN_HPP
#define PLUVIO_LOSS_GAN_HPP
// Adversarial criterion shared by the critic and translator objectives.
// LSGAN: https://arxiv.org/abs/1611.04076  WGAN-GP: https://arxiv.org/abs/1704.00028
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "bce.hpp"
#include "mse.hpp"

namespace Pluvio::Loss::Details {

    enum class GANMode { LSGAN, Vanilla, WGANGP };

    struct GANOptions {
        GANMode mode{GANMode::LSGAN};
        double real_label{1.0};
        double fake_label{0.0};
    };

    struct GANDescriptor {
        GANOptions options{};
    };

    // The critic output is compared against a label tensor broadcast to its own shape,
    // so patch critics and scalar critics are scored the same way.
    inline torch::Tensor compute(const GANDescriptor& descriptor, const torch::Tensor& prediction, bool target_is_real) {
        const auto& options = descriptor.options;
        switch (options.mode) {
            case GANMode::LSGAN: {
                auto target = torch::full_like(prediction, target_is_real ? options.real_label : options.fake_label);
                return compute(MSEDescriptor{}, prediction, target);
            }
            case GANMode::Vanilla: {
                auto target = torch::full_like(prediction, target_is_real ? options.real_label : options.fake_label);
                return compute(BCEWithLogitsDescriptor{}, prediction, target);
            }
            case GANMode::WGANGP:
                return target_is_real ? -prediction.mean() : prediction.mean();
        }
        throw std::invalid_argument("Unsupported GAN mode.");
    }

    [[nodiscard]] inline GANMode parse_gan_mode(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "lsgan") return GANMode::LSGAN;
        if (lowered == "vanilla") return GANMode::Vanilla;
        if (lowered == "wgangp") return GANMode::WGANGP;
        throw std::invalid_argument("Unknown GAN mode '" + std::string(name) + "'; expected lsgan, vanilla or wgangp.");
    }

    [[nodiscard]] inline std::string to_string(GANMode mode) {
        switch (mode) {
            case GANMode::LSGAN:   return "lsgan";
            case GANMode::Vanilla: return "vanilla";
            case GANMode::WGANGP:  return "wgangp";
        }
        return "unknown";
    }

}

#endif // PLUVIO_LOSS_GAN_HPP
