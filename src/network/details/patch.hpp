#ifndef PLUVIO_NETWORK_PATCH_HPP
#define PLUVIO_NETWORK_PATCH_HPP
// 1-D PatchGAN critic, "Image-to-Image Translation with Conditional Adversarial Networks" https://arxiv.org/abs/1611.07004
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "module.hpp"

namespace Pluvio::Network::Details {

    struct PatchCriticOptions {
        std::int64_t input_channels{1};
        std::int64_t filters{64};
        std::int64_t layers{3};
        Norm norm{Norm::Instance};
    };

    // Scores every receptive-field patch of the sequence: [N, C, L] -> [N, 1, L'].
    // Raw scores; the adversarial criterion decides how they are squashed.
    class PatchCritic final : public SignalModule {
    public:
        explicit PatchCritic(PatchCriticOptions options)
            : SignalModule("PatchCritic"), options_(options)
        {
            if (options_.input_channels <= 0 || options_.filters <= 0) {
                throw std::invalid_argument("PatchCritic requires positive channel and filter counts.");
            }
            if (options_.layers < 1) {
                throw std::invalid_argument("PatchCritic requires at least one layer.");
            }

            const bool bias = use_conv_bias(options_.norm);
            layers_ = register_module("layers", torch::nn::Sequential());

            layers_->push_back(torch::nn::Conv1d(
                torch::nn::Conv1dOptions(options_.input_channels, options_.filters, 3).stride(2).padding(1)));
            layers_->push_back(torch::nn::LeakyReLU(torch::nn::LeakyReLUOptions().negative_slope(0.2).inplace(true)));

            std::int64_t multiplier = 1;
            for (std::int64_t n = 1; n < options_.layers; ++n) {
                const auto previous = multiplier;
                multiplier = std::min<std::int64_t>(std::int64_t{1} << n, 8);
                layers_->push_back(torch::nn::Conv1d(
                    torch::nn::Conv1dOptions(options_.filters * previous, options_.filters * multiplier, 3)
                        .stride(2).padding(1).bias(bias)));
                layers_->push_back(make_norm(options_.norm, options_.filters * multiplier));
                layers_->push_back(torch::nn::LeakyReLU(torch::nn::LeakyReLUOptions().negative_slope(0.2).inplace(true)));
            }

            const auto previous = multiplier;
            multiplier = std::min<std::int64_t>(std::int64_t{1} << options_.layers, 8);
            layers_->push_back(torch::nn::Conv1d(
                torch::nn::Conv1dOptions(options_.filters * previous, options_.filters * multiplier, 3)
                    .stride(1).padding(1).bias(bias)));
            layers_->push_back(make_norm(options_.norm, options_.filters * multiplier));
            layers_->push_back(torch::nn::LeakyReLU(torch::nn::LeakyReLUOptions().negative_slope(0.2).inplace(true)));

            layers_->push_back(torch::nn::Conv1d(
                torch::nn::Conv1dOptions(options_.filters * multiplier, 1, 3).stride(1).padding(1)));
        }

        [[nodiscard]] torch::Tensor forward(const torch::Tensor& input) override
        {
            if (input.dim() != 3) {
                throw std::invalid_argument("PatchCritic expects [batch, channels, length] input, got "
                                            + std::to_string(input.dim()) + " dimensions.");
            }
            return layers_->forward(input);
        }

        [[nodiscard]] const PatchCriticOptions& options() const noexcept { return options_; }

    private:
        PatchCriticOptions options_{};
        torch::nn::Sequential layers_{nullptr};
    };

}

#endif // PLUVIO_NETWORK_PATCH_HPP
