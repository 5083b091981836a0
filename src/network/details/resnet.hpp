#ifndef PLUVIO_NETWORK_RESNET_HPP
#define PLUVIO_NETWORK_RESNET_HPP
// 1-D adaptation of the ResNet generator from "Perceptual Losses for Real-Time Style Transfer" https://arxiv.org/abs/1603.08155
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "module.hpp"

namespace Pluvio::Network::Details {

    struct ResnetTranslatorOptions {
        std::int64_t input_channels{1};
        std::int64_t output_channels{1};
        std::int64_t filters{64};
        std::int64_t blocks{6};
        std::int64_t downsampling{2};
        Norm norm{Norm::Instance};
        bool dropout{false};
    };

    class ResidualBlock1dImpl : public torch::nn::Module {
    public:
        ResidualBlock1dImpl(std::int64_t channels, Norm norm, bool dropout)
        {
            const bool bias = use_conv_bias(norm);
            body_ = register_module("body", torch::nn::Sequential());
            body_->push_back(torch::nn::ReflectionPad1d(torch::nn::ReflectionPad1dOptions(1)));
            body_->push_back(torch::nn::Conv1d(torch::nn::Conv1dOptions(channels, channels, 3).bias(bias)));
            body_->push_back(make_norm(norm, channels));
            body_->push_back(torch::nn::ReLU(torch::nn::ReLUOptions(true)));
            if (dropout) {
                body_->push_back(torch::nn::Dropout(torch::nn::DropoutOptions(0.5)));
            }
            body_->push_back(torch::nn::ReflectionPad1d(torch::nn::ReflectionPad1dOptions(1)));
            body_->push_back(torch::nn::Conv1d(torch::nn::Conv1dOptions(channels, channels, 3).bias(bias)));
            body_->push_back(make_norm(norm, channels));
        }

        torch::Tensor forward(const torch::Tensor& input) {
            return input + body_->forward(input);
        }

    private:
        torch::nn::Sequential body_{nullptr};
    };
    TORCH_MODULE(ResidualBlock1d);

    // Translates [N, C_in, L] into [N, C_out, L]. Output is squashed to [-1, 1], the
    // range the dataset normalizes every domain to.
    class ResnetTranslator final : public SignalModule {
    public:
        explicit ResnetTranslator(ResnetTranslatorOptions options)
            : SignalModule("ResnetTranslator"), options_(options)
        {
            if (options_.input_channels <= 0 || options_.output_channels <= 0) {
                throw std::invalid_argument("ResnetTranslator requires positive input and output channel counts.");
            }
            if (options_.filters <= 0) {
                throw std::invalid_argument("ResnetTranslator requires a positive filter count.");
            }
            if (options_.blocks < 0 || options_.downsampling < 0) {
                throw std::invalid_argument("ResnetTranslator block and downsampling counts must be non-negative.");
            }

            const bool bias = use_conv_bias(options_.norm);
            layers_ = register_module("layers", torch::nn::Sequential());

            layers_->push_back(torch::nn::ReflectionPad1d(torch::nn::ReflectionPad1dOptions(3)));
            layers_->push_back(torch::nn::Conv1d(
                torch::nn::Conv1dOptions(options_.input_channels, options_.filters, 7).bias(bias)));
            layers_->push_back(make_norm(options_.norm, options_.filters));
            layers_->push_back(torch::nn::ReLU(torch::nn::ReLUOptions(true)));

            std::int64_t channels = options_.filters;
            for (std::int64_t i = 0; i < options_.downsampling; ++i) {
                layers_->push_back(torch::nn::Conv1d(
                    torch::nn::Conv1dOptions(channels, channels * 2, 3).stride(2).padding(1).bias(bias)));
                layers_->push_back(make_norm(options_.norm, channels * 2));
                layers_->push_back(torch::nn::ReLU(torch::nn::ReLUOptions(true)));
                channels *= 2;
            }

            for (std::int64_t i = 0; i < options_.blocks; ++i) {
                layers_->push_back(ResidualBlock1d(channels, options_.norm, options_.dropout));
            }

            for (std::int64_t i = 0; i < options_.downsampling; ++i) {
                layers_->push_back(torch::nn::ConvTranspose1d(
                    torch::nn::ConvTranspose1dOptions(channels, channels / 2, 3)
                        .stride(2).padding(1).output_padding(1).bias(bias)));
                layers_->push_back(make_norm(options_.norm, channels / 2));
                layers_->push_back(torch::nn::ReLU(torch::nn::ReLUOptions(true)));
                channels /= 2;
            }

            layers_->push_back(torch::nn::ReflectionPad1d(torch::nn::ReflectionPad1dOptions(3)));
            layers_->push_back(torch::nn::Conv1d(torch::nn::Conv1dOptions(channels, options_.output_channels, 7)));
            layers_->push_back(torch::nn::Tanh());
        }

        [[nodiscard]] torch::Tensor forward(const torch::Tensor& input) override
        {
            if (input.dim() != 3) {
                throw std::invalid_argument("ResnetTranslator expects [batch, channels, length] input, got "
                                            + std::to_string(input.dim()) + " dimensions.");
            }
            auto output = layers_->forward(input);
            // Strided stages round odd lengths up; trim back to the input length.
            const auto length = input.size(-1);
            if (output.size(-1) != length) {
                output = output.narrow(/*dim=*/-1, /*start=*/0, length);
            }
            return output;
        }

        [[nodiscard]] const ResnetTranslatorOptions& options() const noexcept { return options_; }

    private:
        ResnetTranslatorOptions options_{};
        torch::nn::Sequential layers_{nullptr};
    };

}

#endif // PLUVIO_NETWORK_RESNET_HPP
