#ifndef PLUVIO_NETWORK_MODULE_HPP
#define PLUVIO_NETWORK_MODULE_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

namespace Pluvio::Network::Details {

    // Seam between the training protocol and whatever architecture sits behind a
    // translator or a critic. The trainer only calls forward() and toggles frozen.
    class SignalModule : public torch::nn::Module {
    public:
        explicit SignalModule(std::string name) : torch::nn::Module(std::move(name)) {}
        ~SignalModule() override = default;

        [[nodiscard]] virtual torch::Tensor forward(const torch::Tensor& input) = 0;

        // Marks every parameter as (non-)trainable. Autograd skips frozen parameters.
        void set_frozen(bool frozen) {
            for (auto& parameter : this->parameters(/*recurse=*/true)) {
                parameter.requires_grad_(!frozen);
            }
            frozen_ = frozen;
        }

        [[nodiscard]] bool frozen() const noexcept { return frozen_; }

        [[nodiscard]] std::int64_t parameter_count() const {
            std::int64_t count = 0;
            for (const auto& parameter : this->parameters(/*recurse=*/true)) {
                count += parameter.numel();
            }
            return count;
        }

    private:
        bool frozen_{false};
    };

    using SignalModulePtr = std::shared_ptr<SignalModule>;

    enum class Norm { Instance, Batch, None };

    [[nodiscard]] inline Norm parse_norm(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "instance") return Norm::Instance;
        if (lowered == "batch") return Norm::Batch;
        if (lowered == "none") return Norm::None;
        throw std::invalid_argument("Unknown normalization layer '" + std::string(name) + "'; expected instance, batch or none.");
    }

    [[nodiscard]] inline std::string to_string(Norm norm) {
        switch (norm) {
            case Norm::Instance: return "instance";
            case Norm::Batch:    return "batch";
            case Norm::None:     return "none";
        }
        return "none";
    }

    // Instance norm without affine parameters, batch norm with them.
    inline torch::nn::AnyModule make_norm(Norm norm, std::int64_t channels) {
        switch (norm) {
            case Norm::Instance:
                return torch::nn::AnyModule(torch::nn::InstanceNorm1d(
                    torch::nn::InstanceNorm1dOptions(channels).affine(false).track_running_stats(false)));
            case Norm::Batch:
                return torch::nn::AnyModule(torch::nn::BatchNorm1d(
                    torch::nn::BatchNorm1dOptions(channels).affine(true).track_running_stats(true)));
            case Norm::None:
            default:
                return torch::nn::AnyModule(torch::nn::Identity());
        }
    }

    // Conv bias is redundant in front of a batch norm.
    [[nodiscard]] constexpr bool use_conv_bias(Norm norm) noexcept {
        return norm != Norm::Batch;
    }

}

#endif // PLUVIO_NETWORK_MODULE_HPP
