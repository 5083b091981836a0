#ifndef PLUVIO_TRAINING_OBJECTIVE_HPP
#define PLUVIO_TRAINING_OBJECTIVE_HPP
/*
 * Cycle-consistent adversarial objective between attenuation (A) and rain rate (B).
 * ---------------------------------------------------------------------------
 *  critic:       GAN(D(real), real) + GAN(D(fake.detach()), fake)
 *  adversarial:  GAN(D_A(fake_B), real)
 *                GAN(D_B(fake_A), real) + BCE(zero_at_or_below(sigmoid(fake_B), 0.1), real_B)
 *  cycle:        L1(real_A, rec_A) * lambda_A
 *                L1(real_B, zero_at_or_below(rec_B, 0.25)) * lambda_B
 *  identity:     L1(G_A(real_B), real_B) * lambda_B * lambda_identity
 *                L1(G_B(real_A), real_A) * lambda_A * lambda_identity
 *  diagnostics:  MSE(fake_A, real_A), MSE(real_B, zero_at_or_below(fake_B, 0.25))
 *
 * Only the B -> A adversarial term carries the classification penalty.
 */

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

#include "../loss/loss.hpp"
#include "../network/network.hpp"

namespace Pluvio::Training {

    // What decides which reconstructed rain-rate steps enter the backward cycle term.
    enum class CycleMask {
        Reconstruction,  // the reconstruction itself
        Reference        // the observed rain rate
    };

    [[nodiscard]] inline CycleMask parse_cycle_mask(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "reconstruction") return CycleMask::Reconstruction;
        if (lowered == "reference") return CycleMask::Reference;
        throw std::invalid_argument("Unknown cycle mask '" + std::string(name) + "'; expected reconstruction or reference.");
    }

    [[nodiscard]] inline std::string to_string(CycleMask mask) {
        return mask == CycleMask::Reference ? "reference" : "reconstruction";
    }

    struct ObjectiveOptions {
        double lambda_A{10.0};
        double lambda_B{10.0};
        double lambda_identity{0.0};
        Loss::GANOptions gan{};
        double classification_threshold{0.1};
        double cycle_threshold{0.25};
        double diagnostic_threshold{0.25};
        CycleMask cycle_mask{CycleMask::Reconstruction};
    };

    class Objective {
    public:
        explicit Objective(ObjectiveOptions options = {})
            : options_(options), gan_(Loss::GAN(options.gan))
        {
            if (options_.lambda_A < 0.0 || options_.lambda_B < 0.0 || options_.lambda_identity < 0.0) {
                throw std::invalid_argument("Cycle and identity weights must be non-negative.");
            }
        }

        [[nodiscard]] bool identity_enabled() const noexcept { return options_.lambda_identity > 0.0; }

        [[nodiscard]] torch::Tensor critic(Network::SignalModule& critic,
                                           const torch::Tensor& real,
                                           const torch::Tensor& fake) const
        {
            auto loss_real = Loss::compute(gan_, critic.forward(real), /*target_is_real=*/true);
            auto loss_fake = Loss::compute(gan_, critic.forward(fake.detach()), /*target_is_real=*/false);
            return loss_real + loss_fake;
        }

        // The critic is expected to be frozen by the caller.
        [[nodiscard]] torch::Tensor adversarial(Network::SignalModule& critic, const torch::Tensor& fake) const
        {
            return Loss::compute(gan_, critic.forward(fake), /*target_is_real=*/true);
        }

        [[nodiscard]] torch::Tensor classification(const torch::Tensor& classification, const torch::Tensor& real_B) const
        {
            if (classification.sizes() != real_B.sizes()) {
                throw std::invalid_argument("Shape mismatch between the rain-rate classification "
                                            + shape_of(classification) + " and real_B " + shape_of(real_B) + ".");
            }
            auto gated = Loss::zero_at_or_below(classification, options_.classification_threshold);
            return Loss::compute(Loss::BCE(), gated, real_B);
        }

        [[nodiscard]] torch::Tensor cycle_A(const torch::Tensor& real_A, const torch::Tensor& rec_A) const
        {
            return Loss::compute(Loss::MAE(), real_A, rec_A) * options_.lambda_A;
        }

        [[nodiscard]] torch::Tensor cycle_B(const torch::Tensor& real_B, const torch::Tensor& rec_B) const
        {
            const auto gated = options_.cycle_mask == CycleMask::Reference
                ? Loss::zero_where_reference_at_or_below(rec_B, real_B, options_.cycle_threshold)
                : Loss::zero_at_or_below(rec_B, options_.cycle_threshold);
            return Loss::compute(Loss::MAE(), real_B, gated) * options_.lambda_B;
        }

        // ||G(x) - x|| for a translator fed a sample already in its target domain.
        [[nodiscard]] torch::Tensor identity(const torch::Tensor& translated, const torch::Tensor& real, double lambda) const
        {
            return Loss::compute(Loss::MAE(), translated, real) * lambda * options_.lambda_identity;
        }

        [[nodiscard]] torch::Tensor mse_A(const torch::Tensor& fake_A, const torch::Tensor& real_A) const
        {
            torch::NoGradGuard no_grad;
            return Loss::compute(Loss::MSE(), fake_A, real_A);
        }

        [[nodiscard]] torch::Tensor mse_B(const torch::Tensor& real_B, const torch::Tensor& fake_B) const
        {
            torch::NoGradGuard no_grad;
            return Loss::compute(Loss::MSE(), real_B, Loss::zero_at_or_below(fake_B, options_.diagnostic_threshold));
        }

        [[nodiscard]] const ObjectiveOptions& options() const noexcept { return options_; }

    private:
        static std::string shape_of(const torch::Tensor& tensor)
        {
            std::string text = "[";
            for (std::int64_t d = 0; d < tensor.dim(); ++d) {
                if (d > 0) text += ", ";
                text += std::to_string(tensor.size(d));
            }
            return text + "]";
        }

        ObjectiveOptions options_{};
        Loss::GANDescriptor gan_{};
    };

}

#endif // PLUVIO_TRAINING_OBJECTIVE_HPP
