#ifndef PLUVIO_LOSS_BCE_HPP
#define PLUVIO_LOSS_BCE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Pluvio::Loss::Details {

    // Binary cross-entropy over probabilities (inputs already in [0, 1]).
    struct BCEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct BCEDescriptor {
        BCEOptions options{};
    };

    // Binary cross-entropy over raw scores; the sigmoid is folded into the loss.
    struct BCEWithLogitsOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct BCEWithLogitsDescriptor {
        BCEWithLogitsOptions options{};
    };

    inline torch::Tensor compute(const BCEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        namespace F = torch::nn::functional;
        auto opts = F::BinaryCrossEntropyFuncOptions().reduction(
            to_torch_reduction<F::BinaryCrossEntropyFuncOptions>(descriptor.options.reduction));
        return F::binary_cross_entropy(prediction, target.to(prediction.scalar_type()), opts);
    }

    inline torch::Tensor compute(const BCEWithLogitsDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        namespace F = torch::nn::functional;
        auto opts = F::BinaryCrossEntropyWithLogitsFuncOptions().reduction(
            to_torch_reduction<F::BinaryCrossEntropyWithLogitsFuncOptions>(descriptor.options.reduction));
        return F::binary_cross_entropy_with_logits(prediction, target.to(prediction.scalar_type()), opts);
    }

}

#endif // PLUVIO_LOSS_BCE_HPP
