#ifndef PLUVIO_LOSS_MAE_HPP
#define PLUVIO_LOSS_MAE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Pluvio::Loss::Details {

    struct MAEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MAEDescriptor {
        MAEOptions options{};
    };

    inline torch::Tensor compute(const MAEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        namespace F = torch::nn::functional;
        return F::l1_loss(prediction, target,
            F::L1LossFuncOptions().reduction(to_torch_reduction<F::L1LossFuncOptions>(descriptor.options.reduction)));
    }

}

#endif // PLUVIO_LOSS_MAE_HPP
