#ifndef PLUVIO_LOSS_MSE_HPP
#define PLUVIO_LOSS_MSE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Pluvio::Loss::Details {

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        namespace F = torch::nn::functional;
        return F::mse_loss(prediction, target,
            F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction)));
    }

}

#endif // PLUVIO_LOSS_MSE_HPP
