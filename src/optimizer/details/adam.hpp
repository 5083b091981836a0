#ifndef PLUVIO_OPTIMIZER_ADAM_HPP
#define PLUVIO_OPTIMIZER_ADAM_HPP
// "Adam: A Method for Stochastic Optimization" https://arxiv.org/abs/1412.6980
#include <tuple>

#include <torch/torch.h>

namespace Pluvio::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{2e-4};
        double beta1{0.5};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    struct AdamWOptions {
        double learning_rate{2e-4};
        double beta1{0.5};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        torch::optim::AdamWOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    inline double learning_rate(const AdamDescriptor& descriptor) noexcept { return descriptor.options.learning_rate; }
    inline double learning_rate(const AdamWDescriptor& descriptor) noexcept { return descriptor.options.learning_rate; }

}

#endif // PLUVIO_OPTIMIZER_ADAM_HPP
