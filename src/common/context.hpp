#ifndef PLUVIO_COMMON_CONTEXT_HPP
#define PLUVIO_COMMON_CONTEXT_HPP

#include <stdexcept>

#include <torch/torch.h>

namespace Pluvio::Common {

    // Device and dtype every network, batch and scratch tensor is created on.
    // Handed to constructors explicitly; nothing in the library reads a global device.
    struct Context {
        torch::Device device{torch::kCPU};
        torch::Dtype dtype{torch::kFloat};

        [[nodiscard]] static Context cpu() { return Context{}; }

        [[nodiscard]] static Context select(bool use_cuda)
        {
            if (use_cuda) {
                if (!torch::cuda::is_available()) {
                    throw std::runtime_error("CUDA device requested but is unavailable.");
                }
                return Context{torch::Device(torch::kCUDA, /*index=*/0), torch::kFloat};
            }
            return Context{};
        }

        [[nodiscard]] torch::TensorOptions options() const
        {
            return torch::TensorOptions().dtype(dtype).device(device);
        }

        [[nodiscard]] torch::Tensor place(const torch::Tensor& tensor) const
        {
            if (!tensor.defined()) {
                return tensor;
            }
            return tensor.to(device, dtype);
        }

        [[nodiscard]] bool is_cuda() const noexcept { return device.is_cuda(); }
    };

}

#endif // PLUVIO_COMMON_CONTEXT_HPP
