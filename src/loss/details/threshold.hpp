#ifndef PLUVIO_LOSS_THRESHOLD_HPP
#define PLUVIO_LOSS_THRESHOLD_HPP

#include <stdexcept>

#include <torch/torch.h>

namespace Pluvio::Loss::Details {

    // Keeps values strictly above `threshold`, zeroes the rest. Idempotent.
    inline torch::Tensor zero_at_or_below(const torch::Tensor& values, double threshold) {
        return torch::where(values > threshold, values, torch::zeros_like(values));
    }

    // Same gate, but decided by `reference` (e.g. the observed rain rate) instead of `values`.
    inline torch::Tensor zero_where_reference_at_or_below(const torch::Tensor& values,
                                                          const torch::Tensor& reference,
                                                          double threshold) {
        if (values.sizes() != reference.sizes()) {
            throw std::invalid_argument("Threshold reference must match the gated tensor's shape.");
        }
        return torch::where(reference > threshold, values, torch::zeros_like(values));
    }

}

#endif // PLUVIO_LOSS_THRESHOLD_HPP
