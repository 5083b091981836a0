#ifndef PLUVIO_LOSS_REDUCTION_HPP
#define PLUVIO_LOSS_REDUCTION_HPP

#include <type_traits>

#include <torch/torch.h>

namespace Pluvio::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    // to_torch_reduction<torch::nn::functional::L1LossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction reduction) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (reduction) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::None: return RT{torch::kNone};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

}

#endif // PLUVIO_LOSS_REDUCTION_HPP
