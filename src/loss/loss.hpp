#ifndef PLUVIO_LOSS_HPP
#define PLUVIO_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/reduction.hpp"
#include "details/mse.hpp"
#include "details/mae.hpp"
#include "details/bce.hpp"
#include "details/gan.hpp"
#include "details/threshold.hpp"

namespace Pluvio::Loss {
    using Reduction = Details::Reduction;
    using GANMode = Details::GANMode;

    using MSEOptions = Details::MSEOptions;
    using MSEDescriptor = Details::MSEDescriptor;
    using MAEOptions = Details::MAEOptions;
    using MAEDescriptor = Details::MAEDescriptor;
    using BCEOptions = Details::BCEOptions;
    using BCEDescriptor = Details::BCEDescriptor;
    using BCEWithLogitsOptions = Details::BCEWithLogitsOptions;
    using BCEWithLogitsDescriptor = Details::BCEWithLogitsDescriptor;
    using GANOptions = Details::GANOptions;
    using GANDescriptor = Details::GANDescriptor;

    using Details::compute;
    using Details::zero_at_or_below;
    using Details::zero_where_reference_at_or_below;

    [[nodiscard]] constexpr auto MSE(const MSEOptions& options = {}) noexcept -> MSEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MAE(const MAEOptions& options = {}) noexcept -> MAEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto BCE(const BCEOptions& options = {}) noexcept -> BCEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto BCEWithLogits(const BCEWithLogitsOptions& options = {}) noexcept -> BCEWithLogitsDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto GAN(const GANOptions& options = {}) noexcept -> GANDescriptor {
        return {options};
    }
}

#endif // PLUVIO_LOSS_HPP
