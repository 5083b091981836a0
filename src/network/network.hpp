#ifndef PLUVIO_NETWORK_HPP
#define PLUVIO_NETWORK_HPP
/*
 * Translator and critic factory.
 * ---------------------------------------------------------------------------
 *  - Descriptors are plain option structs; `make` materialises one, applies the
 *    requested initialization and moves it onto the execution context.
 *  - Anything deriving from SignalModule can stand in for the built-in
 *    architectures; the training protocol never looks past forward().
 */

#include <memory>
#include <type_traits>
#include <variant>

#include <torch/torch.h>

#include "../common/context.hpp"
#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"
#include "details/module.hpp"
#include "details/patch.hpp"
#include "details/resnet.hpp"

namespace Pluvio::Network {
    using SignalModule = Details::SignalModule;
    using SignalModulePtr = Details::SignalModulePtr;
    using Norm = Details::Norm;

    using ResnetTranslatorOptions = Details::ResnetTranslatorOptions;
    using PatchCriticOptions = Details::PatchCriticOptions;

    struct ResnetTranslatorDescriptor {
        ResnetTranslatorOptions options{};
        Initialization::Descriptor initialization{Initialization::Normal};
    };

    struct PatchCriticDescriptor {
        PatchCriticOptions options{};
        Initialization::Descriptor initialization{Initialization::Normal};
    };

    using TranslatorDescriptor = std::variant<ResnetTranslatorDescriptor>;
    using CriticDescriptor = std::variant<PatchCriticDescriptor>;

    [[nodiscard]] inline auto ResnetTranslator(const ResnetTranslatorOptions& options = {},
                                               Initialization::Descriptor initialization = Initialization::Normal)
        -> ResnetTranslatorDescriptor {
        return {options, initialization};
    }

    [[nodiscard]] inline auto PatchCritic(const PatchCriticOptions& options = {},
                                          Initialization::Descriptor initialization = Initialization::Normal)
        -> PatchCriticDescriptor {
        return {options, initialization};
    }

    namespace Details {
        inline SignalModulePtr finalize(SignalModulePtr module,
                                        const Initialization::Descriptor& initialization,
                                        const Common::Context& context) {
            Initialization::Details::apply_network_initialization(*module, initialization);
            module->to(context.device, context.dtype);
            return module;
        }

        inline SignalModulePtr build(const ResnetTranslatorDescriptor& descriptor, const Common::Context& context) {
            return finalize(std::make_shared<ResnetTranslator>(descriptor.options), descriptor.initialization, context);
        }

        inline SignalModulePtr build(const PatchCriticDescriptor& descriptor, const Common::Context& context) {
            return finalize(std::make_shared<PatchCritic>(descriptor.options), descriptor.initialization, context);
        }
    }

    [[nodiscard]] inline SignalModulePtr make(const TranslatorDescriptor& descriptor, const Common::Context& context) {
        return std::visit([&context](const auto& concrete) { return Details::build(concrete, context); }, descriptor);
    }

    [[nodiscard]] inline SignalModulePtr make(const CriticDescriptor& descriptor, const Common::Context& context) {
        return std::visit([&context](const auto& concrete) { return Details::build(concrete, context); }, descriptor);
    }
}

#endif // PLUVIO_NETWORK_HPP
