#ifndef PLUVIO_INITIALIZATION_HPP
#define PLUVIO_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Pluvio::Initialization {
    enum class Type {
        Default,
        Normal,
        XavierNormal,
        KaimingNormal,
        Orthogonal,
        Dirac, // https://arxiv.org/pdf/1706.00388
    };

    struct Descriptor {
        Type type{Type::Normal};
        double gain{0.02};
    };

    inline constexpr Descriptor Default{Type::Default, 0.0};
    inline constexpr Descriptor Normal{Type::Normal, 0.02};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal, 0.02};
    inline constexpr Descriptor KaimingNormal{Type::KaimingNormal, 0.0};
    inline constexpr Descriptor Orthogonal{Type::Orthogonal, 0.02};
    inline constexpr Descriptor Dirac{Type::Dirac, 0.0};

    [[nodiscard]] inline Type parse_type(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (lowered == "default") return Type::Default;
        if (lowered == "normal") return Type::Normal;
        if (lowered == "xavier") return Type::XavierNormal;
        if (lowered == "kaiming") return Type::KaimingNormal;
        if (lowered == "orthogonal") return Type::Orthogonal;
        if (lowered == "dirac") return Type::Dirac;
        throw std::invalid_argument("Unknown initialization '" + std::string(name)
                                    + "'; expected default, normal, xavier, kaiming, orthogonal or dirac.");
    }

    [[nodiscard]] inline std::string to_string(Type type) {
        switch (type) {
            case Type::Default:       return "default";
            case Type::Normal:        return "normal";
            case Type::XavierNormal:  return "xavier";
            case Type::KaimingNormal: return "kaiming";
            case Type::Orthogonal:    return "orthogonal";
            case Type::Dirac:         return "dirac";
        }
        return "default";
    }
}

#endif // PLUVIO_INITIALIZATION_HPP
