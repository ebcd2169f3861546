#ifndef STRATA_ACTIVATION_HPP
#define STRATA_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Strata::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        LeakyReLU,
        Softmax,
        SiLU,
        GeLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Softmax{Type::Softmax};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor GeLU{Type::GeLU};
}

#endif // STRATA_ACTIVATION_HPP
