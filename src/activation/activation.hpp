#ifndef SIGMA_ACTIVATION_HPP
#define SIGMA_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Sigma::Activation {
    enum class Type {
        Identity,
        ReLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
}

#endif //SIGMA_ACTIVATION_HPP
