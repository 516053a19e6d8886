#ifndef SIGMA_ACTIVATION_APPLY_HPP
#define SIGMA_ACTIVATION_APPLY_HPP

#include <stdexcept>

#include "../core.hpp"
#include "../function/function.hpp"
#include "activation.hpp"

namespace Sigma::Activation::Details {
    inline Pair apply(::Sigma::Activation::Type type, const Pair& input) {
        switch (type) {
            case ::Sigma::Activation::Type::ReLU:
                return ::Sigma::Function::relu(input);
            case ::Sigma::Activation::Type::Identity:
                return input;
        }
        throw std::invalid_argument("Unsupported activation type.");
    }
}
#endif // SIGMA_ACTIVATION_APPLY_HPP
