#ifndef SIGMA_LOSS_HPP
#define SIGMA_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/reduction.hpp"
#include "details/ce.hpp"
#include "details/mse.hpp"

namespace Sigma::Loss {
    using Reduction = Details::Reduction;
    using MSEOptions = Details::MSEOptions;
    using MSEDescriptor = Details::MSEDescriptor;
    using CrossEntropyOptions = Details::CrossEntropyOptions;
    using CrossEntropyDescriptor = Details::CrossEntropyDescriptor;

    using Descriptor = std::variant<
        Details::MSEDescriptor,
        Details::CrossEntropyDescriptor>;


    [[nodiscard]] inline auto MSE(const Details::MSEOptions& options = {}) -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto CrossEntropy(const Details::CrossEntropyOptions& options = {}) -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] inline torch::Tensor compute(const Descriptor& descriptor, const Pair& prediction, const torch::Tensor& target) {
        return std::visit(
            [&](const auto& concrete) { return Details::compute(concrete, prediction, target); },
            descriptor);
    }
}

#endif //SIGMA_LOSS_HPP
