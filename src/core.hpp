#ifndef SIGMA_CORE_HPP
#define SIGMA_CORE_HPP
/*
 * Shared value/variance carrier.
 * ---------------------------------------------------------------------------
 *  - Every operator under src/function consumes and produces the value tensor
 *    together with its S channel (variance surrogate).
 *  - The forward S of a layer is a ones carrier: only its gradient is read.
 *  - seed() prepares a network input so the S gradient of the input itself
 *    can be inspected after backward().
 */
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Sigma {
    struct Pair {
        torch::Tensor value{};
        torch::Tensor variance{};

        [[nodiscard]] bool defined() const noexcept { return value.defined() && variance.defined(); }
    };

    [[nodiscard]] inline Pair seed(torch::Tensor input, bool track_variance = true)
    {
        if (!input.defined()) {
            throw std::invalid_argument("Sigma::seed requires a defined input tensor.");
        }
        auto variance = torch::ones_like(input);
        if (track_variance) {
            variance.set_requires_grad(true);
        }
        return {std::move(input), std::move(variance)};
    }

    inline void require_matching(const Pair& pair, const char* where)
    {
        if (!pair.defined()) {
            throw std::invalid_argument(std::string(where) + " received an undefined value or variance tensor.");
        }
        if (pair.value.sizes() != pair.variance.sizes()) {
            throw std::invalid_argument(std::string(where) + " requires value and variance of identical shape.");
        }
    }
}

#endif // SIGMA_CORE_HPP
