#ifndef SIGMA_FUNCTION_QUANTIZE_HPP
#define SIGMA_FUNCTION_QUANTIZE_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    // Step of the symmetric uniform grid spanning max|x| with 2^bits levels per sign.
    [[nodiscard]] inline torch::Tensor quantization_step(const torch::Tensor& input, std::int64_t bits)
    {
        if (bits < 1) {
            throw std::invalid_argument("Quantization requires at least one bit.");
        }
        return input.detach().abs().max() / std::pow(2.0, static_cast<double>(bits));
    }

    // Straight-through estimator: gradients pass unchanged.
    struct QuantizeFunction : public torch::autograd::Function<QuantizeFunction> {
        static torch::Tensor forward(AutogradContext* ctx, torch::Tensor input, std::int64_t bits)
        {
            if (bits < 1) {
                throw std::invalid_argument("Quantization requires at least one bit.");
            }
            if (input.numel() == 0) {
                return input.clone();
            }
            auto step = quantization_step(input, bits);
            if (step.item<double>() == 0.0) {
                return input.clone();
            }
            return torch::round(input / step) * step;
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            return {grad_outputs[0], torch::Tensor()};
        }
    };
}

#endif // SIGMA_FUNCTION_QUANTIZE_HPP
