#ifndef SIGMA_FUNCTION_SCALE_HPP
#define SIGMA_FUNCTION_SCALE_HPP

#include <torch/torch.h>

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    // Identity forward; rescales the S gradient by `factor` on the way back.
    struct BackPoolFunction : public torch::autograd::Function<BackPoolFunction> {
        static variable_list forward(AutogradContext* ctx, torch::Tensor input, torch::Tensor input_variance, double factor)
        {
            ctx->saved_data["factor"] = factor;
            return {input.clone(), input_variance.clone()};
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            const auto factor = ctx->saved_data["factor"].toDouble();
            return {grad_outputs[0], grad_outputs[1] * factor, torch::Tensor()};
        }
    };

    struct TimesFunction : public torch::autograd::Function<TimesFunction> {
        static variable_list forward(AutogradContext* ctx, torch::Tensor input, torch::Tensor input_variance, double factor)
        {
            ctx->saved_data["factor"] = factor;
            auto output = input * factor;
            auto output_variance = torch::ones_like(output);
            return {output, output_variance};
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            const auto factor = ctx->saved_data["factor"].toDouble();
            return {grad_outputs[0] * factor, grad_outputs[1] * (factor * factor), torch::Tensor()};
        }
    };
}

#endif // SIGMA_FUNCTION_SCALE_HPP
