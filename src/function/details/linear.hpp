#ifndef SIGMA_FUNCTION_LINEAR_HPP
#define SIGMA_FUNCTION_LINEAR_HPP

#include <stdexcept>

#include <torch/torch.h>

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    // y = x Wᵀ + b, S carrier out. Leading dimensions of x are treated as batch.
    struct LinearFunction : public torch::autograd::Function<LinearFunction> {
        static variable_list forward(AutogradContext* ctx,
                                     torch::Tensor input,
                                     torch::Tensor input_variance,
                                     torch::Tensor weight,
                                     torch::Tensor weight_variance,
                                     torch::Tensor bias)
        {
            if (weight.dim() != 2) {
                throw std::invalid_argument("Linear expects a 2-D weight [out_features, in_features].");
            }
            if (input.dim() < 1 || input.size(-1) != weight.size(1)) {
                throw std::invalid_argument("Linear input feature dimension does not match weight.");
            }
            ctx->save_for_backward({input, weight});
            ctx->saved_data["has_bias"] = bias.defined();

            auto output = torch::nn::functional::linear(input, weight, bias);
            auto output_variance = torch::ones_like(output);
            return {output, output_variance};
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            const auto saved = ctx->get_saved_variables();
            const auto& input = saved[0];
            const auto& weight = saved[1];
            const bool has_bias = ctx->saved_data["has_bias"].toBool();

            const auto out_features = weight.size(0);
            const auto in_features = weight.size(1);
            auto grad_output = grad_outputs[0].reshape({-1, out_features});
            auto grad_output_variance = grad_outputs[1].reshape({-1, out_features});
            auto flat_input = input.reshape({-1, in_features});

            torch::Tensor grad_input, grad_input_variance, grad_weight, grad_weight_variance, grad_bias;
            if (ctx->needs_input_grad(0)) {
                grad_input = grad_output.mm(weight).view(input.sizes());
            }
            if (ctx->needs_input_grad(1)) {
                grad_input_variance = grad_output_variance.mm(weight.pow(2)).view(input.sizes());
            }
            if (ctx->needs_input_grad(2)) {
                grad_weight = grad_output.t().mm(flat_input);
            }
            if (ctx->needs_input_grad(3)) {
                grad_weight_variance = grad_output_variance.t().mm(flat_input.pow(2));
            }
            if (has_bias && ctx->needs_input_grad(4)) {
                grad_bias = grad_output.sum(0);
            }

            return {grad_input, grad_input_variance, grad_weight, grad_weight_variance, grad_bias};
        }
    };
}

#endif // SIGMA_FUNCTION_LINEAR_HPP
