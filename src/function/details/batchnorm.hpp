#ifndef SIGMA_FUNCTION_BATCHNORM_HPP
#define SIGMA_FUNCTION_BATCHNORM_HPP

#include <stdexcept>

#include <torch/torch.h>

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    // Backward is taken through the running statistics, whatever the forward mode.
    struct BatchNorm2dFunction : public torch::autograd::Function<BatchNorm2dFunction> {
        static variable_list forward(AutogradContext* ctx,
                                     torch::Tensor input,
                                     torch::Tensor input_variance,
                                     torch::Tensor running_mean,
                                     torch::Tensor running_var,
                                     torch::Tensor weight,
                                     torch::Tensor bias,
                                     bool training,
                                     double momentum,
                                     double eps)
        {
            if (input.dim() != 4) {
                throw std::invalid_argument("BatchNorm2d expects a 4-D input [B, C, H, W].");
            }
            if (!running_mean.defined() || !running_var.defined()) {
                throw std::invalid_argument("BatchNorm2d requires running statistics.");
            }

            auto output = torch::nn::functional::batch_norm(
                input,
                running_mean,
                running_var,
                torch::nn::functional::BatchNormFuncOptions()
                    .weight(weight)
                    .bias(bias)
                    .training(training)
                    .momentum(momentum)
                    .eps(eps));

            ctx->save_for_backward({input, weight});
            ctx->saved_data["has_weight"] = weight.defined();
            ctx->saved_data["has_bias"] = bias.defined();
            ctx->saved_data["running_mean"] = running_mean.detach().clone();
            ctx->saved_data["running_var"] = running_var.detach().clone();
            ctx->saved_data["eps"] = eps;

            auto output_variance = torch::ones_like(output);
            return {output, output_variance};
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            const auto saved = ctx->get_saved_variables();
            const auto& input = saved[0];
            const bool has_weight = ctx->saved_data["has_weight"].toBool();
            const bool has_bias = ctx->saved_data["has_bias"].toBool();
            const auto eps = ctx->saved_data["eps"].toDouble();
            auto running_mean = ctx->saved_data["running_mean"].toTensor().view({1, -1, 1, 1});
            auto running_var = ctx->saved_data["running_var"].toTensor().view({1, -1, 1, 1});

            const auto& grad_output = grad_outputs[0];
            const auto& grad_output_variance = grad_outputs[1];

            auto inv_std = torch::rsqrt(running_var + eps);
            auto scale = has_weight ? saved[1].view({1, -1, 1, 1}) * inv_std : inv_std;

            torch::Tensor grad_input, grad_input_variance, grad_weight, grad_bias;
            if (ctx->needs_input_grad(0)) {
                grad_input = grad_output * scale;
            }
            if (ctx->needs_input_grad(1)) {
                grad_input_variance = grad_output_variance * scale.pow(2);
            }
            if (has_weight && ctx->needs_input_grad(4)) {
                grad_weight = (grad_output * (input - running_mean) * inv_std).sum({0, 2, 3});
            }
            if (has_bias && ctx->needs_input_grad(5)) {
                grad_bias = grad_output.sum({0, 2, 3});
            }

            return {grad_input, grad_input_variance, torch::Tensor(), torch::Tensor(), grad_weight, grad_bias,
                    torch::Tensor(), torch::Tensor(), torch::Tensor()};
        }
    };
}

#endif // SIGMA_FUNCTION_BATCHNORM_HPP
