#ifndef SIGMA_FUNCTION_MSE_HPP
#define SIGMA_FUNCTION_MSE_HPP

#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    // `reduction` is an at::Reduction::Reduction value.
    struct MSEFunction : public torch::autograd::Function<MSEFunction> {
        static torch::Tensor forward(AutogradContext* ctx,
                                     torch::Tensor input,
                                     torch::Tensor input_variance,
                                     torch::Tensor target,
                                     std::int64_t reduction)
        {
            if (input.sizes() != target.sizes()) {
                throw std::invalid_argument("MSE requires prediction and target of identical shape.");
            }
            ctx->save_for_backward({input, target});
            ctx->saved_data["reduction"] = reduction;
            return torch::mse_loss(input, target, reduction);
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            const auto saved = ctx->get_saved_variables();
            const auto& input = saved[0];
            const auto& target = saved[1];
            const auto reduction = ctx->saved_data["reduction"].toInt();

            double scale = 1.0;
            if (reduction == at::Reduction::Mean && input.numel() > 0) {
                scale = 1.0 / static_cast<double>(input.numel());
            }
            const auto& grad_output = grad_outputs[0];

            auto grad_input = grad_output * 2.0 * scale * (input - target);
            // d²L/dx² of the squared error is constant per element.
            auto grad_input_variance = grad_output * torch::full_like(input, 2.0 * scale);

            return {grad_input, grad_input_variance, torch::Tensor(), torch::Tensor()};
        }
    };
}

#endif // SIGMA_FUNCTION_MSE_HPP
