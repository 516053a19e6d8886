#ifndef SIGMA_FUNCTION_RELU_HPP
#define SIGMA_FUNCTION_RELU_HPP

#include <torch/torch.h>

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    struct ReLUFunction : public torch::autograd::Function<ReLUFunction> {
        static variable_list forward(AutogradContext* ctx, torch::Tensor input, torch::Tensor input_variance)
        {
            ctx->save_for_backward({input});
            auto output = torch::relu(input);
            auto output_variance = torch::ones_like(output);
            return {output, output_variance};
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            const auto saved = ctx->get_saved_variables();
            // The mask is 0/1, so it squares to itself on the S path.
            auto mask = (saved[0] > 0).to(grad_outputs[0].scalar_type());
            return {grad_outputs[0] * mask, grad_outputs[1] * mask};
        }
    };
}

#endif // SIGMA_FUNCTION_RELU_HPP
