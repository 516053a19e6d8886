#ifndef SIGMA_FUNCTION_CROSS_ENTROPY_HPP
#define SIGMA_FUNCTION_CROSS_ENTROPY_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../utils/check.hpp"

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    // Logits [N, C], class indices [N]. `reduction` is an at::Reduction::Reduction value.
    struct CrossEntropyFunction : public torch::autograd::Function<CrossEntropyFunction> {
        static torch::Tensor forward(AutogradContext* ctx,
                                     torch::Tensor input,
                                     torch::Tensor input_variance,
                                     torch::Tensor target,
                                     std::int64_t reduction,
                                     std::int64_t ignore_index,
                                     std::string dump_path)
        {
            if (input.dim() != 2) {
                throw std::invalid_argument("CrossEntropy expects logits of shape [N, C].");
            }
            if (target.dim() != 1 || target.size(0) != input.size(0)) {
                throw std::invalid_argument("CrossEntropy expects one class index per row of logits.");
            }

            ctx->save_for_backward({input, target});
            ctx->saved_data["reduction"] = reduction;
            ctx->saved_data["ignore_index"] = ignore_index;
            ctx->saved_data["dump_path"] = dump_path;

            using Options = torch::nn::functional::CrossEntropyFuncOptions;
            Options::reduction_t torch_reduction = torch::kMean;
            if (reduction == at::Reduction::Sum) {
                torch_reduction = torch::kSum;
            } else if (reduction == at::Reduction::None) {
                torch_reduction = torch::kNone;
            }
            return torch::nn::functional::cross_entropy(
                input, target, Options().ignore_index(ignore_index).reduction(torch_reduction));
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            const auto saved = ctx->get_saved_variables();
            const auto& input = saved[0];
            const auto& target = saved[1];
            const auto reduction = ctx->saved_data["reduction"].toInt();
            const auto ignore_index = ctx->saved_data["ignore_index"].toInt();
            const auto dump_path = ctx->saved_data["dump_path"].toStringRef();

            auto shifted = input - std::get<0>(input.max(1, /*keepdim=*/true));
            auto exp = torch::exp(shifted);
            auto exp_sum = exp.sum(1, /*keepdim=*/true);
            auto ratio = exp / exp_sum;

            auto valid = (target != ignore_index);
            auto safe_target = target.masked_fill(valid.logical_not(), 0);
            auto one_hot = torch::zeros_like(ratio).scatter_(1, safe_target.unsqueeze(1), 1.0);
            auto row_mask = valid.unsqueeze(1).to(ratio.scalar_type());

            auto grad_output = grad_outputs[0];
            if (reduction == at::Reduction::None) {
                grad_output = grad_output.unsqueeze(1);
            } else if (reduction == at::Reduction::Mean) {
                grad_output = grad_output / valid.sum().clamp_min(1).to(ratio.scalar_type());
            }

            auto grad_input = (ratio - one_hot) * row_mask * grad_output;
            auto grad_input_variance = (1 - ratio) * ratio * row_mask * grad_output;

            ::Sigma::Check::ensure_no_nan("CrossEntropy backward",
                                          {{"grad_input", grad_input}, {"grad_input_variance", grad_input_variance}},
                                          {exp, exp_sum},
                                          dump_path);

            return {grad_input, grad_input_variance, torch::Tensor(), torch::Tensor(), torch::Tensor(), torch::Tensor()};
        }
    };
}

#endif // SIGMA_FUNCTION_CROSS_ENTROPY_HPP
