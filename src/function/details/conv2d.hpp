#ifndef SIGMA_FUNCTION_CONV2D_HPP
#define SIGMA_FUNCTION_CONV2D_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Sigma::Function::Details {
    using torch::autograd::AutogradContext;
    using torch::autograd::variable_list;

    // Spatial argument given as {v} or {h, w}; every entry must be >= minimum.
    [[nodiscard]] inline std::vector<std::int64_t> expand_pair(const std::vector<std::int64_t>& values,
                                                               const char* name,
                                                               std::int64_t minimum)
    {
        std::vector<std::int64_t> expanded;
        if (values.size() == 1) {
            expanded = {values[0], values[0]};
        } else if (values.size() == 2) {
            expanded = values;
        } else {
            throw std::invalid_argument(std::string(name) + " expects one or two values.");
        }
        for (const auto value : expanded) {
            if (value < minimum) {
                throw std::invalid_argument(std::string(name) + " values must be at least " + std::to_string(minimum) + ".");
            }
        }
        return expanded;
    }

    [[nodiscard]] inline torch::ExpandingArray<2> as_expanding(const std::vector<std::int64_t>& values)
    {
        return torch::ExpandingArray<2>(at::IntArrayRef(values));
    }

    struct Conv2dFunction : public torch::autograd::Function<Conv2dFunction> {
        static variable_list forward(AutogradContext* ctx,
                                     torch::Tensor input,
                                     torch::Tensor input_variance,
                                     torch::Tensor weight,
                                     torch::Tensor weight_variance,
                                     torch::Tensor bias,
                                     std::vector<std::int64_t> stride,
                                     std::vector<std::int64_t> padding,
                                     std::vector<std::int64_t> dilation,
                                     std::int64_t groups)
        {
            if (input.dim() != 4 || weight.dim() != 4) {
                throw std::invalid_argument("Conv2d expects a 4-D input [B, C, H, W] and a 4-D weight.");
            }
            if (groups <= 0 || weight.size(0) % groups != 0 || input.size(1) != weight.size(1) * groups) {
                throw std::invalid_argument("Conv2d channel counts are inconsistent with the requested groups.");
            }
            stride = expand_pair(stride, "stride", 1);
            padding = expand_pair(padding, "padding", 0);
            dilation = expand_pair(dilation, "dilation", 1);

            auto output = torch::conv2d(input, weight, bias, stride, padding, dilation, groups);

            ctx->save_for_backward({input, weight});
            ctx->saved_data["has_bias"] = bias.defined();
            ctx->saved_data["stride"] = stride;
            ctx->saved_data["padding"] = padding;
            ctx->saved_data["dilation"] = dilation;
            ctx->saved_data["groups"] = groups;

            auto output_variance = torch::ones_like(output);
            return {output, output_variance};
        }

        static variable_list backward(AutogradContext* ctx, variable_list grad_outputs)
        {
            namespace F = torch::nn::functional;

            const auto saved = ctx->get_saved_variables();
            const auto& input = saved[0];
            const auto& weight = saved[1];
            const bool has_bias = ctx->saved_data["has_bias"].toBool();
            const auto stride = ctx->saved_data["stride"].toIntVector();
            const auto padding = ctx->saved_data["padding"].toIntVector();
            const auto dilation = ctx->saved_data["dilation"].toIntVector();
            const auto groups = ctx->saved_data["groups"].toInt();

            const auto batch = input.size(0);
            const auto group_in = weight.size(1);
            const auto group_out = weight.size(0) / groups;
            const std::vector<std::int64_t> kernel{weight.size(2), weight.size(3)};
            const std::vector<std::int64_t> spatial{input.size(2), input.size(3)};

            const auto& grad_output = grad_outputs[0];
            const auto& grad_output_variance = grad_outputs[1];
            const auto locations = grad_output.size(2) * grad_output.size(3);

            const auto unfold_options = F::UnfoldFuncOptions(as_expanding(kernel))
                                            .dilation(as_expanding(dilation))
                                            .padding(as_expanding(padding))
                                            .stride(as_expanding(stride));
            const auto fold_options = F::FoldFuncOptions(as_expanding(spatial), as_expanding(kernel))
                                          .dilation(as_expanding(dilation))
                                          .padding(as_expanding(padding))
                                          .stride(as_expanding(stride));

            const bool want_input = ctx->needs_input_grad(0);
            const bool want_input_variance = ctx->needs_input_grad(1);
            const bool want_weight = ctx->needs_input_grad(2);
            const bool want_weight_variance = ctx->needs_input_grad(3);

            std::vector<torch::Tensor> grad_input_parts, grad_input_variance_parts;
            std::vector<torch::Tensor> grad_weight_parts, grad_weight_variance_parts;

            for (std::int64_t group = 0; group < groups; ++group) {
                auto group_weight = weight.narrow(0, group * group_out, group_out);
                auto group_grad = grad_output.narrow(1, group * group_out, group_out).reshape({batch, group_out, locations});
                auto group_grad_variance =
                    grad_output_variance.narrow(1, group * group_out, group_out).reshape({batch, group_out, locations});

                if (want_weight || want_weight_variance) {
                    // [B, C_g * KH * KW, L]
                    auto columns = F::unfold(input.narrow(1, group * group_in, group_in), unfold_options);
                    if (want_weight) {
                        grad_weight_parts.push_back(
                            group_grad.bmm(columns.transpose(1, 2)).sum(0).view(group_weight.sizes()));
                    }
                    if (want_weight_variance) {
                        grad_weight_variance_parts.push_back(
                            group_grad_variance.bmm(columns.pow(2).transpose(1, 2)).sum(0).view(group_weight.sizes()));
                    }
                }

                auto flat_weight = group_weight.reshape({group_out, -1});
                if (want_input) {
                    auto columns = flat_weight.t().matmul(group_grad);
                    grad_input_parts.push_back(F::fold(columns, fold_options));
                }
                if (want_input_variance) {
                    auto columns = flat_weight.pow(2).t().matmul(group_grad_variance);
                    grad_input_variance_parts.push_back(F::fold(columns, fold_options));
                }
            }

            torch::Tensor grad_input, grad_input_variance, grad_weight, grad_weight_variance, grad_bias;
            if (want_input) {
                grad_input = torch::cat(grad_input_parts, 1);
            }
            if (want_input_variance) {
                grad_input_variance = torch::cat(grad_input_variance_parts, 1);
            }
            if (want_weight) {
                grad_weight = torch::cat(grad_weight_parts, 0);
            }
            if (want_weight_variance) {
                grad_weight_variance = torch::cat(grad_weight_variance_parts, 0);
            }
            if (has_bias && ctx->needs_input_grad(4)) {
                grad_bias = grad_output.sum({0, 2, 3});
            }

            return {grad_input, grad_input_variance, grad_weight, grad_weight_variance, grad_bias,
                    torch::Tensor(), torch::Tensor(), torch::Tensor(), torch::Tensor()};
        }
    };
}

#endif // SIGMA_FUNCTION_CONV2D_HPP
