#ifndef SIGMA_FUNCTION_HPP
#define SIGMA_FUNCTION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../core.hpp"
#include "details/batchnorm.hpp"
#include "details/conv2d.hpp"
#include "details/cross_entropy.hpp"
#include "details/linear.hpp"
#include "details/mse.hpp"
#include "details/quantize.hpp"
#include "details/relu.hpp"
#include "details/scale.hpp"

namespace Sigma::Function {
    using LinearFunction = Details::LinearFunction;
    using Conv2dFunction = Details::Conv2dFunction;
    using BatchNorm2dFunction = Details::BatchNorm2dFunction;
    using BackPoolFunction = Details::BackPoolFunction;
    using TimesFunction = Details::TimesFunction;
    using ReLUFunction = Details::ReLUFunction;
    using QuantizeFunction = Details::QuantizeFunction;
    using MSEFunction = Details::MSEFunction;
    using CrossEntropyFunction = Details::CrossEntropyFunction;

    [[nodiscard]] inline Pair to_pair(torch::autograd::variable_list outputs) {
        return {std::move(outputs[0]), std::move(outputs[1])};
    }

    [[nodiscard]] inline Pair linear(const Pair& input,
                                     const torch::Tensor& weight,
                                     const torch::Tensor& weight_variance,
                                     const torch::Tensor& bias = {}) {
        return to_pair(LinearFunction::apply(input.value, input.variance, weight, weight_variance, bias));
    }

    [[nodiscard]] inline Pair conv2d(const Pair& input,
                                     const torch::Tensor& weight,
                                     const torch::Tensor& weight_variance,
                                     const torch::Tensor& bias = {},
                                     std::vector<std::int64_t> stride = {1, 1},
                                     std::vector<std::int64_t> padding = {0, 0},
                                     std::vector<std::int64_t> dilation = {1, 1},
                                     std::int64_t groups = 1) {
        return to_pair(Conv2dFunction::apply(input.value, input.variance, weight, weight_variance, bias,
                                             std::move(stride), std::move(padding), std::move(dilation), groups));
    }

    [[nodiscard]] inline Pair batch_norm2d(const Pair& input,
                                           const torch::Tensor& running_mean,
                                           const torch::Tensor& running_var,
                                           const torch::Tensor& weight = {},
                                           const torch::Tensor& bias = {},
                                           bool training = false,
                                           double momentum = 0.1,
                                           double eps = 1e-5) {
        return to_pair(BatchNorm2dFunction::apply(input.value, input.variance, running_mean, running_var, weight, bias,
                                                  training, momentum, eps));
    }

    [[nodiscard]] inline Pair back_pool(const Pair& input, double factor) {
        return to_pair(BackPoolFunction::apply(input.value, input.variance, factor));
    }

    [[nodiscard]] inline Pair times(const Pair& input, double factor) {
        return to_pair(TimesFunction::apply(input.value, input.variance, factor));
    }

    [[nodiscard]] inline Pair relu(const Pair& input) {
        return to_pair(ReLUFunction::apply(input.value, input.variance));
    }

    [[nodiscard]] inline torch::Tensor quantize(const torch::Tensor& input, std::int64_t bits) {
        return QuantizeFunction::apply(input, bits);
    }

    [[nodiscard]] inline torch::Tensor mse(const Pair& input, const torch::Tensor& target,
                                           std::int64_t reduction = at::Reduction::Mean) {
        return MSEFunction::apply(input.value, input.variance, target, reduction);
    }

    [[nodiscard]] inline torch::Tensor cross_entropy(const Pair& input, const torch::Tensor& target,
                                                     std::int64_t reduction = at::Reduction::Mean,
                                                     std::int64_t ignore_index = -100,
                                                     std::string dump_path = {}) {
        return CrossEntropyFunction::apply(input.value, input.variance, target, reduction, ignore_index,
                                           std::move(dump_path));
    }
}

#endif // SIGMA_FUNCTION_HPP
