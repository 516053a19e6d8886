#ifndef SIGMA_CONV_HPP
#define SIGMA_CONV_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../core.hpp"
#include "../../function/function.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"

namespace Sigma::Layer::Details {

    // Zero padding only.
    struct Conv2dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        std::int64_t groups{1};
        bool bias{true};
    };

    class Conv2dImpl : public torch::nn::Module {
    public:
        explicit Conv2dImpl(Conv2dOptions options) : options_(std::move(options))
        {
            reset();
        }

        void reset()
        {
            if (options_.in_channels <= 0 || options_.out_channels <= 0) {
                throw std::invalid_argument("Conv2d layers require positive channel counts.");
            }
            if (options_.groups <= 0 || options_.in_channels % options_.groups != 0
                || options_.out_channels % options_.groups != 0) {
                throw std::invalid_argument("Conv2d channel counts must be divisible by groups.");
            }
            using ::Sigma::Function::Details::expand_pair;
            options_.kernel_size = expand_pair(options_.kernel_size, "kernel_size", 1);
            options_.stride = expand_pair(options_.stride, "stride", 1);
            options_.padding = expand_pair(options_.padding, "padding", 0);
            options_.dilation = expand_pair(options_.dilation, "dilation", 1);

            const std::vector<std::int64_t> shape{options_.out_channels,
                                                  options_.in_channels / options_.groups,
                                                  options_.kernel_size[0],
                                                  options_.kernel_size[1]};
            weight = register_parameter("weight", torch::empty(shape));
            weight_variance = register_parameter("weight_variance", torch::zeros(shape));
            if (options_.bias) {
                bias = register_parameter("bias", torch::empty({options_.out_channels}));
            }
            reset_parameters();
        }

        void reset_parameters()
        {
            torch::NoGradGuard no_grad;
            torch::nn::init::kaiming_uniform_(weight, std::sqrt(5.0));
            if (bias.defined()) {
                const auto fan_in = weight.size(1) * weight.size(2) * weight.size(3);
                const auto bound = 1.0 / std::sqrt(static_cast<double>(fan_in));
                torch::nn::init::uniform_(bias, -bound, bound);
            }
        }

        [[nodiscard]] Pair forward(const Pair& input)
        {
            require_matching(input, "Conv2d");
            return ::Sigma::Function::conv2d(input, weight, weight_variance, bias,
                                             options_.stride, options_.padding, options_.dilation, options_.groups);
        }

        [[nodiscard]] const Conv2dOptions& options() const noexcept { return options_; }

        torch::Tensor weight{};
        torch::Tensor weight_variance{};
        torch::Tensor bias{};

    private:
        Conv2dOptions options_{};
    };

    TORCH_MODULE(Conv2d);

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Sigma::Activation::Descriptor activation{::Sigma::Activation::Identity};
        ::Sigma::Initialization::Descriptor initialization{::Sigma::Initialization::Default};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const Conv2dDescriptor& descriptor, std::size_t index)
    {
        auto registered_layer = register_holder(owner, "conv2d_" + std::to_string(index), Conv2d(descriptor.options),
                                                descriptor.activation.type);
        ::Sigma::Initialization::Details::apply_module_initialization(
            std::static_pointer_cast<Conv2dImpl>(registered_layer.module), descriptor);
        return registered_layer;
    }

}

#endif //SIGMA_CONV_HPP
