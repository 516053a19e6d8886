#ifndef SIGMA_POOLING_HPP
#define SIGMA_POOLING_HPP
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../core.hpp"
#include "../../function/function.hpp"
#include "../registry.hpp"

namespace Sigma::Layer::Details {

    // Empty stride means stride == kernel_size.
    struct MaxPool2dOptions {
        std::vector<std::int64_t> kernel_size{2, 2};
        std::vector<std::int64_t> stride{};
    };

    struct AvgPool2dOptions {
        std::vector<std::int64_t> kernel_size{2, 2};
        std::vector<std::int64_t> stride{};
    };

    using PoolingOptions = std::variant<MaxPool2dOptions, AvgPool2dOptions>;

    class PoolingImpl : public torch::nn::Module {
    public:
        explicit PoolingImpl(PoolingOptions options) : options_(std::move(options))
        {
            std::visit(
                [](auto& concrete) {
                    using ::Sigma::Function::Details::expand_pair;
                    concrete.kernel_size = expand_pair(concrete.kernel_size, "kernel_size", 1);
                    if (!concrete.stride.empty()) {
                        concrete.stride = expand_pair(concrete.stride, "stride", 1);
                    }
                },
                options_);
        }

        [[nodiscard]] Pair forward(const Pair& input)
        {
            require_matching(input, "Pooling");
            if (input.value.dim() != 4) {
                throw std::invalid_argument("Pooling expects a 4-D input [B, C, H, W].");
            }
            return std::visit(
                [&](const auto& options) -> Pair {
                    using OptionType = std::decay_t<decltype(options)>;

                    if constexpr (std::is_same_v<OptionType, MaxPool2dOptions>) {
                        // S follows the value's argmax so both channels select the same cells.
                        auto [value, indices] = torch::max_pool2d_with_indices(input.value, options.kernel_size, options.stride);
                        auto variance = input.variance.flatten(2).gather(2, indices.flatten(2)).view_as(value);
                        return {value, variance};
                    } else {
                        auto value = torch::avg_pool2d(input.value, options.kernel_size, options.stride);
                        auto variance = torch::avg_pool2d(input.variance, options.kernel_size, options.stride);
                        const auto area = static_cast<double>(options.kernel_size[0] * options.kernel_size[1]);
                        return ::Sigma::Function::back_pool({value, variance}, 1.0 / area);
                    }
                },
                options_);
        }

        [[nodiscard]] const PoolingOptions& options() const noexcept { return options_; }

    private:
        PoolingOptions options_{};
    };

    TORCH_MODULE(Pooling);

    struct PoolingDescriptor {
        PoolingOptions options{};
        ::Sigma::Activation::Descriptor activation{::Sigma::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const PoolingDescriptor& descriptor, std::size_t index)
    {
        const std::string prefix = std::holds_alternative<MaxPool2dOptions>(descriptor.options) ? "maxpool2d_" : "avgpool2d_";
        return register_holder(owner, prefix + std::to_string(index), Pooling(descriptor.options),
                               descriptor.activation.type);
    }

}

#endif //SIGMA_POOLING_HPP
