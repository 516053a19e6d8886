#ifndef SIGMA_QUANTIZE_HPP
#define SIGMA_QUANTIZE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../core.hpp"
#include "../../function/function.hpp"
#include "../registry.hpp"

namespace Sigma::Layer::Details {

    struct QuantizeOptions {
        std::int64_t bits{8};
    };

    // Rounds the value onto a 2^bits grid; the S channel is left untouched.
    class QuantizeImpl : public torch::nn::Module {
    public:
        explicit QuantizeImpl(QuantizeOptions options) : options_(options)
        {
            if (options_.bits < 1) {
                throw std::invalid_argument("Quantize requires at least one bit.");
            }
        }

        [[nodiscard]] Pair forward(const Pair& input)
        {
            require_matching(input, "Quantize");
            return {::Sigma::Function::quantize(input.value, options_.bits), input.variance};
        }

        [[nodiscard]] const QuantizeOptions& options() const noexcept { return options_; }

    private:
        QuantizeOptions options_{};
    };

    TORCH_MODULE(Quantize);

    struct QuantizeDescriptor {
        QuantizeOptions options{};
        ::Sigma::Activation::Descriptor activation{::Sigma::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const QuantizeDescriptor& descriptor, std::size_t index)
    {
        return register_holder(owner, "quantize_" + std::to_string(index), Quantize(descriptor.options),
                               descriptor.activation.type);
    }

}

#endif //SIGMA_QUANTIZE_HPP
