#ifndef SIGMA_FLATTEN_HPP
#define SIGMA_FLATTEN_HPP
#include <cstdint>
#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../core.hpp"
#include "../registry.hpp"

namespace Sigma::Layer::Details {

    struct FlattenOptions {
        std::int64_t start_dim{1};
        std::int64_t end_dim{-1};
    };

    class FlattenImpl : public torch::nn::Module {
    public:
        explicit FlattenImpl(FlattenOptions options) : options_(options) {}

        [[nodiscard]] Pair forward(const Pair& input)
        {
            require_matching(input, "Flatten");
            return {input.value.flatten(options_.start_dim, options_.end_dim),
                    input.variance.flatten(options_.start_dim, options_.end_dim)};
        }

        [[nodiscard]] const FlattenOptions& options() const noexcept { return options_; }

    private:
        FlattenOptions options_{};
    };

    TORCH_MODULE(Flatten);


    struct FlattenDescriptor {
        FlattenOptions options{};
        ::Sigma::Activation::Descriptor activation{::Sigma::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FlattenDescriptor& descriptor, std::size_t index)
    {
        return register_holder(owner, "flatten_" + std::to_string(index), Flatten(descriptor.options),
                               descriptor.activation.type);
    }

}

#endif //SIGMA_FLATTEN_HPP
