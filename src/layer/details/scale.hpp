#ifndef SIGMA_SCALE_HPP
#define SIGMA_SCALE_HPP

#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../core.hpp"
#include "../../function/function.hpp"
#include "../registry.hpp"

namespace Sigma::Layer::Details {

    struct ScaleOptions {
        double factor{1.0};
    };

    class ScaleImpl : public torch::nn::Module {
    public:
        explicit ScaleImpl(ScaleOptions options) : options_(options) {}

        [[nodiscard]] Pair forward(const Pair& input)
        {
            require_matching(input, "Scale");
            return ::Sigma::Function::times(input, options_.factor);
        }

        [[nodiscard]] const ScaleOptions& options() const noexcept { return options_; }

    private:
        ScaleOptions options_{};
    };

    TORCH_MODULE(Scale);

    struct ScaleDescriptor {
        ScaleOptions options{};
        ::Sigma::Activation::Descriptor activation{::Sigma::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const ScaleDescriptor& descriptor, std::size_t index)
    {
        return register_holder(owner, "scale_" + std::to_string(index), Scale(descriptor.options),
                               descriptor.activation.type);
    }

}

#endif //SIGMA_SCALE_HPP
