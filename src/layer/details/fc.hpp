#ifndef SIGMA_FC_HPP
#define SIGMA_FC_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../core.hpp"
#include "../../function/function.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"


namespace Sigma::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    class FCImpl : public torch::nn::Module {
    public:
        explicit FCImpl(FCOptions options) : options_(options)
        {
            reset();
        }

        void reset()
        {
            if (options_.in_features <= 0 || options_.out_features <= 0) {
                throw std::invalid_argument("Fully connected layers require positive in/out features.");
            }
            weight = register_parameter("weight", torch::empty({options_.out_features, options_.in_features}));
            weight_variance = register_parameter("weight_variance", torch::zeros({options_.out_features, options_.in_features}));
            if (options_.bias) {
                bias = register_parameter("bias", torch::empty({options_.out_features}));
            }
            reset_parameters();
        }

        void reset_parameters()
        {
            torch::NoGradGuard no_grad;
            torch::nn::init::kaiming_uniform_(weight, std::sqrt(5.0));
            if (bias.defined()) {
                const auto bound = 1.0 / std::sqrt(static_cast<double>(options_.in_features));
                torch::nn::init::uniform_(bias, -bound, bound);
            }
        }

        [[nodiscard]] Pair forward(const Pair& input)
        {
            require_matching(input, "FC");
            return ::Sigma::Function::linear(input, weight, weight_variance, bias);
        }

        [[nodiscard]] const FCOptions& options() const noexcept { return options_; }

        torch::Tensor weight{};
        torch::Tensor weight_variance{};
        torch::Tensor bias{};

    private:
        FCOptions options_{};
    };

    TORCH_MODULE(FC);

    struct FCDescriptor {
        FCOptions options;
        ::Sigma::Activation::Descriptor activation{::Sigma::Activation::Identity};
        ::Sigma::Initialization::Descriptor initialization{::Sigma::Initialization::Default};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FCDescriptor& descriptor, std::size_t index)
    {
        auto registered_layer = register_holder(owner, "fc_" + std::to_string(index), FC(descriptor.options),
                                                descriptor.activation.type);
        ::Sigma::Initialization::Details::apply_module_initialization(
            std::static_pointer_cast<FCImpl>(registered_layer.module), descriptor);
        return registered_layer;
    }
}

#endif //SIGMA_FC_HPP
