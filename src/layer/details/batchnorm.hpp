#ifndef SIGMA_BATCHNORM_HPP
#define SIGMA_BATCHNORM_HPP
#include <cstdint>

#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../core.hpp"
#include "../../function/function.hpp"
#include "../registry.hpp"

namespace Sigma::Layer::Details {

    struct BatchNorm2dOptions {
        std::int64_t num_features{};
        double eps{1e-5};
        double momentum{0.1};
        bool affine{true};
    };

    class BatchNorm2dImpl : public torch::nn::Module {
    public:
        explicit BatchNorm2dImpl(BatchNorm2dOptions options) : options_(options)
        {
            reset();
        }

        void reset()
        {
            if (options_.num_features <= 0) {
                throw std::invalid_argument("BatchNorm2d requires a positive number of features.");
            }
            if (options_.affine) {
                weight = register_parameter("weight", torch::ones({options_.num_features}));
                bias = register_parameter("bias", torch::zeros({options_.num_features}));
            }
            running_mean = register_buffer("running_mean", torch::zeros({options_.num_features}));
            running_var = register_buffer("running_var", torch::ones({options_.num_features}));
        }

        // Training mode normalises with batch statistics and updates the running ones.
        [[nodiscard]] Pair forward(const Pair& input)
        {
            require_matching(input, "BatchNorm2d");
            if (input.value.dim() != 4 || input.value.size(1) != options_.num_features) {
                throw std::invalid_argument("BatchNorm2d expects input [B, " + std::to_string(options_.num_features) + ", H, W].");
            }
            return ::Sigma::Function::batch_norm2d(input, running_mean, running_var, weight, bias,
                                                   is_training(), options_.momentum, options_.eps);
        }

        [[nodiscard]] const BatchNorm2dOptions& options() const noexcept { return options_; }

        torch::Tensor weight{};
        torch::Tensor bias{};
        torch::Tensor running_mean{};
        torch::Tensor running_var{};

    private:
        BatchNorm2dOptions options_{};
    };

    TORCH_MODULE(BatchNorm2d);

    struct BatchNorm2dDescriptor {
        BatchNorm2dOptions options{};
        ::Sigma::Activation::Descriptor activation{::Sigma::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const BatchNorm2dDescriptor& descriptor, std::size_t index)
    {
        return register_holder(owner, "batchnorm2d_" + std::to_string(index), BatchNorm2d(descriptor.options),
                               descriptor.activation.type);
    }

}

#endif //SIGMA_BATCHNORM_HPP
