#ifndef SIGMA_INITIALIZATION_APPLY_HPP
#define SIGMA_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include "initialization.hpp"

namespace Sigma::Initialization::Details {
    namespace detail {
        // Returns false when the layer keeps the weights drawn by its own reset_parameters().
        inline bool draw_weight(torch::Tensor weight, Type type) {
            switch (type) {
                case Type::XavierNormal:
                    torch::nn::init::xavier_normal_(weight);
                    return true;
                case Type::XavierUniform:
                    torch::nn::init::xavier_uniform_(weight);
                    return true;
                case Type::KaimingNormal:
                    torch::nn::init::kaiming_normal_(weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                    return true;
                case Type::KaimingUniform:
                    torch::nn::init::kaiming_uniform_(weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                    return true;
                case Type::ZeroBias:
                case Type::Default:
                default:
                    return false;
            }
        }

        template <class Module>
        inline void zero_bias_if_present(const Module& module) {
            if constexpr (requires { module->bias; }) {
                if (module->bias.defined()) {
                    torch::nn::init::zeros_(module->bias);
                }
            }
        }

        // S accumulators restart from zero, stale S gradients included.
        template <class Module>
        inline void reset_variance_if_present(const Module& module) {
            if constexpr (requires { module->weight_variance; }) {
                auto& variance = module->weight_variance;
                if (!variance.defined()) {
                    return;
                }
                torch::nn::init::zeros_(variance);
                if (variance.grad().defined()) {
                    variance.mutable_grad().zero_();
                }
            }
        }
    }  // namespace detail

    template <class Module, class Descriptor>
    inline void apply_module_initialization(const Module& module, const Descriptor& descriptor) {
        torch::NoGradGuard no_grad;
        const auto type = descriptor.initialization.type;
        if (detail::draw_weight(module->weight, type) || type == Type::ZeroBias) {
            detail::zero_bias_if_present(module);
        }
        detail::reset_variance_if_present(module);
    }
}
#endif // SIGMA_INITIALIZATION_APPLY_HPP
