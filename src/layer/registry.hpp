#ifndef SIGMA_LAYER_REGISTRY_HPP
#define SIGMA_LAYER_REGISTRY_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../core.hpp"

namespace Sigma::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const std::shared_ptr<Impl>& pointer)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>,
                      "Shared pointer implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(pointer);
    }

    struct RegisteredLayer {
        struct ForwardBinding {
            using Invoker = Pair (*)(void*, const Pair&);

            Invoker invoke{nullptr};
            void* context{nullptr};

            [[nodiscard]] explicit operator bool() const noexcept { return invoke != nullptr; }

            Pair operator()(const Pair& input) const
            {
                if (!invoke) {
                    throw std::logic_error("Attempted to invoke an empty forward binding.");
                }
                return invoke(context, input);
            }
        };

        template <class Module>
        void bind_module_forward(Module* module)
        {
            forward = ForwardBinding{&dispatch_module<Module>, module};
        }

        // Layer forward followed by its activation.
        Pair operator()(const Pair& input) const
        {
            return ::Sigma::Activation::Details::apply(activation, forward(input));
        }

        ForwardBinding forward{};
        ::Sigma::Activation::Type activation{::Sigma::Activation::Type::Identity};
        std::shared_ptr<torch::nn::Module> module{};
        std::string name{};

    private:
        template <class Module>
        static Pair dispatch_module(void* context, const Pair& input)
        {
            auto* module = static_cast<Module*>(context);
            return module->forward(input);
        }
    };

    template <class Owner, class Descriptor>
    RegisteredLayer build_registered_layer(Owner&, const Descriptor&, std::size_t) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_registered_layer.");
        return {};
    }

    template <class Owner, class... DescriptorTypes>
    RegisteredLayer build_registered_layer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor, std::size_t index) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_registered_layer(owner, concrete_descriptor, index);
            },
            descriptor);
    }

    template <class Owner, class Holder>
    RegisteredLayer register_holder(Owner& owner, const std::string& name, Holder holder, ::Sigma::Activation::Type activation)
    {
        auto module = owner.register_module(name, std::move(holder));

        RegisteredLayer registered_layer{};
        registered_layer.activation = activation;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.name = name;
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }
}
#endif // SIGMA_LAYER_REGISTRY_HPP
