#ifndef SIGMA_LAYER_HPP
#define SIGMA_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "details/batchnorm.hpp"
#include "details/conv.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"
#include "details/pooling.hpp"
#include "details/quantize.hpp"
#include "details/scale.hpp"

#include "registry.hpp"

namespace Sigma::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using Conv2dOptions = Details::Conv2dOptions;
    using Conv2dDescriptor = Details::Conv2dDescriptor;

    using BatchNorm2dOptions = Details::BatchNorm2dOptions;
    using BatchNorm2dDescriptor = Details::BatchNorm2dDescriptor;

    using MaxPool2dOptions = Details::MaxPool2dOptions;
    using AvgPool2dOptions = Details::AvgPool2dOptions;
    using PoolingDescriptor = Details::PoolingDescriptor;

    using ScaleOptions = Details::ScaleOptions;
    using ScaleDescriptor = Details::ScaleDescriptor;

    using QuantizeOptions = Details::QuantizeOptions;
    using QuantizeDescriptor = Details::QuantizeDescriptor;

    using FlattenOptions = Details::FlattenOptions;
    using FlattenDescriptor = Details::FlattenDescriptor;

    using RegisteredLayer = Details::RegisteredLayer;

    using Descriptor = std::variant<FCDescriptor,
                                    Conv2dDescriptor,
                                    BatchNorm2dDescriptor,
                                    PoolingDescriptor,
                                    ScaleDescriptor,
                                    QuantizeDescriptor,
                                    FlattenDescriptor>;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity,
                                 ::Sigma::Initialization::Descriptor initialization = ::Sigma::Initialization::Default) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Conv2d(const Conv2dOptions& options, ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity,
                                     ::Sigma::Initialization::Descriptor initialization = ::Sigma::Initialization::Default) -> Conv2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto BatchNorm2d(const BatchNorm2dOptions& options,
                                          ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity) -> BatchNorm2dDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto MaxPool2d(const MaxPool2dOptions& options,
                                        ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity) -> PoolingDescriptor {
        PoolingDescriptor descriptor{};
        descriptor.options = options;
        descriptor.activation = activation;
        return descriptor;
    }

    [[nodiscard]] inline auto AvgPool2d(const AvgPool2dOptions& options,
                                        ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity) -> PoolingDescriptor {
        PoolingDescriptor descriptor{};
        descriptor.options = options;
        descriptor.activation = activation;
        return descriptor;
    }

    [[nodiscard]] inline auto Scale(const ScaleOptions& options,
                                    ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity) -> ScaleDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto Quantize(const QuantizeOptions& options,
                                       ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity) -> QuantizeDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto Flatten(const FlattenOptions& options = {},
                                      ::Sigma::Activation::Descriptor activation = ::Sigma::Activation::Identity) -> FlattenDescriptor {
        return {options, activation};
    }

    template <class Owner>
    [[nodiscard]] RegisteredLayer build(Owner& owner, const Descriptor& descriptor, std::size_t index) {
        return Details::build_registered_layer(owner, descriptor, index);
    }
}

#endif //SIGMA_LAYER_HPP
