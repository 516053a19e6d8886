#include <catch2/catch_all.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../include/Sigma.h"
#include "tensor_helpers.hpp"

using SigmaTest::matches;
using SigmaTest::doubles;

namespace {

struct Geometry {
    std::string label;
    std::int64_t in_channels;
    std::int64_t out_channels;
    std::vector<std::int64_t> kernel;
    std::vector<std::int64_t> stride;
    std::vector<std::int64_t> padding;
    std::vector<std::int64_t> dilation;
    std::int64_t groups;
    bool bias;
    std::int64_t height;
    std::int64_t width;
};

void check_geometry(const Geometry& g) {
    INFO(g.label);
    torch::manual_seed(7);
    const auto batch = 2;
    auto x = torch::randn({batch, g.in_channels, g.height, g.width}, doubles(true));
    auto w = torch::randn({g.out_channels, g.in_channels / g.groups, g.kernel[0], g.kernel[1]}, doubles(true));
    auto b = g.bias ? torch::randn({g.out_channels}, doubles(true)) : torch::Tensor();
    auto x_var = torch::ones_like(x).set_requires_grad(true);
    auto w_var = torch::zeros_like(w).set_requires_grad(true);

    auto out = Sigma::Function::conv2d({x, x_var}, w, w_var, b, g.stride, g.padding, g.dilation, g.groups);
    auto reference = torch::conv2d(x.detach(), w.detach(), g.bias ? b.detach() : torch::Tensor(),
                                   g.stride, g.padding, g.dilation, g.groups);
    REQUIRE(matches(out.value, reference));
    REQUIRE(matches(out.variance, torch::ones_like(reference)));

    auto upstream = torch::randn(reference.sizes(), doubles());
    auto upstream_variance = torch::rand(reference.sizes(), doubles());
    ((out.value * upstream).sum() + (out.variance * upstream_variance).sum()).backward();

    auto rx = x.detach().clone().set_requires_grad(true);
    auto rw = w.detach().clone().set_requires_grad(true);
    auto rb = g.bias ? b.detach().clone().set_requires_grad(true) : torch::Tensor();
    (torch::conv2d(rx, rw, rb, g.stride, g.padding, g.dilation, g.groups) * upstream).sum().backward();

    REQUIRE(matches(x.grad(), rx.grad()));
    REQUIRE(matches(w.grad(), rw.grad()));
    if (g.bias) {
        REQUIRE(matches(b.grad(), rb.grad()));
    }

    // S references: the same convolution with squared weights, and with squared inputs.
    auto input_reference = torch::zeros_like(x.detach()).set_requires_grad(true);
    (torch::conv2d(input_reference, w.detach().pow(2), {}, g.stride, g.padding, g.dilation, g.groups) * upstream_variance)
        .sum()
        .backward();
    auto weight_reference = torch::zeros_like(w.detach()).set_requires_grad(true);
    (torch::conv2d(x.detach().pow(2), weight_reference, {}, g.stride, g.padding, g.dilation, g.groups) * upstream_variance)
        .sum()
        .backward();

    REQUIRE(matches(x_var.grad(), input_reference.grad()));
    REQUIRE(matches(w_var.grad(), weight_reference.grad()));
}

Sigma::Layer::Details::Conv2d make_conv(const Sigma::Layer::Conv2dOptions& options) {
    return Sigma::Layer::Details::Conv2d(options);
}

} // anonymous namespace

TEST_CASE("conv2d gradients across geometries", "[function][conv2d]") {
    SECTION("plain") {
        check_geometry({"plain", 3, 4, {3, 3}, {1, 1}, {0, 0}, {1, 1}, 1, true, 6, 6});
    }
    SECTION("padded") {
        check_geometry({"padded", 2, 3, {3, 3}, {1, 1}, {1, 1}, {1, 1}, 1, true, 5, 5});
    }
    SECTION("strided with uneven extent") {
        check_geometry({"strided", 2, 3, {3, 3}, {2, 2}, {1, 1}, {1, 1}, 1, true, 6, 7});
    }
    SECTION("dilated rectangular kernel") {
        check_geometry({"dilated", 2, 2, {2, 3}, {1, 2}, {0, 1}, {2, 1}, 1, false, 7, 6});
    }
    SECTION("grouped") {
        check_geometry({"grouped", 4, 6, {3, 3}, {1, 1}, {1, 1}, {1, 1}, 2, true, 5, 5});
    }
    SECTION("depthwise") {
        check_geometry({"depthwise", 3, 3, {3, 3}, {1, 1}, {1, 1}, {1, 1}, 3, false, 4, 4});
    }
}

TEST_CASE("conv2d expands scalar geometry values", "[function][conv2d]") {
    auto x = torch::randn({1, 2, 5, 5}, doubles());
    auto w = torch::randn({3, 2, 3, 3}, doubles());
    auto out = Sigma::Function::conv2d(Sigma::seed(x), w, torch::zeros_like(w), {}, {2}, {1}, {1}, 1);
    REQUIRE(matches(out.value, torch::conv2d(x, w, {}, 2, 1)));
}

TEST_CASE("conv2d rejects inconsistent groups", "[function][conv2d]") {
    auto x = torch::randn({1, 4, 5, 5});
    auto w = torch::randn({3, 2, 3, 3});
    REQUIRE_THROWS_AS(Sigma::Function::conv2d(Sigma::seed(x), w, torch::zeros_like(w), {}, {1, 1}, {0, 0}, {1, 1}, 2),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(make_conv({.in_channels = 3, .out_channels = 4, .groups = 2}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_conv({.in_channels = 2, .out_channels = 2, .stride = {1, 1, 1}}), std::invalid_argument);
}

TEST_CASE("conv2d rejects non-positive geometry", "[layer][conv2d]") {
    REQUIRE_THROWS_AS(make_conv({.in_channels = 2, .out_channels = 2, .kernel_size = {0, 3}}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_conv({.in_channels = 2, .out_channels = 2, .stride = {0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_conv({.in_channels = 2, .out_channels = 2, .dilation = {1, -1}}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_conv({.in_channels = 2, .out_channels = 2, .padding = {-1}}), std::invalid_argument);
    REQUIRE_NOTHROW(make_conv({.in_channels = 2, .out_channels = 2, .padding = {0}}));

    auto x = torch::randn({1, 2, 5, 5});
    auto w = torch::randn({2, 2, 3, 3});
    REQUIRE_THROWS_AS(Sigma::Function::conv2d(Sigma::seed(x), w, torch::zeros_like(w), {}, {0}, {0}, {1}, 1),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Sigma::Function::conv2d(Sigma::seed(x), w, torch::zeros_like(w), {}, {1}, {-2}, {1}, 1),
                      std::invalid_argument);
}

TEST_CASE("conv2d layer wraps the function", "[layer][conv2d]") {
    torch::manual_seed(11);
    auto layer = make_conv({.in_channels = 2, .out_channels = 4, .kernel_size = {3}, .padding = {1}});
    REQUIRE(layer->weight.sizes() == torch::IntArrayRef({4, 2, 3, 3}));
    REQUIRE(layer->weight_variance.sizes() == layer->weight.sizes());

    auto input = Sigma::seed(torch::randn({2, 2, 6, 6}));
    auto out = layer->forward(input);
    REQUIRE(out.value.sizes() == torch::IntArrayRef({2, 4, 6, 6}));
    out.variance.sum().backward();

    REQUIRE(layer->weight_variance.grad().defined());
    REQUIRE(layer->weight_variance.grad().min().item<double>() >= 0.0);
    REQUIRE(input.variance.grad().min().item<double>() >= 0.0);
}
