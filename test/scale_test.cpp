#include <catch2/catch_all.hpp>

#include <stdexcept>

#include <torch/torch.h>

#include "../include/Sigma.h"
#include "tensor_helpers.hpp"

using SigmaTest::matches;
using SigmaTest::doubles;

namespace {

Sigma::Layer::Details::Pooling make_pool(const Sigma::Layer::Details::PoolingOptions& options) {
    return Sigma::Layer::Details::Pooling(options);
}

} // anonymous namespace

TEST_CASE("times scales the value and squares the S factor", "[function][scale]") {
    auto x = torch::randn({3, 4}, doubles(true));
    auto input = Sigma::Pair{x, torch::ones_like(x).set_requires_grad(true)};
    auto upstream = torch::randn({3, 4}, doubles());
    auto upstream_variance = torch::rand({3, 4}, doubles());

    auto out = Sigma::Function::times(input, -1.5);
    REQUIRE(matches(out.value, x.detach() * -1.5));
    REQUIRE(matches(out.variance, torch::ones_like(x)));
    ((out.value * upstream).sum() + (out.variance * upstream_variance).sum()).backward();

    REQUIRE(matches(x.grad(), upstream * -1.5));
    REQUIRE(matches(input.variance.grad(), upstream_variance * 2.25));
}

TEST_CASE("back_pool rescales only the S gradient", "[function][scale]") {
    auto x = torch::randn({2, 3}, doubles(true));
    auto x_var = torch::rand({2, 3}, doubles(true));
    auto upstream = torch::randn({2, 3}, doubles());
    auto upstream_variance = torch::rand({2, 3}, doubles());

    auto out = Sigma::Function::back_pool({x, x_var}, 0.25);
    REQUIRE(matches(out.value, x));
    REQUIRE(matches(out.variance, x_var));
    ((out.value * upstream).sum() + (out.variance * upstream_variance).sum()).backward();

    REQUIRE(matches(x.grad(), upstream));
    REQUIRE(matches(x_var.grad(), upstream_variance * 0.25));
}

TEST_CASE("relu masks both channels", "[function][relu]") {
    auto x = torch::tensor({-2.0, -0.5, 0.5, 3.0}, doubles(true));
    auto input = Sigma::Pair{x, torch::ones_like(x).set_requires_grad(true)};
    auto out = Sigma::Function::relu(input);
    REQUIRE(matches(out.value, torch::tensor({0.0, 0.0, 0.5, 3.0}, doubles())));

    auto upstream_variance = torch::tensor({1.0, 2.0, 3.0, 4.0}, doubles());
    ((out.value * 2.0).sum() + (out.variance * upstream_variance).sum()).backward();
    REQUIRE(matches(x.grad(), torch::tensor({0.0, 0.0, 2.0, 2.0}, doubles())));
    REQUIRE(matches(input.variance.grad(), torch::tensor({0.0, 0.0, 3.0, 4.0}, doubles())));
}

TEST_CASE("max pooling routes S to the argmax cells", "[layer][pooling]") {
    torch::manual_seed(21);
    auto pool = make_pool(Sigma::Layer::MaxPool2dOptions{});
    auto x = torch::randn({2, 3, 4, 6}, doubles(true));
    auto input = Sigma::Pair{x, torch::ones_like(x).set_requires_grad(true)};

    auto out = pool->forward(input);
    auto reference = torch::max_pool2d(x.detach(), {2, 2});
    REQUIRE(matches(out.value, reference));
    REQUIRE(matches(out.variance, torch::ones_like(reference)));

    auto upstream_variance = torch::rand(reference.sizes(), doubles());
    out.variance.mul(upstream_variance).sum().backward();

    auto routed = x.detach().clone().set_requires_grad(true);
    torch::max_pool2d(routed, {2, 2}).mul(upstream_variance).sum().backward();
    REQUIRE(matches(input.variance.grad(), routed.grad()));
}

TEST_CASE("average pooling divides S by the squared window area", "[layer][pooling]") {
    torch::manual_seed(22);
    auto pool = make_pool(Sigma::Layer::AvgPool2dOptions{.kernel_size = {2, 3}});
    auto x = torch::randn({1, 2, 4, 6}, doubles(true));
    auto input = Sigma::Pair{x, torch::ones_like(x).set_requires_grad(true)};

    auto out = pool->forward(input);
    REQUIRE(matches(out.value, torch::avg_pool2d(x.detach(), {2, 3})));

    auto upstream = torch::randn(out.value.sizes(), doubles());
    auto upstream_variance = torch::rand(out.value.sizes(), doubles());
    ((out.value * upstream).sum() + (out.variance * upstream_variance).sum()).backward();

    auto rx = x.detach().clone().set_requires_grad(true);
    torch::avg_pool2d(rx, {2, 3}).mul(upstream).sum().backward();
    REQUIRE(matches(x.grad(), rx.grad()));

    auto spread = torch::repeat_interleave(torch::repeat_interleave(upstream_variance, 2, 2), 3, 3);
    REQUIRE(matches(input.variance.grad(), spread / 36.0));
}

TEST_CASE("scale layer squares its factor on the S path", "[layer][scale]") {
    Sigma::Layer::Details::Scale scale(Sigma::Layer::ScaleOptions{.factor = 3.0});
    auto input = Sigma::seed(torch::ones({2, 2}));
    auto out = scale->forward(input);
    out.variance.sum().backward();
    REQUIRE(matches(input.variance.grad(), torch::full({2, 2}, 9.0)));
}

TEST_CASE("pooling rejects invalid windows and inputs", "[layer][pooling]") {
    REQUIRE_THROWS_AS(make_pool(Sigma::Layer::MaxPool2dOptions{.kernel_size = {2, 2, 2}}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_pool(Sigma::Layer::MaxPool2dOptions{.kernel_size = {0, 2}}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_pool(Sigma::Layer::AvgPool2dOptions{.stride = {0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_pool(Sigma::Layer::MaxPool2dOptions{.stride = {2, -1}}), std::invalid_argument);

    // Unbatched [C, H, W] input is refused rather than mis-gathered.
    auto max_pool = make_pool(Sigma::Layer::MaxPool2dOptions{});
    REQUIRE_THROWS_AS(max_pool->forward(Sigma::seed(torch::randn({3, 4, 4}))), std::invalid_argument);
    auto avg_pool = make_pool(Sigma::Layer::AvgPool2dOptions{});
    REQUIRE_THROWS_AS(avg_pool->forward(Sigma::seed(torch::randn({3, 4, 4}))), std::invalid_argument);
}
