#ifndef SIGMA_REPORT_HPP
#define SIGMA_REPORT_HPP
#pragma once

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../function/details/quantize.hpp"

namespace Sigma::Report {
    inline constexpr const char* kVarianceSuffix = "_variance";

    struct ParameterSplit {
        std::vector<std::pair<std::string, torch::Tensor>> value{};
        std::vector<std::pair<std::string, torch::Tensor>> variance{};
    };

    namespace Details {
        [[nodiscard]] inline bool ends_with(const std::string& text, const std::string& suffix)
        {
            return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        [[nodiscard]] inline std::string format_shape(const std::vector<std::int64_t>& shape)
        {
            if (shape.empty()) {
                return std::string{"()"};
            }

            std::ostringstream stream;
            stream << '(';
            for (std::size_t i = 0; i < shape.size(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << shape[i];
            }
            stream << ')';
            return stream.str();
        }
    }

    // `*_variance` parameters only collect S gradients; hand `value` to the optimizer.
    [[nodiscard]] inline ParameterSplit split_parameters(const torch::nn::Module& module)
    {
        ParameterSplit split{};
        for (const auto& item : module.named_parameters(/*recurse=*/true)) {
            if (Details::ends_with(item.key(), kVarianceSuffix)) {
                split.variance.emplace_back(item.key(), item.value());
            } else {
                split.value.emplace_back(item.key(), item.value());
            }
        }
        return split;
    }

    struct VarianceReport {
        struct Entry {
            std::string name{};
            std::vector<std::int64_t> shape{};
            bool has_gradient{false};
            double gradient_norm{0.0};
            bool has_variance{false};
            double variance_mean{0.0};
            double variance_max{0.0};
        };

        std::vector<Entry> entries{};

        [[nodiscard]] const Entry* find(const std::string& name) const
        {
            for (const auto& entry : entries) {
                if (entry.name == name) {
                    return &entry;
                }
            }
            return nullptr;
        }

        [[nodiscard]] std::string to_string() const
        {
            std::ostringstream stream;
            stream << "Variance report: " << entries.size() << " parameter(s)" << '\n';
            for (const auto& entry : entries) {
                stream << "  " << entry.name << ' ' << Details::format_shape(entry.shape) << '\n';
                if (entry.has_gradient) {
                    stream << "    grad |g|   : " << std::scientific << std::setprecision(4) << entry.gradient_norm << '\n';
                } else {
                    stream << "    grad |g|   : n/a" << '\n';
                }
                if (entry.has_variance) {
                    stream << "    S mean/max : " << std::scientific << std::setprecision(4)
                           << entry.variance_mean << " / " << entry.variance_max << '\n';
                }
                stream << std::defaultfloat;
            }
            return stream.str();
        }
    };

    inline std::ostream& operator<<(std::ostream& stream, const VarianceReport& report)
    {
        return stream << report.to_string();
    }

    // One entry per value parameter; S statistics come from its `<name>_variance` sibling.
    [[nodiscard]] inline VarianceReport collect(const torch::nn::Module& module)
    {
        const auto split = split_parameters(module);

        VarianceReport report{};
        report.entries.reserve(split.value.size());
        for (const auto& [name, parameter] : split.value) {
            VarianceReport::Entry entry{};
            entry.name = name;
            entry.shape = parameter.sizes().vec();

            const auto& gradient = parameter.grad();
            if (gradient.defined()) {
                entry.has_gradient = true;
                entry.gradient_norm = gradient.norm().item<double>();
            }

            const auto sibling = name + kVarianceSuffix;
            for (const auto& [variance_name, variance] : split.variance) {
                if (variance_name != sibling) {
                    continue;
                }
                const auto& variance_gradient = variance.grad();
                if (variance_gradient.defined() && variance_gradient.numel() > 0) {
                    entry.has_variance = true;
                    entry.variance_mean = variance_gradient.mean().item<double>();
                    entry.variance_max = variance_gradient.max().item<double>();
                }
                break;
            }
            report.entries.push_back(std::move(entry));
        }
        return report;
    }

    // Uniform rounding noise on the grid used by Quantize: det² / 12 per element.
    [[nodiscard]] inline torch::Tensor quantization_noise(const torch::Tensor& input, std::int64_t bits)
    {
        if (bits < 1) {
            throw std::invalid_argument("quantization_noise requires at least one bit.");
        }
        if (input.numel() == 0) {
            return torch::zeros_like(input);
        }
        const auto step = ::Sigma::Function::Details::quantization_step(input, bits);
        return torch::full_like(input, 1.0 / 12.0) * step.pow(2);
    }

    // Second-order estimate of the loss increase caused by independent noise of the given variance.
    [[nodiscard]] inline double loss_perturbation(const torch::Tensor& variance_gradient, const torch::Tensor& noise_variance)
    {
        if (!variance_gradient.defined() || !noise_variance.defined()) {
            throw std::invalid_argument("loss_perturbation requires defined tensors.");
        }
        if (variance_gradient.sizes() != noise_variance.sizes()) {
            throw std::invalid_argument("loss_perturbation requires tensors of identical shape.");
        }
        return 0.5 * (variance_gradient.detach() * noise_variance.detach()).sum().item<double>();
    }
}

#endif // SIGMA_REPORT_HPP
