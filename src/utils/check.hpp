#ifndef SIGMA_CHECK_HPP
#define SIGMA_CHECK_HPP

#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Sigma::Check {
    [[nodiscard]] inline bool has_nan(const torch::Tensor& tensor)
    {
        if (!tensor.defined()) {
            return false;
        }
        return torch::isnan(tensor).any().item<bool>();
    }

    // Throws when any of `tensors` holds a NaN. `dump` is written to `dump_path` first.
    inline void ensure_no_nan(const std::string& where,
                              std::initializer_list<std::pair<const char*, torch::Tensor>> tensors,
                              const std::vector<torch::Tensor>& dump = {},
                              const std::string& dump_path = {})
    {
        std::ostringstream offenders;
        bool failed = false;
        for (const auto& [name, tensor] : tensors) {
            if (has_nan(tensor)) {
                offenders << (failed ? ", " : "") << name;
                failed = true;
            }
        }
        if (!failed) {
            return;
        }

        std::ostringstream message;
        message << where << ": NaN detected in " << offenders.str() << '.';
        if (!dump_path.empty() && !dump.empty()) {
            std::vector<torch::Tensor> detached;
            detached.reserve(dump.size());
            for (const auto& tensor : dump) {
                detached.push_back(tensor.detach().to(torch::kCPU));
            }
            torch::save(detached, dump_path);
            message << " Intermediates written to " << dump_path << '.';
        }
        throw std::runtime_error(message.str());
    }
}

#endif // SIGMA_CHECK_HPP
