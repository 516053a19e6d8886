#ifndef SIGMA_LOSS_CE_HPP
#define SIGMA_LOSS_CE_HPP
#include <cstdint>
#include <string>

#include <torch/torch.h>

#include "../../core.hpp"
#include "../../function/function.hpp"
#include "reduction.hpp"

namespace Sigma::Loss::Details {
    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::int64_t ignore_index{-100};
        // Where softmax intermediates are saved when the backward pass produces NaN. Empty disables.
        std::string dump_path{};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const Pair& prediction,
                                 const torch::Tensor& target) {
        require_matching(prediction, "CrossEntropy");
        auto indices = target.to(prediction.value.device(), torch::kLong);
        return ::Sigma::Function::cross_entropy(prediction,
                                                indices,
                                                to_torch_reduction(descriptor.options.reduction),
                                                descriptor.options.ignore_index,
                                                descriptor.options.dump_path);
    }
}
#endif //SIGMA_LOSS_CE_HPP
