#ifndef SIGMA_LOSS_REDUCTION_HPP
#define SIGMA_LOSS_REDUCTION_HPP

#include <cstdint>

#include <torch/torch.h>

namespace Sigma::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    [[nodiscard]] inline std::int64_t to_torch_reduction(Reduction r) {
        switch (r) {
            case Reduction::Sum:  return at::Reduction::Sum;
            case Reduction::None: return at::Reduction::None;
            case Reduction::Mean:
            default:              return at::Reduction::Mean;
        }
    }

}

#endif // SIGMA_LOSS_REDUCTION_HPP
