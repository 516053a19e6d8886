#ifndef SIGMA_LOSS_MSE_HPP
#define SIGMA_LOSS_MSE_HPP

#include <torch/torch.h>

#include "../../core.hpp"
#include "../../function/function.hpp"
#include "reduction.hpp"

namespace Sigma::Loss::Details {

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    // Seeds the S channel with d²L/dx² = 2 (scaled like the reduction).
    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const Pair& prediction,
                                 const torch::Tensor& target)
    {
        require_matching(prediction, "MSE");
        auto aligned = target.to(prediction.value.device(), prediction.value.scalar_type());
        return ::Sigma::Function::mse(prediction, aligned, to_torch_reduction(descriptor.options.reduction));
    }

}

#endif // SIGMA_LOSS_MSE_HPP
