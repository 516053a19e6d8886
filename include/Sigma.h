#ifndef SIGMA_LIBRARY_H
#define SIGMA_LIBRARY_H

#include "../src/core.hpp"
#include "../src/utils/check.hpp"
#include "../src/function/function.hpp"
#include "../src/activation/activation.hpp"
#include "../src/initialization/initialization.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/report/report.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Function: custom autograd operators carrying the S channel.
//  - Layer: torch::nn modules and descriptors wrapping those operators.
//  - Loss: loss descriptors that seed the S channel on backward.
//  - Report: S gradient summaries for inspection.
//  - Header-only; link against libtorch.

#endif // SIGMA_LIBRARY_H
