#pragma once

#include "homomorphism/homomorphism.hpp"
#include "model/model_instance.hpp"

#include <vector>

namespace modex {

struct PullbackResult {
    InstancePtr instance;
    std::vector<Homomorphism> projections;  // one per factor
};

/// Limit of factors sliced over a common base (fibre product).
/// Elements of object X are tuples (b, x_1..x_k) with slice_i(x_i) == b
/// for every factor; relations act componentwise. Over the terminal base
/// this is the cartesian product. Tags of the factors are unioned.
PullbackResult computePullback(const ModelInstance& base,
                               const std::vector<InstancePtr>& factors,
                               const std::vector<Homomorphism>& slices);

} // namespace modex
