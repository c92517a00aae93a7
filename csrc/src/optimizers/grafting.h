// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_GRAFTING_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_GRAFTING_H

#include <string>

#include "optimizers/shampoo_config.h"
#include "utilities/tensor.h"

class TensorAllocator;

namespace shampoo {

/**
 * @brief Layer-wise reference method whose step magnitude is grafted onto the Shampoo step.
 *
 * Owns its own diagonal second-moment accumulator (none for NONE and SGD); it never shares
 * state with the curvature statistics, only the raw gradient.
 */
class GraftingState {
public:
    GraftingState() = default;
    GraftingState(EGraftingType type, ETensorDType dtype, long numel, const std::string& name, TensorAllocator& allocator);

    //! Blend g^2 (or the normalized gradient squared) into the accumulator.
    void update(const double* grad, const ParamGroupOptions& options);

    //! The step the reference method would take on its own; SGD and NONE return the gradient.
    void precondition(const double* grad, const ParamGroupOptions& options, int step, double* out) const;

    void reset();

    [[nodiscard]] EGraftingType type() const { return mType; }
    [[nodiscard]] long numel() const { return mNumel; }
    [[nodiscard]] bool has_accumulator() const { return mAccumulator.has_value(); }
    [[nodiscard]] Tensor& accumulator() { return mAccumulator; }
    [[nodiscard]] const Tensor& accumulator() const { return mAccumulator; }

    //! Decay of the accumulator: 1 for Adagrad, the group's grafting beta2 otherwise.
    [[nodiscard]] double beta2(const ParamGroupOptions& options) const;
    //! 1 - beta2^step for Adam grafting with beta2 < 1, else 1.
    [[nodiscard]] double bias_correction(const ParamGroupOptions& options, int step) const;

private:
    [[nodiscard]] bool is_normalized() const;

    EGraftingType mType = EGraftingType::NONE;
    long mNumel = 0;
    Tensor mAccumulator;
};

//! ||grafted||_inf / (||preconditioned||_inf + 1e-16)
double grafting_scale(const double* grafted, const double* preconditioned, long n);

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_GRAFTING_H
