// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/grafting.h"

#include <algorithm>
#include <cmath>
#include <vector>

#include "utilities/allocator.h"

namespace shampoo {

namespace {

double l2_norm(const double* x, long n) {
    double sum = 0.0;
    for (long i = 0; i < n; ++i) {
        sum += x[i] * x[i];
    }
    return std::sqrt(sum);
}

double inf_norm(const double* x, long n) {
    double result = 0.0;
    for (long i = 0; i < n; ++i) {
        result = std::max(result, std::abs(x[i]));
    }
    return result;
}

} // namespace

GraftingState::GraftingState(EGraftingType type, ETensorDType dtype, long numel, const std::string& name,
                             TensorAllocator& allocator) :
    mType(type), mNumel(numel)
{
    if (type != EGraftingType::NONE && type != EGraftingType::SGD) {
        mAccumulator = allocator.allocate(dtype, name, {numel});
    }
}

bool GraftingState::is_normalized() const {
    return mType == EGraftingType::ADAGRAD_NORMALIZED || mType == EGraftingType::RMSPROP_NORMALIZED ||
           mType == EGraftingType::ADAM_NORMALIZED;
}

double GraftingState::beta2(const ParamGroupOptions& options) const {
    switch (mType) {
        case EGraftingType::ADAGRAD:
        case EGraftingType::ADAGRAD_NORMALIZED:
            return 1.0;
        default:
            return options.grafting_beta2;
    }
}

double GraftingState::bias_correction(const ParamGroupOptions& options, int step) const {
    const bool adam = mType == EGraftingType::ADAM || mType == EGraftingType::ADAM_NORMALIZED;
    const double b2 = beta2(options);
    return adam && b2 < 1.0 ? 1.0 - std::pow(b2, step) : 1.0;
}

void GraftingState::update(const double* grad, const ParamGroupOptions& options) {
    if (!has_accumulator()) {
        return;
    }

    double scale = 1.0;
    if (is_normalized()) {
        const double norm = l2_norm(grad, mNumel);
        if (norm > 0.0) {
            scale = 1.0 / norm;
        }
    }

    const double b2 = beta2(options);
    std::vector<double> acc(mNumel);
    load_range(mAccumulator, 0, mNumel, acc.data());
    for (long i = 0; i < mNumel; ++i) {
        const double g = grad[i] * scale;
        acc[i] = b2 == 1.0 ? acc[i] + g * g : b2 * acc[i] + (1.0 - b2) * g * g;
    }
    store_range(mAccumulator, 0, mNumel, acc.data());
}

void GraftingState::precondition(const double* grad, const ParamGroupOptions& options, int step, double* out) const {
    if (!has_accumulator()) {
        std::copy_n(grad, mNumel, out);
        return;
    }

    // normalized variants only normalize what they accumulate
    const double bc = bias_correction(options, step);
    std::vector<double> acc(mNumel);
    load_range(mAccumulator, 0, mNumel, acc.data());
    for (long i = 0; i < mNumel; ++i) {
        out[i] = grad[i] / (std::sqrt(acc[i] / bc) + options.grafting_epsilon);
    }
}

void GraftingState::reset() {
    if (has_accumulator()) {
        fill_zero(mAccumulator);
    }
}

double grafting_scale(const double* grafted, const double* preconditioned, long n) {
    return inf_norm(grafted, n) / (inf_norm(preconditioned, n) + 1e-16);
}

} // namespace shampoo
