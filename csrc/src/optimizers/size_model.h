// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_SIZE_MODEL_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_SIZE_MODEL_H

#include <cstddef>
#include <vector>

#include "optimizers/shampoo_config.h"

namespace shampoo {

enum class ECurvatureKind : int {
    FULL,       // one Kronecker factor per dimension
    BLOCK,      // independent FULL sub-problems on blocks of the tensor
    DIAGONAL    // elementwise accumulator
};

const char* to_str(ECurvatureKind kind);

//! A rectangular block of the (merged) tensor, in row-major coordinates.
struct BlockSpec {
    std::vector<long> Offsets;
    std::vector<long> Extents;

    [[nodiscard]] long numel() const;
};

/**
 * @brief The curvature strategy chosen for one tensor.
 *
 * `PreconditionedShape` is the shape the statistics are computed over: the tensor shape
 * after dimension merging (BLOCKING) or the plain shape (0-d tensors become {1}).
 * FULL and DIAGONAL plans have exactly one block covering everything.
 */
struct CurvaturePlan {
    ECurvatureKind Kind = ECurvatureKind::FULL;
    std::vector<long> PreconditionedShape;
    std::vector<BlockSpec> Blocks;
    //! Per dimension of PreconditionedShape: use a diagonal factor instead of a full matrix.
    std::vector<bool> DiagonalDims;
};

/**
 * @brief Greedily merges adjacent dimensions while their product stays <= max_dim.
 *
 * Starting from the first dimension, the next dimension is multiplied into the current
 * one if the product does not exceed `max_dim`, otherwise it starts a new dimension.
 * A 0-d shape is treated as {1}.
 */
std::vector<long> merge_small_dims(const std::vector<long>& shape, long max_dim);

//! Cuts `extent` into chunks of `max_dim`, the last chunk possibly smaller.
std::vector<long> split_extent(long extent, long max_dim);

//! Block decomposition of `shape` with every block extent <= max_dim, row-major block order.
std::vector<BlockSpec> split_into_blocks(const std::vector<long>& shape, long max_dim);

/**
 * @brief Copies the elements of `block` out of a row-major tensor of `shape` into contiguous `dst`.
 */
void gather_block(const double* src, const std::vector<long>& shape, const BlockSpec& block, double* dst);

//! Inverse of gather_block: writes the contiguous block data back into the tensor.
void scatter_block(const double* src, const std::vector<long>& shape, const BlockSpec& block, double* dst);

CurvaturePlan classify(const std::vector<long>& shape, const ShampooConfig& config);

//! One communication buffer per block, holding the preconditioned gradient in `dtype`.
std::vector<std::size_t> buffer_sizes(const CurvaturePlan& plan, ETensorDType dtype);

//! Number of scalars the curvature state stores (statistics and inverse factors).
long preconditioner_parameter_count(const CurvaturePlan& plan);

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_SIZE_MODEL_H
