// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/size_model.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

namespace shampoo {

const char* to_str(ECurvatureKind kind) {
    switch (kind) {
        case ECurvatureKind::FULL: return "full";
        case ECurvatureKind::BLOCK: return "block";
        case ECurvatureKind::DIAGONAL: return "diagonal";
    }
    return "unknown";
}

long BlockSpec::numel() const {
    return shape_numel(Extents);
}

std::vector<long> merge_small_dims(const std::vector<long>& shape, long max_dim) {
    if (shape.empty()) {
        return {1};
    }
    std::vector<long> merged = {shape.front()};
    for (std::size_t i = 1; i < shape.size(); ++i) {
        if (merged.back() * shape[i] <= max_dim) {
            merged.back() *= shape[i];
        } else {
            merged.push_back(shape[i]);
        }
    }
    return merged;
}

std::vector<long> split_extent(long extent, long max_dim) {
    std::vector<long> chunks;
    for (long begin = 0; begin < extent; begin += max_dim) {
        chunks.push_back(std::min(max_dim, extent - begin));
    }
    if (chunks.empty()) {
        chunks.push_back(0);
    }
    return chunks;
}

std::vector<BlockSpec> split_into_blocks(const std::vector<long>& shape, long max_dim) {
    std::vector<BlockSpec> blocks = {BlockSpec{}};
    for (long extent : shape) {
        const auto chunks = split_extent(extent, max_dim);
        std::vector<BlockSpec> next;
        next.reserve(blocks.size() * chunks.size());
        // earlier dimensions vary slowest: row-major block order
        for (const auto& block : blocks) {
            long offset = 0;
            for (long chunk : chunks) {
                BlockSpec refined = block;
                refined.Offsets.push_back(offset);
                refined.Extents.push_back(chunk);
                next.push_back(std::move(refined));
                offset += chunk;
            }
        }
        blocks = std::move(next);
    }
    return blocks;
}

namespace {

// Calls fn(block_offset, tensor_offset, count) for every contiguous innermost row of the block.
template<typename Fn>
void for_each_block_row(const std::vector<long>& shape, const BlockSpec& block, Fn&& fn) {
    const std::size_t rank = shape.size();
    if (block.Offsets.size() != rank || block.Extents.size() != rank) {
        throw std::logic_error(fmt::format("Block of rank {} does not match tensor of rank {}", block.Extents.size(), rank));
    }
    if (rank == 0 || block.numel() == 0) {
        return;
    }

    std::vector<long> strides(rank, 1);
    for (std::size_t k = rank - 1; k > 0; --k) {
        strides[k - 1] = strides[k] * shape[k];
    }

    const long row = block.Extents.back();
    const long rows = block.numel() / row;
    std::vector<long> index(rank - 1, 0);
    for (long r = 0; r < rows; ++r) {
        long offset = block.Offsets.back();
        for (std::size_t k = 0; k + 1 < rank; ++k) {
            offset += (block.Offsets[k] + index[k]) * strides[k];
        }
        fn(r * row, offset, row);

        // advance the multi-index over all but the innermost dimension
        for (std::size_t k = rank - 1; k > 0; --k) {
            if (++index[k - 1] < block.Extents[k - 1]) {
                break;
            }
            index[k - 1] = 0;
        }
    }
}

} // namespace

void gather_block(const double* src, const std::vector<long>& shape, const BlockSpec& block, double* dst) {
    for_each_block_row(shape, block, [&](long block_offset, long tensor_offset, long count) {
        std::copy_n(src + tensor_offset, count, dst + block_offset);
    });
}

void scatter_block(const double* src, const std::vector<long>& shape, const BlockSpec& block, double* dst) {
    for_each_block_row(shape, block, [&](long block_offset, long tensor_offset, long count) {
        std::copy_n(src + block_offset, count, dst + tensor_offset);
    });
}

CurvaturePlan classify(const std::vector<long>& shape, const ShampooConfig& config) {
    for (long extent : shape) {
        if (extent < 0) {
            throw std::invalid_argument(fmt::format("Invalid tensor shape {}", shape_to_str(shape)));
        }
    }

    const long max_dim = config.max_preconditioner_dim;
    CurvaturePlan plan;
    plan.PreconditionedShape = shape.empty() ? std::vector<long>{1} : shape;
    const auto& pshape = plan.PreconditionedShape;
    const bool any_large = std::any_of(pshape.begin(), pshape.end(), [&](long d) { return d > max_dim; });

    switch (config.large_dim_method) {
        case ELargeDimMethod::BLOCKING: {
            if (config.use_merge_dims) {
                plan.PreconditionedShape = merge_small_dims(shape, max_dim);
            }
            plan.Blocks = split_into_blocks(plan.PreconditionedShape, max_dim);
            plan.Kind = plan.Blocks.size() == 1 ? ECurvatureKind::FULL : ECurvatureKind::BLOCK;
            plan.DiagonalDims.assign(plan.PreconditionedShape.size(), false);
            break;
        }
        case ELargeDimMethod::ADAGRAD: {
            plan.Kind = any_large ? ECurvatureKind::DIAGONAL : ECurvatureKind::FULL;
            plan.Blocks = {BlockSpec{std::vector<long>(pshape.size(), 0), pshape}};
            plan.DiagonalDims.assign(pshape.size(), false);
            break;
        }
        case ELargeDimMethod::DIAGONAL: {
            plan.Kind = ECurvatureKind::FULL;
            plan.Blocks = {BlockSpec{std::vector<long>(pshape.size(), 0), pshape}};
            for (long d : pshape) {
                plan.DiagonalDims.push_back(d > max_dim);
            }
            break;
        }
    }
    return plan;
}

std::vector<std::size_t> buffer_sizes(const CurvaturePlan& plan, ETensorDType dtype) {
    std::vector<std::size_t> sizes;
    sizes.reserve(plan.Blocks.size());
    for (const auto& block : plan.Blocks) {
        sizes.push_back(static_cast<std::size_t>(block.numel()) * get_dtype_size(dtype));
    }
    return sizes;
}

long preconditioner_parameter_count(const CurvaturePlan& plan) {
    if (plan.Kind == ECurvatureKind::DIAGONAL) {
        return shape_numel(plan.PreconditionedShape);
    }
    long count = 0;
    for (const auto& block : plan.Blocks) {
        for (std::size_t k = 0; k < block.Extents.size(); ++k) {
            const long d = block.Extents[k];
            // statistic + inverse factor
            count += plan.DiagonalDims[k] ? 2 * d : 2 * d * d;
        }
    }
    return count;
}

} // namespace shampoo
