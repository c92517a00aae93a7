// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_BUFFER_PLAN_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_BUFFER_PLAN_H

#include <cstddef>
#include <vector>

namespace shampoo {

constexpr std::size_t BUFFER_ALIGNMENT_BYTES = 64;

struct BufferAssignment {
    std::size_t Bytes;      // aligned size
    int Owner;
};

/**
 * @brief Balanced assignment of communication buffers to the workers of a group.
 *
 * Every worker allocates `SharedSize * GroupSize` bytes; worker w owns the slice
 * `[w * SharedSize, (w + 1) * SharedSize)` and fills its prefix of `Loads[w]` bytes.
 */
struct BufferPlan {
    std::vector<BufferAssignment> Items;    // input order
    std::vector<std::size_t> Loads;         // per worker
    std::size_t SharedSize = 0;
    int GroupSize = 1;

    [[nodiscard]] std::size_t total_bytes() const { return SharedSize * static_cast<std::size_t>(GroupSize); }
};

//! A byte range of the group buffer, bound to one curvature (sub-)state for its lifetime.
struct BufferRegion {
    std::size_t Offset = 0;     // from the start of the group buffer
    std::size_t Bytes = 0;
    int Owner = 0;
};

/**
 * @brief Greedy longest-processing-time assignment of buffer sizes to `group_size` workers.
 *
 * Sizes are rounded up to BUFFER_ALIGNMENT_BYTES, visited largest first (ties keep input
 * order) and each goes to the currently least-loaded worker, lowest index on ties. The
 * result only depends on the input, so every worker computes the same plan on its own.
 */
BufferPlan distribute_buffer_sizes(const std::vector<std::size_t>& sizes, int group_size);

/**
 * @brief Slices the group buffer into one region per plan item, in input order.
 *
 * Each owner's regions are packed back to back from the start of its slice.
 */
std::vector<BufferRegion> split_buffer(const BufferPlan& plan);

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_BUFFER_PLAN_H
