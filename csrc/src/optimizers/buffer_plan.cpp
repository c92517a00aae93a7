// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/buffer_plan.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

namespace shampoo {

BufferPlan distribute_buffer_sizes(const std::vector<std::size_t>& sizes, int group_size) {
    if (group_size < 1) {
        throw std::invalid_argument(fmt::format("Invalid group size {}", group_size));
    }

    BufferPlan plan;
    plan.GroupSize = group_size;
    plan.Loads.assign(group_size, 0);
    plan.Items.resize(sizes.size());

    std::vector<std::size_t> order(sizes.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        plan.Items[i].Bytes = align_up(sizes[i], BUFFER_ALIGNMENT_BYTES);
    }
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return plan.Items[a].Bytes > plan.Items[b].Bytes;
    });

    for (std::size_t idx : order) {
        // min_element returns the first minimum: lowest worker index wins ties
        auto lightest = std::min_element(plan.Loads.begin(), plan.Loads.end());
        plan.Items[idx].Owner = static_cast<int>(std::distance(plan.Loads.begin(), lightest));
        *lightest += plan.Items[idx].Bytes;
    }

    plan.SharedSize = *std::max_element(plan.Loads.begin(), plan.Loads.end());
    return plan;
}

std::vector<BufferRegion> split_buffer(const BufferPlan& plan) {
    std::vector<std::size_t> cursor(plan.GroupSize, 0);
    std::vector<BufferRegion> regions;
    regions.reserve(plan.Items.size());
    for (const auto& item : plan.Items) {
        if (item.Owner < 0 || item.Owner >= plan.GroupSize) {
            throw std::logic_error(fmt::format("Buffer owner {} outside of group of {}", item.Owner, plan.GroupSize));
        }
        std::size_t& used = cursor[item.Owner];
        if (used + item.Bytes > plan.SharedSize) {
            throw std::logic_error(fmt::format("Buffer of {} bytes does not fit into slice of worker {}", item.Bytes, item.Owner));
        }
        regions.push_back({static_cast<std::size_t>(item.Owner) * plan.SharedSize + used, item.Bytes, item.Owner});
        used += item.Bytes;
    }
    return regions;
}

} // namespace shampoo
