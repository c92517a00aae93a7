// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "optimizers/communication_coordinator.h"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "training/logging.h"
#include "utilities/comm.h"

namespace shampoo {

CommunicationCoordinator::CommunicationCoordinator(Communicator* world, int num_workers_per_group, RunLogger* logger) {
    const int group_size = resolve_workers_per_group(num_workers_per_group, world, logger);
    if (!world || group_size == 1) {
        return;
    }

    if (group_size == world->world_size()) {
        mGroup = world;
    } else {
        mOwnedGroup = world->split(group_size);
        mGroup = mOwnedGroup.get();
    }
    mGroupSize = mGroup->world_size();
    mGroupRank = mGroup->rank();
}

CommunicationCoordinator::~CommunicationCoordinator() = default;

int CommunicationCoordinator::resolve_workers_per_group(int requested, const Communicator* world, RunLogger* logger) {
    if (requested < -1 || requested == 0) {
        throw std::invalid_argument(fmt::format(
            "Invalid number of workers per group: {}. Must be >= 1 or -1.", requested));
    }
    if (!world) {
        return 1;
    }

    const int world_size = world->world_size();
    int group_size = requested;
    if (requested == -1) {
        group_size = world->local_world_size();
        if (const char* env = std::getenv("LOCAL_WORLD_SIZE"); env) {
            try {
                group_size = std::stoi(env);
            } catch (const std::exception& e) {
                throw std::invalid_argument(fmt::format("Invalid LOCAL_WORLD_SIZE '{}': {}", env, e.what()));
            }
        }
        if (group_size < 1) {
            throw std::invalid_argument(fmt::format("Invalid local world size {}", group_size));
        }
    }

    if (group_size > world_size) {
        const std::string msg = fmt::format(
            "num_workers_per_group = {} is greater than the world size {}; using {} workers per group",
            group_size, world_size, world_size);
        if (logger) {
            logger->log_warning(0, msg);
        } else {
            fprintf(stderr, "WARNING: %s\n", msg.c_str());
        }
        group_size = world_size;
    }

    if (world_size % group_size != 0) {
        throw std::invalid_argument(fmt::format(
            "Invalid number of workers per group: {}. Must divide the world size {}.", group_size, world_size));
    }
    return group_size;
}

void CommunicationCoordinator::gather_all(std::byte* buffer, std::size_t buffer_bytes, std::size_t shared_size) {
    if (buffer_bytes != shared_size * static_cast<std::size_t>(mGroupSize)) {
        throw std::logic_error(fmt::format("Group buffer of {} bytes does not match {} workers x {} bytes",
                                           buffer_bytes, mGroupSize, shared_size));
    }
    if (!mGroup || shared_size == 0) {
        return;
    }
    mGroup->all_gather_bytes(buffer, buffer + static_cast<std::size_t>(mGroupRank) * shared_size, shared_size);
}

} // namespace shampoo
