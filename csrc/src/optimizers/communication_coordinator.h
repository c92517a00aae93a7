// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_OPTIMIZERS_COMMUNICATION_COORDINATOR_H
#define DISTSHAMPOO_SRC_OPTIMIZERS_COMMUNICATION_COORDINATOR_H

#include <cstddef>
#include <memory>

class Communicator;
class RunLogger;

namespace shampoo {

/**
 * @brief Owns the worker group of the calling worker and the per-step all-gather.
 *
 * The world is cut into consecutive groups of G workers; every group holds a full copy of
 * the preconditioned gradients after `gather_all`. Without a communicator, or with G == 1,
 * the calling worker owns every buffer and no communication happens.
 */
class CommunicationCoordinator {
public:
    /**
     * @brief Collective when 1 < G < world size: every worker must construct its coordinator
     * in the same order relative to other collectives.
     * @param world May be null for a single worker. Must outlive the coordinator.
     * @throws std::invalid_argument If the group size does not divide the world size.
     */
    CommunicationCoordinator(Communicator* world, int num_workers_per_group, RunLogger* logger = nullptr);
    ~CommunicationCoordinator();

    CommunicationCoordinator(const CommunicationCoordinator&) = delete;
    CommunicationCoordinator& operator=(const CommunicationCoordinator&) = delete;

    /**
     * @brief Resolves the requested group size against the world.
     *
     * -1 selects the LOCAL_WORLD_SIZE environment variable, or the local world size of the
     * communicator if unset. Values larger than the world are clamped with a warning.
     */
    static int resolve_workers_per_group(int requested, const Communicator* world, RunLogger* logger);

    /**
     * @brief In-place all-gather of each worker's `shared_size`-byte slice of `buffer`.
     *
     * Worker r contributes `[r * shared_size, (r + 1) * shared_size)`; afterwards every
     * worker of the group holds all slices at the same offsets. No-op if G == 1.
     * @throws std::logic_error If `buffer_bytes` != shared_size * G.
     */
    void gather_all(std::byte* buffer, std::size_t buffer_bytes, std::size_t shared_size);

    [[nodiscard]] int group_size() const { return mGroupSize; }
    [[nodiscard]] int group_rank() const { return mGroupRank; }
    [[nodiscard]] bool is_distributed() const { return mGroupSize > 1; }

private:
    std::unique_ptr<Communicator> mOwnedGroup;
    Communicator* mGroup = nullptr;
    int mGroupSize = 1;
    int mGroupRank = 0;
};

} // namespace shampoo

#endif // DISTSHAMPOO_SRC_OPTIMIZERS_COMMUNICATION_COORDINATOR_H
