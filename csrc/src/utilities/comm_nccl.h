// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_UTILITIES_COMM_NCCL_H
#define DISTSHAMPOO_SRC_UTILITIES_COMM_NCCL_H

#include <array>
#include <cstddef>
#include <functional>
#include <memory>

#include "comm.h"

typedef struct ncclComm* ncclComm_t;
typedef struct CUstream_st* cudaStream_t;

/**
 * @brief Communicator backed by NCCL, one worker per GPU.
 *
 * The optimizer works on host memory, so every collective stages the host bytes through a
 * device buffer: host-to-device copy, ncclAllGather on the device, device-to-host copy.
 */
class NCCLCommunicator : public Communicator {
public:
    NCCLCommunicator(int rank, int world, const void* nccl_id, int local_device = -1);
    ~NCCLCommunicator() override;

    void barrier() override;
    void all_gather_bytes(std::byte* recv, const std::byte* send, std::size_t size) override;
    std::unique_ptr<Communicator> split(int group_size) override;

    [[nodiscard]] int local_device() const { return mDevice; }
    [[nodiscard]] cudaStream_t stream() const { return mStream; }

    /**
     * @brief Run `work` with one thread per local GPU (blocking).
     *
     * @param ngpus Number of local GPUs to use (0 = auto-detect all available).
     * @param work Callable invoked once per GPU with that GPU's communicator.
     */
    static void run_communicators(int ngpus, std::function<void(Communicator& comm)> work);

    /**
     * @brief Generate a new NCCL unique ID.
     * @return 128-byte unique ID that must be shared across all ranks.
     */
    static std::array<std::byte, 128> generate_nccl_id();

private:
    NCCLCommunicator(int rank, int world, ncclComm_t comm, int local_device);
    void ensure_staging(std::size_t bytes);

    ncclComm_t mNcclComm = nullptr;
    cudaStream_t mStream = nullptr;
    int mDevice;
    std::byte* mStaging = nullptr;
    std::size_t mStagingBytes = 0;
    char* mBarrierBuf = nullptr;
};

#endif //DISTSHAMPOO_SRC_UTILITIES_COMM_NCCL_H
