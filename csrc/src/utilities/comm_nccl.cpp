// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm_nccl.h"

#include <cstdio>
#include <cstring>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <cuda_runtime.h>
#include <nccl.h>
#include <fmt/core.h>

/**
 * @brief Throws a std::runtime_error if a CUDA runtime call failed.
 */
void cuda_check(cudaError_t status, const char* file, int line) {
    if (status != cudaSuccess) {
        [[maybe_unused]] cudaError_t clear_error = cudaGetLastError();
        throw std::runtime_error(fmt::format("CUDA error at {}:{}: {}: {}", file, line,
                                             cudaGetErrorName(status), cudaGetErrorString(status)));
    }
}
#define CUDA_CHECK(err) (cuda_check(err, __FILE__, __LINE__))

/**
 * @brief Throws a std::runtime_error if an NCCL call returned an error.
 *
 * @param status NCCL status code returned by an NCCL API call.
 * @param file Source file where the failing call was made.
 * @param line Source line where the failing call was made.
 */
void nccl_check(ncclResult_t status, const char* file, int line) {
    if (status != ncclSuccess) {
        throw std::runtime_error(fmt::format("NCCL error at {}:{}: {}", file, line, ncclGetErrorString(status)));
    }
}
#define ncclCheck(err) (nccl_check(err, __FILE__, __LINE__))

NCCLCommunicator::NCCLCommunicator(int rank, int world, const void* nccl_id, int local_device) :
    Communicator(rank, world), mDevice(local_device >= 0 ? local_device : rank)
{
    CUDA_CHECK(cudaSetDevice(mDevice));
    ncclCheck(ncclCommInitRank(&mNcclComm, world, *reinterpret_cast<const ncclUniqueId*>(nccl_id), rank));
    // must be created _after_ we set the device
    CUDA_CHECK(cudaStreamCreateWithFlags(&mStream, cudaStreamNonBlocking));
    CUDA_CHECK(cudaMalloc(reinterpret_cast<void**>(&mBarrierBuf), 1));
}

NCCLCommunicator::NCCLCommunicator(int rank, int world, ncclComm_t comm, int local_device) :
    Communicator(rank, world), mNcclComm(comm), mDevice(local_device)
{
    CUDA_CHECK(cudaSetDevice(mDevice));
    CUDA_CHECK(cudaStreamCreateWithFlags(&mStream, cudaStreamNonBlocking));
    CUDA_CHECK(cudaMalloc(reinterpret_cast<void**>(&mBarrierBuf), 1));
}

/**
 * @brief Best-effort teardown; never throws. Errors are reported on stderr.
 */
NCCLCommunicator::~NCCLCommunicator() {
    if (mNcclComm) {
        ncclResult_t async_error = ncclSuccess;
        ncclCommGetAsyncError(mNcclComm, &async_error);
        if (std::uncaught_exceptions() == 0 && async_error == ncclSuccess) {
            if (mStream) cudaStreamSynchronize(mStream);
            ncclCommFinalize(mNcclComm);
            ncclCommDestroy(mNcclComm);
        } else {
            ncclCommAbort(mNcclComm);
        }
    }
    if (mStaging) {
        const cudaError_t st = cudaFree(mStaging);
        if (st != cudaSuccess) {
            fprintf(stderr, "WARNING: cudaFree(staging) failed: %s\n", cudaGetErrorString(st));
            fflush(stderr);
            (void)cudaGetLastError();
        }
    }
    if (mBarrierBuf) {
        (void)cudaFree(mBarrierBuf);
    }
    if (mStream) {
        const cudaError_t st = cudaStreamDestroy(mStream);
        if (st != cudaSuccess) {
            fprintf(stderr, "WARNING: cudaStreamDestroy(nccl_stream) failed: %s\n", cudaGetErrorString(st));
            fflush(stderr);
            (void)cudaGetLastError();
        }
    }
}

void NCCLCommunicator::ensure_staging(std::size_t bytes) {
    if (bytes <= mStagingBytes) return;
    if (mStaging) {
        CUDA_CHECK(cudaFree(mStaging));
        mStaging = nullptr;
    }
    CUDA_CHECK(cudaMalloc(reinterpret_cast<void**>(&mStaging), bytes));
    mStagingBytes = bytes;
}

void NCCLCommunicator::barrier() {
    // ncclAllReduce requires device memory, a single byte is enough
    ncclCheck(ncclAllReduce(mBarrierBuf, mBarrierBuf, 1, ncclChar, ncclSum, mNcclComm, mStream));
    CUDA_CHECK(cudaStreamSynchronize(mStream));
}

void NCCLCommunicator::all_gather_bytes(std::byte* recv, const std::byte* send, std::size_t size) {
    if (size == 0) {
        barrier();
        return;
    }
    const std::size_t total = size * static_cast<std::size_t>(world_size());
    ensure_staging(total);
    std::byte* own_slot = mStaging + static_cast<std::size_t>(rank()) * size;

    CUDA_CHECK(cudaMemcpyAsync(own_slot, send, size, cudaMemcpyHostToDevice, mStream));
    ncclCheck(ncclAllGather(own_slot, mStaging, size, ncclChar, mNcclComm, mStream));
    CUDA_CHECK(cudaMemcpyAsync(recv, mStaging, total, cudaMemcpyDeviceToHost, mStream));
    CUDA_CHECK(cudaStreamSynchronize(mStream));
}

std::unique_ptr<Communicator> NCCLCommunicator::split(int group_size) {
    check_split(group_size);
    ncclComm_t sub = nullptr;
    ncclCheck(ncclCommSplit(mNcclComm, rank() / group_size, rank(), &sub, nullptr));
    return std::unique_ptr<Communicator>(new NCCLCommunicator(rank() % group_size, group_size, sub, mDevice));
}

std::array<std::byte, 128> NCCLCommunicator::generate_nccl_id() {
    ncclUniqueId id;
    ncclCheck(ncclGetUniqueId(&id));
    std::array<std::byte, 128> result;
    static_assert(sizeof(id) == sizeof(result));
    std::memcpy(result.data(), &id, sizeof(id));
    return result;
}

void NCCLCommunicator::run_communicators(int ngpus, std::function<void(Communicator& comm)> work) {
    int gpus_available = 0;
    CUDA_CHECK(cudaGetDeviceCount(&gpus_available));
    if (ngpus == 0) {
        ngpus = gpus_available;
    }
    if (ngpus > gpus_available || ngpus < 1) {
        throw std::runtime_error(fmt::format("Requested {} GPUs, but only {} available", ngpus, gpus_available));
    }

    const auto nccl_id = generate_nccl_id();
    std::vector<std::exception_ptr> exceptions(ngpus);
    std::mutex mutex;
    {
        std::vector<std::jthread> threads;
        threads.reserve(ngpus);
        for (int rank = 0; rank < ngpus; ++rank) {
            threads.emplace_back([&, rank]() {
                try {
                    NCCLCommunicator comm(rank, ngpus, nccl_id.data(), rank);
                    work(comm);
                    comm.barrier();
                } catch (...) {
                    std::lock_guard<std::mutex> lock(mutex);
                    exceptions[rank] = std::current_exception();
                }
            });
        }
    }

    for (int t = 0; t < ngpus; ++t) {
        if (exceptions[t]) {
            fprintf(stderr, "Thread %d exited with uncaught exception\n", t);
            fflush(stderr);
            std::rethrow_exception(exceptions[t]);
        }
    }
}
