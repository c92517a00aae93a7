// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <atomic>
#include <barrier>
#include <cstdio>
#include <cstring>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/core.h>

Communicator::Communicator(int rank, int world) : mRank(rank), mWorld(world) {
    if(world < 1 || rank < 0 || rank >= world) {
        throw std::invalid_argument(fmt::format("Invalid communicator rank {} for world size {}", rank, world));
    }
}

Communicator::~Communicator() = default;

void Communicator::check_split(int group_size) const {
    if(group_size < 1 || group_size > mWorld) {
        throw std::invalid_argument(fmt::format("Invalid group size {} for world size {}", group_size, mWorld));
    }
    if(mWorld % group_size != 0) {
        throw std::invalid_argument(fmt::format("Group size {} must evenly divide world size {}", group_size, mWorld));
    }
}

/**
 * @brief Communicator for workers running as threads of the same process.
 *
 * All collectives are implemented with a shared std::barrier and direct memcpy between
 * the participating threads' buffers.
 */
class ThreadedCommunicator : public Communicator {
public:
    struct SharedState {
        explicit SharedState(int parties) :
            Barrier(std::make_unique<std::barrier<>>(parties)), Buffer(parties), Dropped(parties), Exceptions(parties) {}

        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<const std::byte*> Buffer;     // one pointer per thread
        std::vector<std::atomic<bool>> Dropped;   // set once a thread leaves the barrier
        std::vector<std::exception_ptr> Exceptions;
        std::mutex Mutex;
        // sub-group states, keyed by (split generation, group index)
        std::map<std::pair<int, int>, std::shared_ptr<SharedState>> Children;
    };

    ThreadedCommunicator(int rank, int world, std::shared_ptr<SharedState> state) :
        Communicator(rank, world), mShare(std::move(state)) {
    }

    /**
     * @brief Drops out of the shared barrier on destruction.
     *
     * The send pointer of the last gather is cleared first; peers still running fail
     * their next gather instead of reading it.
     */
    ~ThreadedCommunicator() override {
        if(mShare && mShare->Barrier) {
            mShare->Buffer[rank()] = nullptr;
            mShare->Dropped[rank()] = true;
            mShare->Barrier->arrive_and_drop();
        }
    }

    void barrier() override {
        mShare->Barrier->arrive_and_wait();
    }

    void all_gather_bytes(std::byte* recv, const std::byte* send, std::size_t size) override;
    std::unique_ptr<Communicator> split(int group_size) override;

private:
    std::shared_ptr<SharedState> mShare;
    int mSplitCount = 0;
};

void ThreadedCommunicator::all_gather_bytes(std::byte* recv, const std::byte* send, std::size_t size) {
    barrier();
    mShare->Buffer[rank()] = send;
    barrier();

    // every live thread sees the same flags here, so all of them fail together
    for(int i = 0; i < world_size(); ++i) {
        if(mShare->Dropped[i]) {
            throw std::runtime_error(fmt::format("all_gather on rank {}: rank {} has already left the communicator", rank(), i));
        }
    }

    // Each thread only writes its own recv buffer, outside of its own slot, so an
    // in-place send slice stays readable for the peers throughout.
    for(int i = 0; i < world_size(); ++i) {
        std::byte* target = recv + static_cast<std::size_t>(i) * size;
        if(target == mShare->Buffer[i] || size == 0) continue;
        if(i == rank()) {
            std::memmove(target, send, size);
        } else {
            std::memcpy(target, mShare->Buffer[i], size);
        }
    }
    barrier();
}

std::unique_ptr<Communicator> ThreadedCommunicator::split(int group_size) {
    check_split(group_size);
    const std::pair<int, int> key{mSplitCount++, rank() / group_size};

    std::shared_ptr<SharedState> child;
    {
        std::lock_guard<std::mutex> lock(mShare->Mutex);
        auto& slot = mShare->Children[key];
        if(!slot) {
            slot = std::make_shared<SharedState>(group_size);
        }
        child = slot;
    }
    // every member holds its reference once this barrier completes
    barrier();
    if(rank() % group_size == 0) {
        std::lock_guard<std::mutex> lock(mShare->Mutex);
        mShare->Children.erase(key);
    }
    return std::make_unique<ThreadedCommunicator>(rank() % group_size, group_size, std::move(child));
}

// ============================================================================
// Thread Pack for managing worker threads
// ============================================================================

class CommunicatorThreadsPackImpl : public CommunicatorThreadsPack {
public:
    CommunicatorThreadsPackImpl(std::vector<std::jthread> threads,
                                std::shared_ptr<ThreadedCommunicator::SharedState> state)
        : mThreads(std::move(threads)), mState(std::move(state)) {}

    ~CommunicatorThreadsPackImpl() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        if (has_exception()) {
            fprintf(stderr, "WARNING: worker exception discarded, join() was never called\n");
            fflush(stderr);
        }
    }

    void join() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        check_exceptions();
    }

    bool has_exception() const override {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (const auto& error : mState->Exceptions) {
            if (error) {
                return true;
            }
        }
        return false;
    }

private:
    void check_exceptions() {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (size_t t = 0; t < mThreads.size(); ++t) {
            if (auto error = mState->Exceptions[t]; error) {
                fprintf(stderr, "Thread %zu exited with uncaught exception\n", t);
                fflush(stderr);
                mState->Exceptions[t] = nullptr;
                std::rethrow_exception(error);
            }
        }
    }

    std::vector<std::jthread> mThreads;
    std::shared_ptr<ThreadedCommunicator::SharedState> mState;
};

std::unique_ptr<CommunicatorThreadsPack> Communicator::launch_communicators(int nworkers, std::function<void(Communicator& comm)> work) {
    if (nworkers < 1) {
        throw std::invalid_argument(fmt::format("Need at least one worker, got {}", nworkers));
    }

    auto shared_state = std::make_shared<ThreadedCommunicator::SharedState>(nworkers);
    auto shared_work = std::make_shared<std::function<void(Communicator&)>>(std::move(work));

    std::vector<std::jthread> threads;
    threads.reserve(nworkers);
    for (int rank = 0; rank < nworkers; ++rank) {
        threads.emplace_back([rank, nworkers, shared_state, shared_work]() {
            try {
                ThreadedCommunicator comm(rank, nworkers, shared_state);
                (*shared_work)(comm);
                comm.barrier();
            } catch (...) {
                std::lock_guard<std::mutex> lock(shared_state->Mutex);
                shared_state->Exceptions[rank] = std::current_exception();
            }
        });
    }

    return std::make_unique<CommunicatorThreadsPackImpl>(std::move(threads), shared_state);
}

void Communicator::run_communicators(int nworkers, std::function<void(Communicator& comm)> work) {
    auto pack = launch_communicators(nworkers, std::move(work));
    pack->join();
}
