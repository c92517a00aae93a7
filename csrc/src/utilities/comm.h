// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef DISTSHAMPOO_SRC_UTILITIES_COMM_H
#define DISTSHAMPOO_SRC_UTILITIES_COMM_H

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

class CommunicatorThreadsPack {
public:
    virtual ~CommunicatorThreadsPack() = default;
    virtual void join() = 0;
    virtual bool has_exception() const = 0;
};

/**
 * @brief Collective communication context consumed by the optimizer.
 *
 * The optimizer only needs a handful of host-side collectives: a barrier, a fixed-size
 * all-gather of bytes, and the ability to carve the world into consecutive sub-groups.
 * Implementations: the in-process threaded communicator below and the NCCL-backed one
 * in comm_nccl.h.
 */
class Communicator {
public:
    Communicator(int rank, int world);
    virtual ~Communicator();

    virtual void barrier() = 0;

    /**
     * @brief All-gather `size` bytes from every rank into `recv` (size * world_size() bytes), rank order.
     *
     * `send` may alias `recv + rank() * size`, which turns this into an in-place gather.
     */
    virtual void all_gather_bytes(std::byte* recv, const std::byte* send, std::size_t size) = 0;

    /**
     * @brief Collective: split the world into consecutive groups of `group_size` ranks.
     *
     * Rank r joins group r / group_size with group rank r % group_size. Must be called by
     * every rank, in the same order relative to other collectives.
     * @throws std::invalid_argument If group_size does not divide world_size().
     */
    virtual std::unique_ptr<Communicator> split(int group_size) = 0;

    //! Number of workers sharing this host; defaults to the world size.
    [[nodiscard]] virtual int local_world_size() const { return mWorld; }

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int world_size() const { return mWorld; }

    template<typename T>
    std::vector<T> host_all_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(world_size());
        all_gather_bytes(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    /**
     * @brief Run `work` on `nworkers` in-process workers, one thread each (blocking).
     *
     * Workers communicate through shared memory and std::barrier. Exceptions thrown by any
     * worker are rethrown on the calling thread after all workers have finished.
     */
    static void run_communicators(int nworkers, std::function<void(Communicator& comm)> work);

    //! Same as run_communicators but returns immediately with a joinable pack.
    static std::unique_ptr<CommunicatorThreadsPack> launch_communicators(int nworkers, std::function<void(Communicator& comm)> work);

protected:
    void check_split(int group_size) const;

private:
    int mRank;
    int mWorld;
};

#endif //DISTSHAMPOO_SRC_UTILITIES_COMM_H
