// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_UTILITIES_COMM_H
#define NMTCORE_SRC_UTILITIES_COMM_H

#include <cstddef>
#include <functional>
#include <type_traits>
#include <vector>

/**
 * @brief Blocking collectives between training workers.
 *
 * Every collective must be reached by all ranks in lock-step; a rank that skips one
 * deadlocks the run. Workers either run alone (LocalCommunicator) or as threads
 * of one process sharing a std::barrier (run_communicators).
 */
class Communicator {
public:
    virtual ~Communicator() = default;

    virtual void barrier() = 0;

    //! In-place element-wise sum of @p count floats over all ranks.
    virtual void all_reduce_sum(float* data, std::size_t count) = 0;

    long all_reduce_sum(long value);
    double all_reduce_sum(double value);

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int world_size() const { return mWorld; }

    template<typename T>
    std::vector<T> host_all_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(world_size());
        all_gather_bytes_host(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    /**
     * @brief Run @p work on @p nworkers threads, each with its own communicator (blocking).
     *
     * The first exception raised by any worker is rethrown after all threads joined.
     */
    static void run_communicators(int nworkers, const std::function<void(Communicator& comm)>& work);

protected:
    Communicator(int rank, int world) : mRank(rank), mWorld(world) {}

    virtual void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) = 0;

private:
    int mRank;
    int mWorld;
};

//! Single worker; every collective is the identity.
class LocalCommunicator : public Communicator {
public:
    LocalCommunicator() : Communicator(0, 1) {}

    void barrier() override {}
    void all_reduce_sum(float* data, std::size_t count) override {}
    using Communicator::all_reduce_sum;

protected:
    void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;
};

#endif //NMTCORE_SRC_UTILITIES_COMM_H
