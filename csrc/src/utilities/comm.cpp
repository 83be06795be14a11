// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <barrier>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <thread>

#include <fmt/core.h>

long Communicator::all_reduce_sum(long value) {
    auto all = host_all_gather(value);
    return std::accumulate(all.begin(), all.end(), 0L);
}

double Communicator::all_reduce_sum(double value) {
    auto all = host_all_gather(value);
    return std::accumulate(all.begin(), all.end(), 0.0);
}

void LocalCommunicator::all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    std::memcpy(recv, object, size);
}

// ============================================================================
// Threaded communicator
// ============================================================================

namespace {

/**
 * @brief Communicator for workers running as threads of one process.
 *
 * Uses std::barrier for synchronization and shared memory for data exchange: each
 * rank publishes a pointer to its buffer, all ranks read after a barrier, and a second
 * barrier keeps anyone from overwriting a buffer that is still being read.
 */
class ThreadsCommunicator : public Communicator {
public:
    struct SharedState {
        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<const std::byte*> Buffer;     // one pointer per thread
        std::vector<std::exception_ptr> Exceptions;
        std::mutex Mutex;
    };

    ThreadsCommunicator(int rank, int world, std::shared_ptr<SharedState> state)
        : Communicator(rank, world), mState(std::move(state)) {}

    /**
     * @brief Drops out of the shared barrier so that surviving ranks are not blocked.
     */
    ~ThreadsCommunicator() override {
        mState->Buffer[rank()] = nullptr;
        mState->Barrier->arrive_and_drop();
    }

    void barrier() override {
        mState->Barrier->arrive_and_wait();
    }

    void all_reduce_sum(float* data, std::size_t count) override {
        mState->Buffer[rank()] = reinterpret_cast<const std::byte*>(data);
        barrier();
        std::vector<float> sum(count, 0.f);
        for (int r = 0; r < world_size(); ++r) {
            const auto* other = reinterpret_cast<const float*>(mState->Buffer[r]);
            if (other == nullptr) continue;
            for (std::size_t i = 0; i < count; ++i) sum[i] += other[i];
        }
        barrier();
        std::memcpy(data, sum.data(), count * sizeof(float));
    }
    using Communicator::all_reduce_sum;

protected:
    void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override {
        mState->Buffer[rank()] = object;
        barrier();
        for (int r = 0; r < world_size(); ++r) {
            if (mState->Buffer[r] == nullptr) {
                std::memset(recv + r * size, 0, size);
            } else {
                std::memcpy(recv + r * size, mState->Buffer[r], size);
            }
        }
        barrier();
    }

private:
    std::shared_ptr<SharedState> mState;
};

} // namespace

/**
 * @brief Run distributed training with one thread per worker (blocking).
 *
 * @param nworkers Number of workers; 1 runs @p work on a LocalCommunicator in the calling thread.
 * @param work Callable invoked once per worker with that worker's communicator.
 *
 * @throws std::invalid_argument If @p nworkers < 1.
 * @throws Rethrows the first exception raised by a worker.
 */
void Communicator::run_communicators(int nworkers, const std::function<void(Communicator& comm)>& work) {
    if (nworkers < 1) {
        throw std::invalid_argument(fmt::format("Invalid number of workers: {}", nworkers));
    }
    if (nworkers == 1) {
        LocalCommunicator comm;
        work(comm);
        return;
    }

    auto shared_state = std::make_shared<ThreadsCommunicator::SharedState>();
    shared_state->Barrier = std::make_unique<std::barrier<>>(nworkers);
    shared_state->Buffer.resize(nworkers, nullptr);
    shared_state->Exceptions.resize(nworkers);

    {
        std::vector<std::jthread> threads;
        threads.reserve(nworkers);
        for (int rank = 0; rank < nworkers; ++rank) {
            threads.emplace_back([=, &work]() {
                try {
                    ThreadsCommunicator comm(rank, nworkers, shared_state);
                    work(comm);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(shared_state->Mutex);
                    shared_state->Exceptions[rank] = std::current_exception();
                }
            });
        }
    } // jthreads join here

    for (int rank = 0; rank < nworkers; ++rank) {
        if (auto error = shared_state->Exceptions[rank]; error) {
            fprintf(stderr, "Worker %d exited with uncaught exception\n", rank);
            fflush(stderr);
            std::rethrow_exception(error);
        }
    }
}
