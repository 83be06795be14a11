// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the threaded worker collectives.

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "utilities/comm.h"

TEST_CASE("a single worker runs on the calling thread", "[comm]") {
    int calls = 0;
    Communicator::run_communicators(1, [&](Communicator& comm) {
        ++calls;
        REQUIRE(comm.rank() == 0);
        REQUIRE(comm.world_size() == 1);
        float data[2] = {1.f, 2.f};
        comm.all_reduce_sum(data, 2);
        REQUIRE(data[0] == 1.f);
        REQUIRE(data[1] == 2.f);
        REQUIRE(comm.all_reduce_sum(5L) == 5L);
    });
    REQUIRE(calls == 1);

    REQUIRE_THROWS_AS(Communicator::run_communicators(0, [](Communicator&) {}), std::invalid_argument);
}

TEST_CASE("all-reduce sums over all workers", "[comm]") {
    const int world = 3;
    std::mutex mutex;
    std::vector<std::vector<float>> results(world);
    std::vector<long> counts(world);
    std::vector<std::vector<int>> gathered(world);

    Communicator::run_communicators(world, [&](Communicator& comm) {
        std::vector<float> data = {static_cast<float>(comm.rank()), 1.f, 0.5f};
        comm.all_reduce_sum(data.data(), data.size());
        long count = comm.all_reduce_sum(static_cast<long>(10 * (comm.rank() + 1)));
        std::vector<int> ranks = comm.host_all_gather(comm.rank());

        std::lock_guard<std::mutex> lock(mutex);
        results[comm.rank()] = data;
        counts[comm.rank()] = count;
        gathered[comm.rank()] = ranks;
    });

    for (int r = 0; r < world; ++r) {
        REQUIRE(results[r] == std::vector<float>{3.f, 3.f, 1.5f});
        REQUIRE(counts[r] == 60);
        REQUIRE(gathered[r] == std::vector<int>{0, 1, 2});
    }
}

TEST_CASE("worker exceptions are rethrown after all workers joined", "[comm]") {
    std::atomic<int> finished{0};
    REQUIRE_THROWS_AS(Communicator::run_communicators(2, [&](Communicator& comm) {
        if (comm.rank() == 1) {
            throw std::runtime_error("worker failed");
        }
        ++finished;
    }), std::runtime_error);
    REQUIRE(finished == 1);
}
