#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace mkc_resampling::concurrency;

TEST_CASE("parallel_for_chunked basic operations", "[parallel_for_chunked]")
{
  SECTION("Basic execution with SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);

    parallel_for_chunked(10, executor, [&results](std::size_t i) {
      results[i] = static_cast<int>(i * 2);
    });

    for (std::size_t i = 0; i < 10; ++i) {
      REQUIRE(results[i] == static_cast<int>(i * 2));
    }
  }

  SECTION("Zero iterations")
  {
    BoostThreadPoolExecutor executor(2);
    std::atomic<int> counter{0};

    parallel_for_chunked(0, executor, [&counter](std::size_t) {
      counter.fetch_add(1);
    });

    REQUIRE(counter.load() == 0);
  }

  SECTION("Deterministic order with SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<std::size_t> order;

    parallel_for_chunked(25, executor, [&order](std::size_t i) {
      order.push_back(i);
    }, 4);

    REQUIRE(order.size() == 25);
    REQUIRE(std::is_sorted(order.begin(), order.end()));
  }

  SECTION("All indices are visited exactly once")
  {
    BoostThreadPoolExecutor executor(4);
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited) v.store(0);

    parallel_for_chunked(1000, executor, [&visited](std::size_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });

    for (const auto& v : visited) {
      REQUIRE(v.load() == 1);
    }
  }

  SECTION("Chunk size hints that do not divide the range")
  {
    BoostThreadPoolExecutor executor(3);
    for (std::size_t hint : {1u, 3u, 7u, 64u, 5000u})
      {
	std::atomic<std::uint64_t> sum{0};
	parallel_for_chunked(997, executor, [&sum](std::size_t i) {
	  sum.fetch_add(i, std::memory_order_relaxed);
	}, hint);

	REQUIRE(sum.load() == 997ull * 996ull / 2ull);
      }
  }

  SECTION("Pre-sized slots are filled without synchronisation")
  {
    BoostThreadPoolExecutor executor(4);
    std::vector<double> slots(5000, -1.0);

    parallel_for_chunked(slots.size(), executor, [&slots](std::size_t i) {
      slots[i] = static_cast<double>(i) * 0.5;
    });

    for (std::size_t i = 0; i < slots.size(); ++i) {
      REQUIRE(slots[i] == static_cast<double>(i) * 0.5);
    }
  }
}

TEST_CASE("parallel_for_chunked exception handling", "[parallel_for_chunked]")
{
  SECTION("Exception from the body is rethrown")
  {
    BoostThreadPoolExecutor executor(4);

    REQUIRE_THROWS_AS(parallel_for_chunked(100, executor, [](std::size_t i) {
      if (i == 37)
	throw std::invalid_argument("bad index");
    }), std::invalid_argument);
  }

  SECTION("Other chunks still complete")
  {
    BoostThreadPoolExecutor executor(2);
    std::atomic<int> counter{0};

    REQUIRE_THROWS(parallel_for_chunked(40, executor, [&counter](std::size_t i) {
      if (i == 0)
	throw std::runtime_error("first chunk fails");
      counter.fetch_add(1);
    }, 10));

    // indices 1..9 of the failing chunk are skipped, the other 30 run
    REQUIRE(counter.load() == 30);
  }

  SECTION("SingleThreadExecutor propagates too")
  {
    SingleThreadExecutor executor;
    REQUIRE_THROWS_AS(parallel_for_chunked(5, executor, [](std::size_t) {
      throw std::runtime_error("inline");
    }), std::runtime_error);
  }
}
