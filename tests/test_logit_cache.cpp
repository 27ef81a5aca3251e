#include "floodmap/search/logit_cache.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace floodmap;
using floodmap::grid::LatticeId;

TEST_CASE("offset_logit_cache_computes_each_cell_once_under_contention") {
  search::OffsetLogitCache cache;
  std::atomic<int> calls{0};

  auto compute = [&](LatticeId, const TileCoord&) {
    ++calls;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return search::LogitsPtr(
        std::make_shared<const ClassLogits>(1, Matrix2Df::Constant(2, 2, 1.0f)));
  };

  std::vector<search::LogitsPtr> results(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i]() {
      results[i] = cache.get_or_compute(LatticeId::OFFSET_X, {3, 4}, compute);
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  REQUIRE(calls.load() == 1);
  REQUIRE(cache.computations() == 1);
  REQUIRE(cache.size() == 1);
  for (const auto& r : results) {
    REQUIRE(r != nullptr);
    REQUIRE(r == results[0]);
  }
}

TEST_CASE("offset_logit_cache_keys_on_lattice_and_coordinate") {
  search::OffsetLogitCache cache;
  int calls = 0;
  auto compute = [&](LatticeId, const TileCoord&) {
    ++calls;
    return search::LogitsPtr();
  };

  cache.get_or_compute(LatticeId::OFFSET_X, {1, 1}, compute);
  cache.get_or_compute(LatticeId::OFFSET_Y, {1, 1}, compute);
  cache.get_or_compute(LatticeId::OFFSET_X, {1, 2}, compute);
  cache.get_or_compute(LatticeId::OFFSET_X, {1, 1}, compute);

  REQUIRE(calls == 3);
  REQUIRE(cache.contains(LatticeId::OFFSET_Y, {1, 1}));
  REQUIRE_FALSE(cache.contains(LatticeId::OFFSET_XY, {1, 1}));
}

TEST_CASE("offset_logit_cache_caches_missing_classification") {
  search::OffsetLogitCache cache;
  int calls = 0;
  auto compute = [&](LatticeId, const TileCoord&) {
    ++calls;
    return search::LogitsPtr();
  };

  REQUIRE(cache.get_or_compute(LatticeId::OFFSET_XY, {0, 0}, compute) == nullptr);
  REQUIRE(cache.get_or_compute(LatticeId::OFFSET_XY, {0, 0}, compute) == nullptr);
  REQUIRE(calls == 1);
}

TEST_CASE("offset_logit_cache_propagates_classifier_failure") {
  search::OffsetLogitCache cache;
  auto failing = [](LatticeId, const TileCoord&) -> search::LogitsPtr {
    throw std::runtime_error("model exploded");
  };
  REQUIRE_THROWS_AS(cache.get_or_compute(LatticeId::OFFSET_X, {0, 0}, failing),
                    std::runtime_error);
  REQUIRE_THROWS_AS(cache.get_or_compute(LatticeId::OFFSET_X, {0, 0}, failing),
                    std::runtime_error);
}
