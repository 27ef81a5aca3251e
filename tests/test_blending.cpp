#include "floodmap/core/errors.hpp"
#include "floodmap/search/blending.hpp"
#include "floodmap/search/tile_checks.hpp"

#include <memory>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace floodmap;
using search::Direction;

namespace {

ClassLogits constant_logits(int h, int w, std::initializer_list<float> values) {
  ClassLogits out;
  for (float v : values) {
    out.push_back(Matrix2Df::Constant(h, w, v));
  }
  return out;
}

search::LogitsPtr shared(ClassLogits logits) {
  return std::make_shared<const ClassLogits>(std::move(logits));
}

} // namespace

TEST_CASE("blend_weights_sum_to_one_everywhere") {
  for (auto shape : {std::make_pair(8, 8), std::make_pair(6, 10), std::make_pair(2, 2)}) {
    const auto weights = search::compute_blend_weights(shape.first, shape.second);
    Matrix2Df sum = Matrix2Df::Zero(shape.first, shape.second);
    for (int i = 0; i < 3; ++i) {
      for (int j = 0; j < 3; ++j) {
        sum += weights.weights[i][j];
      }
    }
    for (int y = 0; y < shape.first; ++y) {
      for (int x = 0; x < shape.second; ++x) {
        REQUIRE(sum(y, x) == Catch::Approx(1.0f).epsilon(1e-5));
      }
    }
  }
}

TEST_CASE("own_weight_peaks_at_center_and_vanishes_at_edges") {
  const auto weights = search::compute_blend_weights(8, 8);
  const Matrix2Df& own = weights.own();
  REQUIRE(own(0, 0) == Catch::Approx(0.0f));
  REQUIRE(own(0, 4) == Catch::Approx(0.0f));
  REQUIRE(own(7, 7) == Catch::Approx(0.0f));
  REQUIRE(own(3, 3) > 0.7f);
  REQUIRE(own(3, 3) == Catch::Approx(own(4, 4)));
  REQUIRE(weights.at(Direction::TOP_LEFT)(0, 0) == Catch::Approx(1.0f));
  REQUIRE(weights.at(Direction::BOTTOM_RIGHT)(7, 7) == Catch::Approx(1.0f));
  REQUIRE(weights.at(Direction::RIGHT)(3, 7) > 0.8f);
}

TEST_CASE("blend_weights_reject_odd_dimensions") {
  REQUIRE_THROWS_AS(search::compute_blend_weights(7, 8), ValidationError);
  REQUIRE_THROWS_AS(search::compute_blend_weights(8, 0), ValidationError);
}

TEST_CASE("blend_with_all_neighbors_agreeing_reproduces_the_tile") {
  const auto weights = search::compute_blend_weights(8, 8);
  const ClassLogits own = constant_logits(8, 8, {0.5f, -1.0f, 2.0f});

  search::NeighborLogits neighbors;
  for (Direction d : search::kAllDirections) {
    neighbors[d] = shared(own);
  }
  REQUIRE(neighbors.present() == 8);

  const ClassLogits out = search::blend_logits(own, neighbors, weights);
  REQUIRE(out.size() == 3);
  for (size_t c = 0; c < out.size(); ++c) {
    for (int y = 0; y < 8; ++y) {
      for (int x = 0; x < 8; ++x) {
        REQUIRE(out[c](y, x) == Catch::Approx(own[c](0, 0)).margin(1e-5));
      }
    }
  }
}

TEST_CASE("blend_without_neighbors_attenuates_but_keeps_interior_argmax") {
  const auto weights = search::compute_blend_weights(8, 8);
  ClassLogits own = constant_logits(8, 8, {0.1f, 0.2f, 0.3f});
  own[0](4, 4) = 5.0f;

  const ClassLogits out = search::blend_logits(own, search::NeighborLogits{}, weights);
  REQUIRE(out[2](0, 0) == Catch::Approx(0.0f));
  REQUIRE(out[2](3, 3) == Catch::Approx(0.3f * weights.own()(3, 3)));

  const ClassMap classes = search::argmax_classes(out);
  REQUIRE(classes(4, 4) == 0);
  REQUIRE(classes(3, 3) == 2);
  REQUIRE(classes(2, 5) == 2);
}

TEST_CASE("blend_reads_mirrored_slice_of_right_neighbor") {
  const int n = 8;
  const auto weights = search::compute_blend_weights(n, n);
  const ClassLogits own = constant_logits(n, n, {0.0f});

  // Neighbor value encodes its own column.
  ClassLogits right(1, Matrix2Df(n, n));
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      right[0](y, x) = static_cast<float>(x);
    }
  }

  search::NeighborLogits neighbors;
  neighbors[Direction::RIGHT] = shared(right);
  const ClassLogits out = search::blend_logits(own, neighbors, weights);

  // Own column 6 lies over neighbor column 2.
  REQUIRE(out[0](3, 6) == Catch::Approx(2.0f * weights.at(Direction::RIGHT)(3, 6)));
  REQUIRE(out[0](3, 7) == Catch::Approx(3.0f * weights.at(Direction::RIGHT)(3, 7)));
  // The left half receives nothing from the right neighbor.
  REQUIRE(out[0](3, 2) == Catch::Approx(0.0f));
}

TEST_CASE("blend_rejects_mismatched_neighbor_shape") {
  const auto weights = search::compute_blend_weights(8, 8);
  const ClassLogits own = constant_logits(8, 8, {1.0f, 2.0f, 3.0f});
  search::NeighborLogits neighbors;
  neighbors[Direction::UP] = shared(constant_logits(8, 8, {1.0f, 2.0f}));
  REQUIRE_THROWS_AS(search::blend_logits(own, neighbors, weights), ClassifierError);
}

TEST_CASE("neighbor_cells_come_from_the_offset_lattices") {
  const TileCoord c{2, 3};
  auto cell = search::neighbor_cell(Direction::LEFT, c);
  REQUIRE(cell.first == grid::LatticeId::OFFSET_X);
  REQUIRE(cell.second == TileCoord{1, 3});

  cell = search::neighbor_cell(Direction::DOWN, c);
  REQUIRE(cell.first == grid::LatticeId::OFFSET_Y);
  REQUIRE(cell.second == TileCoord{2, 3});

  cell = search::neighbor_cell(Direction::TOP_RIGHT, c);
  REQUIRE(cell.first == grid::LatticeId::OFFSET_XY);
  REQUIRE(cell.second == TileCoord{2, 2});
}

TEST_CASE("blend_weight_cache_computes_each_shape_once") {
  search::BlendWeightCache cache;
  const auto a = cache.get(8, 8);
  const auto b = cache.get(8, 8);
  const auto c = cache.get(4, 8);
  REQUIRE(a == b);
  REQUIRE(a != c);
  REQUIRE(cache.size() == 2);
}
