#include <gtest/gtest.h>

#include <random>
#include <set>
#include <vector>

#include "core/topology.hpp"

class TopologyTest : public ::testing::Test {
protected:
  TopologyConfig cfg;
  Topology topology{cfg};

  std::vector<GridPosition> sample_positions(size_t count, unsigned int seed) const {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, topology.slot_count() - 1);
    std::vector<GridPosition> positions;
    for (size_t i = 0; i < count; ++i) {
      positions.push_back(topology.position_at(pick(rng)));
    }
    return positions;
  }
};

TEST_F(TopologyTest, DefaultDimensions) {
  auto [width, height] = topology.dimensions();
  EXPECT_EQ(15, width);
  EXPECT_EQ(10, height);

  EXPECT_EQ(14, topology.sections_per_road(Orientation::Horizontal));
  EXPECT_EQ(9, topology.sections_per_road(Orientation::Vertical));
  // Up and Down: 15 roads x 9 sections; Left and Right: 10 roads x 14 sections.
  EXPECT_EQ(2u * 135u + 2u * 140u, topology.section_count());
  EXPECT_EQ(550u * 5u, topology.slot_count());
}

TEST_F(TopologyTest, RejectsDegenerateNetworks) {
  TopologyConfig one_road;
  one_road.horizontal_roads = 1;
  EXPECT_THROW(Topology{one_road}, std::invalid_argument);

  TopologyConfig no_slots;
  no_slots.vertical_section_slots = 0;
  EXPECT_THROW(Topology{no_slots}, std::invalid_argument);

  // Two roads each way form two one-way loops with no crossing between them.
  TopologyConfig two_loops;
  two_loops.horizontal_roads = 2;
  two_loops.vertical_roads = 2;
  EXPECT_THROW(Topology{two_loops}, std::invalid_argument);

  TopologyConfig narrow;
  narrow.horizontal_roads = 2;
  narrow.vertical_roads = 3;
  EXPECT_TRUE(Topology{narrow}.is_strongly_connected());
}

TEST_F(TopologyTest, Validity) {
  EXPECT_TRUE(topology.is_valid(GridPosition(Direction::Right, 9, 13, 4)));
  EXPECT_FALSE(topology.is_valid(GridPosition(Direction::Right, 10, 0, 0)));
  EXPECT_FALSE(topology.is_valid(GridPosition(Direction::Right, 0, 14, 0)));
  EXPECT_FALSE(topology.is_valid(GridPosition(Direction::Up, 0, 0, 5)));
  EXPECT_TRUE(topology.is_valid(GridPosition(Direction::Down, 14, 8, 0)));
  EXPECT_FALSE(topology.is_valid(GridPosition(Direction::Down, 14, 9, 0)));

  EXPECT_THROW(topology.check(GridPosition(Direction::Left, 0, 20, 0)), std::out_of_range);
}

TEST_F(TopologyTest, SlotIdsRoundTrip) {
  std::set<size_t> seen;
  for (size_t id = 0; id < topology.slot_count(); ++id) {
    GridPosition position = topology.position_at(id);
    ASSERT_TRUE(topology.is_valid(position));
    EXPECT_EQ(id, topology.slot_id(position));
    seen.insert(id);
  }
  EXPECT_EQ(topology.slot_count(), seen.size());
  EXPECT_THROW(topology.position_at(topology.slot_count()), std::out_of_range);

  for (size_t id = 0; id < topology.section_count(); ++id) {
    EXPECT_EQ(id, topology.section_id(topology.section_at(id)));
  }
}

TEST_F(TopologyTest, IntersectionIsLastSlot) {
  EXPECT_TRUE(topology.is_at_intersection(GridPosition(Direction::Right, 0, 0, 4)));
  EXPECT_FALSE(topology.is_at_intersection(GridPosition(Direction::Right, 0, 0, 3)));
  EXPECT_TRUE(topology.is_at_intersection(GridPosition(Direction::Up, 3, 2, 4)));
}

TEST_F(TopologyTest, TopRowCannotTurnUp) {
  RoadSection section{Direction::Right, 0, 0};
  auto decisions = topology.possible_decisions(section);
  ASSERT_EQ(2u, decisions.size());
  EXPECT_EQ(Decision::GoStraight, decisions[0]);
  EXPECT_EQ(Decision::TurnRight, decisions[1]);

  EXPECT_EQ(RoadSection({Direction::Right, 0, 1}), *topology.take_decision(section, Decision::GoStraight));
  EXPECT_EQ(RoadSection({Direction::Down, 1, 0}), *topology.take_decision(section, Decision::TurnRight));
  EXPECT_FALSE(topology.take_decision(section, Decision::TurnLeft).has_value());
}

TEST_F(TopologyTest, CornerHasSingleWayOut) {
  RoadSection corner{Direction::Right, 0, 13};
  auto decisions = topology.possible_decisions(corner);
  ASSERT_EQ(1u, decisions.size());
  EXPECT_EQ(Decision::TurnRight, decisions[0]);
  EXPECT_EQ(RoadSection({Direction::Down, 14, 0}), *topology.take_decision(corner, Decision::TurnRight));
}

TEST_F(TopologyTest, TurnsFromNegativeLane) {
  RoadSection section{Direction::Left, 5, 3};
  EXPECT_EQ(RoadSection({Direction::Left, 5, 2}), *topology.take_decision(section, Decision::GoStraight));
  EXPECT_EQ(RoadSection({Direction::Up, 3, 4}), *topology.take_decision(section, Decision::TurnRight));
  EXPECT_EQ(RoadSection({Direction::Down, 3, 5}), *topology.take_decision(section, Decision::TurnLeft));
}

TEST_F(TopologyTest, DecisionToInvertsTakeDecision) {
  for (size_t id = 0; id < topology.section_count(); ++id) {
    RoadSection section = topology.section_at(id);
    auto decisions = topology.possible_decisions(section);
    EXPECT_FALSE(decisions.empty()) << section.to_string();
    for (Decision decision : decisions) {
      RoadSection next = *topology.take_decision(section, decision);
      EXPECT_EQ(decision, *topology.decision_to(section, next));
    }
  }
  EXPECT_FALSE(
      topology.decision_to(RoadSection{Direction::Right, 0, 0}, RoadSection{Direction::Right, 5, 5}).has_value());
}

TEST_F(TopologyTest, CheckerboardCoords) {
  auto [hx, hy] = topology.checkerboard_coords(RoadSection{Direction::Left, 4, 2});
  EXPECT_FLOAT_EQ(2.5f, hx);
  EXPECT_FLOAT_EQ(4.0f, hy);

  auto [vx, vy] = topology.checkerboard_coords(RoadSection{Direction::Up, 4, 2});
  EXPECT_FLOAT_EQ(4.0f, vx);
  EXPECT_FLOAT_EQ(2.5f, vy);
}

TEST_F(TopologyTest, OtherSideOfRoad) {
  GridPosition position(Direction::Right, 2, 3, 1);
  GridPosition other = topology.other_side_of_road(position);
  EXPECT_EQ(GridPosition(Direction::Left, 2, 3, 3), other);
  EXPECT_EQ(position, topology.other_side_of_road(other));
  EXPECT_EQ(1u, topology.distance(position, other));
}

TEST_F(TopologyTest, DistanceAlongRoad) {
  GridPosition a(Direction::Right, 0, 0, 0);
  GridPosition b(Direction::Right, 0, 0, 3);
  GridPosition c(Direction::Right, 0, 1, 0);
  EXPECT_EQ(0u, topology.distance(a, a));
  EXPECT_EQ(3u, topology.distance(a, b));
  EXPECT_EQ(5u, topology.distance(a, c));
}

TEST_F(TopologyTest, DistanceIsAMetric) {
  auto positions = sample_positions(40, 11);
  for (const GridPosition& a : positions) {
    EXPECT_EQ(0u, topology.distance(a, a));
    for (const GridPosition& b : positions) {
      Distance ab = topology.distance(a, b);
      EXPECT_EQ(ab, topology.distance(b, a));
      for (const GridPosition& c : positions) {
        EXPECT_LE(ab, topology.distance(a, c) + topology.distance(c, b));
      }
    }
  }
}

TEST_F(TopologyTest, NegativeAreaCoordsCountFromFarEdge) {
  Area wrapped = topology.wrap_area(Area{-2.0f, -1.0f, -1.0f, 3.0f});
  EXPECT_FLOAT_EQ(12.0f, wrapped.x1);
  EXPECT_FLOAT_EQ(8.0f, wrapped.y1);
  EXPECT_FLOAT_EQ(13.0f, wrapped.x2);
  EXPECT_FLOAT_EQ(3.0f, wrapped.y2);
}

TEST_F(TopologyTest, SectionsInArea) {
  auto sections = topology.sections_in_area(Area{0.0f, 0.0f, 1.0f, 1.0f});
  // Both lanes of horizontal roads 0 and 1 at x=0.5, both lanes of vertical roads 0 and 1 at y=0.5.
  EXPECT_EQ(8u, sections.size());
  for (const RoadSection& section : sections) {
    EXPECT_EQ(0, section.section_index);
    EXPECT_LE(section.road_index, 1);
  }
  EXPECT_EQ(40u, topology.positions_in_area(Area{0.0f, 0.0f, 1.0f, 1.0f}).size());

  EXPECT_TRUE(topology.sections_in_area(Area{0.1f, 0.1f, 0.2f, 0.2f}).empty());
}
