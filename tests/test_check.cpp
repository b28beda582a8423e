/// @file test_check.cpp
/// @brief Tests for net grouping, net diagnostics, the width solver, and topological sorting

#include <catch2/catch.hpp>

#include "state/check.hpp"
#include "state/topsort.hpp"

#include <stdexcept>

using namespace tachy;

namespace {

PortSpec behavior_port(PortFlow flow, WireLoc loc) {
    return {flow, PortColor::BEHAVIOR, loc};
}

/// Stub pair joining (x, y) to (x + 1, y)
void add_link(WireMap& fragments, Coords left) {
    fragments[{left, Direction::EAST}] = WireShape::STUB;
    fragments[{left + Direction::EAST, Direction::WEST}] = WireShape::STUB;
}

} // namespace

TEST_CASE("Fragments group into nets", "[check][nets]") {
    WireMap fragments;
    add_link(fragments, {4, 0});
    // (0,0)E -> (1,0) turning south -> (1,1)N
    fragments[{{0, 0}, Direction::EAST}] = WireShape::STUB;
    fragments[{{1, 0}, Direction::WEST}] = WireShape::TURN_LEFT;
    fragments[{{1, 0}, Direction::SOUTH}] = WireShape::TURN_RIGHT;
    fragments[{{1, 1}, Direction::NORTH}] = WireShape::STUB;

    const WireLoc lonely{{7, 7}, Direction::NORTH};
    const NetGraph graph =
        group_nets(fragments, {behavior_port(PortFlow::SINK, {{1, 1}, Direction::NORTH}),
                               behavior_port(PortFlow::SOURCE, lonely)});

    REQUIRE(graph.nets.size() == 3);
    CHECK(graph.nets[0].representative == WireLoc{{0, 0}, Direction::EAST});
    CHECK(graph.nets[0].fragments.size() == 4);
    CHECK(graph.nets[0].ports == std::vector<size_t>{0});
    CHECK(graph.nets[1].representative == WireLoc{{4, 0}, Direction::EAST});
    CHECK(graph.nets[1].ports.empty());
    CHECK(graph.nets[2].fragments.empty());
    CHECK(graph.nets[2].ports == std::vector<size_t>{1});

    CHECK(graph.net_at({{1, 0}, Direction::SOUTH}) == 0u);
    CHECK(graph.net_at({{5, 0}, Direction::WEST}) == 1u);
    CHECK(graph.net_at(lonely) == 2u);
    CHECK_FALSE(graph.net_at({{1, 0}, Direction::NORTH}).has_value());
}

TEST_CASE("Sides of a cell join only through their shape", "[check][nets]") {
    // Two straights crossing one cell without a Cross stay separate
    WireMap fragments;
    fragments[{{1, 1}, Direction::EAST}] = WireShape::STRAIGHT;
    fragments[{{1, 1}, Direction::WEST}] = WireShape::STRAIGHT;
    fragments[{{1, 1}, Direction::NORTH}] = WireShape::STRAIGHT;
    fragments[{{1, 1}, Direction::SOUTH}] = WireShape::STRAIGHT;
    const NetGraph graph = group_nets(fragments, {});
    CHECK(graph.nets.size() == 2);

    for (auto& [loc, shape] : fragments) {
        shape = WireShape::CROSS;
    }
    CHECK(group_nets(fragments, {}).nets.size() == 1);
}

TEST_CASE("Net diagnostics", "[check][nets]") {
    WireMap fragments;
    add_link(fragments, {0, 0});
    const WireLoc left{{0, 0}, Direction::EAST};
    const WireLoc right{{1, 0}, Direction::WEST};

    SECTION("One source and one sink is fine") {
        NetGraph graph = group_nets(fragments, {behavior_port(PortFlow::SOURCE, left),
                                                behavior_port(PortFlow::SINK, right)});
        CHECK(check_nets(graph).empty());
        CHECK(graph.nets[0].color == PortColor::BEHAVIOR);
    }

    SECTION("Two sources") {
        NetGraph graph = group_nets(fragments, {behavior_port(PortFlow::SOURCE, left),
                                                behavior_port(PortFlow::SOURCE, right)});
        const auto errors = check_nets(graph);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].kind == BuildErrorKind::MULTIPLE_SOURCES);
        CHECK(errors[0].net == 0u);
        CHECK(errors[0].loc == left);
    }

    SECTION("No source") {
        NetGraph graph = group_nets(fragments, {behavior_port(PortFlow::SINK, right)});
        const auto errors = check_nets(graph);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].kind == BuildErrorKind::NO_SOURCE);
    }

    SECTION("A bare sink with no wire is not an error here") {
        NetGraph graph = group_nets({}, {behavior_port(PortFlow::SINK, right)});
        CHECK(check_nets(graph).empty());
    }

    SECTION("Behavior and event ports") {
        NetGraph graph = group_nets(fragments, {behavior_port(PortFlow::SOURCE, left),
                                                {PortFlow::SINK, PortColor::EVENT, right}});
        const auto errors = check_nets(graph);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].kind == BuildErrorKind::PORT_COLOR_MISMATCH);
        CHECK_FALSE(graph.nets[0].color.has_value());
    }

    SECTION("Analog and digital ports") {
        NetGraph graph = group_nets(fragments, {{PortFlow::SOURCE, PortColor::ANALOG, left},
                                                {PortFlow::SINK, PortColor::EVENT, right}});
        const auto errors = check_nets(graph);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].kind == BuildErrorKind::ANALOG_MIXED_WITH_DIGITAL);
    }
}

TEST_CASE("Wire size solving", "[check][sizes]") {
    WireMap fragments;
    add_link(fragments, {0, 0});
    add_link(fragments, {0, 2});
    const WireLoc a_out{{0, 0}, Direction::EAST};
    const WireLoc a_in{{1, 0}, Direction::WEST};
    const WireLoc b_out{{0, 2}, Direction::EAST};
    const WireLoc b_in{{1, 2}, Direction::WEST};

    NetGraph graph = group_nets(fragments, {behavior_port(PortFlow::SOURCE, a_out),
                                            behavior_port(PortFlow::SINK, a_in),
                                            behavior_port(PortFlow::SOURCE, b_out),
                                            behavior_port(PortFlow::SINK, b_in)});
    REQUIRE(check_nets(graph).empty());
    REQUIRE(graph.nets.size() == 2);

    SECTION("Bounds on both ends pick the smallest size left") {
        const auto solution =
            solve_wire_sizes(graph, {{ConstraintKind::AT_LEAST, a_out, a_out, WireSize::ONE},
                                     {ConstraintKind::AT_MOST, a_in, a_in, WireSize::EIGHT}});
        CHECK(solution.ok());
        CHECK(solution.sizes[0] == WireSize::ONE);
        CHECK(solution.sizes[1] == WireSize::ONE);
    }

    SECTION("Equal carries an exact size across") {
        const auto solution =
            solve_wire_sizes(graph, {{ConstraintKind::EQUAL, a_in, b_out, WireSize::ZERO},
                                     {ConstraintKind::EXACT, b_in, b_in, WireSize::FOUR}});
        CHECK(solution.ok());
        CHECK(solution.sizes[0] == WireSize::FOUR);
        CHECK(solution.sizes[1] == WireSize::FOUR);
    }

    SECTION("Double works in both directions") {
        auto solution =
            solve_wire_sizes(graph, {{ConstraintKind::DOUBLE, a_in, b_out, WireSize::ZERO},
                                     {ConstraintKind::EXACT, a_out, a_out, WireSize::FOUR}});
        CHECK(solution.ok());
        CHECK(solution.sizes[1] == WireSize::EIGHT);

        solution = solve_wire_sizes(graph, {{ConstraintKind::DOUBLE, a_in, b_out, WireSize::ZERO},
                                            {ConstraintKind::EXACT, b_in, b_in, WireSize::TWO}});
        CHECK(solution.ok());
        CHECK(solution.sizes[0] == WireSize::ONE);
    }

    SECTION("Conflicting sizes are reported once per net") {
        const auto solution =
            solve_wire_sizes(graph, {{ConstraintKind::EXACT, a_out, a_out, WireSize::FOUR},
                                     {ConstraintKind::EXACT, a_in, a_in, WireSize::EIGHT},
                                     {ConstraintKind::AT_LEAST, a_in, a_in, WireSize::SIXTEEN}});
        REQUIRE(solution.errors.size() == 1);
        CHECK(solution.errors[0].kind == BuildErrorKind::WIRE_SIZE_CONFLICT);
        CHECK(solution.errors[0].net == 0u);
        CHECK_FALSE(solution.sizes[0].has_value());
        CHECK(solution.sizes[1] == WireSize::ONE);
    }

    SECTION("Constraints must name a known location") {
        CHECK_THROWS_AS(
            solve_wire_sizes(graph, {{ConstraintKind::EXACT, {{9, 9}, Direction::EAST},
                                      {{9, 9}, Direction::EAST}, WireSize::ONE}}),
            std::invalid_argument);
    }
}

TEST_CASE("Event nets may be zero width", "[check][sizes]") {
    WireMap fragments;
    add_link(fragments, {0, 0});
    NetGraph graph = group_nets(fragments, {{PortFlow::SOURCE, PortColor::EVENT, {{0, 0}, Direction::EAST}},
                                            {PortFlow::SINK, PortColor::EVENT, {{1, 0}, Direction::WEST}}});
    REQUIRE(check_nets(graph).empty());
    const auto solution = solve_wire_sizes(graph, {});
    CHECK(solution.sizes[0] == WireSize::ZERO);
}

TEST_CASE("Topological groups", "[check][topsort]") {
    SECTION("Diamond") {
        const auto sorted = topological_groups({{1, 2}, {3}, {3}, {}});
        CHECK(sorted.groups ==
              std::vector<std::vector<size_t>>{{0}, {1, 2}, {3}});
        CHECK(sorted.leftover.empty());
    }

    SECTION("Nodes on and after a cycle are left over") {
        const auto sorted = topological_groups({{1}, {2}, {1, 4}, {}, {}});
        CHECK(sorted.groups == std::vector<std::vector<size_t>>{{0, 3}});
        CHECK(sorted.leftover == std::vector<size_t>{1, 2, 4});
    }

    SECTION("Edges to missing nodes are rejected") {
        CHECK_THROWS_AS(topological_groups({{1}, {5}}), std::out_of_range);
    }

    SECTION("No nodes") {
        const auto sorted = topological_groups({});
        CHECK(sorted.groups.empty());
        CHECK(sorted.leftover.empty());
    }
}
