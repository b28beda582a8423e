/// @file check.cpp
/// @brief Union-find net grouping and the width constraint worklist

#include "state/check.hpp"

#include "save/wire_shape.hpp"

#include <cstdint>
#include <deque>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace tachy {

namespace {

class DisjointSet {
  public:
    explicit DisjointSet(size_t size) : parent_(size) {
        std::iota(parent_.begin(), parent_.end(), size_t{0});
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a != b) {
            // The smaller index becomes the root
            if (b < a) {
                std::swap(a, b);
            }
            parent_[b] = a;
        }
    }

  private:
    std::vector<size_t> parent_;
};

std::string loc_text(const WireLoc& loc) {
    return "(" + std::to_string(loc.coords.x) + ", " + std::to_string(loc.coords.y) + ") " +
           std::string(direction_name(loc.dir));
}

} // namespace

std::optional<size_t> NetGraph::net_at(const WireLoc& loc) const {
    auto it = net_index.find(loc);
    if (it == net_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

NetGraph group_nets(const WireMap& fragments, std::vector<PortSpec> ports) {
    NetGraph graph;
    graph.ports = std::move(ports);

    // Index every distinct location in ascending order
    std::map<WireLoc, size_t> index;
    for (const auto& [loc, shape] : fragments) {
        index.emplace(loc, 0);
    }
    for (const auto& port : graph.ports) {
        index.emplace(port.loc, 0);
    }
    std::vector<WireLoc> locs;
    locs.reserve(index.size());
    for (auto& [loc, idx] : index) {
        idx = locs.size();
        locs.push_back(loc);
    }

    DisjointSet sets(locs.size());
    for (const auto& [loc, shape] : fragments) {
        const size_t here = index.at(loc);
        if (fragments.count(loc.across()) != 0) {
            sets.unite(here, index.at(loc.across()));
        }
        for (Direction dir : connected_directions(shape, loc.dir)) {
            auto it = index.find(WireLoc{loc.coords, dir});
            if (it != index.end() && fragments.count(it->first) != 0) {
                sets.unite(here, it->second);
            }
        }
    }

    // Roots are the smallest index of each set, so numbering nets in
    // location order visits each root before any other member
    std::vector<size_t> net_of_root(locs.size(), SIZE_MAX);
    for (size_t i = 0; i < locs.size(); ++i) {
        const size_t root = sets.find(i);
        if (net_of_root[root] == SIZE_MAX) {
            net_of_root[root] = graph.nets.size();
            Net net;
            net.representative = locs[i];
            graph.nets.push_back(std::move(net));
        }
        const size_t net = net_of_root[root];
        graph.net_index.emplace(locs[i], net);
        if (fragments.count(locs[i]) != 0) {
            graph.nets[net].fragments.push_back(locs[i]);
        }
    }
    for (size_t p = 0; p < graph.ports.size(); ++p) {
        graph.nets[graph.net_index.at(graph.ports[p].loc)].ports.push_back(p);
    }
    return graph;
}

std::vector<BuildError> check_nets(NetGraph& graph) {
    std::vector<BuildError> errors;
    for (size_t n = 0; n < graph.nets.size(); ++n) {
        Net& net = graph.nets[n];
        net.color.reset();

        bool has_behavior = false;
        bool has_event = false;
        bool has_analog = false;
        size_t num_sources = 0;
        size_t num_sinks = 0;
        for (size_t p : net.ports) {
            const PortSpec& port = graph.ports[p];
            switch (port.color) {
            case PortColor::BEHAVIOR:
                has_behavior = true;
                break;
            case PortColor::EVENT:
                has_event = true;
                break;
            case PortColor::ANALOG:
                has_analog = true;
                break;
            }
            if (port.flow == PortFlow::SOURCE) {
                ++num_sources;
            } else {
                ++num_sinks;
            }
        }

        const WireLoc& rep = net.representative;
        if (has_analog && (has_behavior || has_event)) {
            errors.push_back({BuildErrorKind::ANALOG_MIXED_WITH_DIGITAL,
                              "The wire at " + loc_text(rep) +
                                  " connects analog ports to digital ports.",
                              n, rep});
        } else if (has_behavior && has_event) {
            errors.push_back({BuildErrorKind::PORT_COLOR_MISMATCH,
                              "The wire at " + loc_text(rep) +
                                  " connects behavior ports to event ports.",
                              n, rep});
        } else if (has_analog) {
            net.color = PortColor::ANALOG;
        } else if (has_behavior) {
            net.color = PortColor::BEHAVIOR;
        } else if (has_event) {
            net.color = PortColor::EVENT;
        }

        if (num_sources > 1) {
            errors.push_back({BuildErrorKind::MULTIPLE_SOURCES,
                              "The wire at " + loc_text(rep) + " is driven by " +
                                  std::to_string(num_sources) + " source ports.",
                              n, rep});
        } else if (num_sources == 0 && num_sinks > 0 && !net.fragments.empty()) {
            errors.push_back({BuildErrorKind::NO_SOURCE,
                              "The wire at " + loc_text(rep) + " has no source port.", n, rep});
        }
    }
    return errors;
}

// --- Width solver ---

namespace {

WireSizeInterval initial_interval(const Net& net) {
    if (!net.color.has_value()) {
        return WireSizeInterval::full();
    }
    switch (*net.color) {
    case PortColor::BEHAVIOR:
        return {WireSize::ONE, WireSize::SIXTEEN};
    case PortColor::EVENT:
        return WireSizeInterval::full();
    case PortColor::ANALOG:
        return WireSizeInterval::exactly(WireSize::ANALOG);
    }
    return WireSizeInterval::full();
}

/// Applies one constraint. Returns the nets whose interval changed.
std::vector<size_t> apply_constraint(const PortConstraint& constraint, size_t a, size_t b,
                                     std::vector<WireSizeInterval>& intervals) {
    std::vector<size_t> changed;
    auto narrow = [&](size_t net, const WireSizeInterval& bound) {
        WireSizeInterval narrowed = intervals[net].intersection(bound);
        if (narrowed != intervals[net]) {
            intervals[net] = narrowed;
            changed.push_back(net);
        }
    };

    switch (constraint.kind) {
    case ConstraintKind::EXACT:
        narrow(a, WireSizeInterval::exactly(constraint.size));
        break;
    case ConstraintKind::AT_LEAST:
        if (intervals[a].make_at_least(constraint.size)) {
            changed.push_back(a);
        }
        break;
    case ConstraintKind::AT_MOST:
        if (intervals[a].make_at_most(constraint.size)) {
            changed.push_back(a);
        }
        break;
    case ConstraintKind::EQUAL:
        if (a != b) {
            const WireSizeInterval both = intervals[a].intersection(intervals[b]);
            narrow(a, both);
            narrow(b, both);
        }
        break;
    case ConstraintKind::DOUBLE:
        if (a == b) {
            // Only Zero is its own double
            narrow(a, WireSizeInterval::exactly(WireSize::ZERO));
        } else {
            narrow(b, intervals[a].doubled());
            narrow(a, intervals[b].half());
        }
        break;
    }
    return changed;
}

} // namespace

SizeSolution solve_wire_sizes(const NetGraph& graph,
                              const std::vector<PortConstraint>& constraints) {
    const size_t num_nets = graph.nets.size();
    std::vector<WireSizeInterval> intervals;
    intervals.reserve(num_nets);
    for (const auto& net : graph.nets) {
        intervals.push_back(initial_interval(net));
    }

    // Resolve each constraint to the nets it touches
    std::vector<std::pair<size_t, size_t>> endpoints;
    std::vector<std::vector<size_t>> touching(num_nets);
    endpoints.reserve(constraints.size());
    for (size_t c = 0; c < constraints.size(); ++c) {
        auto a = graph.net_at(constraints[c].a);
        auto b = graph.net_at(constraints[c].b);
        if (!a || !b) {
            throw std::invalid_argument("Constraint refers to a location with no net: " +
                                        loc_text(!a ? constraints[c].a : constraints[c].b));
        }
        endpoints.emplace_back(*a, *b);
        touching[*a].push_back(c);
        if (*b != *a) {
            touching[*b].push_back(c);
        }
    }

    std::deque<size_t> worklist;
    std::vector<bool> queued(constraints.size(), true);
    for (size_t c = 0; c < constraints.size(); ++c) {
        worklist.push_back(c);
    }

    SizeSolution solution;
    std::vector<bool> conflicted(num_nets, false);
    while (!worklist.empty()) {
        const size_t c = worklist.front();
        worklist.pop_front();
        queued[c] = false;

        const auto [a, b] = endpoints[c];
        for (size_t net : apply_constraint(constraints[c], a, b, intervals)) {
            if (intervals[net].is_empty()) {
                if (!conflicted[net]) {
                    conflicted[net] = true;
                    const WireLoc& loc = constraints[c].a;
                    solution.errors.push_back(
                        {BuildErrorKind::WIRE_SIZE_CONFLICT,
                         "The wire at " + loc_text(graph.nets[net].representative) +
                             " has no size satisfying the port at " + loc_text(loc) + ".",
                         net, loc});
                }
                continue;
            }
            for (size_t other : touching[net]) {
                if (!queued[other]) {
                    queued[other] = true;
                    worklist.push_back(other);
                }
            }
        }
    }

    solution.sizes.reserve(num_nets);
    for (size_t n = 0; n < num_nets; ++n) {
        if (conflicted[n]) {
            solution.sizes.push_back(std::nullopt);
        } else {
            solution.sizes.push_back(intervals[n].lo());
        }
    }
    return solution;
}

} // namespace tachy
