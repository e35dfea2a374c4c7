#include "placement_planner.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include "test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <cassert>
#include <cmath>
#include <map>

using namespace spora;

namespace {

template <typename E, typename F>
bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

std::string add(NodeRegistry& registry, const std::string& region) {
    NodeRegistration registration;
    registration.capacity_bytes = 1 << 20;
    registration.region = region;
    return registry.register_node(registration);
}

std::map<std::string, std::size_t> by_region(const NodeRegistry& registry, const DistributionPlan& plan) {
    std::map<std::string, std::size_t> counts;
    for (const auto& id : plan.target_nodes) {
        ++counts[registry.get(id)->region];
    }
    return counts;
}

bool distinct(const std::vector<std::string>& ids) {
    return std::set<std::string>(ids.begin(), ids.end()).size() == ids.size();
}

} // namespace

int main() {
    log::set_level(log::Level::error);

    boost::asio::io_context io_context;
    Config config;
    config.base_cost_per_chunk = 1000.0;
    EventChannel events(io_context, 64);

    StoragePreference standard;
    StoragePreference minimum;
    minimum.level = RedundancyLevel::minimum;

    // Four nodes cannot carry any plan.
    {
        NodeRegistry registry(config, events);
        PlacementPlanner planner(config, registry);
        for (int i = 0; i < 4; ++i) {
            add(registry, "r" + std::to_string(i));
        }
        assert(throws<InsufficientNodesError>([&] { planner.create_plan("c.0", minimum, 1e9); }));

        // Capacity is checked before supply.
        assert(throws<InsufficientCapacityError>([&] { planner.create_plan("c.0", minimum, 10.0); }));

        // Tier resolution comes first of all.
        StoragePreference four;
        four.level = RedundancyLevel::custom;
        four.custom_copies = 4;
        assert(throws<InvalidRedundancyError>([&] { planner.create_plan("c.0", four, 10.0); }));

        add(registry, "r4");
        const auto plan = planner.create_plan("c.0", minimum, 1e9);
        assert(plan.target_nodes.size() == 5);
    }

    NodeRegistry registry(config, events);
    PlacementPlanner planner(config, registry);
    const std::vector<std::string> regions{"eu", "us", "ap", "sa", "af"};
    for (int i = 0; i < 20; ++i) {
        add(registry, regions[i % regions.size()]);
    }

    // Standard: 15 distinct nodes over at least 4 regions.
    {
        const auto plan = planner.create_plan("file_x.0", standard, 1e9);
        assert(plan.chunk_id == "file_x.0");
        assert(plan.target_nodes.size() == 15);
        assert(plan.redundancy_level == 15);
        assert(distinct(plan.target_nodes));
        assert(plan.regions.size() >= 4);
        assert(std::fabs(plan.estimated_cost - 3000.0) < 1e-9);
        assert(by_region(registry, plan).size() == plan.regions.size());
    }

    // Payment capacity threshold is cost_multiplier * base.
    assert(throws<InsufficientCapacityError>([&] { planner.create_plan("file_x.0", standard, 1799.0); }));
    assert(planner.create_plan("file_x.0", standard, 1800.0).target_nodes.size() == 15);

    // Maximum wants 30 but takes every eligible node above the floor.
    {
        StoragePreference maximum;
        maximum.level = RedundancyLevel::maximum;
        const auto plan = planner.create_plan("file_x.1", maximum, 1e9);
        assert(plan.target_nodes.size() == 20);
        assert(plan.regions.size() == 5);
        assert(std::fabs(plan.estimated_cost - 6000.0) < 1e-9);
    }

    // Preferred regions get their share first.
    {
        StoragePreference preferred = minimum;
        preferred.preferred_regions = {"ap"};
        const auto plan = planner.create_plan("file_x.2", preferred, 1e9);
        const auto counts = by_region(registry, plan);
        assert(plan.target_nodes.size() == 5);
        assert(counts.at("ap") >= 2);
        assert(counts.size() >= 2);
        assert(registry.get(plan.target_nodes[0])->region == "ap");
        assert(registry.get(plan.target_nodes[1])->region == "ap");
    }

    // Region spread wins over raw reliability until the tier's regions are covered.
    {
        EventChannel skew_events(io_context, 64);
        NodeRegistry skewed(config, skew_events);
        PlacementPlanner skew_planner(config, skewed);
        std::vector<std::string> crowded;
        for (int i = 0; i < 12; ++i) {
            crowded.push_back(add(skewed, "eu"));
        }
        for (const auto& region : {"us", "ap", "sa"}) {
            add(skewed, region);
        }
        for (const auto& id : crowded) {
            for (int k = 0; k < 10; ++k) {
                skewed.record_success(id);
            }
        }
        const auto plan = skew_planner.create_plan("file_y.0", standard, 1e9);
        assert(plan.target_nodes.size() == 15);
        assert(plan.regions.size() == 4);
    }

    // Repair: only new nodes, and only as many as the deficit.
    {
        const auto initial = planner.create_plan("file_z.0", minimum, 1e9);
        const std::set<std::string> existing(initial.target_nodes.begin(), initial.target_nodes.end());
        const auto repair = planner.create_repair_plan("file_z.0", standard, existing, 10);
        assert(repair.target_nodes.size() == 10);
        for (const auto& id : repair.target_nodes) {
            assert(!existing.count(id));
        }
        assert(repair.redundancy_level == 15);
        assert(std::fabs(repair.estimated_cost - 2000.0) < 1e-9);

        const auto none = planner.create_repair_plan("file_z.0", standard, existing, 0);
        assert(none.target_nodes.empty());

        // Short supply is fine as long as the result reaches the floor.
        const auto partial = planner.create_repair_plan("file_z.0", standard, existing, 40);
        assert(partial.target_nodes.size() == 15);
    }

    // Repair below the floor fails.
    {
        EventChannel small_events(io_context, 64);
        NodeRegistry small(config, small_events);
        PlacementPlanner small_planner(config, small);
        const std::string a = add(small, "eu");
        const std::string b = add(small, "us");
        add(small, "ap");
        add(small, "sa");
        assert(throws<InsufficientNodesError>([&] {
            small_planner.create_repair_plan("file_w.0", minimum, {a, b}, 3);
        }));
    }

    assert(std::fabs(planner.estimate_cost(5) - 1000.0) < 1e-9);
    assert(std::fabs(planner.estimate_cost(1) - 200.0) < 1e-9);

    // A configurable floor.
    {
        Config strict = config;
        strict.redundancy_floor = 8;
        PlacementPlanner strict_planner(strict, registry);
        assert(strict_planner.floor() == 8);
        EventChannel few_events(io_context, 64);
        NodeRegistry few(strict, few_events);
        PlacementPlanner few_planner(strict, few);
        for (int i = 0; i < 7; ++i) {
            add(few, regions[i % regions.size()]);
        }
        assert(throws<InsufficientNodesError>([&] { few_planner.create_plan("c.0", minimum, 1e9); }));
    }

    return 0;
}
