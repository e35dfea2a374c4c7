#pragma once

#include "config.hpp"
#include "node_registry.hpp"
#include "types.hpp"
#include <set>
#include <string>

namespace spora {

class PlacementPlanner {
public:
    PlacementPlanner(const Config& config, const NodeRegistry& registry);

    // Checks, in order: tier resolution, payment capacity, eligible supply,
    // then selects preferred regions, new regions, and best remaining nodes.
    // Throws InvalidRedundancyError, InsufficientCapacityError or
    // InsufficientNodesError. Never returns a partial plan.
    DistributionPlan create_plan(const std::string& chunk_id,
                                 const StoragePreference& preference,
                                 double payment_capacity,
                                 std::uint64_t chunk_bytes = 0) const;

    // Picks up to `deficit` new nodes, excluding `existing` and counting their
    // regions as covered. Throws InsufficientNodesError when existing plus
    // selected stays under the floor.
    DistributionPlan create_repair_plan(const std::string& chunk_id,
                                        const StoragePreference& preference,
                                        const std::set<std::string>& existing,
                                        std::size_t deficit,
                                        std::uint64_t chunk_bytes = 0) const;

    double base_cost_per_chunk() const { return config_.base_cost_per_chunk; }
    double estimate_cost(std::size_t copies) const;
    std::size_t floor() const { return config_.redundancy_floor; }

private:
    std::vector<std::string> select(const RedundancyTier& tier,
                                    const StoragePreference& preference,
                                    const std::vector<StorageNode>& candidates,
                                    std::set<std::string> covered_regions,
                                    std::size_t target,
                                    std::set<std::string>& regions_out) const;

    const Config& config_;
    const NodeRegistry& registry_;
};

} // namespace spora
