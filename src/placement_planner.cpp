#include "placement_planner.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <algorithm>

namespace spora {

PlacementPlanner::PlacementPlanner(const Config& config, const NodeRegistry& registry)
    : config_(config), registry_(registry) {}

double PlacementPlanner::estimate_cost(std::size_t copies) const {
    return config_.base_cost_per_chunk * static_cast<double>(copies) / static_cast<double>(kAbsoluteRedundancyFloor);
}

DistributionPlan PlacementPlanner::create_plan(const std::string& chunk_id,
                                               const StoragePreference& preference,
                                               double payment_capacity,
                                               std::uint64_t chunk_bytes) const {
    const RedundancyTier tier = resolve_tier(preference);

    const double required_capacity = tier.cost_multiplier * config_.base_cost_per_chunk;
    if (required_capacity > payment_capacity) {
        throw InsufficientCapacityError("Payment capacity " + std::to_string(payment_capacity) +
                                        " is below " + std::to_string(required_capacity) +
                                        " required for " + tier.name + " redundancy");
    }

    NodeCriteria criteria;
    criteria.min_available_bytes = chunk_bytes;
    const auto candidates = registry_.find_nodes(criteria);
    if (candidates.size() < config_.redundancy_floor) {
        throw InsufficientNodesError("Only " + std::to_string(candidates.size()) +
                                     " eligible node(s), need at least " +
                                     std::to_string(config_.redundancy_floor));
    }

    DistributionPlan plan;
    plan.chunk_id = chunk_id;
    plan.target_nodes = select(tier, preference, candidates, {}, tier.copies, plan.regions);
    if (plan.target_nodes.size() < config_.redundancy_floor) {
        throw InsufficientNodesError("Selected " + std::to_string(plan.target_nodes.size()) +
                                     " node(s) for " + chunk_id + ", need at least " +
                                     std::to_string(config_.redundancy_floor));
    }
    plan.redundancy_level = static_cast<std::uint32_t>(plan.target_nodes.size());
    plan.estimated_cost = estimate_cost(tier.copies);

    log::debug("Planner") << chunk_id << ": " << plan.target_nodes.size() << "/" << tier.copies
                          << " nodes across " << plan.regions.size() << " region(s)";
    return plan;
}

DistributionPlan PlacementPlanner::create_repair_plan(const std::string& chunk_id,
                                                      const StoragePreference& preference,
                                                      const std::set<std::string>& existing,
                                                      std::size_t deficit,
                                                      std::uint64_t chunk_bytes) const {
    const RedundancyTier tier = resolve_tier(preference);

    DistributionPlan plan;
    plan.chunk_id = chunk_id;
    if (deficit == 0) {
        plan.redundancy_level = static_cast<std::uint32_t>(existing.size());
        return plan;
    }

    std::set<std::string> covered;
    for (const auto& node_id : existing) {
        if (auto node = registry_.get(node_id)) {
            covered.insert(node->region);
        }
    }

    NodeCriteria criteria;
    criteria.min_available_bytes = chunk_bytes;
    criteria.exclude = existing;
    const auto candidates = registry_.find_nodes(criteria);

    plan.target_nodes = select(tier, preference, candidates, covered, deficit, plan.regions);
    if (existing.size() + plan.target_nodes.size() < config_.redundancy_floor) {
        throw InsufficientNodesError("Repair of " + chunk_id + " reaches only " +
                                     std::to_string(existing.size() + plan.target_nodes.size()) +
                                     " replica(s), need at least " +
                                     std::to_string(config_.redundancy_floor));
    }
    plan.redundancy_level = static_cast<std::uint32_t>(existing.size() + plan.target_nodes.size());
    plan.estimated_cost = estimate_cost(plan.target_nodes.size());

    log::debug("Planner") << "Repair " << chunk_id << ": +" << plan.target_nodes.size()
                          << " node(s), deficit " << deficit;
    return plan;
}

std::vector<std::string> PlacementPlanner::select(const RedundancyTier& tier,
                                                  const StoragePreference& preference,
                                                  const std::vector<StorageNode>& candidates,
                                                  std::set<std::string> covered_regions,
                                                  std::size_t target,
                                                  std::set<std::string>& regions_out) const {
    std::vector<std::string> selected;
    std::set<std::string> taken;

    auto take = [&](const StorageNode& node) {
        selected.push_back(node.id);
        taken.insert(node.id);
        covered_regions.insert(node.region);
        regions_out.insert(node.region);
    };

    // --- Preferred regions ---
    const std::size_t share = tier.regions == 0 ? 0 : tier.copies / tier.regions;
    std::set<std::string> seen_preferred;
    for (const auto& region : preference.preferred_regions) {
        if (!seen_preferred.insert(region).second) {
            continue;
        }
        std::size_t in_region = 0;
        for (const auto& node : candidates) {
            if (selected.size() >= target || in_region >= share) break;
            if (node.region != region || taken.count(node.id)) continue;
            take(node);
            ++in_region;
        }
    }

    // --- New regions first ---
    while (selected.size() < target && covered_regions.size() < tier.regions) {
        auto it = std::find_if(candidates.begin(), candidates.end(), [&](const StorageNode& node) {
            return !taken.count(node.id) && !covered_regions.count(node.region);
        });
        if (it == candidates.end()) {
            break;
        }
        take(*it);
    }

    // --- Best remaining ---
    for (const auto& node : candidates) {
        if (selected.size() >= target) break;
        if (taken.count(node.id)) continue;
        take(node);
    }

    return selected;
}

} // namespace spora
