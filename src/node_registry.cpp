#include "node_registry.hpp"
#include "spora/errors.hpp"
#include "spora/hex.hpp"
#include "spora/log.hpp"
#include <algorithm>

namespace spora {

std::string node_id_for_pubkey(const std::string& pubkey) {
    if (pubkey.empty()) {
        return "node_" + hex::encode(crypto::random_bytes(16));
    }
    const auto digest = crypto::sha256(reinterpret_cast<const std::uint8_t*>(pubkey.data()), pubkey.size());
    return "node_" + hex::encode(digest).substr(0, 32);
}

NodeRegistry::NodeRegistry(const Config& config, EventChannel& events, NowFunction now)
    : config_(config), events_(events), now_(std::move(now)) {}

std::string NodeRegistry::register_node(const NodeRegistration& registration) {
    if (registration.capacity_bytes == 0) {
        throw InvalidInputError("Node capacity must be positive");
    }
    if (registration.region.empty()) {
        throw InvalidInputError("Node region must not be empty");
    }

    StorageNode node;
    node.id = node_id_for_pubkey(registration.pubkey);
    node.region = registration.region;
    node.pubkey = registration.pubkey;
    node.address = registration.address;
    node.capacity_bytes = registration.capacity_bytes;
    node.available_bytes = registration.capacity_bytes;
    announce(node);
    return node.id;
}

void NodeRegistry::announce(StorageNode node) {
    if (node.id.empty()) {
        throw InvalidInputError("Node id must not be empty");
    }
    node.last_seen = now_();
    node.status = NodeStatus::active;

    auto it = nodes_.find(node.id);
    if (it == nodes_.end()) {
        node.reliability = std::clamp(node.reliability, 0.0, 1.0);
        log::info("Registry") << "Registered " << node.id << " in " << node.region
                              << ", capacity " << node.capacity_bytes;
        nodes_.emplace(node.id, std::move(node));
        return;
    }

    // Keep what the registry learned about the node.
    const std::uint64_t used = it->second.capacity_bytes - std::min(it->second.capacity_bytes, it->second.available_bytes);
    node.reliability = it->second.reliability;
    node.available_bytes = node.capacity_bytes > used ? node.capacity_bytes - used : 0;
    it->second = std::move(node);
    log::debug("Registry") << "Updated " << it->first;
}

void NodeRegistry::restore(const StorageNode& node) {
    nodes_[node.id] = node;
}

bool NodeRegistry::remove(const std::string& node_id) {
    if (nodes_.erase(node_id) == 0) {
        return false;
    }
    log::info("Registry") << "Removed " << node_id;
    return true;
}

bool NodeRegistry::eligible(const StorageNode& node, TimePoint now) const {
    return node.status == NodeStatus::active &&
           node.available_bytes > 0 &&
           now - node.last_seen < config_.freshness_window;
}

std::vector<StorageNode> NodeRegistry::find_nodes(const NodeCriteria& criteria) const {
    const TimePoint now = now_();
    std::vector<StorageNode> result;
    for (const auto& entry : nodes_) {
        const StorageNode& node = entry.second;
        if (!eligible(node, now)) continue;
        if (criteria.region && node.region != *criteria.region) continue;
        if (node.available_bytes < criteria.min_available_bytes) continue;
        if (criteria.exclude.count(node.id)) continue;
        result.push_back(node);
    }
    std::sort(result.begin(), result.end(), [](const StorageNode& a, const StorageNode& b) {
        if (a.reliability != b.reliability) {
            return a.reliability > b.reliability;
        }
        return a.id < b.id;
    });
    return result;
}

bool NodeRegistry::is_eligible(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    return it != nodes_.end() && eligible(it->second, now_());
}

std::optional<StorageNode> NodeRegistry::get(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<StorageNode> NodeRegistry::all() const {
    std::vector<StorageNode> result;
    result.reserve(nodes_.size());
    for (const auto& entry : nodes_) {
        result.push_back(entry.second);
    }
    return result;
}

bool NodeRegistry::mark_seen(const std::string& node_id) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.last_seen = now_();
    if (it->second.status != NodeStatus::active) {
        log::info("Registry") << node_id << " is back (" << to_string(it->second.status) << " -> active)";
        it->second.status = NodeStatus::active;
    }
    return true;
}

bool NodeRegistry::mark_offline(const std::string& node_id) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }
    if (it->second.status == NodeStatus::active) {
        it->second.status = NodeStatus::offline;
        log::warn("Registry") << node_id << " marked offline";
        events_.push(NodeOffline{node_id});
    }
    return true;
}

bool NodeRegistry::record_success(const std::string& node_id) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.reliability = std::min(1.0, it->second.reliability + config_.reliability_reward);
    return true;
}

bool NodeRegistry::record_failure(const std::string& node_id) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.reliability = std::max(0.0, it->second.reliability - config_.reliability_penalty);
    log::debug("Registry") << node_id << " reliability now " << it->second.reliability;
    return true;
}

bool NodeRegistry::reserve(const std::string& node_id, std::uint64_t bytes) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end() || it->second.available_bytes < bytes) {
        return false;
    }
    it->second.available_bytes -= bytes;
    return true;
}

void NodeRegistry::release(const std::string& node_id, std::uint64_t bytes) {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return;
    }
    it->second.available_bytes = std::min(it->second.capacity_bytes, it->second.available_bytes + bytes);
}

std::size_t NodeRegistry::sweep() {
    const TimePoint now = now_();
    const auto offline_after = 2 * config_.heartbeat_interval;
    std::size_t transitions = 0;

    for (auto& entry : nodes_) {
        StorageNode& node = entry.second;
        const auto silent = now - node.last_seen;

        if (node.status != NodeStatus::dead && silent > config_.dead_node_timeout) {
            node.status = NodeStatus::dead;
            log::warn("Liveness") << node.id << " is dead";
            events_.push(NodeDead{node.id});
            ++transitions;
        } else if (node.status == NodeStatus::active && silent > offline_after) {
            node.status = NodeStatus::offline;
            log::warn("Liveness") << node.id << " went offline";
            events_.push(NodeOffline{node.id});
            ++transitions;
        }
    }
    return transitions;
}

} // namespace spora
