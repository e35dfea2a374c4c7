#pragma once

#include "config.hpp"
#include "event_channel.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spora {

struct NodeRegistration {
    std::uint64_t capacity_bytes = 0;
    std::string region;
    std::string pubkey;
    std::string address;
};

struct NodeCriteria {
    std::optional<std::string> region;
    std::uint64_t min_available_bytes = 0;
    std::set<std::string> exclude;
};

// "node_" + first 32 hex chars of SHA-256(pubkey). A random id when pubkey is empty.
std::string node_id_for_pubkey(const std::string& pubkey);

// Sole owner of StorageNode records. Everyone else keeps node ids and asks
// for a fresh copy right before use.
class NodeRegistry {
public:
    NodeRegistry(const Config& config, EventChannel& events, NowFunction now = &Clock::now);

    // Throws InvalidInputError on zero capacity or an empty region.
    std::string register_node(const NodeRegistration& registration);

    // Inserts or updates a node: last_seen becomes now, status becomes active.
    // An update keeps the registry's reliability score and byte accounting.
    void announce(StorageNode node);

    // Inserts the record verbatim (snapshot restore).
    void restore(const StorageNode& node);

    bool remove(const std::string& node_id);

    // Eligible nodes that match, sorted by reliability desc then id asc.
    std::vector<StorageNode> find_nodes(const NodeCriteria& criteria = {}) const;
    bool is_eligible(const std::string& node_id) const;

    std::optional<StorageNode> get(const std::string& node_id) const;
    std::vector<StorageNode> all() const;
    bool contains(const std::string& node_id) const { return nodes_.count(node_id) > 0; }
    std::size_t size() const { return nodes_.size(); }

    // Heartbeat: offline|dead -> active. Returns false for an unknown node.
    bool mark_seen(const std::string& node_id);
    bool mark_offline(const std::string& node_id);

    bool record_success(const std::string& node_id);
    bool record_failure(const std::string& node_id);

    // Byte accounting for placed replicas.
    bool reserve(const std::string& node_id, std::uint64_t bytes);
    void release(const std::string& node_id, std::uint64_t bytes);

    // Liveness state machine. Returns the number of transitions.
    std::size_t sweep();

    TimePoint now() const { return now_(); }

private:
    bool eligible(const StorageNode& node, TimePoint now) const;

    const Config& config_;
    EventChannel& events_;
    NowFunction now_;
    std::map<std::string, StorageNode> nodes_;
};

} // namespace spora
