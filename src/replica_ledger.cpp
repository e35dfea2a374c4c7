#include "replica_ledger.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"

namespace spora {

ReplicaLedger::ReplicaLedger(EventChannel& events, std::size_t floor)
    : events_(events), floor_(floor) {}

void ReplicaLedger::record_placement(const std::string& chunk_id,
                                     const std::vector<std::string>& node_ids,
                                     std::uint32_t required_copies) {
    Entry& entry = entries_[chunk_id];
    entry.required = required_copies;
    for (const auto& node_id : node_ids) {
        entry.replicas.insert(node_id);
        by_node_[node_id].insert(chunk_id);
    }
    log::debug("Ledger") << chunk_id << " placed on " << entry.replicas.size() << "/" << required_copies;
    evaluate(chunk_id, entry);
}

bool ReplicaLedger::add_replica(const std::string& chunk_id, const std::string& node_id) {
    auto it = entries_.find(chunk_id);
    if (it == entries_.end()) {
        throw NotFoundError("Unknown chunk " + chunk_id);
    }
    const bool inserted = it->second.replicas.insert(node_id).second;
    if (inserted) {
        by_node_[node_id].insert(chunk_id);
        evaluate(chunk_id, it->second);
    }
    return inserted;
}

bool ReplicaLedger::remove_replica(const std::string& chunk_id, const std::string& node_id) {
    auto it = entries_.find(chunk_id);
    if (it == entries_.end()) {
        return false;
    }
    const bool removed = it->second.replicas.erase(node_id) > 0;
    if (removed) {
        auto node_it = by_node_.find(node_id);
        if (node_it != by_node_.end()) {
            node_it->second.erase(chunk_id);
            if (node_it->second.empty()) {
                by_node_.erase(node_it);
            }
        }
        log::debug("Ledger") << "Removed replica of " << chunk_id << " on " << node_id;
        evaluate(chunk_id, it->second);
    }
    return removed;
}

void ReplicaLedger::evaluate(const std::string& chunk_id, const Entry& entry) {
    const std::size_t current = entry.replicas.size();
    if (current < entry.required) {
        events_.push(LowRedundancy{chunk_id, current, entry.required});
    }
    if (current < floor_) {
        log::warn("Ledger") << chunk_id << " is critical: " << current << " replica(s)";
        events_.push(CriticalRedundancy{chunk_id, current});
    }
}

std::set<std::string> ReplicaLedger::current_replicas(const std::string& chunk_id) const {
    auto it = entries_.find(chunk_id);
    if (it == entries_.end()) {
        return {};
    }
    return it->second.replicas;
}

std::uint32_t ReplicaLedger::required_copies(const std::string& chunk_id) const {
    auto it = entries_.find(chunk_id);
    return it == entries_.end() ? 0 : it->second.required;
}

std::size_t ReplicaLedger::deficit(const std::string& chunk_id) const {
    auto it = entries_.find(chunk_id);
    if (it == entries_.end() || it->second.replicas.size() >= it->second.required) {
        return 0;
    }
    return it->second.required - it->second.replicas.size();
}

std::vector<std::string> ReplicaLedger::chunks_on_node(const std::string& node_id) const {
    auto it = by_node_.find(node_id);
    if (it == by_node_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> ReplicaLedger::chunks() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool ReplicaLedger::forget(const std::string& chunk_id) {
    auto it = entries_.find(chunk_id);
    if (it == entries_.end()) {
        return false;
    }
    for (const auto& node_id : it->second.replicas) {
        auto node_it = by_node_.find(node_id);
        if (node_it != by_node_.end()) {
            node_it->second.erase(chunk_id);
            if (node_it->second.empty()) {
                by_node_.erase(node_it);
            }
        }
    }
    entries_.erase(it);
    return true;
}

} // namespace spora
