#pragma once

#include "event_channel.hpp"
#include "types.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace spora {

// chunk id -> set of node ids holding a replica. The only source of truth for
// redundancy. Every mutation re-evaluates the chunk and signals deficits.
class ReplicaLedger {
public:
    explicit ReplicaLedger(EventChannel& events, std::size_t floor = kAbsoluteRedundancyFloor);

    // Adds the nodes to the chunk's replica set and sets its target.
    void record_placement(const std::string& chunk_id,
                          const std::vector<std::string>& node_ids,
                          std::uint32_t required_copies);

    // Throws NotFoundError for an unknown chunk.
    bool add_replica(const std::string& chunk_id, const std::string& node_id);
    bool remove_replica(const std::string& chunk_id, const std::string& node_id);

    std::set<std::string> current_replicas(const std::string& chunk_id) const;
    std::uint32_t required_copies(const std::string& chunk_id) const;
    std::size_t deficit(const std::string& chunk_id) const;
    bool contains(const std::string& chunk_id) const { return entries_.count(chunk_id) > 0; }

    std::vector<std::string> chunks_on_node(const std::string& node_id) const;
    std::vector<std::string> chunks() const;

    // Drops the chunk without signalling.
    bool forget(const std::string& chunk_id);

    std::size_t size() const { return entries_.size(); }
    std::size_t floor() const { return floor_; }

private:
    struct Entry {
        std::set<std::string> replicas;
        std::uint32_t required = 0;
    };

    void evaluate(const std::string& chunk_id, const Entry& entry);

    EventChannel& events_;
    std::size_t floor_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::set<std::string>> by_node_;
};

} // namespace spora
