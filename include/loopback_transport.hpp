#pragma once

#include "chunk_store.hpp"
#include "transport.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace spora {

// Failure switches for one simulated node.
struct NodeFaults {
    bool unreachable = false;        // every request fails with transport_errc::unreachable
    bool drop_challenges = false;    // challenges are never answered
    bool corrupt_proofs = false;     // challenges are answered with a wrong digest
    unsigned fail_next_stores = 0;   // the next N stores are rejected
    std::chrono::milliseconds latency{0};
};

struct LoopbackStats {
    std::size_t challenges = 0;
    std::size_t stores = 0;
    std::size_t fetches = 0;
    std::size_t deletes = 0;
    std::size_t pings = 0;
};

// In-process transport: every node is a ChunkStore inside this object.
// Responses are computed when they are delivered, through the io_context.
class LoopbackTransport : public Transport {
public:
    explicit LoopbackTransport(boost::asio::io_context& io_context);

    ChunkStore& attach(const std::string& node_id, std::uint64_t capacity_bytes);
    void detach(const std::string& node_id);
    ChunkStore* store_for(const std::string& node_id);
    NodeFaults& faults(const std::string& node_id);

    const LoopbackStats& stats() const { return stats_; }

    void send_challenge(const StorageNode& node, const std::string& chunk_id,
                        const Bytes& nonce, ChallengeHandler handler) override;
    void store_chunk(const StorageNode& node, const std::string& chunk_id,
                     std::shared_ptr<const Bytes> blob, CompletionHandler handler) override;
    void fetch_chunk(const StorageNode& node, const std::string& chunk_id,
                     FetchHandler handler) override;
    void delete_chunk(const StorageNode& node, const std::string& chunk_id,
                      CompletionHandler handler) override;
    void ping(const StorageNode& node, CompletionHandler handler) override;

private:
    struct SimulatedNode {
        std::unique_ptr<ChunkStore> store;
        NodeFaults faults;
    };

    // Runs fn after the node's latency; nullptr is passed when the node is
    // detached or unreachable at delivery time.
    void deliver(const std::string& node_id, std::function<void(SimulatedNode*)> fn);

    boost::asio::io_context& io_context_;
    std::map<std::string, SimulatedNode> nodes_;
    std::map<std::string, NodeFaults> pending_faults_;
    LoopbackStats stats_;
};

} // namespace spora
