#pragma once

#include "chunk_store.hpp"
#include "config.hpp"
#include "event_channel.hpp"
#include "node_registry.hpp"
#include "replica_ledger.hpp"
#include "transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace spora {

enum class ProofStatus { pending, complete, failed };

const char* to_string(ProofStatus status);

struct StorageProof {
    std::string chunk_id;
    std::string node_id;
    Bytes nonce;
    TimePoint issued_at{};
    std::optional<TimePoint> answered_at;
    ProofStatus status = ProofStatus::pending;
    std::optional<Digest> response_digest;
    boost::system::error_code error;
};

// Challenge-response proofs of storage. A node proves it holds a chunk by
// returning SHA-256(blob || nonce) for a fresh nonce before the timeout.
class VerificationEngine {
public:
    using VerifyHandler = std::function<void(bool)>;

    VerificationEngine(boost::asio::io_context& io_context,
                       const Config& config,
                       ReplicaLedger& ledger,
                       NodeRegistry& registry,
                       const ChunkStore& reference,
                       Transport& transport,
                       EventChannel& events);

    // Queues a challenge; at most max_concurrent_verifications run at once.
    // The handler receives true only for a valid, timely proof. A chunk with
    // no reference copy resolves false without counting against the node.
    void verify(const std::string& chunk_id, const std::string& node_id, VerifyHandler handler = {});

    // Challenges every ledger pair whose last proof is older than challenge_interval.
    std::size_t run_cycle();

    void start();
    void stop();

    std::vector<StorageProof> history(const std::string& chunk_id, const std::string& node_id) const;
    unsigned consecutive_failures(const std::string& chunk_id, const std::string& node_id) const;
    std::optional<ProofStatus> last_status(const std::string& chunk_id, const std::string& node_id) const;
    std::optional<TimePoint> last_verified(const std::string& chunk_id) const;

    void forget(const std::string& chunk_id);

    std::size_t in_flight() const { return in_flight_; }
    std::size_t queued() const { return queue_.size(); }

private:
    using PairKey = std::pair<std::string, std::string>;

    struct Request {
        std::string chunk_id;
        std::string node_id;
        VerifyHandler handler;
    };

    struct PairState {
        std::deque<std::shared_ptr<StorageProof>> history;
        unsigned consecutive_failures = 0;
        bool in_progress = false;
    };

    struct Attempt;

    void pump();
    void begin(Request request);
    void settle(const std::shared_ptr<Attempt>& attempt, ProofStatus status,
                std::optional<Digest> digest, boost::system::error_code ec);
    void schedule_cycle();

    boost::asio::io_context& io_context_;
    const Config& config_;
    ReplicaLedger& ledger_;
    NodeRegistry& registry_;
    const ChunkStore& reference_;
    Transport& transport_;
    EventChannel& events_;

    std::deque<Request> queue_;
    std::size_t in_flight_ = 0;
    std::map<PairKey, PairState> pairs_;
    std::map<std::string, TimePoint> last_verified_;

    boost::asio::steady_timer cycle_timer_;
    bool running_ = false;
};

} // namespace spora
