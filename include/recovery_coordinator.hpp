#pragma once

#include "chunk_store.hpp"
#include "config.hpp"
#include "event_channel.hpp"
#include "keyed_serializer.hpp"
#include "metadata_store.hpp"
#include "node_registry.hpp"
#include "payment.hpp"
#include "placement_planner.hpp"
#include "replica_ledger.hpp"
#include "transport.hpp"
#include "verification_engine.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spora {

enum class RecoveryType { chunk, node, system };
enum class RecoveryStatus { started, in_progress, completed, failed };

const char* to_string(RecoveryType type);
const char* to_string(RecoveryStatus status);

struct RecoveryOperation {
    std::string id;
    RecoveryType type = RecoveryType::chunk;
    std::string target;
    unsigned attempts = 0;
    RecoveryStatus status = RecoveryStatus::started;
    TimePoint started_at{};
    std::optional<TimePoint> finished_at;
    std::string error;
    std::vector<std::chrono::milliseconds> backoff_history;
};

// Restores redundancy after chunk deficits, node failures, and on periodic sweeps.
//
// Operations move started -> in_progress -> completed|failed. A failed attempt
// is retried after backoff_base * attempts until max_retries attempts have run;
// policy errors fail at once. Requests for the same (type, target) coalesce
// into the operation already in flight. Only the most recent
// recovery_history_limit finished operations stay queryable.
//
// Evicted and evacuated replicas give their bytes back to the registry, and
// an active node is asked to delete its copy.
class RecoveryCoordinator {
public:
    using Callback = std::function<void(const RecoveryOperation&)>;
    using AlertHandler = std::function<void(const RecoveryExhausted&)>;

    RecoveryCoordinator(boost::asio::io_context& io_context,
                        const Config& config,
                        NodeRegistry& registry,
                        ReplicaLedger& ledger,
                        const PlacementPlanner& planner,
                        const VerificationEngine& verifier,
                        const ChunkStore& reference,
                        const MetadataStore& metadata,
                        Transport& transport,
                        PaymentOracle& payment,
                        EventChannel& events,
                        KeyedSerializer& serializer);

    // Returns the id of the new or coalesced operation.
    std::string start_recovery(RecoveryType type, const std::string& target, Callback done = {});

    // Drains the event channel and runs the periodic system sweep.
    void start();
    void stop();

    void set_alert_handler(AlertHandler handler) { alert_ = std::move(handler); }

    std::optional<RecoveryOperation> operation(const std::string& id) const;
    std::vector<RecoveryOperation> operations() const;
    std::size_t running() const { return running_; }
    std::size_t queued() const { return queue_.size(); }

private:
    using AttemptDone = std::function<void(std::exception_ptr)>;
    using Key = std::pair<RecoveryType, std::string>;

    struct Entry {
        RecoveryOperation op;
        std::vector<Callback> callbacks;
        std::uint64_t token = 0;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    struct ChunkRepair;

    void pump();
    void run_attempt(const std::string& id);
    void on_attempt_done(const std::string& id, std::uint64_t token, std::exception_ptr error);
    void finish(Entry& entry, RecoveryStatus status, const std::string& error);

    void execute(const RecoveryOperation& op, AttemptDone done);
    void recover_chunk(const std::string& chunk_id, AttemptDone done);
    void fetch_source(const std::shared_ptr<ChunkRepair>& repair);
    void place(const std::shared_ptr<ChunkRepair>& repair);
    void conclude(const std::shared_ptr<ChunkRepair>& repair);
    void recover_node(const std::string& node_id, AttemptDone done);
    void recover_system(AttemptDone done);
    void evacuate(const std::string& node_id);
    void drop_replica(const std::string& chunk_id, const std::string& node_id);
    std::uint64_t replica_bytes(const std::string& chunk_id) const;

    void receive_next();
    void handle_event(const Event& event);
    void schedule_sweep();

    StoragePreference preference_for(const std::string& chunk_id) const;

    boost::asio::io_context& io_context_;
    const Config& config_;
    NodeRegistry& registry_;
    ReplicaLedger& ledger_;
    const PlacementPlanner& planner_;
    const VerificationEngine& verifier_;
    const ChunkStore& reference_;
    const MetadataStore& metadata_;
    Transport& transport_;
    PaymentOracle& payment_;
    EventChannel& events_;
    KeyedSerializer& serializer_;

    std::map<std::string, Entry> ops_;
    std::map<Key, std::string> active_;
    std::deque<std::string> queue_;
    std::deque<std::string> finished_;
    std::size_t running_ = 0;
    std::uint64_t next_token_ = 0;

    AlertHandler alert_;
    boost::asio::steady_timer sweep_timer_;
    bool started_ = false;
    std::uint64_t generation_ = 0;
};

} // namespace spora
