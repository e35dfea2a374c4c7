#pragma once

#include "chunk_codec.hpp"
#include "chunk_store.hpp"
#include "config.hpp"
#include "keyed_serializer.hpp"
#include "metadata_store.hpp"
#include "node_registry.hpp"
#include "payment.hpp"
#include "placement_planner.hpp"
#include "replica_ledger.hpp"
#include "transport.hpp"
#include "verification_engine.hpp"
#include <boost/asio/io_context.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spora {

struct StoreOptions {
    StoragePreference preference;
    std::string name;
};

struct StoreResult {
    std::string file_id;
    std::vector<std::string> chunk_ids;
    double cost = 0.0;
};

struct FileStatus {
    std::size_t chunks = 0;
    std::size_t nodes_storing = 0;
    std::size_t redundancy_level = 0;   // fewest replicas held by any chunk
    std::set<std::string> regions;
    double health_percent = 0.0;
    std::optional<TimePoint> last_verified;
};

// Client-facing operations. Completion handlers receive a null exception_ptr
// on success; only input and policy errors (and NotFoundError) reach them.
class StorageService {
public:
    using StoreHandler = std::function<void(std::exception_ptr, StoreResult)>;
    using RetrieveHandler = std::function<void(std::exception_ptr, Bytes)>;
    using RemoveHandler = std::function<void(std::exception_ptr)>;

    StorageService(boost::asio::io_context& io_context,
                   const Config& config,
                   const ChunkCodec& codec,
                   NodeRegistry& registry,
                   const PlacementPlanner& planner,
                   ReplicaLedger& ledger,
                   VerificationEngine& verifier,
                   MetadataStore& metadata,
                   ChunkStore& reference,
                   Transport& transport,
                   PaymentOracle& payment,
                   KeyedSerializer& serializer);

    // Encodes one chunk per posted handler, plans every chunk, checks the total
    // cost, transfers, then records placements and charges storage.
    // Succeeds when every chunk reached at least one node; otherwise rolls back
    // and fails with InsufficientNodesError.
    void store(Bytes data, StoreOptions options, StoreHandler handler);

    void retrieve(const std::string& file_id, RetrieveHandler handler);

    // Deletes every replica and drops all state for the file.
    void remove(const std::string& file_id, RemoveHandler handler);

    // Throws NotFoundError.
    FileStatus status(const std::string& file_id) const;

    std::string register_node(const NodeRegistration& registration);

    // Throws NotFoundError for an unknown node.
    void heartbeat(const std::string& node_id);

private:
    struct StoreJob;
    struct RetrieveJob;

    void begin_store(const std::shared_ptr<StoreJob>& job);
    void encode_next(const std::shared_ptr<StoreJob>& job);
    void plan_store(const std::shared_ptr<StoreJob>& job);
    void pump_transfers(const std::shared_ptr<StoreJob>& job);
    void complete_store(const std::shared_ptr<StoreJob>& job);
    void abort_store(const std::shared_ptr<StoreJob>& job, std::exception_ptr error);

    void fetch_chunk(const std::shared_ptr<RetrieveJob>& job, std::size_t slot);
    void chunk_fetched(const std::shared_ptr<RetrieveJob>& job, std::size_t slot, Bytes blob);

    boost::asio::io_context& io_context_;
    const Config& config_;
    const ChunkCodec& codec_;
    NodeRegistry& registry_;
    const PlacementPlanner& planner_;
    ReplicaLedger& ledger_;
    VerificationEngine& verifier_;
    MetadataStore& metadata_;
    ChunkStore& reference_;
    Transport& transport_;
    PaymentOracle& payment_;
    KeyedSerializer& serializer_;
};

} // namespace spora
