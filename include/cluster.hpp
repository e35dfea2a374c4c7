#pragma once

#include "chunk_codec.hpp"
#include "chunk_store.hpp"
#include "config.hpp"
#include "event_channel.hpp"
#include "keyed_serializer.hpp"
#include "liveness_monitor.hpp"
#include "metadata_store.hpp"
#include "node_registry.hpp"
#include "payment.hpp"
#include "placement_planner.hpp"
#include "recovery_coordinator.hpp"
#include "replica_ledger.hpp"
#include "storage_service.hpp"
#include "transport.hpp"
#include "verification_engine.hpp"
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <limits>
#include <string>

namespace spora {

// Owns every client-side component and wires them together.
// The io_context must have stopped running before the cluster is destroyed.
class StorageCluster {
public:
    StorageCluster(boost::asio::io_context& io_context,
                   const Config& config,
                   Transport& transport,
                   PaymentOracle& payment,
                   const crypto::Key& key,
                   NowFunction now = &Clock::now);

    StorageCluster(const StorageCluster&) = delete;
    StorageCluster& operator=(const StorageCluster&) = delete;

    // Starts the verification cycle, liveness pings and the recovery loop.
    void start();
    void stop();

    // Metadata snapshot plus the reference copies kept under reference_dir.
    // Chunks left without a reference copy cannot be verified.
    void save_snapshot(const std::string& path) const;
    void load_snapshot(const std::string& path);

    const Config& config() const { return config_; }
    EventChannel& events() { return events_; }
    ChunkCodec& codec() { return codec_; }
    ChunkStore& reference_store() { return reference_; }
    NodeRegistry& registry() { return registry_; }
    ReplicaLedger& ledger() { return ledger_; }
    PlacementPlanner& planner() { return planner_; }
    MetadataStore& metadata() { return metadata_; }
    KeyedSerializer& serializer() { return serializer_; }
    VerificationEngine& verifier() { return verifier_; }
    RecoveryCoordinator& recovery() { return recovery_; }
    LivenessMonitor& liveness() { return liveness_; }
    StorageService& service() { return service_; }

private:
    Config config_;
    EventChannel events_;
    ChunkCodec codec_;
    ChunkStore reference_;
    NodeRegistry registry_;
    ReplicaLedger ledger_;
    PlacementPlanner planner_;
    MetadataStore metadata_;
    KeyedSerializer serializer_;
    VerificationEngine verifier_;
    RecoveryCoordinator recovery_;
    LivenessMonitor liveness_;
    StorageService service_;
};

} // namespace spora
