#include "cluster.hpp"
#include "spora/log.hpp"

namespace spora {

StorageCluster::StorageCluster(boost::asio::io_context& io_context,
                               const Config& config,
                               Transport& transport,
                               PaymentOracle& payment,
                               const crypto::Key& key,
                               NowFunction now)
    : config_(config),
      events_(io_context, config_.event_channel_capacity),
      codec_(key, config_.encryption),
      reference_(std::numeric_limits<std::uint64_t>::max(), config_.reference_dir),
      registry_(config_, events_, std::move(now)),
      ledger_(events_, config_.redundancy_floor),
      planner_(config_, registry_),
      verifier_(io_context, config_, ledger_, registry_, reference_, transport, events_),
      recovery_(io_context, config_, registry_, ledger_, planner_, verifier_, reference_, metadata_,
                transport, payment, events_, serializer_),
      liveness_(io_context, config_, registry_, transport),
      service_(io_context, config_, codec_, registry_, planner_, ledger_, verifier_, metadata_,
               reference_, transport, payment, serializer_) {}

void StorageCluster::start() {
    log::info("Service") << "Starting cluster: floor " << config_.redundancy_floor << ", chunk size "
                         << config_.chunk_size << ", " << registry_.size() << " node(s) known";
    recovery_.start();
    verifier_.start();
    liveness_.start();
}

void StorageCluster::stop() {
    liveness_.stop();
    verifier_.stop();
    recovery_.stop();
    log::info("Service") << "Cluster stopped";
}

void StorageCluster::save_snapshot(const std::string& path) const {
    metadata_.save_snapshot(path, ledger_, registry_);
    log::info("Service") << "Saved snapshot of " << metadata_.file_count() << " file(s) to " << path;
}

void StorageCluster::load_snapshot(const std::string& path) {
    metadata_.load_snapshot(path, ledger_, registry_);
    reference_.load_existing();

    std::size_t missing = 0;
    for (const auto& chunk_id : ledger_.chunks()) {
        if (!reference_.contains(chunk_id)) {
            ++missing;
        }
    }
    if (missing > 0) {
        log::warn("Service") << missing << " chunk(s) have no reference copy and will not be verified"
                             << (config_.reference_dir.empty() ? " (reference.dataDir is not set)" : "");
    }
    log::info("Service") << "Loaded snapshot " << path << ": " << metadata_.file_count() << " file(s), "
                         << reference_.size() << " reference copies";
}

} // namespace spora
