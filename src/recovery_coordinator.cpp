#include "recovery_coordinator.hpp"
#include "spora/errors.hpp"
#include "spora/hex.hpp"
#include "spora/log.hpp"
#include <algorithm>

namespace spora {

const char* to_string(RecoveryType type) {
    switch (type) {
        case RecoveryType::chunk: return "chunk";
        case RecoveryType::node: return "node";
        case RecoveryType::system: return "system";
    }
    return "unknown";
}

const char* to_string(RecoveryStatus status) {
    switch (status) {
        case RecoveryStatus::started: return "started";
        case RecoveryStatus::in_progress: return "in_progress";
        case RecoveryStatus::completed: return "completed";
        case RecoveryStatus::failed: return "failed";
    }
    return "unknown";
}

// State of one chunk-repair attempt. Holds the chunk's serializer slot until finish().
struct RecoveryCoordinator::ChunkRepair {
    std::string chunk_id;
    KeyedSerializer::Release release;
    AttemptDone done;
    Digest expected{};
    std::vector<std::string> sources;
    std::size_t next_source = 0;
    std::shared_ptr<const Bytes> blob;
    std::uint32_t required = 0;
    std::size_t pending_stores = 0;
    bool finished = false;

    void finish(std::exception_ptr error) {
        if (finished) {
            return;
        }
        finished = true;
        release();
        done(error);
    }
};

RecoveryCoordinator::RecoveryCoordinator(boost::asio::io_context& io_context,
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
                                         KeyedSerializer& serializer)
    : io_context_(io_context),
      config_(config),
      registry_(registry),
      ledger_(ledger),
      planner_(planner),
      verifier_(verifier),
      reference_(reference),
      metadata_(metadata),
      transport_(transport),
      payment_(payment),
      events_(events),
      serializer_(serializer),
      sweep_timer_(io_context) {}

// --- Operation lifecycle ---

std::string RecoveryCoordinator::start_recovery(RecoveryType type, const std::string& target, Callback done) {
    const Key key{type, target};
    auto active = active_.find(key);
    if (active != active_.end()) {
        if (done) {
            ops_.at(active->second).callbacks.push_back(std::move(done));
        }
        log::debug("Recovery") << "Coalesced " << to_string(type) << " recovery of '" << target << "' into "
                               << active->second;
        return active->second;
    }

    const std::string id = "rec_" + hex::encode(crypto::random_bytes(8));
    Entry entry;
    entry.op.id = id;
    entry.op.type = type;
    entry.op.target = target;
    entry.op.status = RecoveryStatus::started;
    entry.op.started_at = registry_.now();
    entry.timer = std::make_unique<boost::asio::steady_timer>(io_context_);
    if (done) {
        entry.callbacks.push_back(std::move(done));
    }
    ops_.emplace(id, std::move(entry));
    active_.emplace(key, id);
    queue_.push_back(id);

    log::info("Recovery") << "Started " << to_string(type) << " recovery " << id
                          << (target.empty() ? std::string() : " of " + target);
    pump();
    return id;
}

void RecoveryCoordinator::pump() {
    while (running_ < config_.max_concurrent_recoveries && !queue_.empty()) {
        const std::string id = queue_.front();
        queue_.pop_front();
        ++running_;
        run_attempt(id);
    }
}

void RecoveryCoordinator::run_attempt(const std::string& id) {
    auto it = ops_.find(id);
    if (it == ops_.end()) {
        return;
    }
    Entry& entry = it->second;
    entry.op.status = RecoveryStatus::in_progress;
    ++entry.op.attempts;
    const std::uint64_t token = ++next_token_;
    entry.token = token;

    entry.timer->expires_after(config_.recovery_timeout);
    entry.timer->async_wait([this, id, token](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        on_attempt_done(id, token, std::make_exception_ptr(
            Error("Attempt timed out after " + std::to_string(config_.recovery_timeout.count()) + " ms")));
    });

    const RecoveryOperation op = entry.op;
    try {
        execute(op, [this, id, token](std::exception_ptr error) { on_attempt_done(id, token, error); });
    } catch (const std::exception&) {
        on_attempt_done(id, token, std::current_exception());
    }
}

void RecoveryCoordinator::on_attempt_done(const std::string& id, std::uint64_t token, std::exception_ptr error) {
    auto it = ops_.find(id);
    if (it == ops_.end()) {
        return;
    }
    Entry& entry = it->second;
    if (entry.token != token || entry.op.status != RecoveryStatus::in_progress) {
        log::debug("Recovery") << "Ignoring late completion of " << id;
        return;
    }
    entry.token = 0;
    entry.timer->cancel();

    if (!error) {
        finish(entry, RecoveryStatus::completed, {});
        return;
    }

    bool permanent = false;
    std::string message;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        permanent = is_policy_error(e) || dynamic_cast<const NotFoundError*>(&e) != nullptr;
        message = e.what();
    }

    if (permanent || entry.op.attempts >= config_.max_retries) {
        finish(entry, RecoveryStatus::failed, message);
        return;
    }

    const auto delay = config_.backoff_base * entry.op.attempts;
    entry.op.backoff_history.push_back(delay);
    log::warn("Recovery") << id << " attempt " << entry.op.attempts << " failed: " << message
                          << "; retrying in " << delay.count() << " ms";

    entry.timer->expires_after(delay);
    entry.timer->async_wait([this, id](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        run_attempt(id);
    });
}

void RecoveryCoordinator::finish(Entry& entry, RecoveryStatus status, const std::string& error) {
    entry.op.status = status;
    entry.op.finished_at = registry_.now();
    entry.op.error = error;
    entry.token = 0;
    entry.timer->cancel();
    active_.erase(Key{entry.op.type, entry.op.target});
    --running_;

    const RecoveryOperation op = entry.op;
    auto callbacks = std::move(entry.callbacks);
    entry.callbacks.clear();

    if (status == RecoveryStatus::completed) {
        log::info("Recovery") << op.id << " completed after " << op.attempts << " attempt(s)";
    } else {
        log::error("Recovery") << op.id << " (" << to_string(op.type) << " " << op.target << ") failed after "
                               << op.attempts << " attempt(s): " << error;
        RecoveryExhausted alert{op.id, to_string(op.type), op.target, op.attempts, error};
        events_.push(alert);
        if (alert_) {
            alert_(alert);
        }
        if (op.type == RecoveryType::node) {
            registry_.mark_offline(op.target);
            registry_.record_failure(op.target);
            evacuate(op.target);
        }
    }

    for (auto& callback : callbacks) {
        callback(op);
    }

    finished_.push_back(op.id);
    while (finished_.size() > config_.recovery_history_limit) {
        ops_.erase(finished_.front());
        finished_.pop_front();
    }
    pump();
}

void RecoveryCoordinator::execute(const RecoveryOperation& op, AttemptDone done) {
    switch (op.type) {
        case RecoveryType::chunk:
            recover_chunk(op.target, std::move(done));
            return;
        case RecoveryType::node:
            recover_node(op.target, std::move(done));
            return;
        case RecoveryType::system:
            recover_system(std::move(done));
            return;
    }
}

// --- Chunk recovery ---

StoragePreference RecoveryCoordinator::preference_for(const std::string& chunk_id) const {
    if (auto preference = metadata_.preference_for_chunk(chunk_id)) {
        return *preference;
    }
    StoragePreference preference;
    const std::uint32_t required = ledger_.required_copies(chunk_id);
    if (required >= kAbsoluteRedundancyFloor) {
        preference.level = RedundancyLevel::custom;
        preference.custom_copies = required;
    } else {
        preference.level = RedundancyLevel::minimum;
    }
    return preference;
}

void RecoveryCoordinator::recover_chunk(const std::string& chunk_id, AttemptDone done) {
    serializer_.dispatch(chunk_id, [this, chunk_id, done](KeyedSerializer::Release release) {
        auto repair = std::make_shared<ChunkRepair>();
        repair->chunk_id = chunk_id;
        repair->release = std::move(release);
        repair->done = done;

        try {
            if (!ledger_.contains(chunk_id)) {
                log::debug("Recovery") << chunk_id << " is no longer tracked";
                repair->finish(nullptr);
                return;
            }
            const auto current = ledger_.current_replicas(chunk_id);
            repair->required = ledger_.required_copies(chunk_id);
            if (current.size() >= repair->required) {
                log::debug("Recovery") << chunk_id << " is healthy (" << current.size() << "/" << repair->required << ")";
                repair->finish(nullptr);
                return;
            }

            if (auto record = metadata_.chunk(chunk_id)) {
                repair->expected = record->hash;
            } else if (auto blob = reference_.get(chunk_id)) {
                repair->expected = crypto::sha256(*blob);
            } else {
                throw NotFoundError("No metadata or reference copy for " + chunk_id);
            }

            for (const auto& node : registry_.find_nodes()) {
                if (current.count(node.id)) {
                    repair->sources.push_back(node.id);
                }
            }
            fetch_source(repair);
        } catch (const std::exception&) {
            repair->finish(std::current_exception());
        }
    });
}

void RecoveryCoordinator::fetch_source(const std::shared_ptr<ChunkRepair>& repair) {
    while (repair->next_source < repair->sources.size()) {
        const std::string node_id = repair->sources[repair->next_source++];
        auto node = registry_.get(node_id);
        if (!node) {
            continue;
        }
        transport_.fetch_chunk(*node, repair->chunk_id,
            [this, repair, node_id](boost::system::error_code ec, Bytes blob) {
                if (repair->finished) {
                    return;
                }
                if (!ec && crypto::digest_equal(crypto::sha256(blob), repair->expected)) {
                    repair->blob = std::make_shared<const Bytes>(std::move(blob));
                    place(repair);
                    return;
                }
                log::debug("Recovery") << "Source " << node_id << " unusable for " << repair->chunk_id << ": "
                                       << (ec ? ec.message() : std::string("hash mismatch"));
                fetch_source(repair);
            });
        return;
    }

    auto local = reference_.get(repair->chunk_id);
    if (local && crypto::digest_equal(crypto::sha256(*local), repair->expected)) {
        log::debug("Recovery") << "Using reference copy of " << repair->chunk_id;
        repair->blob = std::make_shared<const Bytes>(std::move(*local));
        place(repair);
        return;
    }
    repair->finish(std::make_exception_ptr(Error("No verified source for " + repair->chunk_id)));
}

void RecoveryCoordinator::place(const std::shared_ptr<ChunkRepair>& repair) {
    try {
        if (!ledger_.contains(repair->chunk_id)) {
            repair->finish(nullptr);
            return;
        }
        const auto current = ledger_.current_replicas(repair->chunk_id);
        repair->required = ledger_.required_copies(repair->chunk_id);
        if (current.size() >= repair->required) {
            repair->finish(nullptr);
            return;
        }

        const std::size_t deficit = repair->required - current.size();
        const DistributionPlan plan = planner_.create_repair_plan(
            repair->chunk_id, preference_for(repair->chunk_id), current, deficit, repair->blob->size());

        for (const auto& node_id : plan.target_nodes) {
            // Re-check right before the transfer.
            auto node = registry_.get(node_id);
            if (!node || !registry_.is_eligible(node_id)) {
                continue;
            }
            ++repair->pending_stores;
            transport_.store_chunk(*node, repair->chunk_id, repair->blob,
                [this, repair, node_id](boost::system::error_code ec) {
                    if (ec) {
                        log::warn("Recovery") << "Store of " << repair->chunk_id << " on " << node_id
                                              << " failed: " << ec.message();
                    } else if (ledger_.contains(repair->chunk_id)) {
                        ledger_.add_replica(repair->chunk_id, node_id);
                        registry_.reserve(node_id, repair->blob->size());
                        payment_.charge(node_id, planner_.estimate_cost(1), PaymentPurpose::maintenance);
                    }
                    if (--repair->pending_stores == 0) {
                        conclude(repair);
                    }
                });
        }
        if (repair->pending_stores == 0) {
            conclude(repair);
        }
    } catch (const std::exception&) {
        repair->finish(std::current_exception());
    }
}

void RecoveryCoordinator::conclude(const std::shared_ptr<ChunkRepair>& repair) {
    if (!ledger_.contains(repair->chunk_id)) {
        repair->finish(nullptr);
        return;
    }
    const std::size_t current = ledger_.current_replicas(repair->chunk_id).size();
    const std::uint32_t required = ledger_.required_copies(repair->chunk_id);
    if (current < required) {
        repair->finish(std::make_exception_ptr(Error(repair->chunk_id + " still under target: " +
                                                     std::to_string(current) + "/" + std::to_string(required))));
        return;
    }
    log::info("Recovery") << repair->chunk_id << " restored to " << current << "/" << required;
    repair->finish(nullptr);
}

// --- Node recovery ---

void RecoveryCoordinator::recover_node(const std::string& node_id, AttemptDone done) {
    auto node = registry_.get(node_id);
    if (!node) {
        throw NotFoundError("Unknown node " + node_id);
    }

    transport_.ping(*node, [this, node_id, done](boost::system::error_code ec) {
        if (ec) {
            done(std::make_exception_ptr(TransportError("Ping of " + node_id + " failed", ec)));
            return;
        }
        registry_.mark_seen(node_id);

        std::vector<std::string> affected;
        for (const auto& chunk_id : ledger_.chunks_on_node(node_id)) {
            const auto status = verifier_.last_status(chunk_id, node_id);
            if (status && *status == ProofStatus::failed) {
                log::warn("Recovery") << "Evicting replica of " << chunk_id << " on " << node_id;
                drop_replica(chunk_id, node_id);
                affected.push_back(chunk_id);
            } else if (ledger_.deficit(chunk_id) > 0) {
                affected.push_back(chunk_id);
            }
        }
        for (const auto& chunk_id : affected) {
            start_recovery(RecoveryType::chunk, chunk_id);
        }
        done(nullptr);
    });
}

void RecoveryCoordinator::evacuate(const std::string& node_id) {
    const auto chunks = ledger_.chunks_on_node(node_id);
    if (chunks.empty()) {
        return;
    }
    log::warn("Recovery") << "Evacuating " << chunks.size() << " replica(s) from " << node_id;
    for (const auto& chunk_id : chunks) {
        drop_replica(chunk_id, node_id);
    }
}

void RecoveryCoordinator::drop_replica(const std::string& chunk_id, const std::string& node_id) {
    serializer_.dispatch(chunk_id, [this, chunk_id, node_id](KeyedSerializer::Release release) {
        if (ledger_.remove_replica(chunk_id, node_id)) {
            registry_.release(node_id, replica_bytes(chunk_id));
            auto node = registry_.get(node_id);
            if (node && node->status == NodeStatus::active) {
                transport_.delete_chunk(*node, chunk_id, [chunk_id, node_id](boost::system::error_code ec) {
                    if (ec) {
                        log::warn("Recovery") << "Delete of evicted " << chunk_id << " on " << node_id
                                              << " failed: " << ec.message();
                    }
                });
            }
        }
        release();
    });
}

std::uint64_t RecoveryCoordinator::replica_bytes(const std::string& chunk_id) const {
    if (auto record = metadata_.chunk(chunk_id)) {
        return record->blob_size;
    }
    if (auto blob = reference_.get(chunk_id)) {
        return blob->size();
    }
    return 0;
}

// --- System sweep ---

void RecoveryCoordinator::recover_system(AttemptDone done) {
    std::size_t scheduled = 0;
    for (const auto& chunk_id : ledger_.chunks()) {
        if (ledger_.deficit(chunk_id) > 0) {
            start_recovery(RecoveryType::chunk, chunk_id);
            ++scheduled;
        }
    }
    log::info("Recovery") << "System sweep scheduled " << scheduled << " chunk recovery(ies)";
    done(nullptr);
}

// --- Event loop ---

void RecoveryCoordinator::start() {
    if (started_) {
        return;
    }
    started_ = true;
    ++generation_;
    receive_next();
    schedule_sweep();
}

void RecoveryCoordinator::stop() {
    started_ = false;
    ++generation_;
    events_.close();
    sweep_timer_.cancel();
}

void RecoveryCoordinator::receive_next() {
    const std::uint64_t generation = generation_;
    events_.async_receive([this, generation](Event event) {
        if (!started_ || generation != generation_) {
            return;
        }
        handle_event(event);
        if (events_.take_overflow()) {
            log::warn("Recovery") << "Events were dropped, sweeping the whole ledger";
            start_recovery(RecoveryType::system, {});
        }
        receive_next();
    });
}

void RecoveryCoordinator::handle_event(const Event& event) {
    if (auto* low = std::get_if<LowRedundancy>(&event)) {
        start_recovery(RecoveryType::chunk, low->chunk_id);
    } else if (auto* critical = std::get_if<CriticalRedundancy>(&event)) {
        start_recovery(RecoveryType::chunk, critical->chunk_id);
    } else if (auto* suspect = std::get_if<NodeSuspect>(&event)) {
        start_recovery(RecoveryType::node, suspect->node_id);
    } else if (auto* dead = std::get_if<NodeDead>(&event)) {
        start_recovery(RecoveryType::node, dead->node_id);
    } else if (auto* offline = std::get_if<NodeOffline>(&event)) {
        log::debug("Recovery") << offline->node_id << " offline, waiting for it to return or die";
    }
}

void RecoveryCoordinator::schedule_sweep() {
    sweep_timer_.expires_after(config_.system_sweep_interval);
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !started_) {
            return;
        }
        start_recovery(RecoveryType::system, {});
        schedule_sweep();
    });
}

// --- Queries ---

std::optional<RecoveryOperation> RecoveryCoordinator::operation(const std::string& id) const {
    auto it = ops_.find(id);
    if (it == ops_.end()) {
        return std::nullopt;
    }
    return it->second.op;
}

std::vector<RecoveryOperation> RecoveryCoordinator::operations() const {
    std::vector<RecoveryOperation> result;
    result.reserve(ops_.size());
    for (const auto& entry : ops_) {
        result.push_back(entry.second.op);
    }
    std::sort(result.begin(), result.end(), [](const RecoveryOperation& a, const RecoveryOperation& b) {
        return a.started_at < b.started_at;
    });
    return result;
}

} // namespace spora
