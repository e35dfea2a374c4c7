#include "storage_service.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <deque>
#include <limits>

namespace spora {

struct StorageService::StoreJob {
    Bytes data;
    StoreOptions options;
    StoreHandler handler;

    RedundancyTier tier;
    std::string file_id;
    std::size_t chunk_count = 0;
    std::vector<Chunk> chunks;
    std::vector<std::string> chunk_ids;
    std::vector<DistributionPlan> plans;
    std::vector<std::shared_ptr<const Bytes>> blobs;
    std::vector<std::vector<std::string>> accepted;

    std::deque<std::pair<std::size_t, std::string>> transfers;
    std::size_t active = 0;
    bool done = false;
};

struct StorageService::RetrieveJob {
    FileRecord file;
    std::vector<ChunkRecord> records;
    std::vector<std::vector<std::string>> sources;
    std::vector<std::size_t> next_source;
    std::vector<std::optional<Chunk>> chunks;
    std::size_t remaining = 0;
    RetrieveHandler handler;
    bool done = false;
};

StorageService::StorageService(boost::asio::io_context& io_context,
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
                               KeyedSerializer& serializer)
    : io_context_(io_context),
      config_(config),
      codec_(codec),
      registry_(registry),
      planner_(planner),
      ledger_(ledger),
      verifier_(verifier),
      metadata_(metadata),
      reference_(reference),
      transport_(transport),
      payment_(payment),
      serializer_(serializer) {}

// --- Store ---

void StorageService::store(Bytes data, StoreOptions options, StoreHandler handler) {
    auto job = std::make_shared<StoreJob>();
    job->data = std::move(data);
    job->options = std::move(options);
    job->handler = std::move(handler);
    boost::asio::post(io_context_, [this, job]() { begin_store(job); });
}

void StorageService::begin_store(const std::shared_ptr<StoreJob>& job) {
    try {
        if (job->data.empty()) {
            throw InvalidInputError("Cannot store an empty file");
        }
        job->tier = resolve_tier(job->options.preference);
        job->file_id = make_file_id();
        job->chunk_count = static_cast<std::size_t>((job->data.size() + config_.chunk_size - 1) / config_.chunk_size);
        job->chunks.reserve(job->chunk_count);
        log::info("Service") << "Storing " << job->data.size() << " bytes as " << job->file_id << " ("
                             << job->chunk_count << " chunk(s), " << job->tier.name << ")";
    } catch (const std::exception&) {
        abort_store(job, std::current_exception());
        return;
    }
    encode_next(job);
}

void StorageService::encode_next(const std::shared_ptr<StoreJob>& job) {
    const std::size_t index = job->chunks.size();
    if (index == job->chunk_count) {
        plan_store(job);
        return;
    }
    try {
        const std::size_t offset = index * static_cast<std::size_t>(config_.chunk_size);
        const std::size_t len = std::min<std::size_t>(config_.chunk_size, job->data.size() - offset);
        job->chunks.push_back(codec_.encode_chunk(static_cast<std::uint32_t>(index), job->data.data() + offset, len));
    } catch (const std::exception&) {
        abort_store(job, std::current_exception());
        return;
    }
    boost::asio::post(io_context_, [this, job]() { encode_next(job); });
}

void StorageService::plan_store(const std::shared_ptr<StoreJob>& job) {
    try {
        double total = 0.0;
        for (const auto& chunk : job->chunks) {
            const std::string chunk_id = make_chunk_id(job->file_id, chunk.index);
            job->chunk_ids.push_back(chunk_id);
            job->plans.push_back(planner_.create_plan(chunk_id, job->options.preference,
                                                      payment_.available_capacity(), chunk.data.size()));
            total += job->plans.back().estimated_cost;
        }
        if (!payment_.can_afford(total)) {
            throw InsufficientCapacityError("Storing " + job->file_id + " costs " + std::to_string(total) +
                                            ", available " + std::to_string(payment_.available_capacity()));
        }

        job->accepted.resize(job->chunks.size());
        for (std::size_t i = 0; i < job->chunks.size(); ++i) {
            auto blob = std::make_shared<const Bytes>(job->chunks[i].data);
            if (!reference_.put(job->chunk_ids[i], *blob)) {
                throw Error("Reference store is full");
            }
            job->blobs.push_back(std::move(blob));
            for (const auto& node_id : job->plans[i].target_nodes) {
                job->transfers.emplace_back(i, node_id);
            }
        }
    } catch (const std::exception&) {
        abort_store(job, std::current_exception());
        return;
    }
    // Plaintext is no longer needed.
    job->data.clear();
    job->data.shrink_to_fit();
    pump_transfers(job);
}

void StorageService::pump_transfers(const std::shared_ptr<StoreJob>& job) {
    while (job->active < config_.max_concurrent_transfers && !job->transfers.empty()) {
        const auto transfer = job->transfers.front();
        job->transfers.pop_front();
        const std::size_t slot = transfer.first;
        const std::string node_id = transfer.second;

        // Plans are not kept across suspension points without a fresh check.
        auto node = registry_.get(node_id);
        if (!node || !registry_.is_eligible(node_id)) {
            log::warn("Service") << "Skipping " << node_id << " for " << job->chunk_ids[slot] << ": no longer eligible";
            continue;
        }

        ++job->active;
        transport_.store_chunk(*node, job->chunk_ids[slot], job->blobs[slot],
            [this, job, slot, node_id](boost::system::error_code ec) {
                --job->active;
                if (!ec) {
                    job->accepted[slot].push_back(node_id);
                    registry_.reserve(node_id, job->blobs[slot]->size());
                } else {
                    log::warn("Service") << "Transfer of " << job->chunk_ids[slot] << " to " << node_id
                                         << " failed: " << ec.message();
                }
                pump_transfers(job);
            });
    }

    if (job->active == 0 && job->transfers.empty() && !job->done) {
        complete_store(job);
    }
}

void StorageService::complete_store(const std::shared_ptr<StoreJob>& job) {
    job->done = true;

    for (std::size_t i = 0; i < job->accepted.size(); ++i) {
        if (job->accepted[i].empty()) {
            abort_store(job, std::make_exception_ptr(InsufficientNodesError(
                "No node accepted " + job->chunk_ids[i] + ", rolling back " + job->file_id)));
            return;
        }
    }

    const TimePoint now = registry_.now();
    FileRecord file;
    file.id = job->file_id;
    file.name = job->options.name;
    file.size = 0;
    file.created = now;
    file.modified = now;
    file.chunk_ids = job->chunk_ids;
    file.redundancy.tier = job->tier;
    file.redundancy.preference = job->options.preference;

    StoreResult result;
    result.file_id = job->file_id;
    result.chunk_ids = job->chunk_ids;

    for (std::size_t i = 0; i < job->chunks.size(); ++i) {
        const Chunk& chunk = job->chunks[i];
        file.size += chunk.size;

        ChunkRecord record;
        record.id = job->chunk_ids[i];
        record.file_id = job->file_id;
        record.index = chunk.index;
        record.hash = chunk.hash;
        record.size = chunk.size;
        record.blob_size = chunk.data.size();
        record.encrypted = chunk.iv.has_value();
        metadata_.put_chunk(record);

        const std::string chunk_id = job->chunk_ids[i];
        const std::vector<std::string> nodes = job->accepted[i];
        const std::uint32_t required = job->tier.copies;
        serializer_.dispatch(chunk_id, [this, chunk_id, nodes, required](KeyedSerializer::Release release) {
            ledger_.record_placement(chunk_id, nodes, required);
            release();
        });

        const DistributionPlan& plan = job->plans[i];
        const double per_replica = plan.estimated_cost / static_cast<double>(plan.target_nodes.size());
        for (const auto& node_id : nodes) {
            payment_.charge(node_id, per_replica, PaymentPurpose::storage);
            result.cost += per_replica;
        }
    }
    metadata_.put_file(std::move(file));

    log::info("Service") << "Stored " << job->file_id << ", cost " << result.cost;
    job->handler(nullptr, std::move(result));
}

void StorageService::abort_store(const std::shared_ptr<StoreJob>& job, std::exception_ptr error) {
    job->done = true;
    for (std::size_t i = 0; i < job->accepted.size(); ++i) {
        for (const auto& node_id : job->accepted[i]) {
            registry_.release(node_id, job->blobs[i]->size());
            auto node = registry_.get(node_id);
            if (!node) {
                continue;
            }
            const std::string chunk_id = job->chunk_ids[i];
            transport_.delete_chunk(*node, chunk_id, [chunk_id, node_id](boost::system::error_code ec) {
                if (ec) {
                    log::warn("Service") << "Rollback of " << chunk_id << " on " << node_id
                                         << " failed: " << ec.message();
                }
            });
        }
    }
    for (const auto& chunk_id : job->chunk_ids) {
        reference_.erase(chunk_id);
    }
    job->handler(error, StoreResult{});
}

// --- Retrieve ---

void StorageService::retrieve(const std::string& file_id, RetrieveHandler handler) {
    auto file = metadata_.file(file_id);
    if (!file) {
        boost::asio::post(io_context_, [handler = std::move(handler), file_id]() {
            handler(std::make_exception_ptr(NotFoundError("Unknown file " + file_id)), Bytes{});
        });
        return;
    }

    auto job = std::make_shared<RetrieveJob>();
    job->file = std::move(*file);
    job->handler = std::move(handler);

    for (const auto& chunk_id : job->file.chunk_ids) {
        auto record = metadata_.chunk(chunk_id);
        if (!record) {
            boost::asio::post(io_context_, [job, chunk_id]() {
                job->handler(std::make_exception_ptr(NotFoundError("Missing metadata for " + chunk_id)), Bytes{});
            });
            return;
        }
        const auto replicas = ledger_.current_replicas(chunk_id);
        std::vector<std::string> sources;
        for (const auto& node : registry_.find_nodes()) {
            if (replicas.count(node.id)) {
                sources.push_back(node.id);
            }
        }
        job->records.push_back(*record);
        job->sources.push_back(std::move(sources));
    }

    job->next_source.assign(job->records.size(), 0);
    job->chunks.resize(job->records.size());
    job->remaining = job->records.size();
    for (std::size_t slot = 0; slot < job->records.size(); ++slot) {
        fetch_chunk(job, slot);
    }
}

void StorageService::fetch_chunk(const std::shared_ptr<RetrieveJob>& job, std::size_t slot) {
    const ChunkRecord& record = job->records[slot];
    auto& sources = job->sources[slot];

    while (job->next_source[slot] < sources.size()) {
        const std::string node_id = sources[job->next_source[slot]++];
        auto node = registry_.get(node_id);
        if (!node) {
            continue;
        }
        transport_.fetch_chunk(*node, record.id, [this, job, slot, node_id](boost::system::error_code ec, Bytes blob) {
            if (job->done) {
                return;
            }
            const ChunkRecord& record = job->records[slot];
            if (!ec && crypto::digest_equal(crypto::sha256(blob), record.hash)) {
                payment_.charge(node_id, planner_.estimate_cost(1), PaymentPurpose::retrieval);
                chunk_fetched(job, slot, std::move(blob));
                return;
            }
            log::warn("Service") << "Replica of " << record.id << " on " << node_id << " unusable: "
                                 << (ec ? ec.message() : std::string("hash mismatch"));
            fetch_chunk(job, slot);
        });
        return;
    }

    auto local = reference_.get(record.id);
    if (local && crypto::digest_equal(crypto::sha256(*local), record.hash)) {
        log::info("Service") << "Serving " << record.id << " from the reference copy";
        boost::asio::post(io_context_, [this, job, slot, blob = std::move(*local)]() mutable {
            if (!job->done) {
                chunk_fetched(job, slot, std::move(blob));
            }
        });
        return;
    }

    boost::asio::post(io_context_, [job, id = record.id]() {
        if (job->done) {
            return;
        }
        job->done = true;
        job->handler(std::make_exception_ptr(AssemblyError("No intact replica of " + id)), Bytes{});
    });
}

void StorageService::chunk_fetched(const std::shared_ptr<RetrieveJob>& job, std::size_t slot, Bytes blob) {
    const ChunkRecord& record = job->records[slot];
    try {
        job->chunks[slot] = ChunkCodec::from_blob(record.index, std::move(blob), record.hash, record.size, record.encrypted);
    } catch (const std::exception&) {
        job->done = true;
        job->handler(std::current_exception(), Bytes{});
        return;
    }
    if (--job->remaining > 0) {
        return;
    }

    job->done = true;
    std::vector<Chunk> chunks;
    chunks.reserve(job->chunks.size());
    for (auto& chunk : job->chunks) {
        chunks.push_back(std::move(*chunk));
    }
    Bytes data;
    try {
        data = codec_.assemble(std::move(chunks));
    } catch (const std::exception&) {
        job->handler(std::current_exception(), Bytes{});
        return;
    }
    log::info("Service") << "Retrieved " << job->file.id << ", " << data.size() << " bytes";
    job->handler(nullptr, std::move(data));
}

// --- Remove ---

void StorageService::remove(const std::string& file_id, RemoveHandler handler) {
    auto file = metadata_.file(file_id);
    if (!file) {
        boost::asio::post(io_context_, [handler = std::move(handler), file_id]() {
            handler(std::make_exception_ptr(NotFoundError("Unknown file " + file_id)));
        });
        return;
    }

    auto pending = std::make_shared<std::size_t>(0);
    auto finish = std::make_shared<RemoveHandler>(std::move(handler));

    for (const auto& chunk_id : file->chunk_ids) {
        const auto record = metadata_.chunk(chunk_id);
        const std::uint64_t blob_size = record ? record->blob_size : 0;
        const auto replicas = ledger_.current_replicas(chunk_id);

        serializer_.dispatch(chunk_id, [this, chunk_id](KeyedSerializer::Release release) {
            ledger_.forget(chunk_id);
            release();
        });
        verifier_.forget(chunk_id);
        reference_.erase(chunk_id);

        for (const auto& node_id : replicas) {
            auto node = registry_.get(node_id);
            if (!node) {
                continue;
            }
            ++*pending;
            transport_.delete_chunk(*node, chunk_id,
                [this, pending, finish, chunk_id, node_id, blob_size](boost::system::error_code ec) {
                    if (!ec) {
                        registry_.release(node_id, blob_size);
                    } else {
                        log::warn("Service") << "Delete of " << chunk_id << " on " << node_id
                                             << " failed: " << ec.message();
                    }
                    if (--*pending == 0) {
                        (*finish)(nullptr);
                    }
                });
        }
    }
    metadata_.erase_file(file_id);
    log::info("Service") << "Removing " << file_id;

    if (*pending == 0) {
        boost::asio::post(io_context_, [finish]() { (*finish)(nullptr); });
    }
}

// --- Status and nodes ---

FileStatus StorageService::status(const std::string& file_id) const {
    auto file = metadata_.file(file_id);
    if (!file) {
        throw NotFoundError("Unknown file " + file_id);
    }

    FileStatus status;
    status.chunks = file->chunk_ids.size();

    std::set<std::string> nodes;
    std::size_t fewest = std::numeric_limits<std::size_t>::max();
    std::size_t held = 0;
    std::size_t wanted = 0;
    for (const auto& chunk_id : file->chunk_ids) {
        const auto replicas = ledger_.current_replicas(chunk_id);
        const std::size_t required = ledger_.required_copies(chunk_id);
        nodes.insert(replicas.begin(), replicas.end());
        fewest = std::min(fewest, replicas.size());
        held += std::min(replicas.size(), required);
        wanted += required;

        auto verified = verifier_.last_verified(chunk_id);
        if (verified && (!status.last_verified || *verified > *status.last_verified)) {
            status.last_verified = verified;
        }
    }

    status.nodes_storing = nodes.size();
    status.redundancy_level = file->chunk_ids.empty() ? 0 : fewest;
    for (const auto& node_id : nodes) {
        if (auto node = registry_.get(node_id)) {
            status.regions.insert(node->region);
        }
    }
    status.health_percent = wanted == 0 ? 0.0 : 100.0 * static_cast<double>(held) / static_cast<double>(wanted);
    return status;
}

std::string StorageService::register_node(const NodeRegistration& registration) {
    return registry_.register_node(registration);
}

void StorageService::heartbeat(const std::string& node_id) {
    if (!registry_.mark_seen(node_id)) {
        throw NotFoundError("Unknown node " + node_id);
    }
}

} // namespace spora
