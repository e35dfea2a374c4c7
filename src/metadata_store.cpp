#include "metadata_store.hpp"
#include "node_registry.hpp"
#include "replica_ledger.hpp"
#include "spora.pb.h"
#include "spora/errors.hpp"
#include "spora/hex.hpp"
#include "spora/log.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <algorithm>
#include <fstream>
#include <set>

namespace spora {

using boost::property_tree::ptree;

void MetadataStore::put_file(FileRecord file) {
    const std::string id = file.id;
    files_[id] = std::move(file);
}

void MetadataStore::put_chunk(ChunkRecord chunk) {
    const std::string id = chunk.id;
    chunks_[id] = std::move(chunk);
}

std::optional<FileRecord> MetadataStore::file(const std::string& file_id) const {
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ChunkRecord> MetadataStore::chunk(const std::string& chunk_id) const {
    auto it = chunks_.find(chunk_id);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileRecord> MetadataStore::files() const {
    std::vector<FileRecord> result;
    for (const auto& entry : files_) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<StoragePreference> MetadataStore::preference_for_chunk(const std::string& chunk_id) const {
    auto chunk_it = chunks_.find(chunk_id);
    if (chunk_it == chunks_.end()) {
        return std::nullopt;
    }
    auto file_it = files_.find(chunk_it->second.file_id);
    if (file_it == files_.end()) {
        return std::nullopt;
    }
    return file_it->second.redundancy.preference;
}

bool MetadataStore::erase_file(const std::string& file_id) {
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return false;
    }
    for (const auto& chunk_id : it->second.chunk_ids) {
        chunks_.erase(chunk_id);
    }
    files_.erase(it);
    return true;
}

// --- Snapshot ---

void MetadataStore::save_snapshot(const std::string& path, const ReplicaLedger& ledger,
                                  const NodeRegistry& registry) const {
    wire::Snapshot snapshot;

    for (const auto& entry : files_) {
        const FileRecord& file = entry.second;
        auto* record = snapshot.add_files();
        record->set_id(file.id);
        record->set_name(file.name);
        record->set_size(file.size);
        record->set_created_ms(to_unix_ms(file.created));
        record->set_modified_ms(to_unix_ms(file.modified));
        for (const auto& chunk_id : file.chunk_ids) {
            record->add_chunk_ids(chunk_id);
        }
        auto* redundancy = record->mutable_redundancy();
        redundancy->set_level(to_string(file.redundancy.preference.level));
        redundancy->set_copies(file.redundancy.tier.copies);
        redundancy->set_regions(file.redundancy.tier.regions);
        redundancy->set_cost_multiplier(file.redundancy.tier.cost_multiplier);
        for (const auto& region : file.redundancy.preference.preferred_regions) {
            redundancy->add_preferred_regions(region);
        }
    }

    for (const auto& entry : chunks_) {
        const ChunkRecord& chunk = entry.second;
        auto* record = snapshot.add_chunks();
        record->set_id(chunk.id);
        record->set_file_id(chunk.file_id);
        record->set_index(chunk.index);
        record->set_hash(chunk.hash.data(), chunk.hash.size());
        record->set_size(chunk.size);
        record->set_blob_size(chunk.blob_size);
        record->set_encrypted(chunk.encrypted);
        for (const auto& node_id : ledger.current_replicas(chunk.id)) {
            record->add_locations(node_id);
        }
        record->set_required_copies(ledger.required_copies(chunk.id));
    }

    for (const auto& node : registry.all()) {
        auto* record = snapshot.add_nodes();
        record->set_id(node.id);
        record->set_region(node.region);
        record->set_pubkey(node.pubkey);
        record->set_address(node.address);
        record->set_capacity(node.capacity_bytes);
        record->set_available(node.available_bytes);
        record->set_reliability(node.reliability);
        record->set_last_seen_ms(to_unix_ms(node.last_seen));
        record->set_status(static_cast<std::uint32_t>(node.status));
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open() || !snapshot.SerializeToOstream(&out)) {
        throw Error("Failed to write metadata snapshot " + path);
    }
    log::info("Service") << "Saved snapshot: " << files_.size() << " file(s), " << chunks_.size()
                         << " chunk(s), " << snapshot.nodes_size() << " node(s)";
}

void MetadataStore::load_snapshot(const std::string& path, ReplicaLedger& ledger, NodeRegistry& registry) {
    wire::Snapshot snapshot;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open() || !snapshot.ParseFromIstream(&in)) {
        throw Error("Failed to read metadata snapshot " + path);
    }

    // Nodes first so ledger locations refer to known nodes.
    for (const auto& record : snapshot.nodes()) {
        if (record.status() > static_cast<std::uint32_t>(NodeStatus::dead)) {
            throw Error("Snapshot node " + record.id() + " has invalid status");
        }
        StorageNode node;
        node.id = record.id();
        node.region = record.region();
        node.pubkey = record.pubkey();
        node.address = record.address();
        node.capacity_bytes = record.capacity();
        node.available_bytes = record.available();
        node.reliability = record.reliability();
        node.last_seen = from_unix_ms(record.last_seen_ms());
        node.status = static_cast<NodeStatus>(record.status());
        registry.restore(node);
    }

    for (const auto& record : snapshot.files()) {
        FileRecord file;
        file.id = record.id();
        file.name = record.name();
        file.size = record.size();
        file.created = from_unix_ms(record.created_ms());
        file.modified = from_unix_ms(record.modified_ms());
        file.chunk_ids.assign(record.chunk_ids().begin(), record.chunk_ids().end());

        const auto& redundancy = record.redundancy();
        try {
            file.redundancy.preference.level = parse_redundancy_level(redundancy.level());
        } catch (const InvalidRedundancyError& e) {
            throw Error("Snapshot file " + file.id + ": " + e.what());
        }
        if (file.redundancy.preference.level == RedundancyLevel::custom) {
            file.redundancy.preference.custom_copies = redundancy.copies();
        }
        file.redundancy.preference.preferred_regions.assign(redundancy.preferred_regions().begin(),
                                                            redundancy.preferred_regions().end());
        file.redundancy.tier.name = redundancy.level();
        file.redundancy.tier.copies = redundancy.copies();
        file.redundancy.tier.regions = redundancy.regions();
        file.redundancy.tier.cost_multiplier = redundancy.cost_multiplier();
        put_file(std::move(file));
    }

    for (const auto& record : snapshot.chunks()) {
        if (record.hash().size() != crypto::kDigestSize) {
            throw Error("Snapshot chunk " + record.id() + " has a malformed hash");
        }
        ChunkRecord chunk;
        chunk.id = record.id();
        chunk.file_id = record.file_id();
        chunk.index = record.index();
        std::copy(record.hash().begin(), record.hash().end(), chunk.hash.begin());
        chunk.size = record.size();
        chunk.blob_size = record.blob_size();
        chunk.encrypted = record.encrypted();
        put_chunk(chunk);

        ledger.record_placement(chunk.id,
                                std::vector<std::string>(record.locations().begin(), record.locations().end()),
                                record.required_copies());
    }

    log::info("Service") << "Loaded snapshot: " << files_.size() << " file(s), " << chunks_.size()
                         << " chunk(s), " << snapshot.nodes_size() << " node(s)";
}

// --- JSON ---

void MetadataStore::write_file_json(std::ostream& out, const std::string& file_id,
                                    const ReplicaLedger& ledger, const NodeRegistry& registry) const {
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        throw NotFoundError("Unknown file " + file_id);
    }
    const FileRecord& file = it->second;

    ptree file_tree;
    file_tree.put("id", file.id);
    ptree chunk_list;
    for (const auto& chunk_id : file.chunk_ids) {
        ptree item;
        item.put("", chunk_id);
        chunk_list.push_back(std::make_pair("", item));
    }
    file_tree.add_child("chunks", chunk_list);
    file_tree.put("size", file.size);
    file_tree.put("created", to_unix_ms(file.created));

    ptree chunks_tree;
    std::set<std::string> node_ids;
    for (const auto& chunk_id : file.chunk_ids) {
        auto chunk_it = chunks_.find(chunk_id);
        if (chunk_it == chunks_.end()) {
            continue;
        }
        ptree chunk_tree;
        chunk_tree.put("id", chunk_id);
        chunk_tree.put("index", chunk_it->second.index);
        chunk_tree.put("hash", hex::encode(chunk_it->second.hash));
        ptree locations;
        for (const auto& node_id : ledger.current_replicas(chunk_id)) {
            ptree item;
            item.put("", node_id);
            locations.push_back(std::make_pair("", item));
            node_ids.insert(node_id);
        }
        chunk_tree.add_child("locations", locations);
        chunks_tree.push_back(std::make_pair("", chunk_tree));
    }

    ptree nodes_tree;
    for (const auto& node_id : node_ids) {
        auto node = registry.get(node_id);
        if (!node) {
            continue;
        }
        ptree node_tree;
        node_tree.put("id", node->id);
        node_tree.put("region", node->region);
        node_tree.put("pubkey", node->pubkey);
        node_tree.put("capacity", node->capacity_bytes);
        nodes_tree.push_back(std::make_pair("", node_tree));
    }

    ptree root;
    root.add_child("file", file_tree);
    root.add_child("chunks", chunks_tree);
    root.add_child("nodes", nodes_tree);
    boost::property_tree::write_json(out, root);
}

} // namespace spora
