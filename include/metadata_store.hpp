#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace spora {

class NodeRegistry;
class ReplicaLedger;

// File and chunk records owned by the client side.
class MetadataStore {
public:
    void put_file(FileRecord file);
    void put_chunk(ChunkRecord chunk);

    std::optional<FileRecord> file(const std::string& file_id) const;
    std::optional<ChunkRecord> chunk(const std::string& chunk_id) const;
    std::vector<FileRecord> files() const;

    // The preference of the file the chunk belongs to.
    std::optional<StoragePreference> preference_for_chunk(const std::string& chunk_id) const;

    // Drops the file and its chunk records.
    bool erase_file(const std::string& file_id);

    std::size_t file_count() const { return files_.size(); }
    std::size_t chunk_count() const { return chunks_.size(); }

    // Protobuf snapshot of files, chunks with their ledger locations, and nodes.
    // Throws Error on I/O or parse failure.
    void save_snapshot(const std::string& path, const ReplicaLedger& ledger, const NodeRegistry& registry) const;
    void load_snapshot(const std::string& path, ReplicaLedger& ledger, NodeRegistry& registry);

    // {"file": {...}, "chunks": [...], "nodes": [...]}. Throws NotFoundError.
    void write_file_json(std::ostream& out, const std::string& file_id,
                         const ReplicaLedger& ledger, const NodeRegistry& registry) const;

private:
    std::map<std::string, FileRecord> files_;
    std::map<std::string, ChunkRecord> chunks_;
};

} // namespace spora
