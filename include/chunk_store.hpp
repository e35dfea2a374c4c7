#pragma once

#include "types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace spora {

// Blob store held by a storage provider (and, on the client, the reference copy
// every proof is checked against). Blobs live in memory; when a directory is
// given each blob is also written to <directory>/<chunk_id>.chunk.
class ChunkStore {
public:
    explicit ChunkStore(std::uint64_t capacity_bytes, std::string directory = {});

    // Reads every <chunk_id>.chunk file from the directory. Returns the number loaded.
    std::size_t load_existing();

    // Returns false when the blob does not fit in the remaining capacity.
    // Throws InvalidInputError when chunk_id is not filename-safe.
    bool put(const std::string& chunk_id, const Bytes& blob);
    std::optional<Bytes> get(const std::string& chunk_id) const;
    bool erase(const std::string& chunk_id);
    bool contains(const std::string& chunk_id) const;

    // SHA-256(blob || nonce), or nullopt when the chunk is not held.
    std::optional<Digest> prove(const std::string& chunk_id, const Bytes& nonce) const;

    std::vector<std::string> chunk_ids() const;
    std::size_t size() const { return blobs_.size(); }
    std::uint64_t capacity_bytes() const { return capacity_bytes_; }
    std::uint64_t used_bytes() const { return used_bytes_; }
    std::uint64_t available_bytes() const;
    const std::string& directory() const { return directory_; }

    static bool valid_chunk_id(const std::string& chunk_id);

private:
    std::string path_for(const std::string& chunk_id) const;

    std::uint64_t capacity_bytes_;
    std::uint64_t used_bytes_ = 0;
    std::string directory_;
    std::map<std::string, Bytes> blobs_;
};

} // namespace spora
