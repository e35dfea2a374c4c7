#pragma once

#include "types.hpp"
#include <cstdint>
#include <vector>

namespace spora {

// Splits files into chunks, seals each one with AES-256-GCM and reassembles them.
// An encrypted chunk's blob is IV || ciphertext || tag and its hash covers the whole blob.
class ChunkCodec {
public:
    explicit ChunkCodec(const crypto::Key& key, bool encryption = true);

    // Throws InvalidInputError on empty input or chunk_size <= 0.
    std::vector<Chunk> split(const Bytes& data, std::int64_t chunk_size) const;

    // Encodes a single chunk. split() is a loop over this; callers that want to
    // yield between chunks call it directly.
    Chunk encode_chunk(std::uint32_t index, const std::uint8_t* data, std::size_t len) const;

    // Verifies the hash and, when sealed, authenticates and decrypts.
    // Throws AssemblyError on any failure.
    Bytes decode_chunk(const Chunk& chunk) const;

    // Sorts by index, requires 0..n-1 without gaps or duplicates, decodes each chunk.
    // Throws AssemblyError.
    Bytes assemble(std::vector<Chunk> chunks) const;

    static bool verify(const Chunk& chunk);

    // Rebuilds a Chunk from a stored blob. Throws InvalidInputError if an
    // encrypted blob is too short to carry an IV and tag.
    static Chunk from_blob(std::uint32_t index, Bytes blob, const Digest& hash,
                           std::uint64_t size, bool encrypted);

    bool encryption_enabled() const { return encryption_; }

private:
    crypto::Key key_;
    bool encryption_;
};

} // namespace spora
