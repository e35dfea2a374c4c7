#include "chunk_codec.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <algorithm>

namespace spora {

ChunkCodec::ChunkCodec(const crypto::Key& key, bool encryption)
    : key_(key), encryption_(encryption) {}

std::vector<Chunk> ChunkCodec::split(const Bytes& data, std::int64_t chunk_size) const {
    if (data.empty()) {
        throw InvalidInputError("Cannot split empty input");
    }
    if (chunk_size <= 0) {
        throw InvalidInputError("Chunk size must be positive, got " + std::to_string(chunk_size));
    }

    const std::size_t step = static_cast<std::size_t>(chunk_size);
    std::vector<Chunk> chunks;
    chunks.reserve((data.size() + step - 1) / step);

    std::uint32_t index = 0;
    for (std::size_t offset = 0; offset < data.size(); offset += step) {
        const std::size_t len = std::min(step, data.size() - offset);
        chunks.push_back(encode_chunk(index++, data.data() + offset, len));
    }

    log::debug("Codec") << "Split " << data.size() << " bytes into " << chunks.size() << " chunk(s)";
    return chunks;
}

Chunk ChunkCodec::encode_chunk(std::uint32_t index, const std::uint8_t* data, std::size_t len) const {
    Chunk chunk;
    chunk.index = index;
    chunk.size = len;

    if (!encryption_) {
        chunk.data.assign(data, data + len);
        chunk.hash = crypto::sha256(chunk.data);
        return chunk;
    }

    std::array<std::uint8_t, crypto::kIvSize> iv{};
    crypto::random_fill(iv.data(), iv.size());
    Bytes sealed = crypto::aes256_gcm_seal(key_, iv.data(), data, len);

    std::array<std::uint8_t, crypto::kTagSize> tag{};
    std::copy(sealed.end() - crypto::kTagSize, sealed.end(), tag.begin());

    chunk.data.reserve(iv.size() + sealed.size());
    chunk.data.insert(chunk.data.end(), iv.begin(), iv.end());
    chunk.data.insert(chunk.data.end(), sealed.begin(), sealed.end());
    chunk.hash = crypto::sha256(chunk.data);
    chunk.iv = iv;
    chunk.auth_tag = tag;
    return chunk;
}

Bytes ChunkCodec::decode_chunk(const Chunk& chunk) const {
    if (!verify(chunk)) {
        throw AssemblyError("Hash mismatch for chunk " + std::to_string(chunk.index));
    }

    if (!chunk.iv) {
        if (chunk.data.size() != chunk.size) {
            throw AssemblyError("Size mismatch for chunk " + std::to_string(chunk.index));
        }
        return chunk.data;
    }

    if (chunk.data.size() < crypto::kIvSize + crypto::kTagSize) {
        throw AssemblyError("Truncated chunk " + std::to_string(chunk.index));
    }
    auto plain = crypto::aes256_gcm_open(key_, chunk.iv->data(),
                                         chunk.data.data() + crypto::kIvSize,
                                         chunk.data.size() - crypto::kIvSize);
    if (!plain) {
        throw AssemblyError("Authentication failed for chunk " + std::to_string(chunk.index));
    }
    if (plain->size() != chunk.size) {
        throw AssemblyError("Size mismatch for chunk " + std::to_string(chunk.index));
    }
    return std::move(*plain);
}

Bytes ChunkCodec::assemble(std::vector<Chunk> chunks) const {
    if (chunks.empty()) {
        throw AssemblyError("No chunks to assemble");
    }

    std::sort(chunks.begin(), chunks.end(),
              [](const Chunk& a, const Chunk& b) { return a.index < b.index; });

    Bytes out;
    std::uint32_t expected = 0;
    for (const auto& chunk : chunks) {
        if (chunk.index != expected) {
            if (chunk.index < expected) {
                throw AssemblyError("Duplicate chunk index " + std::to_string(chunk.index));
            }
            throw AssemblyError("Missing chunk index " + std::to_string(expected));
        }
        Bytes plain = decode_chunk(chunk);
        out.insert(out.end(), plain.begin(), plain.end());
        ++expected;
    }

    log::debug("Codec") << "Assembled " << chunks.size() << " chunk(s), " << out.size() << " bytes";
    return out;
}

bool ChunkCodec::verify(const Chunk& chunk) {
    return crypto::digest_equal(crypto::sha256(chunk.data), chunk.hash);
}

Chunk ChunkCodec::from_blob(std::uint32_t index, Bytes blob, const Digest& hash,
                            std::uint64_t size, bool encrypted) {
    Chunk chunk;
    chunk.index = index;
    chunk.hash = hash;
    chunk.size = size;

    if (encrypted) {
        if (blob.size() < crypto::kIvSize + crypto::kTagSize) {
            throw InvalidInputError("Encrypted blob for chunk " + std::to_string(index) + " is truncated");
        }
        std::array<std::uint8_t, crypto::kIvSize> iv{};
        std::copy(blob.begin(), blob.begin() + crypto::kIvSize, iv.begin());
        std::array<std::uint8_t, crypto::kTagSize> tag{};
        std::copy(blob.end() - crypto::kTagSize, blob.end(), tag.begin());
        chunk.iv = iv;
        chunk.auth_tag = tag;
    }
    chunk.data = std::move(blob);
    return chunk;
}

} // namespace spora
