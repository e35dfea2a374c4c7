#include "chunk_store.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace spora {

namespace {
const char* const kChunkExtension = ".chunk";
}

ChunkStore::ChunkStore(std::uint64_t capacity_bytes, std::string directory)
    : capacity_bytes_(capacity_bytes), directory_(std::move(directory))
{
    if (!directory_.empty()) {
        std::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec) {
            throw Error("Could not create chunk directory " + directory_ + ": " + ec.message());
        }
    }
}

bool ChunkStore::valid_chunk_id(const std::string& chunk_id) {
    if (chunk_id.empty() || chunk_id.size() > 200 || chunk_id == "." || chunk_id == "..") {
        return false;
    }
    for (char c : chunk_id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '.' || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string ChunkStore::path_for(const std::string& chunk_id) const {
    return (fs::path(directory_) / (chunk_id + kChunkExtension)).string();
}

std::uint64_t ChunkStore::available_bytes() const {
    return used_bytes_ >= capacity_bytes_ ? 0 : capacity_bytes_ - used_bytes_;
}

std::size_t ChunkStore::load_existing() {
    if (directory_.empty()) {
        return 0;
    }

    std::size_t loaded = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kChunkExtension) {
            continue;
        }
        const std::string chunk_id = entry.path().stem().string();
        if (!valid_chunk_id(chunk_id) || blobs_.count(chunk_id)) {
            continue;
        }

        std::ifstream file(entry.path(), std::ios::binary);
        if (!file.is_open()) {
            log::warn("Node") << "Could not open " << entry.path().string();
            continue;
        }
        Bytes blob((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        used_bytes_ += blob.size();
        blobs_.emplace(chunk_id, std::move(blob));
        ++loaded;
    }
    if (ec) {
        throw Error("Could not scan chunk directory " + directory_ + ": " + ec.message());
    }

    log::info("Node") << "Loaded " << loaded << " chunk(s) from " << directory_ << ", " << used_bytes_ << " bytes";
    return loaded;
}

bool ChunkStore::put(const std::string& chunk_id, const Bytes& blob) {
    if (!valid_chunk_id(chunk_id)) {
        throw InvalidInputError("Invalid chunk id: " + chunk_id);
    }

    auto it = blobs_.find(chunk_id);
    const std::uint64_t previous = it != blobs_.end() ? it->second.size() : 0;
    if (used_bytes_ - previous + blob.size() > capacity_bytes_) {
        log::warn("Node") << "Rejecting chunk " << chunk_id << " (" << blob.size()
                          << " bytes): only " << available_bytes() << " bytes free";
        return false;
    }

    if (!directory_.empty()) {
        std::ofstream file(path_for(chunk_id), std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw Error("Could not open chunk file for writing: " + path_for(chunk_id));
        }
        file.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
        if (!file) {
            throw Error("Could not write chunk file: " + path_for(chunk_id));
        }
    }

    used_bytes_ = used_bytes_ - previous + blob.size();
    blobs_[chunk_id] = blob;
    log::debug("Node") << "Stored chunk " << chunk_id << ", size: " << blob.size();
    return true;
}

std::optional<Bytes> ChunkStore::get(const std::string& chunk_id) const {
    auto it = blobs_.find(chunk_id);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ChunkStore::erase(const std::string& chunk_id) {
    auto it = blobs_.find(chunk_id);
    if (it == blobs_.end()) {
        return false;
    }
    used_bytes_ -= it->second.size();
    blobs_.erase(it);

    if (!directory_.empty()) {
        std::error_code ec;
        fs::remove(path_for(chunk_id), ec);
        if (ec) {
            log::warn("Node") << "Could not remove chunk file for " << chunk_id << ": " << ec.message();
        }
    }
    log::debug("Node") << "Erased chunk " << chunk_id;
    return true;
}

bool ChunkStore::contains(const std::string& chunk_id) const {
    return blobs_.count(chunk_id) > 0;
}

std::optional<Digest> ChunkStore::prove(const std::string& chunk_id, const Bytes& nonce) const {
    auto it = blobs_.find(chunk_id);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return crypto::proof_digest(it->second, nonce);
}

std::vector<std::string> ChunkStore::chunk_ids() const {
    std::vector<std::string> ids;
    ids.reserve(blobs_.size());
    for (const auto& entry : blobs_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace spora
