#pragma once

#include "spora/crypto.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spora {

using Bytes = std::vector<std::uint8_t>;
using Digest = crypto::Digest;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFunction = std::function<TimePoint()>;

// A chunk may never be placed on fewer nodes than this.
constexpr std::size_t kAbsoluteRedundancyFloor = 5;

// --- Chunk ---
// hash covers the stored bytes in data (IV || ciphertext || tag when encrypted).
// size is the plaintext length.
struct Chunk {
    std::uint32_t index = 0;
    Bytes data;
    Digest hash{};
    std::uint64_t size = 0;
    std::optional<std::array<std::uint8_t, crypto::kIvSize>> iv;
    std::optional<std::array<std::uint8_t, crypto::kTagSize>> auth_tag;
};

// --- StorageNode ---
enum class NodeStatus { active, offline, dead };

struct StorageNode {
    std::string id;
    std::string region;
    std::string pubkey;   // hex SHA-256 fingerprint of the node's TLS public key
    std::string address;  // host:port
    std::uint64_t capacity_bytes = 0;
    std::uint64_t available_bytes = 0;
    double reliability = 0.5;
    TimePoint last_seen{};
    NodeStatus status = NodeStatus::active;
};

const char* to_string(NodeStatus status);

// --- Redundancy ---
enum class RedundancyLevel { minimum, standard, maximum, custom };

struct RedundancyTier {
    std::string name;
    std::uint32_t copies = 0;
    std::uint32_t regions = 0;
    double cost_multiplier = 0.0;
};

struct StoragePreference {
    RedundancyLevel level = RedundancyLevel::standard;
    std::optional<std::uint32_t> custom_copies;
    std::vector<std::string> preferred_regions;
};

const char* to_string(RedundancyLevel level);

// Throws InvalidRedundancyError for an unknown name.
RedundancyLevel parse_redundancy_level(const std::string& name);

// minimum{5,2,1.0}, standard{15,4,1.8}, maximum{30,8,3.0}.
const RedundancyTier& tier_for(RedundancyLevel level);

// copies = requested, regions = max(2, floor(copies / 5)), cost_multiplier = copies / 5.
// Throws InvalidRedundancyError when copies < 5.
RedundancyTier custom_tier(std::uint32_t copies);

// Resolves the tier a preference asks for.
RedundancyTier resolve_tier(const StoragePreference& preference);

// --- DistributionPlan ---
struct DistributionPlan {
    std::string chunk_id;
    std::vector<std::string> target_nodes;
    std::uint32_t redundancy_level = 0;
    std::set<std::string> regions;
    double estimated_cost = 0.0;
};

// --- File metadata ---
struct RedundancyInfo {
    RedundancyTier tier;
    StoragePreference preference;
};

struct FileRecord {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    TimePoint created{};
    TimePoint modified{};
    std::vector<std::string> chunk_ids;
    RedundancyInfo redundancy;
};

struct ChunkRecord {
    std::string id;
    std::string file_id;
    std::uint32_t index = 0;
    Digest hash{};
    std::uint64_t size = 0;
    std::uint64_t blob_size = 0;
    bool encrypted = true;
};

std::string make_file_id();
std::string make_chunk_id(const std::string& file_id, std::uint32_t index);

std::int64_t to_unix_ms(TimePoint tp);
TimePoint from_unix_ms(std::int64_t ms);

} // namespace spora
