#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace spora {

using namespace std::chrono_literals;

// Settings for the storage-provider daemon (spora-node).
struct NodeDaemonConfig {
    std::uint16_t listen_port{7420};
    std::string address;  // empty: derived from listen_port
    std::string region{"default"};
    std::uint64_t capacity_bytes{10ull * 1024 * 1024 * 1024};
    std::string data_dir{"chunks"};
    std::string certificate{"node.crt"};
    std::string private_key{"node.key"};
};

struct Config {
    // chunking
    std::uint64_t chunk_size{1024 * 1024};
    bool encryption{true};

    // placement
    double base_cost_per_chunk{1000.0};
    std::size_t redundancy_floor{5};
    std::chrono::milliseconds freshness_window{5min};

    // liveness
    std::chrono::milliseconds heartbeat_interval{30s};
    std::chrono::milliseconds dead_node_timeout{5min};

    // verification
    std::chrono::milliseconds challenge_interval{1h};
    std::chrono::milliseconds challenge_timeout{30s};
    unsigned suspect_threshold{3};
    std::size_t proof_history_limit{16};
    std::size_t max_concurrent_verifications{8};
    double reliability_reward{0.01};
    double reliability_penalty{0.05};

    // recovery
    std::chrono::milliseconds recovery_timeout{5min};
    unsigned max_retries{3};
    std::chrono::milliseconds backoff_base{1s};
    std::size_t max_concurrent_recoveries{4};
    std::chrono::milliseconds system_sweep_interval{1h};
    std::size_t recovery_history_limit{256};  // finished operations kept for queries

    // reference copies; empty keeps them in memory only
    std::string reference_dir;

    // events
    std::size_t event_channel_capacity{1024};

    // transport
    std::chrono::milliseconds transport_timeout{30s};
    std::size_t max_frame_bytes{64ull * 1024 * 1024};
    std::size_t max_concurrent_transfers{8};

    std::string log_level{"info"};

    NodeDaemonConfig node;
};

// The host:port a client should dial: `address` when set, else 127.0.0.1 on listen_port.
std::string advertised_address(const NodeDaemonConfig& node);

// Reads a JSON configuration file. Missing keys keep their defaults.
// Throws InvalidInputError if the file cannot be read or a value is malformed.
Config load_config(const std::string& path);

// Same as load_config, reading from an in-memory JSON document.
Config parse_config(const std::string& json);

} // namespace spora
