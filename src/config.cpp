#include "config.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>

namespace spora {

namespace {

using boost::property_tree::ptree;

std::chrono::milliseconds get_ms(const ptree& root, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(root.get<std::int64_t>(key, fallback.count()));
}

Config read_tree(const ptree& root) {
    Config config;

    // Chunking
    config.chunk_size = root.get<std::uint64_t>("chunking.size", config.chunk_size);
    config.encryption = root.get<bool>("chunking.encryption", config.encryption);

    // Placement
    config.base_cost_per_chunk = root.get<double>("placement.baseCostPerChunk", config.base_cost_per_chunk);
    config.redundancy_floor = root.get<std::size_t>("placement.redundancyFloor", config.redundancy_floor);
    config.freshness_window = get_ms(root, "placement.freshnessWindowMs", config.freshness_window);

    // Liveness
    config.heartbeat_interval = get_ms(root, "liveness.heartbeatIntervalMs", config.heartbeat_interval);
    config.dead_node_timeout = get_ms(root, "liveness.deadNodeTimeoutMs", config.dead_node_timeout);

    // Verification
    config.challenge_interval = get_ms(root, "verification.intervalMs", config.challenge_interval);
    config.challenge_timeout = get_ms(root, "verification.timeoutMs", config.challenge_timeout);
    config.suspect_threshold = root.get<unsigned>("verification.suspectThreshold", config.suspect_threshold);
    config.proof_history_limit = root.get<std::size_t>("verification.historyLimit", config.proof_history_limit);
    config.max_concurrent_verifications =
        root.get<std::size_t>("verification.maxConcurrent", config.max_concurrent_verifications);
    config.reliability_reward = root.get<double>("verification.reliabilityReward", config.reliability_reward);
    config.reliability_penalty = root.get<double>("verification.reliabilityPenalty", config.reliability_penalty);

    // Recovery
    config.recovery_timeout = get_ms(root, "recovery.timeoutMs", config.recovery_timeout);
    config.max_retries = root.get<unsigned>("recovery.maxRetries", config.max_retries);
    config.backoff_base = get_ms(root, "recovery.backoffBaseMs", config.backoff_base);
    config.max_concurrent_recoveries =
        root.get<std::size_t>("recovery.maxConcurrent", config.max_concurrent_recoveries);
    config.system_sweep_interval = get_ms(root, "recovery.sweepIntervalMs", config.system_sweep_interval);
    config.recovery_history_limit = root.get<std::size_t>("recovery.historyLimit", config.recovery_history_limit);
    config.reference_dir = root.get<std::string>("reference.dataDir", config.reference_dir);

    config.event_channel_capacity = root.get<std::size_t>("events.capacity", config.event_channel_capacity);

    // Transport
    config.transport_timeout = get_ms(root, "transport.timeoutMs", config.transport_timeout);
    config.max_frame_bytes = root.get<std::size_t>("transport.maxFrameBytes", config.max_frame_bytes);
    config.max_concurrent_transfers =
        root.get<std::size_t>("transport.maxConcurrentTransfers", config.max_concurrent_transfers);

    config.log_level = root.get<std::string>("log.level", config.log_level);

    // Node daemon
    auto& node = config.node;
    node.listen_port = root.get<std::uint16_t>("node.listenPort", node.listen_port);
    node.address = root.get<std::string>("node.address", node.address);
    node.region = root.get<std::string>("node.region", node.region);
    node.capacity_bytes = root.get<std::uint64_t>("node.capacityBytes", node.capacity_bytes);
    node.data_dir = root.get<std::string>("node.dataDir", node.data_dir);
    node.certificate = root.get<std::string>("node.certificate", node.certificate);
    node.private_key = root.get<std::string>("node.privateKey", node.private_key);

    if (config.chunk_size == 0) {
        throw InvalidInputError("chunking.size must be positive");
    }
    if (config.max_retries == 0) {
        throw InvalidInputError("recovery.maxRetries must be at least 1");
    }
    if (config.recovery_history_limit == 0) {
        throw InvalidInputError("recovery.historyLimit must be at least 1");
    }
    if (config.max_concurrent_recoveries == 0 || config.max_concurrent_verifications == 0) {
        throw InvalidInputError("concurrency limits must be at least 1");
    }
    log::parse_level(config.log_level);
    return config;
}

} // namespace

std::string advertised_address(const NodeDaemonConfig& node) {
    if (!node.address.empty()) {
        return node.address;
    }
    return "127.0.0.1:" + std::to_string(node.listen_port);
}

Config load_config(const std::string& path) {
    ptree root;
    try {
        boost::property_tree::read_json(path, root);
        return read_tree(root);
    } catch (const boost::property_tree::ptree_error& e) {
        throw InvalidInputError("Failed to load configuration " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw InvalidInputError("Invalid configuration " + path + ": " + e.what());
    }
}

Config parse_config(const std::string& json) {
    ptree root;
    std::istringstream input(json);
    try {
        boost::property_tree::read_json(input, root);
        return read_tree(root);
    } catch (const boost::property_tree::ptree_error& e) {
        throw InvalidInputError(std::string("Failed to parse configuration: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw InvalidInputError(std::string("Invalid configuration: ") + e.what());
    }
}

} // namespace spora
