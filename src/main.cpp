#include <iostream>
#include <boost/asio.hpp>
#include "config.hpp"
#include "chunk_store.hpp"
#include "node.hpp"
#include "node_registry.hpp"
#include "spora/log.hpp"

namespace {

void usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>] [--listen <port>] [--address <host:port>]\n"
              << "       [--data-dir <dir>] [--region <name>] [--capacity <bytes>]\n"
              << "       [--cert <file>] [--key <file>] [--log-level <level>]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spora::Config config;

        // --config is applied first so the other flags override it.
        for (int i = 1; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") {
                config = spora::load_config(argv[i + 1]);
            }
        }

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                usage(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 1;
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                continue;
            } else if (arg == "--listen") {
                config.node.listen_port = static_cast<std::uint16_t>(std::stoi(value));
            } else if (arg == "--address") {
                config.node.address = value;
            } else if (arg == "--data-dir") {
                config.node.data_dir = value;
            } else if (arg == "--region") {
                config.node.region = value;
            } else if (arg == "--capacity") {
                config.node.capacity_bytes = std::stoull(value);
            } else if (arg == "--cert") {
                config.node.certificate = value;
            } else if (arg == "--key") {
                config.node.private_key = value;
            } else if (arg == "--log-level") {
                config.log_level = value;
            } else {
                std::cerr << "Unknown option " << arg << std::endl;
                usage(argv[0]);
                return 1;
            }
        }

        spora::log::set_level(spora::log::parse_level(config.log_level));

        boost::asio::io_context io_context;

        auto ssl_context = spora::make_server_context(config.node.certificate, config.node.private_key);
        const std::string pubkey = spora::certificate_fingerprint(ssl_context);
        const std::string node_id = spora::node_id_for_pubkey(pubkey);

        spora::ChunkStore store(config.node.capacity_bytes, config.node.data_dir);
        const std::size_t loaded = store.load_existing();
        spora::log::info("Main") << "Loaded " << loaded << " chunks from " << config.node.data_dir;

        spora::StorageNodeServer server(io_context, ssl_context, store, node_id, config.max_frame_bytes);
        server.listen(config.node.listen_port);

        // Everything a client needs to register this node.
        std::cout << "node_id  " << node_id << "\n"
                  << "pubkey   " << pubkey << "\n"
                  << "address  " << spora::advertised_address(config.node) << "\n"
                  << "region   " << config.node.region << "\n"
                  << "capacity " << store.capacity_bytes() << std::endl;

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int /*signal*/) {
            if (!ec) {
                spora::log::info("Main") << "Shutting down";
                server.stop();
                io_context.stop();
            }
        });

        io_context.run();
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
