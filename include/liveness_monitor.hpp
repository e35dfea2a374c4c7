#pragma once

#include "config.hpp"
#include "node_registry.hpp"
#include "transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>

namespace spora {

// Pings every known node each heartbeat_interval, then runs the registry's
// liveness sweep once all pings have answered.
class LivenessMonitor {
public:
    LivenessMonitor(boost::asio::io_context& io_context, const Config& config,
                    NodeRegistry& registry, Transport& transport);

    void start();
    void stop();

    // One round. done runs after the sweep.
    void ping_all(std::function<void()> done = {});

    std::size_t rounds() const { return rounds_; }

private:
    void schedule();

    boost::asio::io_context& io_context_;
    const Config& config_;
    NodeRegistry& registry_;
    Transport& transport_;
    boost::asio::steady_timer timer_;
    bool running_ = false;
    std::size_t rounds_ = 0;
};

} // namespace spora
