#include "liveness_monitor.hpp"
#include "spora/log.hpp"
#include <boost/asio/post.hpp>
#include <memory>

namespace spora {

LivenessMonitor::LivenessMonitor(boost::asio::io_context& io_context, const Config& config,
                                 NodeRegistry& registry, Transport& transport)
    : io_context_(io_context),
      config_(config),
      registry_(registry),
      transport_(transport),
      timer_(io_context) {}

void LivenessMonitor::start() {
    if (running_) {
        return;
    }
    running_ = true;
    schedule();
}

void LivenessMonitor::stop() {
    running_ = false;
    timer_.cancel();
}

void LivenessMonitor::schedule() {
    timer_.expires_after(config_.heartbeat_interval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        ping_all([this]() {
            if (running_) {
                schedule();
            }
        });
    });
}

void LivenessMonitor::ping_all(std::function<void()> done) {
    const auto nodes = registry_.all();
    auto remaining = std::make_shared<std::size_t>(nodes.size());
    auto answered = std::make_shared<std::size_t>(0);

    auto finish = [this, remaining, answered, total = nodes.size(), done]() {
        ++rounds_;
        const std::size_t transitions = registry_.sweep();
        log::debug("Liveness") << "Round " << rounds_ << ": " << *answered << "/" << total
                               << " answered, " << transitions << " transition(s)";
        if (done) {
            done();
        }
    };

    if (nodes.empty()) {
        boost::asio::post(io_context_, finish);
        return;
    }

    for (const auto& node : nodes) {
        const std::string node_id = node.id;
        transport_.ping(node, [this, node_id, remaining, answered, finish](boost::system::error_code ec) {
            if (!ec) {
                registry_.mark_seen(node_id);
                ++*answered;
            } else {
                log::debug("Liveness") << "No answer from " << node_id << ": " << ec.message();
            }
            if (--*remaining == 0) {
                finish();
            }
        });
    }
}

} // namespace spora
