#pragma once

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace spora {

// --- Events ---
struct LowRedundancy {
    std::string chunk_id;
    std::size_t current = 0;
    std::size_t required = 0;
};

struct CriticalRedundancy {
    std::string chunk_id;
    std::size_t current = 0;
};

struct NodeSuspect {
    std::string node_id;
    std::string chunk_id;
    unsigned consecutive_failures = 0;
};

struct NodeOffline {
    std::string node_id;
};

struct NodeDead {
    std::string node_id;
};

struct RecoveryExhausted {
    std::string operation_id;
    std::string type;
    std::string target;
    unsigned attempts = 0;
    std::string error;
};

using Event = std::variant<LowRedundancy, CriticalRedundancy, NodeSuspect, NodeOffline, NodeDead, RecoveryExhausted>;

const char* event_name(const Event& event);

// Bounded FIFO of events with a single asynchronous consumer.
// A full channel drops the new event and raises the overflow flag.
// A parked receiver is not outstanding work for the io_context.
class EventChannel {
public:
    using Receiver = std::function<void(Event)>;

    EventChannel(boost::asio::io_context& io_context, std::size_t capacity);

    bool push(Event event);

    // Handler is always invoked through the io_context, never inline.
    // Throws std::logic_error if a receiver is already parked.
    void async_receive(Receiver handler);
    std::optional<Event> try_receive();

    // Returns whether events were dropped since the last call, and clears the flag.
    bool take_overflow();

    // Drops a parked receiver without calling it.
    void close();

    std::size_t size() const { return queue_.size(); }
    std::size_t capacity() const { return capacity_; }
    std::size_t dropped() const { return dropped_; }

private:
    boost::asio::io_context& io_context_;
    std::size_t capacity_;
    std::deque<Event> queue_;
    Receiver receiver_;
    bool overflow_ = false;
    std::size_t dropped_ = 0;
};

} // namespace spora
