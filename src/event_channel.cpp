#include "event_channel.hpp"
#include "spora/log.hpp"
#include <boost/asio/post.hpp>
#include <stdexcept>

namespace spora {

const char* event_name(const Event& event) {
    switch (event.index()) {
        case 0: return "LowRedundancy";
        case 1: return "CriticalRedundancy";
        case 2: return "NodeSuspect";
        case 3: return "NodeOffline";
        case 4: return "NodeDead";
        case 5: return "RecoveryExhausted";
    }
    return "Unknown";
}

EventChannel::EventChannel(boost::asio::io_context& io_context, std::size_t capacity)
    : io_context_(io_context), capacity_(capacity == 0 ? 1 : capacity) {}

bool EventChannel::push(Event event) {
    if (receiver_) {
        // Queue is empty whenever a receiver is parked.
        auto receiver = std::move(receiver_);
        receiver_ = nullptr;
        boost::asio::post(io_context_, [receiver = std::move(receiver), event = std::move(event)]() mutable {
            receiver(std::move(event));
        });
        return true;
    }

    if (queue_.size() >= capacity_) {
        if (!overflow_) {
            log::warn("Recovery") << "Event channel full (" << capacity_ << "), dropping " << event_name(event);
        }
        overflow_ = true;
        ++dropped_;
        return false;
    }
    queue_.push_back(std::move(event));
    return true;
}

void EventChannel::async_receive(Receiver handler) {
    if (receiver_) {
        throw std::logic_error("EventChannel already has a parked receiver");
    }
    if (!queue_.empty()) {
        Event event = std::move(queue_.front());
        queue_.pop_front();
        boost::asio::post(io_context_, [handler = std::move(handler), event = std::move(event)]() mutable {
            handler(std::move(event));
        });
        return;
    }
    receiver_ = std::move(handler);
}

std::optional<Event> EventChannel::try_receive() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

bool EventChannel::take_overflow() {
    const bool was = overflow_;
    overflow_ = false;
    return was;
}

void EventChannel::close() {
    receiver_ = nullptr;
}

} // namespace spora
