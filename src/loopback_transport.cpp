#include "loopback_transport.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace spora {

LoopbackTransport::LoopbackTransport(boost::asio::io_context& io_context)
    : io_context_(io_context) {}

ChunkStore& LoopbackTransport::attach(const std::string& node_id, std::uint64_t capacity_bytes) {
    SimulatedNode& node = nodes_[node_id];
    node.store = std::make_unique<ChunkStore>(capacity_bytes);
    auto pending = pending_faults_.find(node_id);
    if (pending != pending_faults_.end()) {
        node.faults = pending->second;
        pending_faults_.erase(pending);
    }
    return *node.store;
}

void LoopbackTransport::detach(const std::string& node_id) {
    nodes_.erase(node_id);
}

ChunkStore* LoopbackTransport::store_for(const std::string& node_id) {
    auto it = nodes_.find(node_id);
    return it == nodes_.end() ? nullptr : it->second.store.get();
}

NodeFaults& LoopbackTransport::faults(const std::string& node_id) {
    auto it = nodes_.find(node_id);
    if (it != nodes_.end()) {
        return it->second.faults;
    }
    return pending_faults_[node_id];
}

void LoopbackTransport::deliver(const std::string& node_id, std::function<void(SimulatedNode*)> fn) {
    auto resolve = [this, node_id, fn = std::move(fn)]() {
        auto it = nodes_.find(node_id);
        if (it == nodes_.end() || it->second.faults.unreachable) {
            fn(nullptr);
            return;
        }
        fn(&it->second);
    };

    std::chrono::milliseconds latency{0};
    auto it = nodes_.find(node_id);
    if (it != nodes_.end()) {
        latency = it->second.faults.latency;
    }

    if (latency.count() == 0) {
        boost::asio::post(io_context_, std::move(resolve));
        return;
    }
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, latency);
    timer->async_wait([timer, resolve = std::move(resolve)](const boost::system::error_code&) {
        resolve();
    });
}

void LoopbackTransport::send_challenge(const StorageNode& node, const std::string& chunk_id,
                                       const Bytes& nonce, ChallengeHandler handler) {
    ++stats_.challenges;
    deliver(node.id, [chunk_id, nonce, handler = std::move(handler)](SimulatedNode* target) {
        if (!target) {
            handler(make_error_code(transport_errc::unreachable), Digest{});
            return;
        }
        if (target->faults.drop_challenges) {
            return;
        }
        auto digest = target->store->prove(chunk_id, nonce);
        if (!digest) {
            handler(make_error_code(transport_errc::chunk_not_found), Digest{});
            return;
        }
        if (target->faults.corrupt_proofs) {
            (*digest)[0] ^= 0xff;
        }
        handler({}, *digest);
    });
}

void LoopbackTransport::store_chunk(const StorageNode& node, const std::string& chunk_id,
                                    std::shared_ptr<const Bytes> blob, CompletionHandler handler) {
    ++stats_.stores;
    deliver(node.id, [chunk_id, blob, handler = std::move(handler)](SimulatedNode* target) {
        if (!target) {
            handler(make_error_code(transport_errc::unreachable));
            return;
        }
        if (target->faults.fail_next_stores > 0) {
            --target->faults.fail_next_stores;
            handler(make_error_code(transport_errc::rejected));
            return;
        }
        bool stored = false;
        try {
            stored = target->store->put(chunk_id, *blob);
        } catch (const std::exception& e) {
            log::warn("Transport") << "Store of " << chunk_id << " failed: " << e.what();
        }
        handler(stored ? boost::system::error_code{} : make_error_code(transport_errc::rejected));
    });
}

void LoopbackTransport::fetch_chunk(const StorageNode& node, const std::string& chunk_id,
                                    FetchHandler handler) {
    ++stats_.fetches;
    deliver(node.id, [chunk_id, handler = std::move(handler)](SimulatedNode* target) {
        if (!target) {
            handler(make_error_code(transport_errc::unreachable), Bytes{});
            return;
        }
        auto blob = target->store->get(chunk_id);
        if (!blob) {
            handler(make_error_code(transport_errc::chunk_not_found), Bytes{});
            return;
        }
        handler({}, std::move(*blob));
    });
}

void LoopbackTransport::delete_chunk(const StorageNode& node, const std::string& chunk_id,
                                     CompletionHandler handler) {
    ++stats_.deletes;
    deliver(node.id, [chunk_id, handler = std::move(handler)](SimulatedNode* target) {
        if (!target) {
            handler(make_error_code(transport_errc::unreachable));
            return;
        }
        target->store->erase(chunk_id);
        handler({});
    });
}

void LoopbackTransport::ping(const StorageNode& node, CompletionHandler handler) {
    ++stats_.pings;
    deliver(node.id, [handler = std::move(handler)](SimulatedNode* target) {
        handler(target ? boost::system::error_code{} : make_error_code(transport_errc::unreachable));
    });
}

} // namespace spora
