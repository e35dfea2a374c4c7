#include "node.hpp"
#include "session.hpp"
#include "spora/crypto.hpp"
#include "spora/log.hpp"
#include <openssl/ssl.h>

namespace spora {

namespace {

void configure(ssl::context& context) {
    context.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 | ssl::context::no_sslv3 |
        ssl::context::single_dh_use);
    // Identity is checked by key fingerprint, not by a CA chain.
    context.set_verify_mode(ssl::verify_none);
}

} // namespace

ssl::context make_server_context(const std::string& certificate_file, const std::string& private_key_file) {
    ssl::context context(ssl::context::tls_server);
    configure(context);
    context.use_certificate_chain_file(certificate_file);
    context.use_private_key_file(private_key_file, ssl::context::pem);
    return context;
}

ssl::context make_server_context_pem(const std::string& certificate_pem, const std::string& private_key_pem) {
    ssl::context context(ssl::context::tls_server);
    configure(context);
    context.use_certificate(boost::asio::buffer(certificate_pem), ssl::context::pem);
    context.use_private_key(boost::asio::buffer(private_key_pem), ssl::context::pem);
    return context;
}

std::string certificate_fingerprint(ssl::context& context) {
    return crypto::public_key_fingerprint(SSL_CTX_get0_certificate(context.native_handle()));
}

StorageNodeServer::StorageNodeServer(boost::asio::io_context& io_context,
                                     ssl::context& ssl_context,
                                     ChunkStore& store,
                                     std::string node_id,
                                     std::size_t max_frame_bytes)
    : io_context_(io_context),
      ssl_context_(ssl_context),
      store_(store),
      node_id_(std::move(node_id)),
      max_frame_bytes_(max_frame_bytes) {}

void StorageNodeServer::listen(std::uint16_t port, const std::string& host) {
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_,
        tcp::endpoint(boost::asio::ip::make_address(host), port));
    log::info("Node") << node_id_ << " listening on " << host << ":" << local_port();
    do_accept();
}

void StorageNodeServer::stop() {
    if (acceptor_ && acceptor_->is_open()) {
        boost::system::error_code ignored;
        acceptor_->close(ignored);
    }
    // Session::stop() removes itself from the set.
    auto sessions = sessions_;
    for (const auto& session : sessions) {
        session->stop();
    }
}

std::uint16_t StorageNodeServer::local_port() const {
    return acceptor_ ? acceptor_->local_endpoint().port() : 0;
}

void StorageNodeServer::do_accept() {
    acceptor_->async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_->is_open()) {
                return;
            }
            if (!ec) {
                log::debug("Node") << "Accepted connection. Starting session...";
                auto session = std::make_shared<Session>(std::move(socket), *this);
                sessions_.insert(session);
                session->start();
            } else {
                log::warn("Node") << "Accept error: " << ec.message();
            }
            do_accept();
        });
}

void StorageNodeServer::remove_session(std::shared_ptr<Session> session) {
    sessions_.erase(session);
}

wire::MessageWrapper StorageNodeServer::handle(const wire::MessageWrapper& request) {
    wire::MessageWrapper response;

    switch (request.payload_case()) {
        case wire::MessageWrapper::kHandshake: {
            auto* handshake = response.mutable_handshake();
            handshake->set_node_id(node_id_);
            handshake->set_version(1);
            break;
        }
        case wire::MessageWrapper::kChallengeReq: {
            const auto& challenge = request.challenge_req();
            const Bytes nonce(challenge.nonce().begin(), challenge.nonce().end());
            auto* res = response.mutable_challenge_res();
            res->set_chunk_id(challenge.chunk_id());
            if (auto digest = store_.prove(challenge.chunk_id(), nonce)) {
                res->set_found(true);
                res->set_digest(digest->data(), digest->size());
            } else {
                res->set_found(false);
            }
            break;
        }
        case wire::MessageWrapper::kStoreReq: {
            const auto& store = request.store_req();
            auto* res = response.mutable_store_res();
            res->set_chunk_id(store.chunk_id());
            try {
                const Bytes blob(store.blob().begin(), store.blob().end());
                if (store_.put(store.chunk_id(), blob)) {
                    res->set_ok(true);
                } else {
                    res->set_ok(false);
                    res->set_error("capacity exhausted");
                }
            } catch (const std::exception& e) {
                res->set_ok(false);
                res->set_error(e.what());
            }
            break;
        }
        case wire::MessageWrapper::kFetchReq: {
            const auto& fetch = request.fetch_req();
            auto* res = response.mutable_fetch_res();
            res->set_chunk_id(fetch.chunk_id());
            if (auto blob = store_.get(fetch.chunk_id())) {
                res->set_found(true);
                res->set_blob(blob->data(), blob->size());
            } else {
                res->set_found(false);
            }
            break;
        }
        case wire::MessageWrapper::kDeleteReq: {
            const auto& del = request.delete_req();
            auto* res = response.mutable_delete_res();
            res->set_chunk_id(del.chunk_id());
            res->set_removed(store_.erase(del.chunk_id()));
            break;
        }
        case wire::MessageWrapper::kPing: {
            auto* pong = response.mutable_pong();
            pong->set_node_id(node_id_);
            pong->set_available_bytes(store_.available_bytes());
            break;
        }
        default:
            log::warn("Node") << "Unexpected message type " << static_cast<int>(request.payload_case());
            break;
    }
    return response;
}

} // namespace spora
