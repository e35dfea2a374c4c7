#include "tls_transport.hpp"
#include "spora/crypto.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <boost/asio.hpp>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <algorithm>
#include <memory>
#include <vector>

namespace spora {

using tcp = boost::asio::ip::tcp;

ssl::context make_client_context() {
    ssl::context context(ssl::context::tls_client);
    context.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 | ssl::context::no_sslv3);
    // Peers are pinned by key fingerprint after the handshake.
    context.set_verify_mode(ssl::verify_none);
    return context;
}

namespace {

// One connection carrying one request and its response.
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    Exchange(boost::asio::io_context& io_context, ssl::context& ssl_context, const Config& config,
             StorageNode node, wire::MessageWrapper request, TlsTransport::ResponseHandler handler)
        : io_context_(io_context),
          resolver_(io_context),
          stream_(io_context, ssl_context),
          timer_(io_context),
          config_(config),
          node_(std::move(node)),
          request_(std::move(request)),
          handler_(std::move(handler)) {}

    void start() {
        const auto colon = node_.address.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == node_.address.size()) {
            log::warn("Transport") << "Invalid address for " << node_.id << ": '" << node_.address << "'";
            boost::asio::post(io_context_, [self = shared_from_this()]() {
                self->finish(make_error_code(transport_errc::unreachable), {});
            });
            return;
        }
        const std::string host = node_.address.substr(0, colon);
        const std::string port = node_.address.substr(colon + 1);

        auto self(shared_from_this());
        timer_.expires_after(config_.transport_timeout);
        timer_.async_wait([this, self](const boost::system::error_code& ec) {
            if (!ec) {
                finish(make_error_code(transport_errc::timed_out), {});
            }
        });

        resolver_.async_resolve(host, port,
            [this, self](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    fail("resolve", ec);
                    return;
                }
                boost::asio::async_connect(stream_.lowest_layer(), endpoints,
                    [this, self](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (ec) {
                            fail("connect", ec);
                            return;
                        }
                        do_handshake();
                    });
            });
    }

private:
    void do_handshake() {
        auto self(shared_from_this());
        stream_.async_handshake(ssl::stream_base::client, [this, self](const boost::system::error_code& ec) {
            if (ec) {
                fail("handshake", ec);
                return;
            }
            if (!node_.pubkey.empty() && peer_fingerprint() != node_.pubkey) {
                log::warn("Transport") << node_.id << " presented an unexpected key";
                finish(make_error_code(transport_errc::identity_mismatch), {});
                return;
            }
            do_write();
        });
    }

    std::string peer_fingerprint() {
        X509* certificate = SSL_get_peer_certificate(stream_.native_handle());
        std::string fingerprint = crypto::public_key_fingerprint(certificate);
        if (certificate) {
            X509_free(certificate);
        }
        return fingerprint;
    }

    void do_write() {
        std::shared_ptr<std::string> frame;
        try {
            frame = framing::encode(request_);
        } catch (const std::exception& e) {
            log::error("Transport") << "Could not encode request: " << e.what();
            finish(make_error_code(transport_errc::rejected), {});
            return;
        }
        auto self(shared_from_this());
        boost::asio::async_write(stream_, boost::asio::buffer(*frame),
            [this, self, frame](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    fail("write", ec);
                    return;
                }
                do_read_header();
            });
    }

    void do_read_header() {
        auto self(shared_from_this());
        boost::asio::async_read(stream_, boost::asio::buffer(header_),
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    fail("read", ec);
                    return;
                }
                const std::uint32_t length = framing::read_length(header_);
                if (length > config_.max_frame_bytes) {
                    finish(make_error_code(transport_errc::malformed_response), {});
                    return;
                }
                body_.resize(length);
                do_read_body();
            });
    }

    void do_read_body() {
        auto self(shared_from_this());
        boost::asio::async_read(stream_, boost::asio::buffer(body_),
            [this, self](const boost::system::error_code& ec, std::size_t length) {
                if (ec) {
                    fail("read", ec);
                    return;
                }
                wire::MessageWrapper response;
                if (!framing::parse(body_.data(), length, response)) {
                    finish(make_error_code(transport_errc::malformed_response), {});
                    return;
                }
                finish({}, std::move(response));
            });
    }

    void fail(const char* stage, const boost::system::error_code& ec) {
        if (done_) {
            return;
        }
        log::debug("Transport") << stage << " to " << node_.id << " (" << node_.address << ") failed: " << ec.message();
        finish(make_error_code(transport_errc::unreachable), {});
    }

    void finish(boost::system::error_code ec, wire::MessageWrapper response) {
        if (done_) {
            return;
        }
        done_ = true;
        timer_.cancel();
        resolver_.cancel();
        boost::system::error_code ignored;
        stream_.lowest_layer().close(ignored);
        handler_(ec, std::move(response));
    }

    boost::asio::io_context& io_context_;
    tcp::resolver resolver_;
    ssl::stream<tcp::socket> stream_;
    boost::asio::steady_timer timer_;
    const Config& config_;
    StorageNode node_;
    wire::MessageWrapper request_;
    TlsTransport::ResponseHandler handler_;
    framing::Header header_{};
    std::vector<std::uint8_t> body_;
    bool done_ = false;
};

} // namespace

TlsTransport::TlsTransport(boost::asio::io_context& io_context, ssl::context& ssl_context, const Config& config)
    : io_context_(io_context), ssl_context_(ssl_context), config_(config) {}

void TlsTransport::request(const StorageNode& node, const wire::MessageWrapper& message, ResponseHandler handler) {
    std::make_shared<Exchange>(io_context_, ssl_context_, config_, node, message, std::move(handler))->start();
}

void TlsTransport::send_challenge(const StorageNode& node, const std::string& chunk_id,
                                  const Bytes& nonce, ChallengeHandler handler) {
    wire::MessageWrapper msg;
    auto* challenge = msg.mutable_challenge_req();
    challenge->set_chunk_id(chunk_id);
    challenge->set_nonce(nonce.data(), nonce.size());

    request(node, msg, [handler = std::move(handler)](boost::system::error_code ec, wire::MessageWrapper response) {
        if (ec) {
            handler(ec, Digest{});
            return;
        }
        if (!response.has_challenge_res()) {
            handler(make_error_code(transport_errc::malformed_response), Digest{});
            return;
        }
        const auto& res = response.challenge_res();
        if (!res.found()) {
            handler(make_error_code(transport_errc::chunk_not_found), Digest{});
            return;
        }
        if (res.digest().size() != crypto::kDigestSize) {
            handler(make_error_code(transport_errc::malformed_response), Digest{});
            return;
        }
        Digest digest{};
        std::copy(res.digest().begin(), res.digest().end(), digest.begin());
        handler({}, digest);
    });
}

void TlsTransport::store_chunk(const StorageNode& node, const std::string& chunk_id,
                               std::shared_ptr<const Bytes> blob, CompletionHandler handler) {
    wire::MessageWrapper msg;
    auto* store = msg.mutable_store_req();
    store->set_chunk_id(chunk_id);
    store->set_blob(blob->data(), blob->size());

    request(node, msg, [handler = std::move(handler), node_id = node.id](boost::system::error_code ec,
                                                                        wire::MessageWrapper response) {
        if (ec) {
            handler(ec);
            return;
        }
        if (!response.has_store_res()) {
            handler(make_error_code(transport_errc::malformed_response));
            return;
        }
        if (!response.store_res().ok()) {
            log::warn("Transport") << node_id << " rejected store: " << response.store_res().error();
            handler(make_error_code(transport_errc::rejected));
            return;
        }
        handler({});
    });
}

void TlsTransport::fetch_chunk(const StorageNode& node, const std::string& chunk_id, FetchHandler handler) {
    wire::MessageWrapper msg;
    msg.mutable_fetch_req()->set_chunk_id(chunk_id);

    request(node, msg, [handler = std::move(handler)](boost::system::error_code ec, wire::MessageWrapper response) {
        if (ec) {
            handler(ec, Bytes{});
            return;
        }
        if (!response.has_fetch_res()) {
            handler(make_error_code(transport_errc::malformed_response), Bytes{});
            return;
        }
        const auto& res = response.fetch_res();
        if (!res.found()) {
            handler(make_error_code(transport_errc::chunk_not_found), Bytes{});
            return;
        }
        handler({}, Bytes(res.blob().begin(), res.blob().end()));
    });
}

void TlsTransport::delete_chunk(const StorageNode& node, const std::string& chunk_id, CompletionHandler handler) {
    wire::MessageWrapper msg;
    msg.mutable_delete_req()->set_chunk_id(chunk_id);

    request(node, msg, [handler = std::move(handler)](boost::system::error_code ec, wire::MessageWrapper response) {
        if (ec) {
            handler(ec);
            return;
        }
        handler(response.has_delete_res() ? boost::system::error_code{}
                                           : make_error_code(transport_errc::malformed_response));
    });
}

void TlsTransport::ping(const StorageNode& node, CompletionHandler handler) {
    wire::MessageWrapper msg;
    msg.mutable_ping()->set_sent_at_ms(static_cast<std::uint64_t>(to_unix_ms(Clock::now())));

    request(node, msg, [handler = std::move(handler)](boost::system::error_code ec, wire::MessageWrapper response) {
        if (ec) {
            handler(ec);
            return;
        }
        handler(response.has_pong() ? boost::system::error_code{}
                                    : make_error_code(transport_errc::malformed_response));
    });
}

} // namespace spora
