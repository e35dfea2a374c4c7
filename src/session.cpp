#include "session.hpp"
#include "node.hpp"
#include "spora/log.hpp"

namespace spora {

Session::Session(tcp::socket socket, StorageNodeServer& server)
    : socket_(std::move(socket), server.ssl_context()),
      server_(server) {}

void Session::start() {
    do_handshake();
}

void Session::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    // Gracefully shut down the TLS connection, then close the socket.
    if (socket_.lowest_layer().is_open()) {
        socket_.async_shutdown([self = shared_from_this()](const boost::system::error_code&) {
            boost::system::error_code ignored;
            self->socket_.lowest_layer().close(ignored);
        });
    }

    server_.remove_session(shared_from_this());
}

void Session::do_handshake() {
    auto self(shared_from_this());
    socket_.async_handshake(ssl::stream_base::server,
        [this, self](const boost::system::error_code& ec) {
            if (ec) {
                log::warn("Session") << "TLS handshake failed: " << ec.message();
                stop();
                return;
            }
            do_read_header();
        });
}

void Session::do_read_header() {
    auto self(shared_from_this());
    boost::asio::async_read(socket_, boost::asio::buffer(header_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                if (ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
                    log::warn("Session") << "Read error: " << ec.message();
                }
                stop();
                return;
            }
            const std::uint32_t length = framing::read_length(header_);
            if (length > server_.max_frame_bytes()) {
                log::warn("Session") << "Frame of " << length << " bytes exceeds limit, closing";
                stop();
                return;
            }
            do_read_body(length);
        });
}

void Session::do_read_body(std::uint32_t length) {
    auto self(shared_from_this());
    body_.resize(length);
    boost::asio::async_read(socket_, boost::asio::buffer(body_),
        [this, self](boost::system::error_code ec, std::size_t length) {
            if (ec) {
                log::warn("Session") << "Read error: " << ec.message();
                stop();
                return;
            }
            wire::MessageWrapper request;
            if (!framing::parse(body_.data(), length, request)) {
                log::warn("Session") << "Failed to parse message";
                stop();
                return;
            }
            do_write(server_.handle(request));
        });
}

void Session::do_write(const wire::MessageWrapper& msg) {
    auto self(shared_from_this());
    std::shared_ptr<std::string> frame;
    try {
        frame = framing::encode(msg);
    } catch (const std::exception& e) {
        log::error("Session") << "Could not encode response: " << e.what();
        stop();
        return;
    }

    boost::asio::async_write(socket_, boost::asio::buffer(*frame),
        [this, self, frame](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                log::warn("Session") << "Write error: " << ec.message();
                stop();
                return;
            }
            do_read_header();
        });
}

} // namespace spora
