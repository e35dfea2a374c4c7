#pragma once

#include "framing.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <memory>
#include <vector>

namespace spora {

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

class StorageNodeServer; // Forward declaration

// One accepted TLS connection on a storage node. Reads a request frame,
// writes the response frame, repeats until the peer hangs up.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, StorageNodeServer& server);

    void start();
    void stop();

private:
    void do_handshake();
    void do_read_header();
    void do_read_body(std::uint32_t length);
    void do_write(const wire::MessageWrapper& msg);

    ssl::stream<tcp::socket> socket_;
    framing::Header header_{};
    std::vector<std::uint8_t> body_;
    StorageNodeServer& server_;
    bool stopped_ = false;
};

} // namespace spora
