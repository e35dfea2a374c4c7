#pragma once

#include "chunk_store.hpp"
#include "session.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>

namespace spora {

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// TLS server context from PEM files. Throws boost::system::system_error.
ssl::context make_server_context(const std::string& certificate_file, const std::string& private_key_file);
// Same, from PEM text held in memory.
ssl::context make_server_context_pem(const std::string& certificate_pem, const std::string& private_key_pem);

// Public-key fingerprint of the certificate loaded into a context.
std::string certificate_fingerprint(ssl::context& context);

// The storage-provider side: accepts TLS sessions and answers challenge,
// store, fetch, delete and ping requests from its ChunkStore.
class StorageNodeServer {
public:
    StorageNodeServer(boost::asio::io_context& io_context,
                      ssl::context& ssl_context,
                      ChunkStore& store,
                      std::string node_id,
                      std::size_t max_frame_bytes);

    // Port 0 picks an ephemeral port; see local_port().
    void listen(std::uint16_t port, const std::string& host = "0.0.0.0");
    void stop();

    std::uint16_t local_port() const;

    // Builds the response for one request frame.
    wire::MessageWrapper handle(const wire::MessageWrapper& request);

    // --- Getters ---
    const std::string& node_id() const { return node_id_; }
    ChunkStore& store() { return store_; }
    ssl::context& ssl_context() { return ssl_context_; }
    std::size_t max_frame_bytes() const { return max_frame_bytes_; }
    std::size_t session_count() const { return sessions_.size(); }

private:
    void do_accept();
    void remove_session(std::shared_ptr<Session> session);

    boost::asio::io_context& io_context_;
    ssl::context& ssl_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    ChunkStore& store_;
    std::string node_id_;
    std::size_t max_frame_bytes_;

    std::unordered_set<std::shared_ptr<Session>> sessions_;

    friend class Session; // Give Session access to remove_session
};

} // namespace spora
