#pragma once

#include "config.hpp"
#include "framing.hpp"
#include "transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl.hpp>
#include <functional>

namespace spora {

namespace ssl = boost::asio::ssl;

ssl::context make_client_context();

// Client side of the node wire protocol. Each request opens its own TLS
// connection and is bounded by transport_timeout. When a node has a pubkey on
// record, the server certificate's key fingerprint must match it.
class TlsTransport : public Transport {
public:
    using ResponseHandler = std::function<void(boost::system::error_code, wire::MessageWrapper)>;

    TlsTransport(boost::asio::io_context& io_context, ssl::context& ssl_context, const Config& config);

    void send_challenge(const StorageNode& node, const std::string& chunk_id,
                        const Bytes& nonce, ChallengeHandler handler) override;
    void store_chunk(const StorageNode& node, const std::string& chunk_id,
                     std::shared_ptr<const Bytes> blob, CompletionHandler handler) override;
    void fetch_chunk(const StorageNode& node, const std::string& chunk_id,
                     FetchHandler handler) override;
    void delete_chunk(const StorageNode& node, const std::string& chunk_id,
                      CompletionHandler handler) override;
    void ping(const StorageNode& node, CompletionHandler handler) override;

    // One request/response round trip.
    void request(const StorageNode& node, const wire::MessageWrapper& message, ResponseHandler handler);

private:
    boost::asio::io_context& io_context_;
    ssl::context& ssl_context_;
    const Config& config_;
};

} // namespace spora
