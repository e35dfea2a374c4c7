#pragma once

#include "types.hpp"
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <string>

namespace spora {

// How the core reaches storage providers. Handlers are never invoked inline
// and run at most once. Errors use transport_errc.
//
// A silent node may never answer a challenge; callers bound challenges with
// their own timer. Every other request completes.
class Transport {
public:
    using ChallengeHandler = std::function<void(boost::system::error_code, Digest)>;
    using CompletionHandler = std::function<void(boost::system::error_code)>;
    using FetchHandler = std::function<void(boost::system::error_code, Bytes)>;

    virtual ~Transport() = default;

    virtual void send_challenge(const StorageNode& node, const std::string& chunk_id,
                                const Bytes& nonce, ChallengeHandler handler) = 0;
    virtual void store_chunk(const StorageNode& node, const std::string& chunk_id,
                             std::shared_ptr<const Bytes> blob, CompletionHandler handler) = 0;
    virtual void fetch_chunk(const StorageNode& node, const std::string& chunk_id,
                             FetchHandler handler) = 0;
    virtual void delete_chunk(const StorageNode& node, const std::string& chunk_id,
                              CompletionHandler handler) = 0;
    virtual void ping(const StorageNode& node, CompletionHandler handler) = 0;
};

} // namespace spora
