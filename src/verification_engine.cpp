#include "verification_engine.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include <boost/asio/post.hpp>

namespace spora {

const char* to_string(ProofStatus status) {
    switch (status) {
        case ProofStatus::pending: return "pending";
        case ProofStatus::complete: return "complete";
        case ProofStatus::failed: return "failed";
    }
    return "unknown";
}

struct VerificationEngine::Attempt {
    Attempt(boost::asio::io_context& io_context, Request req)
        : request(std::move(req)), timer(io_context) {}

    Request request;
    std::shared_ptr<StorageProof> proof;
    Digest expected{};
    boost::asio::steady_timer timer;
    bool settled = false;
};

VerificationEngine::VerificationEngine(boost::asio::io_context& io_context,
                                       const Config& config,
                                       ReplicaLedger& ledger,
                                       NodeRegistry& registry,
                                       const ChunkStore& reference,
                                       Transport& transport,
                                       EventChannel& events)
    : io_context_(io_context),
      config_(config),
      ledger_(ledger),
      registry_(registry),
      reference_(reference),
      transport_(transport),
      events_(events),
      cycle_timer_(io_context) {}

void VerificationEngine::verify(const std::string& chunk_id, const std::string& node_id, VerifyHandler handler) {
    queue_.push_back(Request{chunk_id, node_id, std::move(handler)});
    pump();
}

void VerificationEngine::pump() {
    while (in_flight_ < config_.max_concurrent_verifications && !queue_.empty()) {
        Request request = std::move(queue_.front());
        queue_.pop_front();
        begin(std::move(request));
    }
}

void VerificationEngine::begin(Request request) {
    auto blob = reference_.get(request.chunk_id);
    if (!blob) {
        log::warn("Verify") << "No reference copy of " << request.chunk_id << ", skipping " << request.node_id;
        if (request.handler) {
            boost::asio::post(io_context_, [handler = std::move(request.handler)]() { handler(false); });
        }
        return;
    }

    ++in_flight_;
    PairState& pair = pairs_[{request.chunk_id, request.node_id}];
    pair.in_progress = true;

    auto attempt = std::make_shared<Attempt>(io_context_, std::move(request));
    attempt->proof = std::make_shared<StorageProof>();
    attempt->proof->chunk_id = attempt->request.chunk_id;
    attempt->proof->node_id = attempt->request.node_id;
    attempt->proof->nonce = crypto::random_bytes(crypto::kNonceSize);
    attempt->proof->issued_at = registry_.now();
    attempt->expected = crypto::proof_digest(*blob, attempt->proof->nonce);

    pair.history.push_back(attempt->proof);
    while (pair.history.size() > config_.proof_history_limit && pair.history.size() > 1) {
        pair.history.pop_front();
    }

    auto node = registry_.get(attempt->request.node_id);
    if (!node) {
        boost::asio::post(io_context_, [this, attempt]() {
            settle(attempt, ProofStatus::failed, std::nullopt, make_error_code(transport_errc::unreachable));
        });
        return;
    }

    attempt->timer.expires_after(config_.challenge_timeout);
    attempt->timer.async_wait([this, attempt](const boost::system::error_code& ec) {
        if (ec || attempt->settled) {
            return;
        }
        log::warn("Verify") << "Challenge for " << attempt->request.chunk_id << " on "
                            << attempt->request.node_id << " timed out";
        settle(attempt, ProofStatus::failed, std::nullopt, make_error_code(transport_errc::timed_out));
    });

    transport_.send_challenge(*node, attempt->request.chunk_id, attempt->proof->nonce,
        [this, attempt](boost::system::error_code ec, Digest digest) {
            if (attempt->settled) {
                log::debug("Verify") << "Discarding late proof from " << attempt->request.node_id;
                return;
            }
            if (ec) {
                settle(attempt, ProofStatus::failed, std::nullopt, ec);
                return;
            }
            settle(attempt, ProofStatus::complete, digest, {});
        });
}

void VerificationEngine::settle(const std::shared_ptr<Attempt>& attempt, ProofStatus status,
                                std::optional<Digest> digest, boost::system::error_code ec) {
    attempt->settled = true;
    attempt->timer.cancel();

    const std::string& chunk_id = attempt->request.chunk_id;
    const std::string& node_id = attempt->request.node_id;
    StorageProof& proof = *attempt->proof;

    bool valid = false;
    if (status == ProofStatus::complete && digest) {
        proof.answered_at = registry_.now();
        proof.response_digest = digest;
        valid = crypto::digest_equal(*digest, attempt->expected);
    }
    proof.status = valid ? ProofStatus::complete : ProofStatus::failed;
    proof.error = ec;

    PairState& pair = pairs_[{chunk_id, node_id}];
    pair.in_progress = false;

    if (valid) {
        pair.consecutive_failures = 0;
        registry_.record_success(node_id);
        last_verified_[chunk_id] = registry_.now();
        log::debug("Verify") << node_id << " proved " << chunk_id;
    } else {
        ++pair.consecutive_failures;
        registry_.record_failure(node_id);
        log::warn("Verify") << node_id << " failed proof for " << chunk_id << " ("
                            << (ec ? ec.message() : std::string("digest mismatch")) << "), "
                            << pair.consecutive_failures << " in a row";
        if (pair.consecutive_failures >= config_.suspect_threshold) {
            events_.push(NodeSuspect{node_id, chunk_id, pair.consecutive_failures});
            pair.consecutive_failures = 0;
        }
    }

    --in_flight_;
    if (attempt->request.handler) {
        attempt->request.handler(valid);
    }
    pump();
}

std::size_t VerificationEngine::run_cycle() {
    const TimePoint now = registry_.now();
    std::size_t issued = 0;

    for (const auto& chunk_id : ledger_.chunks()) {
        for (const auto& node_id : ledger_.current_replicas(chunk_id)) {
            auto it = pairs_.find({chunk_id, node_id});
            if (it != pairs_.end()) {
                const PairState& pair = it->second;
                if (pair.in_progress) continue;
                if (!pair.history.empty() && now - pair.history.back()->issued_at < config_.challenge_interval) continue;
            }
            verify(chunk_id, node_id);
            ++issued;
        }
    }
    log::info("Verify") << "Cycle issued " << issued << " challenge(s)";
    return issued;
}

void VerificationEngine::start() {
    if (running_) {
        return;
    }
    running_ = true;
    schedule_cycle();
}

void VerificationEngine::stop() {
    running_ = false;
    cycle_timer_.cancel();
}

void VerificationEngine::schedule_cycle() {
    cycle_timer_.expires_after(config_.challenge_interval);
    cycle_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        run_cycle();
        schedule_cycle();
    });
}

std::vector<StorageProof> VerificationEngine::history(const std::string& chunk_id, const std::string& node_id) const {
    std::vector<StorageProof> result;
    auto it = pairs_.find({chunk_id, node_id});
    if (it == pairs_.end()) {
        return result;
    }
    for (const auto& proof : it->second.history) {
        result.push_back(*proof);
    }
    return result;
}

unsigned VerificationEngine::consecutive_failures(const std::string& chunk_id, const std::string& node_id) const {
    auto it = pairs_.find({chunk_id, node_id});
    return it == pairs_.end() ? 0 : it->second.consecutive_failures;
}

std::optional<ProofStatus> VerificationEngine::last_status(const std::string& chunk_id, const std::string& node_id) const {
    auto it = pairs_.find({chunk_id, node_id});
    if (it == pairs_.end() || it->second.history.empty()) {
        return std::nullopt;
    }
    return it->second.history.back()->status;
}

std::optional<TimePoint> VerificationEngine::last_verified(const std::string& chunk_id) const {
    auto it = last_verified_.find(chunk_id);
    if (it == last_verified_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void VerificationEngine::forget(const std::string& chunk_id) {
    for (auto it = pairs_.begin(); it != pairs_.end();) {
        if (it->first.first == chunk_id && !it->second.in_progress) {
            it = pairs_.erase(it);
        } else {
            ++it;
        }
    }
    last_verified_.erase(chunk_id);
}

} // namespace spora
