#include "spora/errors.hpp"

namespace spora {

bool is_policy_error(const std::exception& e) {
    return dynamic_cast<const InvalidRedundancyError*>(&e) != nullptr ||
           dynamic_cast<const InsufficientCapacityError*>(&e) != nullptr ||
           dynamic_cast<const InvalidInputError*>(&e) != nullptr;
}

namespace {

class TransportCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "spora.transport"; }

    std::string message(int ev) const override {
        switch (static_cast<transport_errc>(ev)) {
            case transport_errc::unreachable: return "node unreachable";
            case transport_errc::timed_out: return "request timed out";
            case transport_errc::chunk_not_found: return "chunk not found on node";
            case transport_errc::rejected: return "request rejected by node";
            case transport_errc::malformed_response: return "malformed response";
            case transport_errc::identity_mismatch: return "node identity does not match registered key";
        }
        return "unknown transport error";
    }
};

} // namespace

const boost::system::error_category& transport_category() {
    static const TransportCategory category;
    return category;
}

boost::system::error_code make_error_code(transport_errc e) {
    return boost::system::error_code(static_cast<int>(e), transport_category());
}

} // namespace spora
