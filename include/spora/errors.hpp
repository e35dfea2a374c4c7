#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace spora {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed chunk or file input. Never retried.
class InvalidInputError : public Error {
public:
    using Error::Error;
};

// Missing index, hash mismatch or failed authentication during reassembly.
class AssemblyError : public Error {
public:
    using Error::Error;
};

// Policy violations, surfaced to the caller and never retried.
class InvalidRedundancyError : public Error {
public:
    using Error::Error;
};

class InsufficientCapacityError : public Error {
public:
    using Error::Error;
};

// Supply shortfall. The caller may retry once more nodes join.
class InsufficientNodesError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public Error {
public:
    using Error::Error;
};

class TransportError : public Error {
public:
    TransportError(const std::string& what, boost::system::error_code ec)
        : Error(what + ": " + ec.message()), code_(ec) {}

    const boost::system::error_code& code() const { return code_; }

private:
    boost::system::error_code code_;
};

// True for errors that are caller configuration mistakes rather than transient faults.
bool is_policy_error(const std::exception& e);

// --- Transport error category ---
enum class transport_errc {
    unreachable = 1,
    timed_out,
    chunk_not_found,
    rejected,
    malformed_response,
    identity_mismatch,
};

const boost::system::error_category& transport_category();
boost::system::error_code make_error_code(transport_errc e);

} // namespace spora

namespace boost {
namespace system {
template <>
struct is_error_code_enum<spora::transport_errc> : std::true_type {};
} // namespace system
} // namespace boost
