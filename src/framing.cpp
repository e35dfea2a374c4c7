#include "framing.hpp"
#include "spora/errors.hpp"
#include <limits>

namespace spora {
namespace framing {

std::shared_ptr<std::string> encode(const wire::MessageWrapper& message) {
    std::string payload;
    if (!message.SerializeToString(&payload)) {
        throw Error("Failed to serialize message");
    }
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw InvalidInputError("Message too large to frame");
    }

    const auto len = static_cast<std::uint32_t>(payload.size());
    auto frame = std::make_shared<std::string>();
    frame->reserve(kHeaderSize + payload.size());
    frame->push_back(static_cast<char>((len >> 24) & 0xff));
    frame->push_back(static_cast<char>((len >> 16) & 0xff));
    frame->push_back(static_cast<char>((len >> 8) & 0xff));
    frame->push_back(static_cast<char>(len & 0xff));
    frame->append(payload);
    return frame;
}

std::uint32_t read_length(const Header& header) {
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8) |
           static_cast<std::uint32_t>(header[3]);
}

bool parse(const std::uint8_t* data, std::size_t len, wire::MessageWrapper& out) {
    if (len > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    return out.ParseFromArray(data, static_cast<int>(len));
}

} // namespace framing
} // namespace spora
