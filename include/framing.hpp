#pragma once

#include "spora.pb.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace spora {
namespace framing {

// Frame: 4-byte big-endian payload length, then a serialized MessageWrapper.
constexpr std::size_t kHeaderSize = 4;

using Header = std::array<std::uint8_t, kHeaderSize>;

// Shared so the buffer outlives an async_write.
std::shared_ptr<std::string> encode(const wire::MessageWrapper& message);

std::uint32_t read_length(const Header& header);

bool parse(const std::uint8_t* data, std::size_t len, wire::MessageWrapper& out);

} // namespace framing
} // namespace spora
