#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace spora {
namespace hex {

// --- Hex encoding for IDs, digests and nonces ---
std::string encode(const std::uint8_t* data, std::size_t len);
std::string encode(const std::string& s);
std::string encode(const std::vector<std::uint8_t>& bytes);

template <std::size_t N>
std::string encode(const std::array<std::uint8_t, N>& bytes) {
    return encode(bytes.data(), N);
}

} // namespace hex
} // namespace spora
