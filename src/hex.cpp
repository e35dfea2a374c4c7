#include "spora/hex.hpp"
#include <iomanip>
#include <sstream>

namespace spora {
namespace hex {

std::string encode(const std::uint8_t* data, std::size_t len) {
    std::stringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

std::string encode(const std::string& s) {
    return encode(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

std::string encode(const std::vector<std::uint8_t>& bytes) {
    return encode(bytes.data(), bytes.size());
}

} // namespace hex
} // namespace spora
