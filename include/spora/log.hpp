#pragma once

#include <sstream>
#include <string>

namespace spora {
namespace log {

enum class Level { debug = 0, info, warning, error, off };

void set_level(Level level);
Level level();

// Accepts "debug", "info", "warning", "error", "off". Throws std::invalid_argument otherwise.
Level parse_level(const std::string& name);

// One "[Tag] message" line. Buffered and written on destruction:
// debug/info go to std::cout, warning/error to std::cerr.
class Line {
public:
    Line(Level level, const char* tag);
    Line(Line&& other) noexcept;
    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;
    ~Line();

    template <typename T>
    Line& operator<<(const T& value) {
        if (enabled_) {
            buffer_ << value;
        }
        return *this;
    }

private:
    Level level_;
    bool enabled_;
    std::ostringstream buffer_;
};

inline Line debug(const char* tag) { return Line(Level::debug, tag); }
inline Line info(const char* tag) { return Line(Level::info, tag); }
inline Line warn(const char* tag) { return Line(Level::warning, tag); }
inline Line error(const char* tag) { return Line(Level::error, tag); }

} // namespace log
} // namespace spora
