#include "spora/log.hpp"
#include <atomic>
#include <iostream>
#include <stdexcept>

namespace spora {
namespace log {

namespace {
std::atomic<int> g_level{static_cast<int>(Level::info)};
}

void set_level(Level level) {
    g_level.store(static_cast<int>(level));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

Level parse_level(const std::string& name) {
    if (name == "debug") return Level::debug;
    if (name == "info") return Level::info;
    if (name == "warning" || name == "warn") return Level::warning;
    if (name == "error") return Level::error;
    if (name == "off") return Level::off;
    throw std::invalid_argument("Unknown log level: " + name);
}

Line::Line(Level level, const char* tag)
    : level_(level),
      enabled_(static_cast<int>(level) >= g_level.load() && level != Level::off)
{
    if (enabled_) {
        buffer_ << '[' << tag << "] ";
    }
}

Line::Line(Line&& other) noexcept
    : level_(other.level_),
      enabled_(other.enabled_),
      buffer_(std::move(other.buffer_))
{
    other.enabled_ = false;
}

Line::~Line() {
    if (!enabled_) {
        return;
    }
    if (level_ >= Level::warning) {
        std::cerr << buffer_.str() << std::endl;
    } else {
        std::cout << buffer_.str() << std::endl;
    }
}

} // namespace log
} // namespace spora
