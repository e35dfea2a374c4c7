#pragma once

#include <deque>
#include <functional>
#include <string>
#include <unordered_map>

namespace spora {

// Runs tasks one at a time per key, in submission order. A task holds the key
// until it calls the release function it was given (exactly once; extra calls
// are ignored). Tasks for different keys interleave freely.
class KeyedSerializer {
public:
    using Release = std::function<void()>;
    using Task = std::function<void(Release)>;

    // Runs the task immediately when the key is idle, otherwise queues it.
    void dispatch(const std::string& key, Task task);

    bool busy(const std::string& key) const;
    std::size_t pending(const std::string& key) const;

private:
    void run(const std::string& key, Task task);
    void release(const std::string& key);

    // key -> tasks waiting behind the running one
    std::unordered_map<std::string, std::deque<Task>> queues_;
};

} // namespace spora
