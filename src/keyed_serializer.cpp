#include "keyed_serializer.hpp"
#include <memory>

namespace spora {

void KeyedSerializer::dispatch(const std::string& key, Task task) {
    auto it = queues_.find(key);
    if (it != queues_.end()) {
        it->second.push_back(std::move(task));
        return;
    }
    queues_.emplace(key, std::deque<Task>{});
    run(key, std::move(task));
}

void KeyedSerializer::run(const std::string& key, Task task) {
    auto released = std::make_shared<bool>(false);
    task([this, key, released]() {
        if (*released) {
            return;
        }
        *released = true;
        release(key);
    });
}

void KeyedSerializer::release(const std::string& key) {
    auto it = queues_.find(key);
    if (it == queues_.end()) {
        return;
    }
    if (it->second.empty()) {
        queues_.erase(it);
        return;
    }
    Task next = std::move(it->second.front());
    it->second.pop_front();
    run(key, std::move(next));
}

bool KeyedSerializer::busy(const std::string& key) const {
    return queues_.count(key) > 0;
}

std::size_t KeyedSerializer::pending(const std::string& key) const {
    auto it = queues_.find(key);
    return it == queues_.end() ? 0 : it->second.size();
}

} // namespace spora
