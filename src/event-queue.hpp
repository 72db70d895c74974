#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace pdrop {
// ordered multi-producer queue, consumed by a single thread
template <class T>
class EventQueue {
  private:
    mutable std::mutex lock;
    std::deque<T>      queue;
    bool               drained = false;

  public:
    // called after every successful push, from the pushing thread
    std::function<void()> on_pushed = [] {};

    auto push(T event) -> bool {
        {
            auto guard = std::lock_guard(lock);
            if(drained) {
                return false;
            }
            queue.emplace_back(std::move(event));
        }
        on_pushed();
        return true;
    }

    auto pop() -> std::optional<T> {
        auto guard = std::lock_guard(lock);
        if(queue.empty()) {
            return std::nullopt;
        }
        auto event = std::move(queue.front());
        queue.pop_front();
        return event;
    }

    // discards pending events and rejects further pushes
    auto drain() -> bool {
        auto guard = std::lock_guard(lock);
        if(std::exchange(drained, true)) {
            return false;
        }
        queue.clear();
        return true;
    }

    auto is_drained() const -> bool {
        auto guard = std::lock_guard(lock);
        return drained;
    }

    auto size() const -> size_t {
        auto guard = std::lock_guard(lock);
        return queue.size();
    }
};
} // namespace pdrop
