#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace deplink::core {

/**
 * Typed, synchronous callback registry for one event kind.
 *
 * emit() invokes listeners on the calling thread in subscription order. The
 * listener list is snapshotted first, so a listener may subscribe or
 * unsubscribe from inside its own callback. A throwing listener is logged and
 * does not prevent delivery to the others. close() drops every listener; later
 * emits are no-ops until a new listener subscribes.
 */
template <typename T> class EventChannel {
public:
    using Listener = std::function<void(const T&)>;
    using ListenerId = std::uint64_t;

    explicit EventChannel(std::string name = {}) : name_(std::move(name)) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    ListenerId subscribe(Listener listener) {
        std::lock_guard<std::mutex> lk(mu_);
        auto id = nextId_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    bool unsubscribe(ListenerId id) {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    std::size_t emit(const T& event) {
        std::vector<std::pair<ListenerId, Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lk(mu_);
            snapshot = listeners_;
        }
        std::size_t delivered = 0;
        for (auto& [id, listener] : snapshot) {
            try {
                listener(event);
                ++delivered;
            } catch (const std::exception& e) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                spdlog::warn("[EventChannel:{}] listener {} threw: {}", name_, id, e.what());
            }
        }
        return delivered;
    }

    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        listeners_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return listeners_.size();
    }

    std::uint64_t failures() const noexcept { return failures_.load(std::memory_order_relaxed); }

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    mutable std::mutex mu_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId nextId_ = 1;
    std::atomic<std::uint64_t> failures_{0};
};

} // namespace deplink::core
