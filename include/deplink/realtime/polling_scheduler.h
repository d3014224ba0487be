#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace deplink::realtime {

/**
 * Cancellable handle for one recurring task. Default-constructed handles are
 * inert; cancel() is idempotent and safe after the scheduler has stopped.
 */
class PollingHandle {
public:
    PollingHandle() = default;

    void cancel();
    bool active() const;

private:
    friend class PollingScheduler;

    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> finished{false};
        std::mutex mutex;
        boost::asio::steady_timer* timer = nullptr; // set while the loop is waiting
        bool executorAlive = true;
    };

    explicit PollingHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/**
 * Runs recurring tasks on a private io_context thread. Each task is a
 * coroutine looping on a steady_timer; a throwing task is logged and the
 * loop continues.
 */
class PollingScheduler {
public:
    using Task = std::function<void()>;

    PollingScheduler();
    ~PollingScheduler();

    PollingScheduler(const PollingScheduler&) = delete;
    PollingScheduler& operator=(const PollingScheduler&) = delete;

    PollingHandle schedule(std::chrono::milliseconds interval, Task task);

    /// Cancels every task and joins the worker thread. A later schedule()
    /// restarts the scheduler.
    void stop();

    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

private:
    void ensureThread();

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::mutex mutex_;
    std::vector<std::weak_ptr<PollingHandle::State>> tasks_;
};

} // namespace deplink::realtime
