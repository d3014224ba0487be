#include <deplink/realtime/polling_scheduler.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace deplink::realtime {

void PollingHandle::cancel() {
    if (!state_)
        return;
    state_->cancelled.store(true, std::memory_order_release);

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->timer && state_->executorAlive) {
        auto state = state_;
        boost::asio::post(state_->timer->get_executor(), [state]() {
            std::lock_guard<std::mutex> inner(state->mutex);
            if (state->timer)
                state->timer->cancel();
        });
    }
}

bool PollingHandle::active() const {
    return state_ && !state_->cancelled.load(std::memory_order_acquire) &&
           !state_->finished.load(std::memory_order_acquire);
}

PollingScheduler::PollingScheduler() {
    work_.emplace(io_.get_executor());
}

PollingScheduler::~PollingScheduler() {
    stop();
}

void PollingScheduler::ensureThread() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        return;
    if (io_.stopped()) {
        io_.restart();
        work_.emplace(io_.get_executor());
    }
    thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& e) {
            spdlog::error("[PollingScheduler] io_context terminated: {}", e.what());
        }
    });
}

PollingHandle PollingScheduler::schedule(std::chrono::milliseconds interval, Task task) {
    auto state = std::make_shared<PollingHandle::State>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(state);
    }
    ensureThread();

    boost::asio::co_spawn(
        io_,
        [state, interval, task = std::move(task)]() -> boost::asio::awaitable<void> {
            auto executor = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(executor);
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->timer = &timer;
            }

            while (!state->cancelled.load(std::memory_order_acquire)) {
                timer.expires_after(interval);
                try {
                    co_await timer.async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted)
                        break;
                    spdlog::warn("[PollingScheduler] timer failed: {}", e.what());
                    break;
                }
                if (state->cancelled.load(std::memory_order_acquire))
                    break;
                try {
                    task();
                } catch (const std::exception& e) {
                    spdlog::warn("[PollingScheduler] task threw: {}", e.what());
                }
            }

            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->timer = nullptr;
            }
            state->finished.store(true, std::memory_order_release);
            spdlog::debug("[PollingScheduler] polling loop stopped");
            co_return;
        },
        boost::asio::detached);

    return PollingHandle(state);
}

void PollingScheduler::stop() {
    std::vector<std::shared_ptr<PollingHandle::State>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& weak : tasks_) {
            if (auto state = weak.lock())
                live.push_back(std::move(state));
        }
        tasks_.clear();
    }
    for (auto& state : live) {
        PollingHandle(state).cancel();
    }

    work_.reset();
    io_.stop();
    if (thread_.joinable())
        thread_.join();
    running_.store(false, std::memory_order_release);

    // Handles may outlive the io_context; stop them from posting into it.
    for (auto& state : live) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->executorAlive = false;
    }
}

} // namespace deplink::realtime
