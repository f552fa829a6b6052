// SPDX-License-Identifier: Apache-2.0
#include "EventLoop.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace scribe
{

struct EventLoop::Impl
{
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Task> queue;
    bool stopRequested = false;

    /// @brief Pops the next task, or returns std::nullopt if the queue is empty.
    auto tryPop() -> std::optional<Task>
    {
        auto lock = std::lock_guard(mutex);
        if (queue.empty())
            return std::nullopt;
        auto task = std::move(queue.front());
        queue.pop_front();
        return task;
    }
};

EventLoop::EventLoop(): _impl(std::make_unique<Impl>())
{
}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->queue.push_back(std::move(task));
    }
    _impl->cv.notify_all();
}

void EventLoop::run()
{
    while (true)
    {
        auto task = Task {};
        {
            auto lock = std::unique_lock(_impl->mutex);
            _impl->cv.wait(lock, [this] { return _impl->stopRequested || !_impl->queue.empty(); });

            if (_impl->stopRequested)
            {
                _impl->stopRequested = false;
                return;
            }

            task = std::move(_impl->queue.front());
            _impl->queue.pop_front();
        }

        task();
    }
}

auto EventLoop::runOne(std::chrono::milliseconds timeout) -> bool
{
    auto task = Task {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        if (!_impl->cv.wait_for(lock, timeout, [this] { return !_impl->queue.empty(); }))
            return false;

        task = std::move(_impl->queue.front());
        _impl->queue.pop_front();
    }

    task();
    return true;
}

auto EventLoop::poll() -> std::size_t
{
    auto count = std::size_t { 0 };
    while (auto task = _impl->tryPop())
    {
        (*task)();
        ++count;
    }
    return count;
}

void EventLoop::stop()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->stopRequested = true;
    }
    _impl->cv.notify_all();
}

} // namespace scribe
