// SPDX-License-Identifier: Apache-2.0
#include "ThreadPool.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace scribe
{

struct ThreadPool::Impl
{
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<Task> queue;
    std::vector<std::jthread> workers;

    void run(const std::stop_token& stopToken)
    {
        while (true)
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !queue.empty(); });

                if (stopToken.stop_requested())
                    return;

                task = std::move(queue.front());
                queue.pop_front();
            }

            task();
        }
    }
};

ThreadPool::ThreadPool(std::size_t workerCount): _impl(std::make_unique<Impl>())
{
    workerCount = std::max<std::size_t>(workerCount, 1);
    _impl->workers.reserve(workerCount);
    for (auto i = std::size_t { 0 }; i < workerCount; ++i)
        _impl->workers.emplace_back([this](const std::stop_token& token) { _impl->run(token); });

    log::debug("Thread pool started with {} worker(s)", workerCount);
}

ThreadPool::~ThreadPool()
{
    for (auto& worker: _impl->workers)
        worker.request_stop();

    // Joining here keeps _impl alive until every worker has left run().
    _impl->workers.clear();
}

void ThreadPool::post(Task task)
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->queue.push_back(std::move(task));
    }
    _impl->cv.notify_one();
}

auto ThreadPool::size() const -> std::size_t
{
    return _impl->workers.size();
}

} // namespace scribe
