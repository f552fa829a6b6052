// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Executor.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

namespace scribe
{

/// @brief Serial task queue drained by whichever thread calls run(), runOne() or poll().
///
/// This is the "main queue" of an application: background work posts results
/// here, and the owning thread observes them in posting order.
class EventLoop final: public Executor
{
  public:
    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// @brief Enqueues @p task and wakes a thread blocked in run() or runOne().
    void post(Task task) override;

    /// @brief Runs tasks until stop() is called.
    ///
    /// A pending stop request is consumed on return, so the loop can be run again.
    void run();

    /// @brief Waits up to @p timeout for a task and runs it.
    /// @return True if a task was run.
    auto runOne(std::chrono::milliseconds timeout) -> bool;

    /// @brief Runs all tasks that are ready without blocking.
    /// @return The number of tasks run.
    auto poll() -> std::size_t;

    /// @brief Makes run() return after the task currently executing.
    void stop();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace scribe
