// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Executor.hpp>

#include <cstddef>
#include <memory>

namespace scribe
{

/// @brief Fixed-size pool of worker threads draining a shared FIFO queue.
///
/// A pool with a single worker behaves as a serial queue.
class ThreadPool final: public Executor
{
  public:
    /// @brief Starts @p workerCount threads (at least one).
    explicit ThreadPool(std::size_t workerCount = 1);

    /// @brief Stops accepting work, lets running tasks finish and joins all workers.
    ///
    /// Tasks still queued at this point are discarded.
    ~ThreadPool() override;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void post(Task task) override;

    /// @brief Returns the number of worker threads.
    [[nodiscard]] auto size() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace scribe
