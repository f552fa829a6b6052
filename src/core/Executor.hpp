// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>

namespace scribe
{

/// @brief A unit of work posted to an Executor.
using Task = std::function<void()>;

/// @brief An execution context that runs posted tasks.
///
/// Implementations decide on which thread the tasks run. Tasks posted from a
/// single thread are started in the order they were posted when the executor
/// is serial (one worker or one draining thread).
class Executor
{
  public:
    virtual ~Executor() = default;

    /// @brief Schedules @p task for execution and returns immediately.
    virtual void post(Task task) = 0;
};

} // namespace scribe
