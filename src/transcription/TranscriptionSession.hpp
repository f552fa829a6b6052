// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Executor.hpp>
#include <engine/InferenceEngine.hpp>
#include <engine/RunConfiguration.hpp>
#include <transcription/Segment.hpp>
#include <transcription/TranscriptionDelegate.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace scribe
{

/// @brief Execution state of a TranscriptionSession.
enum class SessionState : std::uint8_t
{
    Idle,
    Running,
};

/// @brief Receives the terminal result of a transcription run.
using CompletionHandler = std::function<void(Result<std::vector<Segment>> result)>;

/// @brief Drives transcription runs on one engine context.
///
/// At most one run is in flight per session. The engine call executes on the
/// worker executor; progress, segment and completion events are delivered on the
/// delivery executor in the order the engine produced them.
///
/// Both executors must outlive the session. Destroying a session while a run is
/// in flight blocks until the engine call has returned; the session should be
/// destroyed on the delivery executor's thread or after delivery has ceased.
class TranscriptionSession
{
  public:
    /// @brief Takes ownership of @p engine.
    /// @param engine The engine context this session drives.
    /// @param config Initial run configuration.
    /// @param worker Executor on which the blocking engine call runs.
    /// @param delivery Executor on which delegate events and completion handlers run.
    TranscriptionSession(std::unique_ptr<InferenceEngine> engine,
                         RunConfiguration config,
                         Executor& worker,
                         Executor& delivery);
    ~TranscriptionSession();

    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    /// @brief Sets the (non-owning) delegate. Pass nullptr to stop receiving events.
    void setDelegate(TranscriptionDelegate* delegate);

    [[nodiscard]] auto delegate() const -> TranscriptionDelegate*;

    /// @brief Returns a copy of the current run configuration.
    [[nodiscard]] auto configuration() const -> RunConfiguration;

    /// @brief Replaces the run configuration.
    /// @return InstanceBusy while a run is in progress.
    [[nodiscard]] auto setConfiguration(RunConfiguration config) -> VoidResult;

    /// @brief Starts a transcription run and returns immediately.
    ///
    /// Precondition failures (InstanceBusy, then InvalidFrames) are reported by
    /// invoking @p onComplete synchronously on the calling thread. Otherwise
    /// @p onComplete is invoked exactly once on the delivery executor.
    /// @param frames Mono float32 samples at the engine's sample rate.
    /// @param onComplete Receives the full segment list or an error.
    void transcribe(std::vector<float> frames, CompletionHandler onComplete);

    /// @brief Future-returning form of transcribe().
    ///
    /// Abandoning the future does not cancel the run. Do not block on the future
    /// from the delivery executor's thread.
    [[nodiscard]] auto transcribe(std::vector<float> frames) -> std::future<Result<std::vector<Segment>>>;

    [[nodiscard]] auto state() const -> SessionState;

    /// @brief Returns true while a run is in progress.
    [[nodiscard]] auto inProgress() const -> bool;

    /// @brief Number of frames of the current run, or std::nullopt when idle.
    [[nodiscard]] auto expectedFrameCount() const -> std::optional<std::size_t>;

  private:
    struct Impl;
    std::shared_ptr<Impl> _impl;
};

} // namespace scribe
