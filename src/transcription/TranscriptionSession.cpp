// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionSession.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <utility>

namespace scribe
{

struct TranscriptionSession::Impl: std::enable_shared_from_this<Impl>
{
    Impl(std::unique_ptr<InferenceEngine> engine, RunConfiguration config, Executor& worker, Executor& delivery):
        worker(worker), delivery(delivery), engine(std::move(engine)), config(std::move(config))
    {
    }

    Executor& worker;
    Executor& delivery;

    mutable std::mutex mutex;
    std::condition_variable engineIdle;

    // Guarded by mutex. The engine itself is only touched by the worker while
    // engineCallActive is set, and released by the owner once it is cleared.
    std::unique_ptr<InferenceEngine> engine;
    RunConfiguration config;
    TranscriptionDelegate* delegate = nullptr;
    TranscriptionSession* owner = nullptr;
    SessionState state = SessionState::Idle;
    std::optional<std::size_t> frameCount;
    int previousSegmentCount = 0;
    bool engineCallActive = false;

    /// @brief Engine-side entry point; @p userData is the Impl that started the run.
    ///
    /// The token is non-owning. It stays valid because the worker task that is
    /// blocked in runFull() holds a strong reference to the same Impl.
    static void onNewSegments(InferenceEngine& engine, int newSegmentCount, void* userData)
    {
        static_cast<Impl*>(userData)->handleNewSegments(engine, newSegmentCount);
    }

    void handleNewSegments(InferenceEngine& engine, int reportedCount)
    {
        auto const currentTotal = engine.segmentCount();
        auto startIndex = 0;
        auto frames = std::optional<std::size_t> {};
        {
            auto lock = std::lock_guard(mutex);
            startIndex = previousSegmentCount;
            if (currentTotal <= startIndex)
                return;
            previousSegmentCount = currentTotal;
            frames = frameCount;
        }

        if (reportedCount != currentTotal - startIndex)
            log::debug("Engine reported {} new segments, segment count grew by {}",
                       reportedCount,
                       currentTotal - startIndex);

        auto segments = segmentsFromEngine(engine, startIndex, currentTotal);
        if (segments.empty())
            return;

        log::trace("New segments [{}, {})", startIndex, currentTotal);

        auto const self = weak_from_this();

        if (frames)
        {
            auto const audioLengthMs =
                static_cast<double>(*frames * 1000) / static_cast<double>(engine.sampleRate());
            auto const progress = static_cast<double>(segments.back().endTimeMs) / audioLengthMs;

            delivery.post([self, progress] {
                notifyDelegate(self, [progress](TranscriptionDelegate& delegate, TranscriptionSession& session) {
                    delegate.onProgress(session, progress);
                });
            });
        }

        delivery.post([self, segments = std::move(segments), startIndex] {
            notifyDelegate(self, [&](TranscriptionDelegate& delegate, TranscriptionSession& session) {
                delegate.onNewSegments(session, segments, startIndex);
            });
        });
    }

    /// @brief Runs the blocking engine call. Executes on the worker executor.
    void runEngine(const std::vector<float>& frames, const RunConfiguration& runConfig, CompletionHandler onComplete)
    {
        auto outcome = Result<std::vector<Segment>> {};
        try
        {
            if (auto result = engine->runFull(runConfig, frames); result)
                outcome = segmentsFromEngine(*engine, 0, engine->segmentCount());
            else
                outcome = std::unexpected(std::move(result.error()));
        }
        catch (const std::exception& e)
        {
            // engineCallActive must still be cleared below, or the owner never gets to release the engine.
            outcome = makeError(ErrorCode::InferenceFailed, std::format("Engine call threw: {}", e.what()));
        }

        {
            auto lock = std::lock_guard(mutex);
            engineCallActive = false;
        }
        engineIdle.notify_all();

        delivery.post([self = weak_from_this(), outcome = std::move(outcome), onComplete = std::move(onComplete)]() mutable {
            if (auto impl = self.lock())
                impl->finishRun(outcome);
            onComplete(std::move(outcome));
        });
    }

    /// @brief Returns to Idle and notifies the delegate. Executes on the delivery executor.
    void finishRun(const Result<std::vector<Segment>>& outcome)
    {
        auto* currentDelegate = static_cast<TranscriptionDelegate*>(nullptr);
        auto* currentOwner = static_cast<TranscriptionSession*>(nullptr);
        {
            auto lock = std::lock_guard(mutex);
            state = SessionState::Idle;
            frameCount.reset();
            currentDelegate = delegate;
            currentOwner = owner;
        }

        if (!outcome)
        {
            log::error("Transcription failed: {}", outcome.error().message);
            return;
        }

        log::debug("Transcription finished with {} segment(s)", outcome->size());

        if (currentDelegate && currentOwner)
            currentDelegate->onCompletion(*currentOwner, *outcome);
    }

    /// @brief Invokes @p fn with the current delegate, if the session and its delegate still exist.
    template <typename Fn>
    static void notifyDelegate(const std::weak_ptr<Impl>& self, Fn&& fn)
    {
        auto impl = self.lock();
        if (!impl)
            return;

        auto* currentDelegate = static_cast<TranscriptionDelegate*>(nullptr);
        auto* currentOwner = static_cast<TranscriptionSession*>(nullptr);
        {
            auto lock = std::lock_guard(impl->mutex);
            currentDelegate = impl->delegate;
            currentOwner = impl->owner;
        }

        if (currentDelegate && currentOwner)
            std::forward<Fn>(fn)(*currentDelegate, *currentOwner);
    }
};

TranscriptionSession::TranscriptionSession(std::unique_ptr<InferenceEngine> engine,
                                           RunConfiguration config,
                                           Executor& worker,
                                           Executor& delivery):
    _impl(std::make_shared<Impl>(std::move(engine), std::move(config), worker, delivery))
{
    _impl->owner = this;
}

TranscriptionSession::~TranscriptionSession()
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->owner = nullptr;
    _impl->delegate = nullptr;

    if (_impl->engineCallActive)
        log::debug("Waiting for the running engine call before releasing the session");
    _impl->engineIdle.wait(lock, [this] { return !_impl->engineCallActive; });

    _impl->engine.reset();
}

void TranscriptionSession::setDelegate(TranscriptionDelegate* delegate)
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->delegate = delegate;
}

auto TranscriptionSession::delegate() const -> TranscriptionDelegate*
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->delegate;
}

auto TranscriptionSession::configuration() const -> RunConfiguration
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->config;
}

auto TranscriptionSession::setConfiguration(RunConfiguration config) -> VoidResult
{
    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->state == SessionState::Running)
        return makeError(ErrorCode::InstanceBusy, "Cannot change the configuration while a run is in progress");

    _impl->config = std::move(config);
    return {};
}

void TranscriptionSession::transcribe(std::vector<float> frames, CompletionHandler onComplete)
{
    auto runConfig = RunConfiguration {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        if (_impl->state == SessionState::Running)
        {
            lock.unlock();
            onComplete(makeError(ErrorCode::InstanceBusy, "A transcription is already in progress"));
            return;
        }

        if (frames.empty())
        {
            lock.unlock();
            onComplete(makeError(ErrorCode::InvalidFrames, "Cannot transcribe an empty sample buffer"));
            return;
        }

        _impl->state = SessionState::Running;
        _impl->frameCount = frames.size();
        _impl->previousSegmentCount = 0;
        _impl->engineCallActive = true;

        // The token only lives on the worker's snapshot; configuration() never hands it out.
        runConfig = _impl->config;
        runConfig.newSegmentCallback = &Impl::onNewSegments;
        runConfig.newSegmentCallbackUserData = _impl.get();
    }

    log::debug("Transcription started ({} frames)", frames.size());

    _impl->worker.post([self = _impl,
                        frames = std::move(frames),
                        runConfig = std::move(runConfig),
                        onComplete = std::move(onComplete)]() mutable {
        self->runEngine(frames, runConfig, std::move(onComplete));
    });
}

auto TranscriptionSession::transcribe(std::vector<float> frames) -> std::future<Result<std::vector<Segment>>>
{
    auto promise = std::make_shared<std::promise<Result<std::vector<Segment>>>>();
    auto future = promise->get_future();

    transcribe(std::move(frames),
               [promise](Result<std::vector<Segment>> result) { promise->set_value(std::move(result)); });

    return future;
}

auto TranscriptionSession::state() const -> SessionState
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->state;
}

auto TranscriptionSession::inProgress() const -> bool
{
    return state() == SessionState::Running;
}

auto TranscriptionSession::expectedFrameCount() const -> std::optional<std::size_t>
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->frameCount;
}

} // namespace scribe
