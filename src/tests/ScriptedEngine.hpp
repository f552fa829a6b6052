// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/InferenceEngine.hpp>
#include <engine/RunConfiguration.hpp>

#include <atomic>
#include <cstdint>
#include <format>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace scribe::test
{

/// @brief A segment as the engine reports it (timestamps in 10 ms ticks).
struct NativeSegment
{
    std::int64_t t0 = 0;
    std::int64_t t1 = 0;
    std::optional<std::string> text;
};

/// @brief Observations shared between a ScriptedEngine and the test that created it.
struct EngineProbe
{
    std::atomic<int> runCount { 0 };
    std::atomic<int> finishedRuns { 0 };
    std::atomic<int> destroyed { 0 };
    std::atomic<std::size_t> lastSampleCount { 0 };
    std::thread::id runThread;
};

/// @brief InferenceEngine that replays fixed batches through the new-segment callback.
class ScriptedEngine final: public InferenceEngine
{
  public:
    explicit ScriptedEngine(std::vector<std::vector<NativeSegment>> batches,
                            std::shared_ptr<EngineProbe> probe = std::make_shared<EngineProbe>()):
        _batches(std::move(batches)), _probe(std::move(probe))
    {
    }

    ~ScriptedEngine() override { ++_probe->destroyed; }

    /// @brief Makes the next runFull() block until @p gate is ready.
    void holdUntil(std::shared_future<void> gate) { _gate = std::move(gate); }

    /// @brief Invokes the callback once more with no new segments after every batch.
    void emitEmptyCallbacks() { _emitEmptyCallbacks = true; }

    /// @brief Makes runFull() fail after replaying all batches.
    void failWithCode(int code) { _failureCode = code; }

    /// @brief Makes runFull() throw after replaying all batches.
    void throwOnRun(std::string message) { _throwMessage = std::move(message); }

    auto runFull(const RunConfiguration& config, std::span<const float> samples) -> VoidResult override
    {
        ++_probe->runCount;
        _probe->lastSampleCount = samples.size();
        _probe->runThread = std::this_thread::get_id();

        if (_gate.valid())
            _gate.wait();

        _segments.clear();
        for (auto const& batch: _batches)
        {
            _segments.insert(_segments.end(), batch.begin(), batch.end());
            if (config.newSegmentCallback)
            {
                config.newSegmentCallback(*this, static_cast<int>(batch.size()), config.newSegmentCallbackUserData);
                if (_emitEmptyCallbacks)
                    config.newSegmentCallback(*this, 0, config.newSegmentCallbackUserData);
            }
        }

        ++_probe->finishedRuns;

        if (_throwMessage)
            throw std::runtime_error(*_throwMessage);
        if (_failureCode != 0)
            return makeError(ErrorCode::InferenceFailed, std::format("scripted failure {}", _failureCode));
        return {};
    }

    auto segmentCount() const -> int override { return static_cast<int>(_segments.size()); }

    auto segmentText(int index) const -> std::optional<std::string> override
    {
        return _segments.at(static_cast<std::size_t>(index)).text;
    }

    auto segmentStart(int index) const -> std::int64_t override
    {
        return _segments.at(static_cast<std::size_t>(index)).t0;
    }

    auto segmentEnd(int index) const -> std::int64_t override
    {
        return _segments.at(static_cast<std::size_t>(index)).t1;
    }

    auto sampleRate() const -> int override { return 16000; }

  private:
    std::vector<std::vector<NativeSegment>> _batches;
    std::shared_ptr<EngineProbe> _probe;
    std::vector<NativeSegment> _segments;
    std::shared_future<void> _gate;
    bool _emitEmptyCallbacks = false;
    int _failureCode = 0;
    std::optional<std::string> _throwMessage;
};

} // namespace scribe::test
