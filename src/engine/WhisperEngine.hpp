// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/InferenceEngine.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

namespace scribe
{

/// @brief InferenceEngine backed by one whisper.cpp context.
///
/// Owns its whisper_context exclusively and frees it exactly once on destruction.
/// Instances are created through the factories only and cannot be copied or moved;
/// ownership transfers as std::unique_ptr, so the context pointer is never shared.
class WhisperEngine final: public InferenceEngine
{
  public:
    /// @brief Loads a ggml model file.
    /// @param path Path of the model file.
    /// @param options Context options.
    /// @return The engine, or EngineInitFailed.
    [[nodiscard]] static auto fromFile(std::string_view path, const EngineOptions& options = {})
        -> Result<std::unique_ptr<WhisperEngine>>;

    /// @brief Loads a ggml model from memory.
    ///
    /// The bytes are copied before they are handed to whisper.cpp; @p model only has to stay
    /// valid for the duration of this call.
    /// @param model The serialized model.
    /// @param options Context options.
    /// @return The engine, or EngineInitFailed.
    [[nodiscard]] static auto fromBuffer(std::span<const std::byte> model, const EngineOptions& options = {})
        -> Result<std::unique_ptr<WhisperEngine>>;

    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;
    WhisperEngine(WhisperEngine&&) = delete;
    WhisperEngine& operator=(WhisperEngine&&) = delete;

    [[nodiscard]] auto runFull(const RunConfiguration& config, std::span<const float> samples)
        -> VoidResult override;
    [[nodiscard]] auto segmentCount() const -> int override;
    [[nodiscard]] auto segmentText(int index) const -> std::optional<std::string> override;
    [[nodiscard]] auto segmentStart(int index) const -> std::int64_t override;
    [[nodiscard]] auto segmentEnd(int index) const -> std::int64_t override;
    [[nodiscard]] auto sampleRate() const -> int override;

  private:
    struct Impl;
    explicit WhisperEngine(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> _impl;
};

} // namespace scribe
