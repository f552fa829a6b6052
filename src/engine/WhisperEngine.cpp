// SPDX-License-Identifier: Apache-2.0
#include "WhisperEngine.hpp"

#include <core/Log.hpp>
#include <engine/RunConfiguration.hpp>

#include <whisper.h>

#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scribe
{

namespace
{

    /// @brief Maps ggml_log_level to scribe::log::Level.
    /// @return The corresponding level, or std::nullopt for levels that carry no own severity.
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Reassembles whisper.cpp log fragments into lines.
    ///
    /// whisper.cpp emits partial lines (GGML_LOG_LEVEL_CONT) from whichever thread runs
    /// the engine, so the buffer is shared and guarded.
    struct WhisperLogRelay
    {
        std::mutex mutex;
        std::string lineBuffer;
        log::Level lastLevel = log::Level::Debug;

        void feed(ggml_log_level level, std::string_view fragment)
        {
            auto lock = std::lock_guard(mutex);

            if (auto const mapped = mapGgmlLevel(level))
                lastLevel = *mapped;

            lineBuffer += fragment;

            while (true)
            {
                auto const nlPos = lineBuffer.find('\n');
                if (nlPos == std::string::npos)
                    break;

                auto line = lineBuffer.substr(0, nlPos);
                auto const end = line.find_last_not_of(" \t\r");
                if (end != std::string::npos)
                    line.resize(end + 1);
                else
                    line.clear();

                if (!line.empty())
                    log::write(lastLevel, std::format("whisper: {}", line));

                lineBuffer.erase(0, nlPos + 1);
            }
        }
    };

    auto whisperLogRelay = WhisperLogRelay {};

    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;
        whisperLogRelay.feed(level, text);
    }

    void installWhisperLogCallback()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { whisper_log_set(whisperLogCallback, nullptr); });
    }

    auto makeContextParams(const EngineOptions& options) -> whisper_context_params
    {
        auto params = whisper_context_default_params();
        params.use_gpu = options.useGpu;
        params.gpu_device = options.gpuDevice;
        params.flash_attn = options.flashAttention;
        return params;
    }

    /// @brief Carries the caller's callback through whisper.cpp's user_data pointer.
    struct SegmentCallbackRelay
    {
        WhisperEngine* engine = nullptr;
        NewSegmentCallback callback = nullptr;
        void* userData = nullptr;
    };

    void relayNewSegments(whisper_context* /*ctx*/, whisper_state* /*state*/, int newSegmentCount, void* userData)
    {
        auto const* relay = static_cast<SegmentCallbackRelay const*>(userData);
        relay->callback(*relay->engine, newSegmentCount, relay->userData);
    }

    auto makeFullParams(const RunConfiguration& config) -> whisper_full_params
    {
        auto const strategy =
            config.strategy == SamplingStrategy::BeamSearch ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY;

        auto params = whisper_full_default_params(strategy);
        params.n_threads = config.threads;
        params.n_max_text_ctx = config.maxTextContext;
        params.offset_ms = config.offsetMs;
        params.duration_ms = config.durationMs;

        params.translate = config.translate;
        params.no_context = config.noContext;
        params.no_timestamps = config.noTimestamps;
        params.single_segment = config.singleSegment;
        params.print_special = config.printSpecial;
        params.print_progress = config.printProgress;
        params.print_realtime = config.printRealtime;
        params.print_timestamps = config.printTimestamps;

        params.token_timestamps = config.tokenTimestamps;
        params.thold_pt = config.tokenTimestampThreshold;
        params.thold_ptsum = config.tokenTimestampSumThreshold;
        params.max_len = config.maxSegmentLength;
        params.split_on_word = config.splitOnWord;
        params.max_tokens = config.maxTokens;

        params.initial_prompt = config.initialPrompt.empty() ? nullptr : config.initialPrompt.c_str();
        params.language = config.detectLanguage ? "auto" : config.language.c_str();

        params.suppress_blank = config.suppressBlank;
        params.suppress_nst = config.suppressNonSpeechTokens;

        params.temperature = config.temperature;
        params.temperature_inc = config.temperatureIncrement;
        params.entropy_thold = config.entropyThreshold;
        params.logprob_thold = config.logProbThreshold;
        params.no_speech_thold = config.noSpeechThreshold;

        params.greedy.best_of = config.greedyBestOf;
        params.beam_search.beam_size = config.beamSize;
        return params;
    }

} // namespace

struct WhisperEngine::Impl
{
    struct ContextDeleter
    {
        void operator()(whisper_context* ctx) const { whisper_free(ctx); }
    };

    std::unique_ptr<whisper_context, ContextDeleter> ctx;
};

WhisperEngine::WhisperEngine(std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

WhisperEngine::~WhisperEngine() = default;

auto WhisperEngine::fromFile(std::string_view path, const EngineOptions& options)
    -> Result<std::unique_ptr<WhisperEngine>>
{
    installWhisperLogCallback();

    auto const pathStr = std::string(path);
    auto* ctx = whisper_init_from_file_with_params(pathStr.c_str(), makeContextParams(options));
    if (!ctx)
        return makeError(ErrorCode::EngineInitFailed, std::format("Failed to load whisper model: {}", path));

    log::info("Whisper model loaded: {}", path);

    auto impl = std::make_unique<Impl>();
    impl->ctx.reset(ctx);
    return std::unique_ptr<WhisperEngine>(new WhisperEngine(std::move(impl)));
}

auto WhisperEngine::fromBuffer(std::span<const std::byte> model, const EngineOptions& options)
    -> Result<std::unique_ptr<WhisperEngine>>
{
    if (model.empty())
        return makeError(ErrorCode::EngineInitFailed, "Cannot load whisper model from an empty buffer");

    installWhisperLogCallback();

    // whisper_init_from_buffer takes a mutable pointer; never hand it the caller's memory.
    auto copy = std::vector<std::byte>(model.begin(), model.end());
    auto* ctx = whisper_init_from_buffer_with_params(copy.data(), copy.size(), makeContextParams(options));
    if (!ctx)
        return makeError(ErrorCode::EngineInitFailed,
                         std::format("Failed to load whisper model from buffer ({} bytes)", model.size()));

    log::info("Whisper model loaded from buffer ({} bytes)", model.size());

    auto impl = std::make_unique<Impl>();
    impl->ctx.reset(ctx);
    return std::unique_ptr<WhisperEngine>(new WhisperEngine(std::move(impl)));
}

auto WhisperEngine::runFull(const RunConfiguration& config, std::span<const float> samples) -> VoidResult
{
    auto params = makeFullParams(config);

    auto relay = SegmentCallbackRelay { .engine = this,
                                        .callback = config.newSegmentCallback,
                                        .userData = config.newSegmentCallbackUserData };
    if (relay.callback)
    {
        params.new_segment_callback = relayNewSegments;
        params.new_segment_callback_user_data = &relay;
    }

    auto const result =
        whisper_full(_impl->ctx.get(), params, samples.data(), static_cast<int>(samples.size()));
    if (result != 0)
        return makeError(ErrorCode::InferenceFailed,
                         std::format("Whisper transcription failed with code: {}", result));

    return {};
}

auto WhisperEngine::segmentCount() const -> int
{
    return whisper_full_n_segments(_impl->ctx.get());
}

auto WhisperEngine::segmentText(int index) const -> std::optional<std::string>
{
    auto const* text = whisper_full_get_segment_text(_impl->ctx.get(), index);
    if (!text)
        return std::nullopt;
    return std::string(text);
}

auto WhisperEngine::segmentStart(int index) const -> std::int64_t
{
    return whisper_full_get_segment_t0(_impl->ctx.get(), index);
}

auto WhisperEngine::segmentEnd(int index) const -> std::int64_t
{
    return whisper_full_get_segment_t1(_impl->ctx.get(), index);
}

auto WhisperEngine::sampleRate() const -> int
{
    return WHISPER_SAMPLE_RATE;
}

} // namespace scribe
