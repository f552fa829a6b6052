// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/EventLoop.hpp>
#include <core/Log.hpp>
#include <core/ThreadPool.hpp>
#include <engine/WhisperEngine.hpp>
#include <transcription/TranscriptionSession.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <print>

namespace scribe
{

namespace
{

    auto segmentsToJson(const std::vector<Segment>& segments) -> nlohmann::json
    {
        auto array = nlohmann::json::array();
        for (auto const& segment: segments)
        {
            array.push_back(nlohmann::json {
                { "start", segment.startTimeMs },
                { "end", segment.endTimeMs },
                { "text", segment.text },
            });
        }
        return array;
    }

} // namespace

struct App::Impl final: TranscriptionDelegate
{
    AppConfig config;
    TranscriptionRequest request;

    // Both executors must outlive the session, so they are declared first.
    EventLoop mainLoop;
    ThreadPool worker { 1 };
    std::unique_ptr<TranscriptionSession> session;

    void onProgress(TranscriptionSession& /*session*/, double progress) override
    {
        log::info("Progress: {:.1f}%", progress * 100.0);
    }

    void onNewSegments(TranscriptionSession& /*session*/,
                       const std::vector<Segment>& segments,
                       int /*startIndex*/) override
    {
        if (request.printJson)
            return;

        for (auto const& segment: segments)
            std::println("[{} --> {}] {}",
                         formatTimestamp(segment.startTimeMs),
                         formatTimestamp(segment.endTimeMs),
                         segment.text);
    }

    void onCompletion(TranscriptionSession& /*session*/, const std::vector<Segment>& segments) override
    {
        log::info("Transcription complete: {} segment(s)", segments.size());
    }
};

App::App(AppConfig config, TranscriptionRequest request): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->request = std::move(request);
}

App::~App()
{
    // The session must go before the executors it posts to.
    _impl->session.reset();
}

auto App::initialize() -> VoidResult
{
    auto const modelPath = _impl->config.modelPath.empty() ? defaultModelPath() : _impl->config.modelPath;

    auto engine = WhisperEngine::fromFile(modelPath, _impl->config.engine);
    if (!engine)
        return std::unexpected(engine.error());

    _impl->session = std::make_unique<TranscriptionSession>(
        std::move(*engine), _impl->config.run, _impl->worker, _impl->mainLoop);
    _impl->session->setDelegate(_impl.get());
    return {};
}

auto App::run() -> int
{
    if (!_impl->session)
    {
        log::error("App::run() called before initialize()");
        return 1;
    }

    auto samples = readPcmFile(_impl->request.inputPath, _impl->request.format);
    if (!samples)
    {
        log::error("Cannot read input: {}", samples.error());
        return 1;
    }

    log::info("Transcribing {} ({} samples)", _impl->request.inputPath, samples->size());

    auto outcome = std::optional<Result<std::vector<Segment>>> {};
    _impl->session->transcribe(std::move(*samples), [this, &outcome](Result<std::vector<Segment>> result) {
        outcome = std::move(result);
        _impl->mainLoop.stop();
    });

    // Precondition failures complete synchronously; only wait for a run that started.
    if (!outcome)
        _impl->mainLoop.run();

    if (!outcome || !*outcome)
    {
        log::error("Transcription failed: {}", outcome ? outcome->error().message : "no result");
        return 1;
    }

    if (_impl->request.printJson)
        std::println("{}", segmentsToJson(**outcome).dump(2));

    return 0;
}

} // namespace scribe
