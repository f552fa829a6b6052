// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/PcmFile.hpp>
#include <core/Error.hpp>
#include <scribe/Config.hpp>

#include <memory>
#include <string>

namespace scribe
{

/// @brief What the command line asked to transcribe.
struct TranscriptionRequest
{
    std::string inputPath;
    PcmFormat format = PcmFormat::Float32;
    bool printJson = false;
};

/// @brief Command-line application: loads a model and transcribes one PCM file.
class App
{
  public:
    App(AppConfig config, TranscriptionRequest request);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the model and creates the transcription session.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Transcribes the requested file, streaming segments to stdout.
    /// @return The process exit code.
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace scribe
