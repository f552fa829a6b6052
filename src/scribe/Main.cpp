// SPDX-License-Identifier: Apache-2.0
#include <audio/PcmFile.hpp>
#include <core/Log.hpp>
#include <scribe/App.hpp>
#include <scribe/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "scribe — transcribe raw PCM audio with whisper.cpp" };

    auto modelPath = std::string {};
    auto configPath = std::string {};
    auto inputPath = std::string {};
    auto format = std::string { "f32" };
    auto language = std::string {};
    auto threads = 0;
    auto translate = false;
    auto printJson = false;
    auto verbose = false;
    auto saveConfig = false;

    app.add_option("-m,--model", modelPath, "Path to ggml whisper model file");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-i,--input", inputPath, "Headerless mono 16 kHz PCM file")->required();
    app.add_option("--format", format, "Sample encoding of the input (f32|s16)");
    app.add_option("-l,--language", language, "Spoken language (\"auto\" to detect)");
    app.add_option("-t,--threads", threads, "Number of inference threads");
    app.add_flag("--translate", translate, "Translate to English");
    app.add_flag("--json", printJson, "Print the final segment list as JSON");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--save-config", saveConfig, "Write the effective configuration to the config file");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? scribe::loadConfig() : scribe::loadConfigFromFile(configPath);

    if (!configResult)
    {
        scribe::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    scribe::log::setLevel(verbose ? scribe::log::Level::Debug : config.logLevel);

    // Apply CLI overrides
    if (!modelPath.empty())
        config.modelPath = modelPath;
    if (language == "auto")
        config.run.detectLanguage = true;
    else if (!language.empty())
        config.run.language = language;
    if (threads > 0)
        config.run.threads = threads;
    if (translate)
        config.run.translate = true;

    if (saveConfig)
    {
        auto const path = configPath.empty() ? scribe::defaultConfigPath() : configPath;
        if (auto saved = scribe::saveConfigToFile(path, config); !saved)
        {
            scribe::log::error("Failed to save config: {}", saved.error().message);
            return 1;
        }
        scribe::log::info("Configuration written to {}", path);
    }

    auto pcmFormat = scribe::pcmFormatFromString(format);
    if (!pcmFormat)
    {
        scribe::log::error("{}", pcmFormat.error().message);
        return 1;
    }

    auto application = scribe::App(std::move(config),
                                   scribe::TranscriptionRequest {
                                       .inputPath = inputPath,
                                       .format = *pcmFormat,
                                       .printJson = printJson,
                                   });
    auto initResult = application.initialize();
    if (!initResult)
    {
        scribe::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return application.run();
}
