// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

namespace scribe
{

namespace
{

    constexpr auto DefaultModelFilename = std::string_view { "ggml-base.en.bin" };

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\scribe";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/scribe";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/scribe";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/scribe";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\scribe";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/scribe";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/scribe";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/scribe";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultModelPath() -> std::string
{
    return defaultDataDir() + "/models/" + std::string(DefaultModelFilename);
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto parseResult = json::parseFile(path);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Cannot load config file {}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};
    config.modelPath = json::getStringOr(root, "modelPath", "");

    auto const levelName = json::getStringOr(root, "logLevel", log::levelName(config.logLevel));
    auto const level = log::levelFromString(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", levelName));
    config.logLevel = *level;

    // Engine section
    if (root.contains("engine"))
    {
        auto const& engine = root["engine"];
        config.engine.useGpu = json::getBoolOr(engine, "useGpu", config.engine.useGpu);
        config.engine.gpuDevice = json::getIntOr(engine, "gpuDevice", config.engine.gpuDevice);
        config.engine.flashAttention = json::getBoolOr(engine, "flashAttention", config.engine.flashAttention);
    }

    // Run section
    if (root.contains("run"))
    {
        auto run = runConfigurationFromJson(root["run"]);
        if (!run)
            return std::unexpected(run.error());
        config.run = std::move(*run);
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    if (!config.modelPath.empty())
        root["modelPath"] = config.modelPath;
    root["logLevel"] = std::string(log::levelName(config.logLevel));

    auto engine = nlohmann::json::object();
    engine["useGpu"] = config.engine.useGpu;
    engine["gpuDevice"] = config.engine.gpuDevice;
    engine["flashAttention"] = config.engine.flashAttention;
    root["engine"] = std::move(engine);

    root["run"] = toJson(config.run);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace scribe
