// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <engine/InferenceEngine.hpp>
#include <engine/RunConfiguration.hpp>

#include <string>
#include <string_view>

namespace scribe
{

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Path to the ggml whisper model. Empty means defaultModelPath().
    std::string modelPath;
    log::Level logLevel = log::Level::Info;
    EngineOptions engine;
    RunConfiguration run;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/scribe or ~/.local/share/scribe
/// On macOS: ~/Library/Application Support/scribe
/// On Windows: %APPDATA%\scribe
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default whisper model file path.
[[nodiscard]] auto defaultModelPath() -> std::string;

} // namespace scribe
