#pragma once

#include <configuration/launch_options.hpp>

#include <fmt/format.h>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Configuration
{
    constexpr char const* configurationFileName = "suite-launcher.json";
    constexpr char const* logLevelVariable = "SUITE_LAUNCHER_LOG_LEVEL";

    struct ConfigurationError
    {
        std::filesystem::path file;
        std::string message;

        inline std::string toString() const
        {
            return fmt::format("ConfigurationError: file: {}, message: {}", file.string(), message);
        }
    };

    /**
     * @brief Reads the launcher configuration. A missing file is not an error, all options take their defaults then.
     * Options missing in the file are filled from defaultLaunchOptions().
     *
     * @param file The configuration file.
     * @return std::expected<LaunchOptions, ConfigurationError> Fully populated options.
     */
    std::expected<LaunchOptions, ConfigurationError> loadLaunchOptions(std::filesystem::path const& file);

    /**
     * @brief Parses and validates options from a json text, then fills in the defaults.
     */
    std::expected<LaunchOptions, ConfigurationError>
    parseLaunchOptions(std::string const& text, std::filesystem::path const& origin = {});

    /**
     * @brief A non empty value of the log level variable replaces the configured log level.
     */
    std::expected<void, ConfigurationError>
    applyLogLevelOverride(LaunchOptions& options, std::optional<std::string> const& variableValue);
}
