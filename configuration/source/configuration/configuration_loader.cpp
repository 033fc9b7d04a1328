#include <configuration/configuration_loader.hpp>

#include <log/level.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace Configuration
{
    namespace
    {
        std::optional<std::string> checkSectionsAreObjects(nlohmann::json const& j)
        {
            if (!j.is_object())
                return "top level value must be an object";

            for (auto const* section : {"requirements", "runner"})
            {
                if (j.contains(section) && !j[section].is_object())
                    return fmt::format("'{}' must be an object", section);
            }
            return std::nullopt;
        }

        // The function name ends up in a shell command line.
        bool isShellIdentifier(std::string const& name)
        {
            if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
                return false;
            return std::all_of(name.begin(), name.end(), [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
            });
        }

        std::optional<std::string> validate(LaunchOptions const& options)
        {
            if (options.searchPathVariable && options.searchPathVariable->empty())
                return "'searchPathVariable' must not be empty";
            if (options.searchPathVariable && options.searchPathVariable->find('=') != std::string::npos)
                return "'searchPathVariable' must not contain '='";
            if (options.testDirectory && options.testDirectory->empty())
                return "'testDirectory' must not be empty";
            if (options.logLevel && !Log::tryLevelFromString(*options.logLevel))
                return fmt::format("'logLevel' has unknown value '{}'", *options.logLevel);
            if (options.runner && options.runner->command && options.runner->command->empty())
                return "'runner.command' must not be empty";
            if (options.requirements && options.requirements->shell && options.requirements->shell->empty())
                return "'requirements.shell' must not be empty";
            if (options.requirements && options.requirements->helperFunction &&
                !isShellIdentifier(*options.requirements->helperFunction))
                return fmt::format(
                    "'requirements.helperFunction' is not a valid shell function name: '{}'",
                    *options.requirements->helperFunction);
            return std::nullopt;
        }
    }

    std::expected<LaunchOptions, ConfigurationError>
    parseLaunchOptions(std::string const& text, std::filesystem::path const& origin)
    {
        LaunchOptions options{};
        try
        {
            const auto j = nlohmann::json::parse(text);
            if (auto problem = checkSectionsAreObjects(j))
                return std::unexpected(ConfigurationError{.file = origin, .message = std::move(*problem)});

            options = j.get<LaunchOptions>();
        }
        catch (nlohmann::json::exception const& e)
        {
            return std::unexpected(ConfigurationError{.file = origin, .message = e.what()});
        }

        if (auto problem = validate(options))
            return std::unexpected(ConfigurationError{.file = origin, .message = std::move(*problem)});

        options.useDefaultsFrom(defaultLaunchOptions());
        return options;
    }

    std::expected<LaunchOptions, ConfigurationError> loadLaunchOptions(std::filesystem::path const& file)
    {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec))
        {
            Log::debug("No configuration file at '{}', using defaults", file.string());
            return defaultLaunchOptions();
        }

        std::ifstream reader{file, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected(ConfigurationError{.file = file, .message = "Could not open file for reading"});

        std::stringstream buffer;
        buffer << reader.rdbuf();

        Log::debug("Loading configuration from '{}'", file.string());
        return parseLaunchOptions(buffer.str(), file);
    }

    std::expected<void, ConfigurationError>
    applyLogLevelOverride(LaunchOptions& options, std::optional<std::string> const& variableValue)
    {
        if (!variableValue || variableValue->empty())
            return {};

        if (!Log::tryLevelFromString(*variableValue))
        {
            return std::unexpected(ConfigurationError{
                .file = {},
                .message = fmt::format("{} has unknown value '{}'", logLevelVariable, *variableValue),
            });
        }
        options.logLevel = *variableValue;
        return {};
    }
}
