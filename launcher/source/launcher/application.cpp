#include <launcher/application.hpp>

#include <configuration/configuration_loader.hpp>
#include <launcher/exit_code.hpp>
#include <launcher/launcher.hpp>
#include <launcher/layout.hpp>
#include <log/log.hpp>

#include <system_error>
#include <utility>

namespace SuiteLauncher
{
    Application::Application(IProcessRunner& runner, Environment inherited)
        : runner_{&runner}
        , inherited_{std::move(inherited)}
    {}

    int Application::run(
        std::vector<std::string> const& arguments,
        std::expected<std::filesystem::path, LaunchError> const& launcherDirectory) const
    {
        if (!arguments.empty())
        {
            Log::error("suite-launcher takes no arguments, got {}", arguments.size());
            return ExitCode::Usage;
        }

        if (!launcherDirectory)
        {
            Log::error("{}", launcherDirectory.error().message);
            return launcherDirectory.error().exitCode;
        }

        auto options = Configuration::loadLaunchOptions(*launcherDirectory / Configuration::configurationFileName);
        if (!options)
        {
            Log::error("Invalid configuration: {}", options.error().toString());
            return ExitCode::Configuration;
        }

        if (auto overridden =
                Configuration::applyLogLevelOverride(*options, inherited_.get(Configuration::logLevelVariable));
            !overridden)
        {
            Log::error("{}", overridden.error().message);
            return ExitCode::Configuration;
        }
        Log::setLevel(Log::levelFromString(options->logLevel.value()));

        Launcher launcher{*runner_, std::move(*options), inherited_};
        return launcher.run(*launcherDirectory);
    }

    int launch(int argc, char const* const* argv)
    {
        Log::setup("suite-launcher");

        Environment inherited{};
        inherited.loadFromCurrent();

        // Early level, before the configuration is read.
        if (const auto level = inherited.get(Configuration::logLevelVariable); level)
            Log::setLevel(Log::levelFromString(*level));

        std::vector<std::string> arguments{};
        for (int i = 1; i < argc; ++i)
            arguments.emplace_back(argv[i]);

        std::error_code ec;
        const auto currentDirectory = std::filesystem::current_path(ec);
        const auto launcherDirectory =
            locateLauncherDirectory(argc > 0 ? argv[0] : std::string{}, currentDirectory);

        ProcessRunner runner{};
        return Application{runner, std::move(inherited)}.run(arguments, launcherDirectory);
    }
}
