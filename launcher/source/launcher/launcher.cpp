#include <launcher/launcher.hpp>

#include <log/log.hpp>

#include <utility>

namespace SuiteLauncher
{
    Launcher::Launcher(IProcessRunner& runner, Configuration::LaunchOptions options, Environment inherited)
        : options_{std::move(options)}
        , inherited_{std::move(inherited)}
        , requirements_{runner, options_.requirements.value_or(Configuration::RequirementsOptions{})}
        , testRunner_{runner, options_.runner.value_or(Configuration::RunnerOptions{})}
    {}

    Environment Launcher::childEnvironment(Layout const& layout) const
    {
        auto environment = inherited_;
        environment.extendSearchPath(options_.searchPathVariable.value(), layout.libraryDirectory.string());
        Log::debug(
            "{}={}", options_.searchPathVariable.value(), *environment.get(options_.searchPathVariable.value()));
        return environment;
    }

    int Launcher::run(std::filesystem::path const& launcherDirectory) const
    {
        Log::debug("Launcher directory is '{}'", launcherDirectory.string());

        if (auto checked = requirements_.check(launcherDirectory, inherited_); !checked)
        {
            Log::error("Requirements not met: {}", checked.error().message);
            return checked.error().exitCode;
        }

        const auto layout = resolveLayout(launcherDirectory, options_);
        if (!layout)
        {
            Log::error("{}", layout.error().message);
            return layout.error().exitCode;
        }

        const auto result = testRunner_.run(*layout, childEnvironment(*layout));
        if (!result)
        {
            Log::error("{}", result.error().message);
            return result.error().exitCode;
        }

        Log::info("Test runner exited with {}", *result);
        return *result;
    }
}
