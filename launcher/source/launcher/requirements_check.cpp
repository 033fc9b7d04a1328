#include <launcher/requirements_check.hpp>
#include <launcher/exit_code.hpp>

#include <log/log.hpp>

#include <fmt/ranges.h>

#include <system_error>
#include <utility>

namespace SuiteLauncher
{
    namespace
    {
        LaunchError prerequisiteError(std::string message, int exitCode = ExitCode::PrerequisiteNotMet)
        {
            return LaunchError{
                .kind = LaunchErrorKind::PrerequisiteNotMet,
                .message = std::move(message),
                .exitCode = exitCode,
            };
        }
    }

    RequirementsCheck::RequirementsCheck(IProcessRunner& runner, Configuration::RequirementsOptions options)
        : runner_{&runner}
        , options_{std::move(options)}
    {}

    std::expected<void, LaunchError>
    RequirementsCheck::check(std::filesystem::path const& launcherDirectory, Environment const& environment) const
    {
        if (auto result = runHelper(launcherDirectory, environment); !result)
            return result;
        return checkExecutables(environment);
    }

    ProcessSpec
    RequirementsCheck::helperSpec(std::filesystem::path const& launcherDirectory, Environment const& environment) const
    {
        const std::filesystem::path script{options_.helperScript.value_or(std::string{})};
        const auto helperPath = script.is_absolute() ? script : launcherDirectory / script;

        // $0 is the helper file, so its path needs no quoting inside the command.
        return ProcessSpec{
            .executable = options_.shell.value_or("/bin/sh"),
            .arguments =
                {
                    "-c",
                    ". \"$0\" && " + options_.helperFunction.value_or("check_requirements"),
                    helperPath.string(),
                },
            .environment = environment,
            .workingDirectory = launcherDirectory,
        };
    }

    std::expected<void, LaunchError>
    RequirementsCheck::runHelper(std::filesystem::path const& launcherDirectory, Environment const& environment) const
    {
        if (!options_.helperScript || options_.helperScript->empty())
        {
            Log::debug("No requirements helper configured");
            return {};
        }

        auto spec = helperSpec(launcherDirectory, environment);
        const std::filesystem::path helperPath{spec.arguments.back()};

        std::error_code ec;
        if (!std::filesystem::is_regular_file(helperPath, ec))
            return std::unexpected(
                prerequisiteError(fmt::format("Requirements helper '{}' does not exist", helperPath.string())));

        Log::debug("Checking requirements with '{}'", helperPath.string());
        const auto result = runner_->run(spec);
        if (!result)
        {
            return std::unexpected(prerequisiteError(
                fmt::format("Requirements helper could not be run: {}", result.error().toString())));
        }

        if (*result != 0)
        {
            return std::unexpected(
                prerequisiteError(fmt::format("Requirements helper failed with exit code {}", *result), *result));
        }
        return {};
    }

    std::expected<void, LaunchError> RequirementsCheck::checkExecutables(Environment const& environment) const
    {
        if (!options_.requiredExecutables)
            return {};

        std::vector<std::string> missing{};
        for (auto const& executable : *options_.requiredExecutables)
        {
            if (const auto found = runner_->findExecutable(executable, environment); found)
                Log::debug("Found required executable '{}' at '{}'", executable, found->string());
            else
                missing.push_back(executable);
        }

        if (!missing.empty())
        {
            return std::unexpected(
                prerequisiteError(fmt::format("Required executables not found: {}", fmt::join(missing, ", "))));
        }
        return {};
    }
}
