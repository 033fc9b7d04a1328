#pragma once

#include <configuration/launch_options.hpp>
#include <launcher/launch_error.hpp>
#include <process/environment.hpp>
#include <process/process_runner.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace SuiteLauncher
{
    /**
     * @brief Verifies that everything the test run needs is installed before anything else happens.
     *
     * Two independent checks, both optional:
     *  - A shell helper file is sourced and its check function is called. A non zero exit status of the helper
     *    becomes the exit code of the launcher.
     *  - Every required executable must be found on PATH.
     */
    class RequirementsCheck
    {
      public:
        RequirementsCheck(IProcessRunner& runner, Configuration::RequirementsOptions options);

        std::expected<void, LaunchError>
        check(std::filesystem::path const& launcherDirectory, Environment const& environment) const;

        /**
         * @brief The process that runs the helper function, relative helper paths resolved against the launcher
         * directory.
         */
        ProcessSpec helperSpec(std::filesystem::path const& launcherDirectory, Environment const& environment) const;

      private:
        std::expected<void, LaunchError>
        runHelper(std::filesystem::path const& launcherDirectory, Environment const& environment) const;
        std::expected<void, LaunchError> checkExecutables(Environment const& environment) const;

      private:
        IProcessRunner* runner_;
        Configuration::RequirementsOptions options_;
    };
}
