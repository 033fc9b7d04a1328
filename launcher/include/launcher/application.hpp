#pragma once

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
     * @brief Everything between the command line and the Launcher: argument check, configuration file and log level.
     */
    class Application
    {
      public:
        /**
         * @param runner Runs the helper and the test runner.
         * @param inherited The environment of this process. Also the source of the log level override.
         */
        Application(IProcessRunner& runner, Environment inherited);

        /**
         * @brief Runs the launcher.
         *
         * @param arguments Command line arguments after the program name. There must be none.
         * @param launcherDirectory The located launcher directory or the reason it could not be located.
         * @return int The exit code for this process.
         */
        int run(
            std::vector<std::string> const& arguments,
            std::expected<std::filesystem::path, LaunchError> const& launcherDirectory) const;

      private:
        IProcessRunner* runner_;
        Environment inherited_;
    };

    /**
     * @brief Entry point behind main. Sets up logging, reads the environment of this process and locates the
     * launcher directory, then runs an Application with real processes.
     */
    int launch(int argc, char const* const* argv);
}
