#pragma once

#include <configuration/launch_options.hpp>
#include <launcher/layout.hpp>
#include <launcher/requirements_check.hpp>
#include <launcher/test_runner.hpp>
#include <process/environment.hpp>
#include <process/process_runner.hpp>

#include <filesystem>

namespace SuiteLauncher
{
    /**
     * @brief Checks requirements, then runs the test suite with the library under test on the module search path.
     *
     * The process environment and the current directory of this process are never changed. The search path entry
     * lives in the environment given to the children and the repository root is their start directory.
     */
    class Launcher
    {
      public:
        /**
         * @param runner Runs the helper and the test runner.
         * @param options Fully populated options.
         * @param inherited The environment children inherit, normally the one of this process.
         */
        Launcher(IProcessRunner& runner, Configuration::LaunchOptions options, Environment inherited);

        /**
         * @brief Performs the launch.
         *
         * @param launcherDirectory Absolute directory the launcher lives in.
         * @return int The exit code for this process: the one of the test runner, or the code of the first failed
         * step.
         */
        int run(std::filesystem::path const& launcherDirectory) const;

        /**
         * @brief The environment the test runner gets: inherited plus the library directory on the search path.
         */
        Environment childEnvironment(Layout const& layout) const;

      private:
        Configuration::LaunchOptions options_;
        Environment inherited_;
        RequirementsCheck requirements_;
        TestRunner testRunner_;
    };
}
