#pragma once

#include <configuration/launch_options.hpp>
#include <launcher/launch_error.hpp>
#include <launcher/layout.hpp>
#include <process/environment.hpp>
#include <process/process_runner.hpp>

#include <expected>

namespace SuiteLauncher
{
    /**
     * @brief Hands the test directory to the external test runner and reports its exit code.
     */
    class TestRunner
    {
      public:
        TestRunner(IProcessRunner& runner, Configuration::RunnerOptions options);

        /**
         * @brief Runs "<command> <arguments...> <test directory>" in the repository root.
         *
         * @return std::expected<int, LaunchError> The exit code of the runner, whatever it is.
         */
        std::expected<int, LaunchError> run(Layout const& layout, Environment const& environment) const;

        ProcessSpec spec(Layout const& layout, Environment const& environment) const;

      private:
        IProcessRunner* runner_;
        Configuration::RunnerOptions options_;
    };
}
