#pragma once

#include <configuration/launch_options.hpp>
#include <launcher/exit_code.hpp>
#include <launcher/launcher.hpp>
#include <process/process_runner.hpp>
#include <utility/temporary_directory.hpp>

#include <process/utility/scripts.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

extern std::filesystem::path programDirectory;

namespace SuiteLauncher::Test
{
    using ::Test::CurrentDirectoryGuard;
    using ::Test::readFile;
    using ::Test::shellQuote;
    using ::Test::writeFile;
    using ::Test::writeScript;

    /**
     * Builds a repository on disk:
     *   <root>/sh/common.sh   requirements helper
     *   <root>/appoptics/     library under test
     *   <root>/tests/         test directory
     *   <root>/runner.sh      fake test runner, records what it saw into <root>/seen/
     */
    class LaunchEndToEndTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            root_ = std::filesystem::canonical(isolateDirectory_.path());
            std::filesystem::create_directory(root_ / "sh");
            std::filesystem::create_directory(root_ / "tests");
            std::filesystem::create_directory(root_ / "appoptics");
            std::filesystem::create_directory(root_ / "seen");

            setHelperResult(0);
            setRunnerResult(0);
        }

        void setHelperResult(int code)
        {
            writeFile(
                root_ / "sh" / "common.sh",
                "check_requirements() {\n"
                "    printf 'checked' > " +
                    shellQuote((root_ / "seen" / "helper").string()) +
                    "\n"
                    "    return " +
                    std::to_string(code) +
                    "\n"
                    "}\n");
        }

        void setRunnerResult(int code)
        {
            setRunnerEnding("exit " + std::to_string(code));
        }

        void setRunnerEnding(std::string const& lastLine)
        {
            const auto seen = root_ / "seen";
            writeScript(
                root_ / "runner.sh",
                "pwd -P > " + shellQuote((seen / "pwd").string()) + "\n" + "printf '%s' \"$PYTHONPATH\" > " +
                    shellQuote((seen / "pythonpath").string()) + "\n" + "printf '%s\\n' \"$@\" > " +
                    shellQuote((seen / "arguments").string()) + "\n" + lastLine);
        }

        Configuration::LaunchOptions options() const
        {
            auto options = Configuration::defaultLaunchOptions();
            options.requirements->shell = "/bin/sh";
            options.runner->command = "./runner.sh";
            return options;
        }

        Environment inheritedWith(std::optional<std::string> pythonPath) const
        {
            Environment environment{};
            environment.loadFromCurrent();
            environment.environment().erase("PYTHONPATH");
            if (pythonPath)
                environment.set("PYTHONPATH", *pythonPath);
            return environment;
        }

        int launch(std::optional<std::string> pythonPath = std::nullopt)
        {
            Launcher launcher{runner_, options(), inheritedWith(std::move(pythonPath))};
            return launcher.run(root_ / "sh");
        }

        bool runnerWasInvoked() const
        {
            return std::filesystem::exists(root_ / "seen" / "pwd");
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp"};
        std::filesystem::path root_;
        ProcessRunner runner_{};
    };

    TEST_F(LaunchEndToEndTests, EmptySuiteExitsZero)
    {
        EXPECT_EQ(launch(), ExitCode::Success);
        EXPECT_EQ(readFile(root_ / "seen" / "helper"), "checked");
        EXPECT_TRUE(runnerWasInvoked());
    }

    TEST_F(LaunchEndToEndTests, RunnerExitCodeIsTheLauncherExitCode)
    {
        setRunnerResult(1);
        EXPECT_EQ(launch(), 1);

        setRunnerResult(42);
        EXPECT_EQ(launch(), 42);
    }

    TEST_F(LaunchEndToEndTests, RunnerRunsInRepositoryRootWithTestDirectory)
    {
        ASSERT_EQ(launch(), 0);
        EXPECT_EQ(readFile(root_ / "seen" / "pwd"), root_.string() + "\n");
        EXPECT_EQ(readFile(root_ / "seen" / "arguments"), "tests/\n");
    }

    TEST_F(LaunchEndToEndTests, RunnerSeesLibraryOnSearchPath)
    {
        ASSERT_EQ(launch("/site"), 0);
        EXPECT_EQ(readFile(root_ / "seen" / "pythonpath"), "/site:" + (root_ / "appoptics").string());
    }

    TEST_F(LaunchEndToEndTests, UnsetSearchPathHasNoLeadingSeparator)
    {
        ASSERT_EQ(launch(), 0);
        EXPECT_EQ(readFile(root_ / "seen" / "pythonpath"), (root_ / "appoptics").string());
    }

    TEST_F(LaunchEndToEndTests, FailingHelperStopsBeforeTheRunner)
    {
        setHelperResult(3);
        EXPECT_EQ(launch(), 3);
        EXPECT_EQ(readFile(root_ / "seen" / "helper"), "checked");
        EXPECT_FALSE(runnerWasInvoked());
    }

    TEST_F(LaunchEndToEndTests, RunnerKilledBySignalIsReportedLikeAShell)
    {
        setRunnerEnding("kill -SEGV $$");
        EXPECT_EQ(launch(), 128 + 11);
        EXPECT_TRUE(runnerWasInvoked());
    }

    TEST_F(LaunchEndToEndTests, HelperKilledBySignalIsReportedLikeAShell)
    {
        writeFile(root_ / "sh" / "common.sh", "check_requirements() {\n    kill -SEGV $$\n}\n");
        EXPECT_EQ(launch(), 128 + 11);
        EXPECT_FALSE(runnerWasInvoked());
    }

    TEST_F(LaunchEndToEndTests, MissingRunnerIsReportedAs127)
    {
        std::filesystem::remove(root_ / "runner.sh");
        EXPECT_EQ(launch(), ExitCode::RunnerNotFound);
    }

    TEST_F(LaunchEndToEndTests, ResultDoesNotDependOnCurrentDirectory)
    {
        CurrentDirectoryGuard guard{};

        std::filesystem::current_path(root_ / "tests");
        const auto fromTests = launch("/site");
        const auto pwdFromTests = readFile(root_ / "seen" / "pwd");
        const auto pathFromTests = readFile(root_ / "seen" / "pythonpath");

        std::filesystem::current_path(std::filesystem::temp_directory_path());
        const auto fromTemp = launch("/site");
        const auto pwdFromTemp = readFile(root_ / "seen" / "pwd");
        const auto pathFromTemp = readFile(root_ / "seen" / "pythonpath");

        EXPECT_EQ(fromTests, 0);
        EXPECT_EQ(fromTemp, 0);
        EXPECT_EQ(pwdFromTests, pwdFromTemp);
        EXPECT_EQ(pathFromTests, pathFromTemp);
    }

    TEST_F(LaunchEndToEndTests, LauncherProcessStateIsLeftAlone)
    {
        const auto before = std::filesystem::current_path();
        const char* pythonPathBefore = std::getenv("PYTHONPATH");
        const std::optional<std::string> expected =
            pythonPathBefore ? std::optional<std::string>{pythonPathBefore} : std::nullopt;

        ASSERT_EQ(launch("/site"), 0);

        EXPECT_EQ(std::filesystem::current_path(), before);
        const char* pythonPathAfter = std::getenv("PYTHONPATH");
        EXPECT_EQ(pythonPathAfter ? std::optional<std::string>{pythonPathAfter} : std::nullopt, expected);
    }
}
