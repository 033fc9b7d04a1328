#pragma once

#include <configuration/launch_options.hpp>
#include <launcher/exit_code.hpp>
#include <launcher/requirements_check.hpp>
#include <process/mocks/process_runner_mock.hpp>
#include <utility/temporary_directory.hpp>

#include <process/utility/scripts.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>

extern std::filesystem::path programDirectory;

namespace SuiteLauncher::Test
{
    using ::testing::_;
    using ::testing::Field;
    using ::testing::Return;

    class RequirementsCheckTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            launcherDirectory_ = std::filesystem::canonical(isolateDirectory_.path());
        }

        Configuration::RequirementsOptions withHelper()
        {
            ::Test::writeFile(launcherDirectory_ / "common.sh", "check_requirements() { return 0; }\n");
            return Configuration::defaultLaunchOptions().requirements.value();
        }

        Configuration::RequirementsOptions withoutHelper()
        {
            auto options = Configuration::defaultLaunchOptions().requirements.value();
            options.helperScript = std::string{};
            return options;
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp"};
        std::filesystem::path launcherDirectory_;
        ::testing::StrictMock<::Test::ProcessRunnerMock> runner_;
        Environment environment_{};
    };

    TEST_F(RequirementsCheckTests, NothingConfiguredRunsNothing)
    {
        RequirementsCheck check{runner_, withoutHelper()};
        EXPECT_TRUE(check.check(launcherDirectory_, environment_).has_value());
    }

    TEST_F(RequirementsCheckTests, HelperIsSourcedAndItsFunctionCalled)
    {
        RequirementsCheck check{runner_, withHelper()};
        const auto spec = check.helperSpec(launcherDirectory_, environment_);

        EXPECT_EQ(spec.executable, "/bin/bash");
        EXPECT_THAT(
            spec.arguments,
            ::testing::ElementsAre(
                "-c", ". \"$0\" && check_requirements", (launcherDirectory_ / "common.sh").string()));
        EXPECT_EQ(spec.workingDirectory, launcherDirectory_);
    }

    TEST_F(RequirementsCheckTests, SucceedingHelperPasses)
    {
        RequirementsCheck check{runner_, withHelper()};
        EXPECT_CALL(runner_, run(Field(&ProcessSpec::executable, "/bin/bash"))).WillOnce(Return(0));

        EXPECT_TRUE(check.check(launcherDirectory_, environment_).has_value());
    }

    TEST_F(RequirementsCheckTests, FailingHelperStatusIsPropagatedVerbatim)
    {
        RequirementsCheck check{runner_, withHelper()};
        EXPECT_CALL(runner_, run(_)).WillOnce(Return(4));

        const auto result = check.check(launcherDirectory_, environment_);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, LaunchErrorKind::PrerequisiteNotMet);
        EXPECT_EQ(result.error().exitCode, 4);
    }

    TEST_F(RequirementsCheckTests, MissingHelperFileIsPrerequisiteFailure)
    {
        RequirementsCheck check{runner_, Configuration::defaultLaunchOptions().requirements.value()};

        const auto result = check.check(launcherDirectory_, environment_);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().kind, LaunchErrorKind::PrerequisiteNotMet);
        EXPECT_EQ(result.error().exitCode, ExitCode::PrerequisiteNotMet);
    }

    TEST_F(RequirementsCheckTests, UnrunnableHelperIsPrerequisiteFailure)
    {
        RequirementsCheck check{runner_, withHelper()};
        EXPECT_CALL(runner_, run(_))
            .WillOnce(Return(std::unexpected(ProcessError{
                .kind = ProcessErrorKind::NotFound,
                .message = "no shell",
            })));

        const auto result = check.check(launcherDirectory_, environment_);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().exitCode, ExitCode::PrerequisiteNotMet);
    }

    TEST_F(RequirementsCheckTests, MissingExecutableIsPrerequisiteFailure)
    {
        auto options = withoutHelper();
        options.requiredExecutables = std::vector<std::string>{"python3", "nosetests"};
        RequirementsCheck check{runner_, options};

        EXPECT_CALL(runner_, findExecutable("python3", _))
            .WillOnce(Return(std::filesystem::path{"/usr/bin/python3"}));
        EXPECT_CALL(runner_, findExecutable("nosetests", _)).WillOnce(Return(std::nullopt));

        const auto result = check.check(launcherDirectory_, environment_);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().exitCode, ExitCode::PrerequisiteNotMet);
        EXPECT_THAT(result.error().message, ::testing::HasSubstr("nosetests"));
        EXPECT_THAT(result.error().message, ::testing::Not(::testing::HasSubstr("python3")));
    }

    TEST_F(RequirementsCheckTests, ExecutablesAreNotCheckedWhenHelperFails)
    {
        auto options = withHelper();
        options.requiredExecutables = std::vector<std::string>{"nosetests"};
        RequirementsCheck check{runner_, options};

        EXPECT_CALL(runner_, run(_)).WillOnce(Return(2));
        EXPECT_CALL(runner_, findExecutable(_, _)).Times(0);

        const auto result = check.check(launcherDirectory_, environment_);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().exitCode, 2);
    }
}
