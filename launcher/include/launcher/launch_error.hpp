#pragma once

#include <fmt/format.h>

#include <string>

namespace SuiteLauncher
{
    enum class LaunchErrorKind
    {
        PrerequisiteNotMet,
        DirectoryResolution,
        TestExecution,
    };

    struct LaunchError
    {
        LaunchErrorKind kind = LaunchErrorKind::TestExecution;
        std::string message;
        // What the launcher exits with because of this error.
        int exitCode = 1;

        inline std::string toString() const
        {
            return fmt::format("LaunchError: kind: {}, message: {}, exitCode: {}", kindName(), message, exitCode);
        }

        inline char const* kindName() const
        {
            switch (kind)
            {
                case LaunchErrorKind::PrerequisiteNotMet:
                    return "PrerequisiteNotMet";
                case LaunchErrorKind::DirectoryResolution:
                    return "DirectoryResolution";
                case LaunchErrorKind::TestExecution:
                    return "TestExecution";
                default:
                    return "Unknown";
            }
        }
    };
}
