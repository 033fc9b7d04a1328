#pragma once

// Exit codes chosen by the launcher itself. Codes of the requirements helper and the test runner are passed through
// unchanged, a child killed by signal N counts as 128 + N. Numbering follows sysexits.h and the shell conventions for
// 126 and 127.
namespace SuiteLauncher::ExitCode
{
    constexpr int Success = 0;
    constexpr int Usage = 64;
    constexpr int DirectoryResolution = 66;
    constexpr int PrerequisiteNotMet = 69;
    constexpr int InternalError = 70;
    constexpr int Configuration = 78;
    constexpr int RunnerNotExecutable = 126;
    constexpr int RunnerNotFound = 127;
}
