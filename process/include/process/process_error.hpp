#pragma once

#include <fmt/format.h>

#include <string>

enum class ProcessErrorKind
{
    NotFound,
    SpawnFailed,
    WaitFailed,
};

struct ProcessError
{
    ProcessErrorKind kind = ProcessErrorKind::SpawnFailed;
    std::string message;
    // errno style code reported by the operating system, 0 if there was none.
    int systemError = 0;

    inline std::string toString() const
    {
        return fmt::format(
            "ProcessError: kind: {}, message: {}, systemError: {}", kindName(), message, systemError);
    }

    inline char const* kindName() const
    {
        switch (kind)
        {
            case ProcessErrorKind::NotFound:
                return "NotFound";
            case ProcessErrorKind::SpawnFailed:
                return "SpawnFailed";
            case ProcessErrorKind::WaitFailed:
                return "WaitFailed";
            default:
                return "Unknown";
        }
    }
};
