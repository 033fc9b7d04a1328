#pragma once

#include <process/process_runner.hpp>

#include <gmock/gmock.h>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Test
{
    class ProcessRunnerMock : public IProcessRunner
    {
      public:
        MOCK_METHOD((std::expected<int, ProcessError>), run, (ProcessSpec const& spec), (override));
        MOCK_METHOD(
            (std::optional<std::filesystem::path>),
            findExecutable,
            (std::string const& executable, Environment const& environment),
            (const, override));
    };
}
