#include <process/process_runner.hpp>

#include <log/log.hpp>

ProcessRunner::ProcessRunner()
    : context_{}
{}

std::expected<int, ProcessError> ProcessRunner::run(ProcessSpec const& spec)
{
    Process process{context_.get_executor()};
    if (auto spawned = process.spawn(spec); !spawned)
    {
        Log::debug("Could not run '{}': {}", spec.executable, spawned.error().toString());
        return std::unexpected(std::move(spawned).error());
    }
    return process.wait();
}

std::optional<std::filesystem::path>
ProcessRunner::findExecutable(std::string const& executable, Environment const& environment) const
{
    return ::findExecutable(executable, environment);
}
