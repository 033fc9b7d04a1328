#include <process/process.hpp>

#include <log/log.hpp>

#include <boost/asio.hpp>
#include <boost/process/v2.hpp>
#include <boost/system/system_error.hpp>

#include <unordered_map>

#ifndef _WIN32
#    include <sys/wait.h>
#endif

namespace bp2 = boost::process::v2;

namespace
{
    std::unordered_map<bp2::environment::key, bp2::environment::value> toChildEnvironment(Environment const& environment)
    {
        std::unordered_map<bp2::environment::key, bp2::environment::value> env;
        for (auto const& [key, value] : environment.environment())
        {
            if (key.empty())
                continue;
            env.emplace(key, value);
        }
        return env;
    }

    bool isExecutableFile(std::filesystem::path const& path)
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::is_regular_file(status))
            return false;

        using std::filesystem::perms;
        return (status.permissions() & (perms::owner_exec | perms::group_exec | perms::others_exec)) != perms::none;
    }

    // A child killed by signal N is reported as 128 + N, like a shell does.
    int shellExitCode(bp2::native_exit_code_type status, int evaluated)
    {
#ifdef _WIN32
        return evaluated;
#else
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return evaluated;
#endif
    }
}

std::optional<std::filesystem::path> findExecutable(
    std::string const& executable,
    Environment const& environment,
    std::filesystem::path const& workingDirectory)
{
    if (executable.empty())
        return std::nullopt;

    const std::filesystem::path asPath{executable};
    if (asPath.has_parent_path())
    {
        const auto candidate = asPath.is_absolute() ? asPath : workingDirectory / asPath;
        if (isExecutableFile(candidate))
            return candidate;
        return std::nullopt;
    }

    auto env = toChildEnvironment(environment);
    const auto found = bp2::environment::find_executable(executable, env);
    if (found.empty())
        return std::nullopt;
    return std::filesystem::path{found.string()};
}

struct Process::Implementation
{
    boost::asio::any_io_executor executor;
    std::unique_ptr<bp2::process> child;
    std::optional<int> exitCode;

    Implementation(boost::asio::any_io_executor executor)
        : executor{std::move(executor)}
        , child{}
        , exitCode{}
    {}

    bool isRunning() const
    {
        boost::system::error_code ec;
        return child && child->running(ec) && !ec;
    }
};

Process::Process(boost::asio::any_io_executor executor)
    : impl_{std::make_unique<Implementation>(std::move(executor))}
{}
Process::~Process()
{
    if (!impl_ || !impl_->isRunning())
        return;

    boost::system::error_code ec;
    impl_->child->terminate(ec);
    if (ec)
        Log::error("Failed to terminate child process on destruction: {}", ec.message());
}
ROAR_PIMPL_SPECIAL_FUNCTIONS_IMPL_NO_DTOR(Process);

std::expected<void, ProcessError> Process::spawn(ProcessSpec const& spec)
{
    if (impl_->isRunning())
    {
        return std::unexpected(ProcessError{
            .kind = ProcessErrorKind::SpawnFailed,
            .message = "A child process is still running",
        });
    }

    impl_->child.reset();
    impl_->exitCode.reset();

    const auto executable = findExecutable(spec.executable, spec.environment, spec.workingDirectory);
    if (!executable)
    {
        return std::unexpected(ProcessError{
            .kind = ProcessErrorKind::NotFound,
            .message = "Executable not found: " + spec.executable,
        });
    }

    Log::debug("Spawning '{}' in '{}'", executable->string(), spec.workingDirectory.string());
    for (auto const& argument : spec.arguments)
        Log::trace("  argument: '{}'", argument);

    auto env = toChildEnvironment(spec.environment);
    try
    {
        if (spec.workingDirectory.empty())
        {
            impl_->child = std::make_unique<bp2::process>(
                impl_->executor,
                bp2::filesystem::path{executable->string()},
                spec.arguments,
                bp2::process_environment{env});
        }
        else
        {
            impl_->child = std::make_unique<bp2::process>(
                impl_->executor,
                bp2::filesystem::path{executable->string()},
                spec.arguments,
                bp2::process_environment{env},
                bp2::process_start_dir{spec.workingDirectory.string()});
        }
    }
    catch (boost::system::system_error const& e)
    {
        return std::unexpected(ProcessError{
            .kind = ProcessErrorKind::SpawnFailed,
            .message = e.what(),
            .systemError = e.code().value(),
        });
    }
    return {};
}

std::expected<int, ProcessError> Process::wait()
{
    if (impl_->exitCode)
        return *impl_->exitCode;

    if (!impl_->child)
    {
        return std::unexpected(ProcessError{
            .kind = ProcessErrorKind::WaitFailed,
            .message = "No child process was spawned",
        });
    }

    boost::system::error_code ec;
    const int evaluated = impl_->child->wait(ec);
    if (ec)
    {
        return std::unexpected(ProcessError{
            .kind = ProcessErrorKind::WaitFailed,
            .message = ec.message(),
            .systemError = ec.value(),
        });
    }

    const int code = shellExitCode(impl_->child->native_exit_code(), evaluated);
    impl_->exitCode = code;
    Log::debug("Child {} exited with {}", impl_->child->id(), code);
    return code;
}

std::optional<int> Process::exitCode() const
{
    return impl_->exitCode;
}

bool Process::running() const
{
    return impl_->isRunning();
}
