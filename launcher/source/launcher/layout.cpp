#include <launcher/layout.hpp>
#include <launcher/exit_code.hpp>

#include <log/log.hpp>
#include <process/process.hpp>

#include <system_error>

namespace SuiteLauncher
{
    namespace
    {
        LaunchError directoryError(std::string message)
        {
            return LaunchError{
                .kind = LaunchErrorKind::DirectoryResolution,
                .message = std::move(message),
                .exitCode = ExitCode::DirectoryResolution,
            };
        }

        std::expected<std::filesystem::path, LaunchError> parentOfExecutable(std::filesystem::path const& executable)
        {
            std::error_code ec;
            const auto canonical = std::filesystem::canonical(executable, ec);
            if (ec)
                return std::unexpected(directoryError(
                    fmt::format("Cannot resolve launcher path '{}': {}", executable.string(), ec.message())));
            return canonical.parent_path();
        }

        // "/a/b/.." normalizes to "/a/"
        std::filesystem::path normalized(std::filesystem::path const& path)
        {
            auto result = path.lexically_normal();
            if (!result.has_filename() && result.has_relative_path())
                result = result.parent_path();
            return result;
        }
    }

    std::expected<std::filesystem::path, LaunchError>
    locateLauncherDirectory(std::string const& argv0, std::filesystem::path const& currentDirectory)
    {
#ifdef __linux__
        {
            std::error_code ec;
            const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
            if (!ec && !self.empty())
                return parentOfExecutable(self);
            Log::debug("/proc/self/exe is not readable ({}), falling back to argv[0]", ec.message());
        }
#endif
        if (argv0.empty())
            return std::unexpected(directoryError("argv[0] is empty, cannot locate the launcher"));

        const std::filesystem::path asPath{argv0};
        if (asPath.has_parent_path())
            return parentOfExecutable(asPath.is_absolute() ? asPath : currentDirectory / asPath);

        Environment environment{};
        environment.loadFromCurrent();
        const auto found = findExecutable(argv0, environment);
        if (!found)
            return std::unexpected(directoryError(fmt::format("'{}' is not on PATH, cannot locate the launcher", argv0)));
        return parentOfExecutable(*found);
    }

    std::expected<Layout, LaunchError>
    resolveLayout(std::filesystem::path const& launcherDirectory, Configuration::LaunchOptions const& options)
    {
        if (!launcherDirectory.is_absolute())
            return std::unexpected(
                directoryError(fmt::format("Launcher directory '{}' is not absolute", launcherDirectory.string())));

        const auto repositoryRoot = normalized(launcherDirectory / options.repositoryRoot.value());

        std::error_code ec;
        if (!std::filesystem::is_directory(repositoryRoot, ec))
        {
            return std::unexpected(directoryError(fmt::format(
                "Repository root '{}' is not a directory{}",
                repositoryRoot.string(),
                ec ? ": " + ec.message() : std::string{})));
        }

        Layout layout{
            .launcherDirectory = launcherDirectory,
            .repositoryRoot = repositoryRoot,
            .libraryDirectory = normalized(repositoryRoot / options.libraryDirectory.value()),
            .testDirectory = options.testDirectory.value(),
        };

        Log::debug(
            "Layout: launcher '{}', root '{}', library '{}', tests '{}'",
            layout.launcherDirectory.string(),
            layout.repositoryRoot.string(),
            layout.libraryDirectory.string(),
            layout.testDirectory);
        return layout;
    }
}
