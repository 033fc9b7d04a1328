#pragma once

#include <configuration/launch_options.hpp>
#include <launcher/launch_error.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace SuiteLauncher
{
    /**
     * @brief All paths a launch works with, absolute and computed once. Nothing depends on the current directory
     * after this is built.
     */
    struct Layout
    {
        std::filesystem::path launcherDirectory;
        std::filesystem::path repositoryRoot;
        // The entry for the module search path.
        std::filesystem::path libraryDirectory;
        // As configured, relative to the repository root, this is what the runner gets.
        std::string testDirectory;

        std::filesystem::path absoluteTestDirectory() const
        {
            return repositoryRoot / testDirectory;
        }
    };

    /**
     * @brief Finds the directory that contains the running launcher executable.
     *
     * @param argv0 argv[0], only used where the operating system cannot tell the executable path.
     * @param currentDirectory Base for a relative argv[0].
     */
    std::expected<std::filesystem::path, LaunchError>
    locateLauncherDirectory(std::string const& argv0, std::filesystem::path const& currentDirectory);

    /**
     * @brief Computes the layout. Fails if the repository root is not an existing directory.
     *
     * @param launcherDirectory Absolute directory of the launcher.
     * @param options Fully populated options.
     */
    std::expected<Layout, LaunchError>
    resolveLayout(std::filesystem::path const& launcherDirectory, Configuration::LaunchOptions const& options);
}
