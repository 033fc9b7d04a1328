#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace Configuration
{
    struct RequirementsOptions
    {
        // Shell file defining the check function, relative to the launcher directory. Empty: no helper.
        std::optional<std::string> helperScript{std::nullopt};
        std::optional<std::string> helperFunction{std::nullopt};
        std::optional<std::string> shell{std::nullopt};
        std::optional<std::vector<std::string>> requiredExecutables{std::nullopt};

        void useDefaultsFrom(RequirementsOptions const& other);
    };
    void to_json(nlohmann::json& j, RequirementsOptions const& options);
    void from_json(nlohmann::json const& j, RequirementsOptions& options);

    struct RunnerOptions
    {
        std::optional<std::string> command{std::nullopt};
        // Placed before the test directory.
        std::optional<std::vector<std::string>> arguments{std::nullopt};

        void useDefaultsFrom(RunnerOptions const& other);
    };
    void to_json(nlohmann::json& j, RunnerOptions const& options);
    void from_json(nlohmann::json const& j, RunnerOptions& options);

    struct LaunchOptions
    {
        // Relative to the launcher directory.
        std::optional<std::string> repositoryRoot{std::nullopt};
        // Relative to the repository root.
        std::optional<std::string> libraryDirectory{std::nullopt};
        std::optional<std::string> searchPathVariable{std::nullopt};
        // Relative to the repository root, passed to the runner as written.
        std::optional<std::string> testDirectory{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<RequirementsOptions> requirements{std::nullopt};
        std::optional<RunnerOptions> runner{std::nullopt};

        void useDefaultsFrom(LaunchOptions const& other);
    };
    void to_json(nlohmann::json& j, LaunchOptions const& options);
    void from_json(nlohmann::json const& j, LaunchOptions& options);

    /**
     * @brief The options that reproduce the classic shell launcher: PYTHONPATH gets ../appoptics, "nosetests tests/"
     * runs in the repository root after common.sh's check_requirements succeeded.
     */
    LaunchOptions defaultLaunchOptions();
}
