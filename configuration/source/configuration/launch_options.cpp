#include <configuration/launch_options.hpp>

namespace Configuration
{
    void RequirementsOptions::useDefaultsFrom(RequirementsOptions const& other)
    {
        if (!helperScript)
            helperScript = other.helperScript;
        if (!helperFunction)
            helperFunction = other.helperFunction;
        if (!shell)
            shell = other.shell;
        if (!requiredExecutables)
            requiredExecutables = other.requiredExecutables;
    }
    void to_json(nlohmann::json& j, RequirementsOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.helperScript)
        {
            if (options.helperScript->empty())
                j["helperScript"] = nullptr;
            else
                j["helperScript"] = *options.helperScript;
        }
        if (options.helperFunction)
            j["helperFunction"] = *options.helperFunction;
        if (options.shell)
            j["shell"] = *options.shell;
        if (options.requiredExecutables)
            j["requiredExecutables"] = *options.requiredExecutables;
    }
    void from_json(nlohmann::json const& j, RequirementsOptions& options)
    {
        if (j.contains("helperScript"))
        {
            // null disables the helper
            if (j["helperScript"].is_null())
                options.helperScript = std::string{};
            else
                options.helperScript = j["helperScript"].get<std::string>();
        }
        if (j.contains("helperFunction"))
            options.helperFunction = j["helperFunction"].get<std::string>();
        if (j.contains("shell"))
            options.shell = j["shell"].get<std::string>();
        if (j.contains("requiredExecutables"))
            options.requiredExecutables = j["requiredExecutables"].get<std::vector<std::string>>();
    }

    void RunnerOptions::useDefaultsFrom(RunnerOptions const& other)
    {
        if (!command)
            command = other.command;
        if (!arguments)
            arguments = other.arguments;
    }
    void to_json(nlohmann::json& j, RunnerOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.command)
            j["command"] = *options.command;
        if (options.arguments)
            j["arguments"] = *options.arguments;
    }
    void from_json(nlohmann::json const& j, RunnerOptions& options)
    {
        if (j.contains("command"))
            options.command = j["command"].get<std::string>();
        if (j.contains("arguments"))
            options.arguments = j["arguments"].get<std::vector<std::string>>();
    }

    void LaunchOptions::useDefaultsFrom(LaunchOptions const& other)
    {
        if (!repositoryRoot)
            repositoryRoot = other.repositoryRoot;
        if (!libraryDirectory)
            libraryDirectory = other.libraryDirectory;
        if (!searchPathVariable)
            searchPathVariable = other.searchPathVariable;
        if (!testDirectory)
            testDirectory = other.testDirectory;
        if (!logLevel)
            logLevel = other.logLevel;

        if (!requirements)
            requirements = other.requirements;
        else if (other.requirements)
            requirements->useDefaultsFrom(*other.requirements);

        if (!runner)
            runner = other.runner;
        else if (other.runner)
            runner->useDefaultsFrom(*other.runner);
    }
    void to_json(nlohmann::json& j, LaunchOptions const& options)
    {
        j = nlohmann::json::object();
        if (options.repositoryRoot)
            j["repositoryRoot"] = *options.repositoryRoot;
        if (options.libraryDirectory)
            j["libraryDirectory"] = *options.libraryDirectory;
        if (options.searchPathVariable)
            j["searchPathVariable"] = *options.searchPathVariable;
        if (options.testDirectory)
            j["testDirectory"] = *options.testDirectory;
        if (options.logLevel)
            j["logLevel"] = *options.logLevel;
        if (options.requirements)
            j["requirements"] = *options.requirements;
        if (options.runner)
            j["runner"] = *options.runner;
    }
    void from_json(nlohmann::json const& j, LaunchOptions& options)
    {
        if (j.contains("repositoryRoot"))
            options.repositoryRoot = j["repositoryRoot"].get<std::string>();
        if (j.contains("libraryDirectory"))
            options.libraryDirectory = j["libraryDirectory"].get<std::string>();
        if (j.contains("searchPathVariable"))
            options.searchPathVariable = j["searchPathVariable"].get<std::string>();
        if (j.contains("testDirectory"))
            options.testDirectory = j["testDirectory"].get<std::string>();
        if (j.contains("logLevel"))
            options.logLevel = j["logLevel"].get<std::string>();
        if (j.contains("requirements"))
            options.requirements = j["requirements"].get<RequirementsOptions>();
        if (j.contains("runner"))
            options.runner = j["runner"].get<RunnerOptions>();
    }

    LaunchOptions defaultLaunchOptions()
    {
        return LaunchOptions{
            .repositoryRoot = "..",
            .libraryDirectory = "appoptics",
            .searchPathVariable = "PYTHONPATH",
            .testDirectory = "tests/",
            .logLevel = "info",
            .requirements =
                RequirementsOptions{
                    .helperScript = "common.sh",
                    .helperFunction = "check_requirements",
                    .shell = "/bin/bash",
                    .requiredExecutables = std::vector<std::string>{},
                },
            .runner =
                RunnerOptions{
                    .command = "nosetests",
                    .arguments = std::vector<std::string>{},
                },
        };
    }
}
