#pragma once

#include <process/environment.hpp>
#include <process/process_error.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <roar/detail/pimpl_special_functions.hpp>

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ProcessSpec
{
    /// Bare name (looked up on PATH of the environment), relative path (relative to the working directory) or
    /// absolute path.
    std::string executable{};
    std::vector<std::string> arguments{};
    Environment environment{};
    std::filesystem::path workingDirectory{};
};

/**
 * @brief Resolves the executable of a spec the way the child would see it.
 *
 * @return std::optional<std::filesystem::path> std::nullopt if nothing executable is found.
 */
std::optional<std::filesystem::path> findExecutable(
    std::string const& executable,
    Environment const& environment,
    std::filesystem::path const& workingDirectory = {});

/**
 * @brief A single child process that inherits the standard streams of this process.
 */
class Process
{
  public:
    explicit Process(boost::asio::any_io_executor executor);
    ROAR_PIMPL_SPECIAL_FUNCTIONS(Process);

    std::expected<void, ProcessError> spawn(ProcessSpec const& spec);

    /**
     * @brief Blocks until the child exited.
     *
     * @return std::expected<int, ProcessError> The exit code of the child, 128 + N if it was killed by signal N.
     */
    std::expected<int, ProcessError> wait();

    std::optional<int> exitCode() const;
    bool running() const;

  private:
    struct Implementation;
    std::unique_ptr<Implementation> impl_;
};
