#pragma once

#include <process/process.hpp>

#include <boost/asio/io_context.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

class IProcessRunner
{
  public:
    IProcessRunner() = default;
    virtual ~IProcessRunner() = default;
    IProcessRunner(IProcessRunner const&) = default;
    IProcessRunner& operator=(IProcessRunner const&) = default;
    IProcessRunner(IProcessRunner&&) = default;
    IProcessRunner& operator=(IProcessRunner&&) = default;

    /**
     * @brief Runs a child to completion.
     *
     * @param spec What to run, with which environment, where.
     * @return std::expected<int, ProcessError> The exit code of the child or why it could not be run.
     */
    virtual std::expected<int, ProcessError> run(ProcessSpec const& spec) = 0;

    /**
     * @brief Resolves an executable name against the PATH of the given environment.
     */
    virtual std::optional<std::filesystem::path>
    findExecutable(std::string const& executable, Environment const& environment) const = 0;
};

/**
 * @brief Runs children synchronously, one at a time.
 */
class ProcessRunner : public IProcessRunner
{
  public:
    ProcessRunner();

    std::expected<int, ProcessError> run(ProcessSpec const& spec) override;
    std::optional<std::filesystem::path>
    findExecutable(std::string const& executable, Environment const& environment) const override;

  private:
    boost::asio::io_context context_;
};
