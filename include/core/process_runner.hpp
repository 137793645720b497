#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Outcome of one external process invocation
 */
struct InvocationResult
{
    std::string stdout_combined; // stdout and stderr interleaved
    bool exit_succeeded;
    int exit_code;

    InvocationResult() : exit_succeeded(false), exit_code(-1) {}
};

/**
 * @brief Raised when an external tool exits non-zero or cannot be launched
 */
class ExternalToolFailure : public std::runtime_error
{
public:
    static constexpr size_t MAX_OUTPUT_CHARS = 2000;

    ExternalToolFailure(int exit_code, const std::string &output)
        : std::runtime_error(truncate(output)), exit_code_(exit_code) {}

    int exitCode() const { return exit_code_; }

    // Keeps the trailing part, where the tools print their final diagnostics
    static std::string truncate(const std::string &output)
    {
        if (output.size() <= MAX_OUTPUT_CHARS)
            return output;
        return output.substr(output.size() - MAX_OUTPUT_CHARS);
    }

private:
    int exit_code_;
};

/**
 * @brief Runs external commands as discrete argument lists (no shell)
 *
 * Each call spawns one child, blocks until it exits and captures stdout and
 * stderr through a single pipe. Failures are never retried.
 */
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Run a command and return its combined output
     * @param args Program name followed by its arguments
     * @return Combined stdout/stderr text
     * @throws ExternalToolFailure if the process exits non-zero or cannot start
     */
    virtual std::string run(const std::vector<std::string> &args);

    /**
     * @brief Run a command without classifying the exit status
     * @throws ExternalToolFailure only if the process cannot be started
     */
    InvocationResult invoke(const std::vector<std::string> &args);

    static std::string describe(const std::vector<std::string> &args);
};
