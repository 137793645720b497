#include "core/process_runner.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace
{
    // Owns the spawn attributes for the duration of one launch
    class SpawnFileActions
    {
    public:
        SpawnFileActions() { posix_spawn_file_actions_init(&actions_); }
        ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions_); }
        SpawnFileActions(const SpawnFileActions &) = delete;
        SpawnFileActions &operator=(const SpawnFileActions &) = delete;

        posix_spawn_file_actions_t *get() { return &actions_; }

    private:
        posix_spawn_file_actions_t actions_;
    };

    void closeQuietly(int &fd)
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }
}

std::string ProcessRunner::describe(const std::vector<std::string> &args)
{
    std::string text;
    for (const auto &arg : args)
    {
        if (!text.empty())
            text += ' ';
        text += arg;
    }
    return text;
}

std::string ProcessRunner::run(const std::vector<std::string> &args)
{
    InvocationResult result = invoke(args);
    if (!result.exit_succeeded)
    {
        Logger::warn("ProcessRunner: " + args.front() + " failed with exit code " + std::to_string(result.exit_code));
        std::string diagnostic = result.stdout_combined;
        if (diagnostic.empty())
            diagnostic = args.front() + " exited with status " + std::to_string(result.exit_code);
        throw ExternalToolFailure(result.exit_code, diagnostic);
    }
    return result.stdout_combined;
}

InvocationResult ProcessRunner::invoke(const std::vector<std::string> &args)
{
    if (args.empty())
        throw std::invalid_argument("ProcessRunner: empty argument list");

    Logger::debug("ProcessRunner: executing " + describe(args));

    // Close-on-exec: children spawned concurrently by other requests must not
    // inherit the write end
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0)
    {
        throw ExternalToolFailure(-1, "Failed to create pipe for " + args.front() + ": " + std::strerror(errno));
    }
    int read_fd = fds[0];
    int write_fd = fds[1];

    SpawnFileActions actions;
    posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(actions.get(), write_fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(actions.get(), write_fd, STDERR_FILENO);

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args.front().c_str(), actions.get(), nullptr, argv.data(), environ);
    closeQuietly(write_fd);
    if (rc != 0)
    {
        closeQuietly(read_fd);
        Logger::error("ProcessRunner: failed to launch " + args.front() + ": " + std::strerror(rc));
        throw ExternalToolFailure(127, "Failed to launch " + args.front() + ": " + std::strerror(rc));
    }

    InvocationResult result;
    char buffer[4096];
    for (;;)
    {
        ssize_t n = read(read_fd, buffer, sizeof(buffer));
        if (n > 0)
        {
            result.stdout_combined.append(buffer, static_cast<size_t>(n));
        }
        else if (n == 0)
        {
            break;
        }
        else if (errno != EINTR)
        {
            Logger::warn("ProcessRunner: error reading output of " + args.front() + ": " + std::strerror(errno));
            break;
        }
    }
    closeQuietly(read_fd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw ExternalToolFailure(-1, "Failed to wait for " + args.front() + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    result.exit_succeeded = (result.exit_code == 0);

    Logger::debug("ProcessRunner: " + args.front() + " exited with code " + std::to_string(result.exit_code));
    return result;
}
