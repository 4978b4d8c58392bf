#include "subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace
{
// Inherited environment with extra variables applied on top
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string> &extra)
{
    std::vector<std::string> env;
    for (char **entry = environ; entry && *entry; ++entry)
    {
        std::string variable(*entry);
        auto eq = variable.find('=');
        if (eq != std::string::npos && extra.count(variable.substr(0, eq)))
        {
            continue; // overridden below
        }
        env.push_back(std::move(variable));
    }
    for (const auto &[name, value] : extra)
    {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char *> toPointers(std::vector<std::string> &strings)
{
    std::vector<char *> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto &text : strings)
    {
        pointers.push_back(text.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}
}

bool CommandResult::interrupted() const
{
    return termSignal == SIGINT || termSignal == SIGTERM;
}

CommandResult runCommand(const std::vector<std::string> &args, const CommandOptions &options)
{
    CommandResult result;
    if (args.empty())
    {
        result.spawnError = true;
        result.error = "no command specified";
        return result;
    }

    int pipefd[2] = {-1, -1};
    if (options.captureOutput && ::pipe(pipefd) != 0)
    {
        result.spawnError = true;
        result.error = std::strerror(errno);
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (options.captureOutput)
    {
        posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDOUT_FILENO);
        posix_spawn_file_actions_addclose(&actions, pipefd[0]);
        posix_spawn_file_actions_addclose(&actions, pipefd[1]);
    }

    std::vector<std::string> argStorage(args);
    std::vector<char *> argv = toPointers(argStorage);
    std::vector<std::string> envStorage = buildEnvironment(options.extraEnv);
    std::vector<char *> envp = toPointers(envStorage);

    pid_t pid = -1;
    const int spawnStatus = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    if (options.captureOutput)
    {
        ::close(pipefd[1]);
    }

    if (spawnStatus != 0)
    {
        if (options.captureOutput)
        {
            ::close(pipefd[0]);
        }
        result.spawnError = true;
        result.error = std::strerror(spawnStatus);
        return result;
    }

    if (options.captureOutput)
    {
        std::array<char, 4096> buffer{};
        ssize_t n = 0;
        while ((n = ::read(pipefd[0], buffer.data(), buffer.size())) != 0)
        {
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            result.output.append(buffer.data(), static_cast<std::size_t>(n));
        }
        ::close(pipefd[0]);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            result.spawnError = true;
            result.error = std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status))
    {
        result.exitCode = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.termSignal = WTERMSIG(status);
    }
    return result;
}
