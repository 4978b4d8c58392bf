#pragma once

#include <map>
#include <string>
#include <vector>

/**
 * Result of running an external program.
 */
struct CommandResult
{
    int exitCode = -1;      // -1 if the program did not exit normally
    int termSignal = 0;     // signal that killed the program, 0 if it exited
    std::string output;     // captured stdout (empty unless captured)
    bool spawnError = false;
    std::string error;      // spawn failure reason

    // Killed by SIGINT or SIGTERM, usually along with linkgrab itself
    bool interrupted() const;
};

struct CommandOptions
{
    // Variables added to (or overriding) the inherited environment
    std::map<std::string, std::string> extraEnv;

    // Capture stdout into CommandResult::output instead of inheriting it
    bool captureOutput = true;
};

/**
 * Run a program found through PATH and wait for it.
 * stderr is always inherited so the program can log to the terminal.
 *
 * @param args argv, args[0] being the program
 */
CommandResult runCommand(const std::vector<std::string> &args, const CommandOptions &options = {});
