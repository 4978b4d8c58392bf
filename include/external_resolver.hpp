#pragma once

#include <map>
#include <string>
#include <vector>

#include "resolver.hpp"

/**
 * Resolver backed by an external program (one program per hosting site).
 *
 * Invocation: command [module args...] COOKIE_FILE URL
 *
 * The exit status is an ErrorKind code. On success, stdout line 1 is the
 * direct URL and the optional line 2 the filename. On temporary
 * unavailability, stdout line 1 may hold a wait hint in seconds.
 * A program killed by SIGINT or SIGTERM reports ErrorKind::Interrupted.
 */
class ExternalResolver : public Resolver
{
public:
    /**
     * @param name Module name (shown in logs, printed by --get-module)
     * @param command Program path or name looked up in PATH
     * @param capabilities Resume/cookie behaviour of the final link
     * @param environment Variables exported to the program
     */
    ExternalResolver(std::string name,
                     std::string command,
                     ModuleCapabilities capabilities,
                     std::map<std::string, std::string> environment = {});

    const std::string &name() const override { return name_; }
    ModuleCapabilities capabilities() const override { return capabilities_; }
    const std::string &command() const { return command_; }

    ResolveOutcome resolve(const CookieJar &cookies,
                           const std::vector<std::string> &moduleArgs,
                           const std::string &url) override;

    /**
     * Build an outcome from a finished module run.
     * Exposed for tests; resolve() is runCommand() + parseOutput().
     */
    static ResolveOutcome parseOutput(int exitCode, const std::string &output);

private:
    std::string name_;
    std::string command_;
    ModuleCapabilities capabilities_;
    std::map<std::string, std::string> environment_;
};
