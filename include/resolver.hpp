#pragma once

#include <string>
#include <vector>

#include "cookie_jar.hpp"
#include "resolve_outcome.hpp"

/**
 * Static, per-module transfer behaviour.
 */
struct ModuleCapabilities
{
    // Hosting site honours byte ranges on the final link
    bool supportsResume = false;

    // Final request must carry the cookies gathered during resolution
    bool finalLinkNeedsCookie = false;
};

/**
 * Turns a hosting-site page URL into a direct file URL.
 * One implementation per site (or family of sites).
 */
class Resolver
{
public:
    virtual ~Resolver() = default;

    virtual const std::string &name() const = 0;

    virtual ModuleCapabilities capabilities() const = 0;

    /**
     * Resolve url.
     *
     * @param cookies Jar owned by the current link; the module may fill it
     * @param moduleArgs Options the user passed for modules
     * @param url Hosting page URL (already encoded)
     */
    virtual ResolveOutcome resolve(const CookieJar &cookies,
                                   const std::vector<std::string> &moduleArgs,
                                   const std::string &url) = 0;
};

/**
 * Fallback used when no module matches and --fallback is given:
 * the input URL is downloaded with a plain HTTP GET.
 */
class NullResolver : public Resolver
{
public:
    const std::string &name() const override
    {
        static const std::string moduleName = "module_null";
        return moduleName;
    }

    ModuleCapabilities capabilities() const override { return {}; }

    ResolveOutcome resolve(const CookieJar &,
                           const std::vector<std::string> &,
                           const std::string &url) override
    {
        return ResolveOutcome::success(url);
    }
};
