#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "resolver.hpp"

/**
 * Set of known resolvers, dispatched by URL pattern.
 */
class ModuleRegistry
{
public:
    ModuleRegistry() = default;

    /**
     * Register a resolver. Patterns are tried in registration order.
     *
     * @param urlPattern ECMAScript regex, matched case-insensitively
     *                   against any part of the URL
     * @throws std::regex_error if the pattern is invalid
     */
    void add(const std::string &urlPattern, std::shared_ptr<Resolver> resolver);

    /**
     * First resolver whose pattern matches url, or nullptr.
     */
    Resolver *find(const std::string &url) const;

    /**
     * Resolver used when --fallback is given and nothing matches.
     */
    Resolver &fallback() { return fallback_; }

    std::vector<std::string> names() const;
    bool empty() const { return entries_.empty(); }

    /**
     * Load a module manifest.
     *
     * Format, one module per line ('#' comments and blank lines ignored),
     * fields separated by whitespace:
     *     name  url-regex  command  [flags]
     * flags is a comma-separated list of "resume" and "final-cookie".
     * A relative command is resolved against the manifest's directory if
     * such a file exists there.
     *
     * @param manifest Path to the manifest file
     * @param environment Variables exported to every module
     * @throws std::runtime_error on unreadable file or malformed line
     */
    static ModuleRegistry loadManifest(const std::filesystem::path &manifest,
                                       const std::map<std::string, std::string> &environment);

private:
    struct Entry
    {
        std::regex pattern;
        std::shared_ptr<Resolver> resolver;
    };

    std::vector<Entry> entries_;
    NullResolver fallback_;
};
