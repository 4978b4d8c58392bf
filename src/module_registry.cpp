#include "module_registry.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "external_resolver.hpp"
#include "log.hpp"
#include "url_utils.hpp"

namespace
{
std::vector<std::string> splitWords(const std::string &text)
{
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word)
    {
        words.push_back(word);
    }
    return words;
}

std::vector<std::string> split(const std::string &text, char separator)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true)
    {
        auto pos = text.find(separator, start);
        fields.push_back(url_utils::strip(text.substr(start, pos - start)));
        if (pos == std::string::npos)
        {
            break;
        }
        start = pos + 1;
    }
    return fields;
}

ModuleCapabilities parseFlags(const std::string &flags, const std::string &where)
{
    ModuleCapabilities capabilities;
    if (flags.empty())
    {
        return capabilities;
    }

    for (const auto &flag : split(flags, ','))
    {
        if (flag == "resume")
        {
            capabilities.supportsResume = true;
        }
        else if (flag == "final-cookie")
        {
            capabilities.finalLinkNeedsCookie = true;
        }
        else if (!flag.empty())
        {
            throw std::runtime_error(fmt::format("{}: unknown module flag '{}'", where, flag));
        }
    }
    return capabilities;
}
}

void ModuleRegistry::add(const std::string &urlPattern, std::shared_ptr<Resolver> resolver)
{
    entries_.push_back(Entry{
        std::regex(urlPattern, std::regex::ECMAScript | std::regex::icase),
        std::move(resolver)});
}

Resolver *ModuleRegistry::find(const std::string &url) const
{
    for (const auto &entry : entries_)
    {
        if (std::regex_search(url, entry.pattern))
        {
            return entry.resolver.get();
        }
    }
    return nullptr;
}

std::vector<std::string> ModuleRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &entry : entries_)
    {
        result.push_back(entry.resolver->name());
    }
    return result;
}

ModuleRegistry ModuleRegistry::loadManifest(const std::filesystem::path &manifest,
                                            const std::map<std::string, std::string> &environment)
{
    std::ifstream in(manifest);
    if (!in)
    {
        throw std::runtime_error(fmt::format("Cannot read module manifest: {}", manifest.string()));
    }

    ModuleRegistry registry;
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line))
    {
        ++lineNumber;
        std::string text = url_utils::strip(line);
        if (text.empty() || text.front() == '#')
        {
            continue;
        }

        std::string where = fmt::format("{}:{}", manifest.string(), lineNumber);
        auto fields = splitWords(text);
        if (fields.size() < 3 || fields.size() > 4)
        {
            throw std::runtime_error(
                fmt::format("{}: expected 'name url-regex command [flags]'", where));
        }

        const std::string &name = fields[0];
        const std::string &pattern = fields[1];
        std::string command = fields[2];

        ModuleCapabilities capabilities = parseFlags(fields.size() == 4 ? fields[3] : "", where);

        // "modules/foo" next to the manifest wins over a PATH lookup
        std::filesystem::path commandPath(command);
        if (commandPath.is_relative() && command.find('/') != std::string::npos)
        {
            auto local = manifest.parent_path() / commandPath;
            std::error_code ec;
            if (std::filesystem::exists(local, ec))
            {
                command = local.string();
            }
        }

        try
        {
            registry.add(pattern, std::make_shared<ExternalResolver>(name, command, capabilities, environment));
        }
        catch (const std::regex_error &e)
        {
            throw std::runtime_error(fmt::format("{}: invalid URL pattern '{}': {}", where, pattern, e.what()));
        }

        Log::report("module {}: {} (resume={}, final-cookie={})", name, command,
                    capabilities.supportsResume, capabilities.finalLinkNeedsCookie);
    }

    return registry;
}
