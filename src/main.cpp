#include <iostream>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <curl/curl.h>

#include "batch_driver.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "link_annotator.hpp"
#include "link_pipeline.hpp"
#include "log.hpp"
#include "module_registry.hpp"
#include "transfer_engine.hpp"
#include "waiter.hpp"

namespace
{
constexpr const char *VERSION = "1.0";

volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int)
{
    gStopRequested = 1;
}

// curl_global_init/cleanup pair for the lifetime of main()
struct CurlGlobal
{
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

int fatal()
{
    return exitCodeOf(ErrorKind::Fatal);
}
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version")
        {
            fmt::print("linkgrab v{}\n", VERSION);
            return 0;
        }
    }

    CLI::App app{"linkgrab - download files from file sharing servers"};

    // Configuration struct to be populated
    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("URL_OR_FILE", config.items, "Links to download, or files containing links")
        ->required();

    app.add_option("-v,--verbose", config.verbose,
                   "Set output verbose level: 0=none, 1=err, 2=notice (default), 3=dbg, 4=report")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("-q,--quiet", config.quiet, "Alias for -v0");

    app.add_flag("-c,--check-link", config.checkLink, "Check if a link exists and return");
    app.add_flag("-m,--mark-downloaded", config.markDownloaded,
                 "Mark downloaded links in (regular) FILE arguments");
    app.add_flag("-x,--no-overwrite", config.noOverwrite, "Do not overwrite existing files");

    app.add_option("-o,--output-directory", config.outputDirectory, "Directory where files will be saved");
    app.add_option("--temp-directory", config.tempDirectory,
                   "Directory where files are temporarily downloaded");
    app.add_option("-l,--limit-rate", config.limitRate,
                   "Limit speed to bytes/sec (suffixes: k=Kb, m=Mb, g=Gb)")
        ->check([](const std::string &speed) -> std::string {
            return parseRateLimit(speed) ? "" : "invalid speed: " + speed;
        });
    app.add_option("-i,--interface", config.networkInterface, "Force IFACE interface");

    app.add_option("-t,--timeout", config.timeoutSeconds, "Timeout after SECS seconds of waits")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-r,--max-retries", config.maxRetries,
                   "Set maximum retries for captcha solving. 0 means no retry. Default is infinite.")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--captchamethod", config.captchaMethod,
                   "Force specific captcha solving method. Available: prompt, none.")
        ->check(CLI::IsMember({"prompt", "none"}));
    app.add_flag("--no-extra-wait", config.noExtraWait,
                 "Do not wait on uncommon events (unavailable file, unallowed parallel downloads, ...)");

    app.add_option("--cookies", config.globalCookies, "Force using specified cookies file")
        ->check(CLI::ExistingFile);

    app.add_flag("--get-module", config.getModule, "Get module(s) for URL(s) and exit");
    app.add_option("--run-download", config.downloadCommand,
                   "Run down command (interpolations: %url, %filename, %cookies) for each link");
    app.add_option("--download-info-only", config.downloadInfo,
                   "Echo string (interpolations: %url, %filename, %cookies) for each link");
    app.add_flag("--fallback", config.moduleFallback,
                 "If no module is found for link, simply download it (HTTP GET)");

    app.add_option("--modules", config.modulesFile, "Module manifest file")
        ->check(CLI::ExistingFile);
    app.add_option("-a,--module-option", config.moduleArgs,
                   "Argument passed to the resolver module (repeatable)");

    app.set_config("--config", "", "Read options from a configuration file");

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("--version", config.showVersion, "Return linkgrab version");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // Verify verbose level
    if (config.quiet)
    {
        config.verbose = 0;
    }
    else if (config.verbose > 4)
    {
        config.verbose = 4;
    }
    Log::setLevel(static_cast<LogLevel>(config.verbose));
    Log::report("linkgrab version {}", VERSION);

    // ====================================================================
    // VALIDATE CONFIGURATION
    // ====================================================================

    if (!config.tempDirectory.empty())
    {
        Log::notice("Temporary directory: {}", config.tempDirectory);
        if (auto error = prepareDirectory(config.tempDirectory); !error.empty())
        {
            Log::error("error: {}", error);
            return fatal();
        }
    }

    if (!config.outputDirectory.empty())
    {
        Log::notice("Output directory: {}", config.outputDirectory);
        if (auto error = prepareDirectory(config.outputDirectory); !error.empty())
        {
            Log::error("error: {}", error);
            return fatal();
        }
    }

    if (config.globalCookies)
    {
        Log::notice("linkgrab: using provided cookies file");
    }
    if (!config.captchaMethod.empty())
    {
        Log::notice("linkgrab: force captcha method ({})", config.captchaMethod);
    }
    if (config.noOverwrite)
    {
        Log::debug("linkgrab: --no-overwrite selected");
    }
    if (config.noExtraWait)
    {
        Log::debug("linkgrab: --no-extra-wait selected");
    }

    std::map<std::string, std::string> moduleEnvironment = {
        {"LINKGRAB_CAPTCHA_METHOD", config.captchaMethod},
        {"LINKGRAB_VERBOSE", std::to_string(config.verbose)}};

    ModuleRegistry registry;
    std::filesystem::path manifest =
        config.modulesFile.empty() ? defaultModulesFile() : std::filesystem::path(config.modulesFile);
    std::error_code ec;
    if (std::filesystem::exists(manifest, ec))
    {
        try
        {
            registry = ModuleRegistry::loadManifest(manifest, moduleEnvironment);
        }
        catch (const std::exception &e)
        {
            Log::error("error: {}", e.what());
            return fatal();
        }
    }
    else
    {
        Log::debug("no module manifest found ({})", manifest.string());
    }

    // ====================================================================
    // PROCESS LINKS
    // ====================================================================

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    try
    {
        CurlGlobal curlGlobal;
        HttpClient client(&gStopRequested);

        std::optional<std::chrono::seconds> waitBudget;
        if (config.timeoutSeconds)
        {
            waitBudget = std::chrono::seconds(*config.timeoutSeconds);
        }
        SleepWaiter waiter(waitBudget, &gStopRequested);

        TransferOptions transferOptions;
        transferOptions.tempDir = config.tempDirectory;
        transferOptions.outputDir = config.outputDirectory;
        transferOptions.noOverwrite = config.noOverwrite;
        transferOptions.maxRestarts = config.maxRetries;
        transferOptions.rateLimit = parseRateLimit(config.limitRate).value_or(0);
        transferOptions.networkInterface = config.networkInterface;
        TransferEngine engine(client, waiter, transferOptions);

        LinkAnnotator annotator(config.markDownloaded, std::cout);

        LinkOptions linkOptions;
        linkOptions.retry.maxRetries = config.maxRetries;
        linkOptions.retry.noExtraWait = config.noExtraWait;
        linkOptions.retry.captchaMethodNone = (config.captchaMethod == "none");
        linkOptions.checkOnly = config.checkLink;
        linkOptions.downloadCommand = config.downloadCommand;
        linkOptions.downloadInfo = config.downloadInfo;
        if (config.globalCookies)
        {
            linkOptions.globalCookies = std::filesystem::path(*config.globalCookies);
        }
        if (!config.tempDirectory.empty())
        {
            linkOptions.scratchDir = config.tempDirectory;
        }
        linkOptions.moduleArgs = config.moduleArgs;
        linkOptions.stopRequested = &gStopRequested;
        LinkPipeline pipeline(linkOptions, engine, waiter, annotator, std::cout);

        BatchOptions batchOptions;
        batchOptions.moduleFallback = config.moduleFallback;
        batchOptions.getModule = config.getModule;
        batchOptions.stopRequested = &gStopRequested;
        BatchDriver driver(registry, pipeline, annotator, client, batchOptions, std::cout);

        return driver.run(config.items);
    }
    catch (const std::exception &e)
    {
        Log::error("Fatal error: {}", e.what());
        return fatal();
    }
}
