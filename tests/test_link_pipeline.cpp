#include <csignal>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "cookie_jar.hpp"
#include "link_pipeline.hpp"
#include "log.hpp"
#include "url_utils.hpp"
#include "test_helpers.hpp"

namespace
{
class ThrowingResolver : public Resolver
{
public:
    const std::string &name() const override
    {
        static const std::string moduleName = "broken";
        return moduleName;
    }
    ModuleCapabilities capabilities() const override { return {}; }
    ResolveOutcome resolve(const CookieJar &, const std::vector<std::string> &, const std::string &) override
    {
        throw std::runtime_error("module crashed");
    }
};

// Stands for a module killed by the same Ctrl-C as linkgrab
class StoppingResolver : public Resolver
{
public:
    StoppingResolver(volatile std::sig_atomic_t &stop, ResolveOutcome outcome)
        : stop_(stop), outcome_(std::move(outcome))
    {
    }

    const std::string &name() const override
    {
        static const std::string moduleName = "stopping";
        return moduleName;
    }
    ModuleCapabilities capabilities() const override { return {}; }
    ResolveOutcome resolve(const CookieJar &, const std::vector<std::string> &, const std::string &) override
    {
        ++calls;
        stop_ = 1;
        return outcome_;
    }

    int calls = 0;

private:
    volatile std::sig_atomic_t &stop_;
    ResolveOutcome outcome_;
};

// Pipeline with fakes around it, writing into its own scratch dirs
struct Harness
{
    ScratchDir scratch;
    ScratchDir outDir;
    FakeTransport transport;
    FakeWaiter waiter;
    std::ostringstream out;
    std::ostringstream marks;
    std::unique_ptr<TransferEngine> engine;
    std::unique_ptr<LinkAnnotator> annotator;
    std::unique_ptr<LinkPipeline> pipeline;

    explicit Harness(LinkOptions options = {}, bool mark = false,
                     std::vector<FakeResponse> script = {{TransferStatus::Completed, 200, "data"}})
        : transport(std::move(script))
    {
        TransferOptions transferOptions;
        transferOptions.outputDir = outDir.path();
        engine = std::make_unique<TransferEngine>(transport, waiter, transferOptions);
        annotator = std::make_unique<LinkAnnotator>(mark, marks);
        options.scratchDir = scratch.path();
        pipeline = std::make_unique<LinkPipeline>(options, *engine, waiter, *annotator, out);
    }
};

LinkItem directItem(const std::string &url)
{
    LinkItem item;
    item.kind = LinkSource::DirectUrl;
    item.url = url;
    item.rawLine = url;
    return item;
}
}

int main()
{
    Log::setLevel(LogLevel::None);
    TestReport report("LinkPipeline");

    // Cookie jar lifecycle
    {
        ScratchDir dir;
        writeFile(dir / "global.txt", "cookie=1\n");
        std::filesystem::path jarPath;
        {
            CookieJar jar = CookieJar::create(dir / "global.txt", dir.path());
            jarPath = jar.path();
            report.check(readFile(jarPath) == "cookie=1\n", "jar seeded from global cookies");

            CookieJar moved = std::move(jar);
            report.check(moved.path() == jarPath && std::filesystem::exists(jarPath), "jar survives a move");
        }
        report.check(!std::filesystem::exists(jarPath), "jar removed on destruction");

        std::filesystem::path removedPath;
        {
            CookieJar removed = CookieJar::create(std::nullopt, dir.path());
            removedPath = removed.path();
            std::filesystem::remove(removedPath);
        }
        report.check(!std::filesystem::exists(removedPath), "jar file deleted behind its back is not an error");

        CookieJar empty = CookieJar::create(std::nullopt, dir.path());
        report.check(std::filesystem::exists(empty.path()) && readFile(empty.path()).empty(), "fresh jar is empty");
        std::filesystem::path copy = empty.keepCopy();
        report.check(copy != empty.path() && copy.parent_path() == dir.path() && std::filesystem::exists(copy),
                     "kept copy is a new file beside the jar");
    }

    // Resolved link downloaded, path printed, jar cleaned up
    {
        Harness h;
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/file.bin?token=1")});
        ErrorKind result = h.pipeline->process(directItem("http://example/f/1"), resolver);

        report.check(result == ErrorKind::Success, "success end to end");
        report.check(h.out.str() == (h.outDir / "file.bin").string() + "\n", "final path printed");
        report.check(readFile(h.outDir / "file.bin") == "data", "file downloaded");
        report.check(h.transport.requests.size() == 1 && resolver.calls == 1, "no retry on success");
        report.check(resolver.cookieFileExisted && !std::filesystem::exists(resolver.lastCookieFile),
                     "cookie jar existed during resolution and is gone after");
        report.check(h.waiter.resets == 1, "wait budget restarted for the link");
    }

    // Suggested filename and module arguments
    {
        LinkOptions options;
        options.moduleArgs = {"--auth", "user:pass"};
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/get.php", std::string("movie.mkv"))});
        h.pipeline->process(directItem("http://example/f/2"), resolver);

        report.check(std::filesystem::exists(h.outDir / "movie.mkv"), "suggested filename used");
        report.check(resolver.lastArgs == options.moduleArgs, "module arguments passed through");
    }

    // Empty direct URL
    {
        Harness h;
        ScriptedResolver resolver("example", {ResolveOutcome::success("")});
        ErrorKind result = h.pipeline->process(directItem("http://example/f/3"), resolver);
        report.check(result == ErrorKind::Fatal && h.transport.requests.empty(), "empty URL is fatal");
    }

    // Terminal failures are classified and marked
    {
        Harness h({}, true);
        ScriptedResolver resolver("example", {ResolveOutcome::failure(ErrorKind::LinkDead)});
        ErrorKind result = h.pipeline->process(directItem("http://example/dead"), resolver);
        report.check(result == ErrorKind::LinkDead, "dead link reports LinkDead");
        report.check(h.marks.str() == "#NOTFOUND http://example/dead\n", "dead link marked NOTFOUND");
        report.check(h.out.str().empty() && h.transport.requests.empty(), "no transfer for a dead link");
    }
    {
        Harness h;
        ScriptedResolver resolver("example", {ResolveOutcome::failure(ErrorKind::Unclassified)});
        report.check(h.pipeline->process(directItem("http://example/odd"), resolver) == ErrorKind::Fatal,
                     "unknown code is fatal");
    }

    // Retry budget exhausted
    {
        LinkOptions options;
        options.retry.maxRetries = 1;
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::failure(ErrorKind::CaptchaFailed)});
        ErrorKind result = h.pipeline->process(directItem("http://example/captcha"), resolver);
        report.check(result == ErrorKind::MaxTriesReached && resolver.calls == 2, "captcha retried then given up");
    }

    // Resolver exception
    {
        Harness h;
        ThrowingResolver resolver;
        report.check(h.pipeline->process(directItem("http://example/x"), resolver) == ErrorKind::SystemFailure,
                     "exception becomes SystemFailure");
    }

    // Check only
    {
        LinkOptions options;
        options.checkOnly = true;
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::failure(ErrorKind::TemporarilyUnavailable, 30)});
        ErrorKind result = h.pipeline->process(directItem("http://example/alive"), resolver);
        report.check(result == ErrorKind::Success && h.out.str() == "http://example/alive\n",
                     "check-link: unavailable link is alive");
        report.check(resolver.calls == 1 && h.waiter.waits.empty() && h.transport.requests.empty(),
                     "check-link: one call, no wait, no transfer");
    }
    {
        LinkOptions options;
        options.checkOnly = true;
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::failure(ErrorKind::LinkDead)});
        report.check(h.pipeline->process(directItem("http://example/dead"), resolver) == ErrorKind::LinkDead &&
                         h.out.str().empty(),
                     "check-link: dead link reported");
    }

    // Download info only
    {
        LinkOptions options;
        options.downloadInfo = "%url -> %filename";
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/a.iso")});
        ErrorKind result = h.pipeline->process(directItem("http://example/i"), resolver);
        report.check(result == ErrorKind::Success && h.out.str() == "http://cdn/a.iso -> a.iso\n",
                     "download info printed");
        report.check(h.transport.requests.empty(), "download info makes no transfer");
    }
    {
        LinkOptions options;
        options.downloadInfo = "%cookies";
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/a.iso")});
        h.pipeline->process(directItem("http://example/i"), resolver);

        std::filesystem::path kept = url_utils::strip(h.out.str());
        report.check(!kept.empty() && std::filesystem::exists(kept), "cookie copy outlives the link");
        report.check(kept != resolver.lastCookieFile, "copy is not the jar itself");

        // A second link in the same run gets its own copy
        h.out.str("");
        h.pipeline->process(directItem("http://example/j"), resolver);
        std::filesystem::path second = url_utils::strip(h.out.str());
        report.check(!second.empty() && second != kept && std::filesystem::exists(kept) &&
                         std::filesystem::exists(second),
                     "each link keeps a separate cookie copy");
    }

    // Suggested filename with a directory part stays in the output directory
    {
        Harness h;
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/x", std::string("../up.bin"))});
        report.check(h.pipeline->process(directItem("http://example/s"), resolver) == ErrorKind::Success &&
                         std::filesystem::exists(h.outDir / ".._up.bin"),
                     "suggested filename flattened into the output directory");
    }

    // Stop requested while the module ran
    {
        volatile std::sig_atomic_t stop = 0;
        LinkOptions options;
        options.stopRequested = &stop;
        options.retry.maxRetries = 5;
        Harness h(options, true);
        StoppingResolver resolver(stop, ResolveOutcome::failure(ErrorKind::CaptchaFailed));
        ErrorKind result = h.pipeline->process(directItem("http://example/stop"), resolver);
        report.check(result == ErrorKind::Interrupted && resolver.calls == 1, "stop after resolution interrupts");
        report.check(h.marks.str().empty() && h.transport.requests.empty(), "interrupted link not marked");
    }

    // External download command
    {
        LinkOptions options;
        options.downloadCommand = "printf '%s' '%url' > '%filename'";
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/c.bin")});
        ErrorKind result = h.pipeline->process(directItem("http://example/c"), resolver);
        report.check(result == ErrorKind::Success, "download command succeeds");
        report.check(readFile(h.outDir / "c.bin") == "http://cdn/c.bin", "command got URL and output path");
        report.check(h.transport.requests.empty(), "built-in transfer skipped");
    }
    {
        LinkOptions options;
        options.downloadCommand = "exit 3";
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/c.bin")});
        report.check(h.pipeline->process(directItem("http://example/c"), resolver) == ErrorKind::Fatal,
                     "failing download command is fatal");
    }
    {
        LinkOptions options;
        options.downloadCommand = "kill -INT $$";
        Harness h(options);
        ScriptedResolver resolver("example", {ResolveOutcome::success("http://cdn/c.bin")});
        report.check(h.pipeline->process(directItem("http://example/c"), resolver) == ErrorKind::Interrupted,
                     "download command killed by SIGINT interrupts");
    }

    return report.finish();
}
