#include <csignal>
#include <memory>
#include <sstream>

#include "batch_driver.hpp"
#include "external_resolver.hpp"
#include "log.hpp"
#include "test_helpers.hpp"

namespace
{
volatile std::sig_atomic_t gStop = 0;

void onSignal(int)
{
    gStop = 1;
}

// Registry, pipeline and driver around fakes
struct Batch
{
    ScratchDir scratch;
    ScratchDir outDir;
    FakeTransport transport{{{TransferStatus::Completed, 200, "data"}}};
    FakeWaiter waiter;
    std::ostringstream out;
    ModuleRegistry registry;
    std::unique_ptr<TransferEngine> engine;
    std::unique_ptr<LinkAnnotator> annotator;
    std::unique_ptr<LinkPipeline> pipeline;
    std::unique_ptr<BatchDriver> driver;

    explicit Batch(BatchOptions batchOptions = {}, bool mark = true)
    {
        gStop = 0;
        batchOptions.stopRequested = &gStop;

        TransferOptions transferOptions;
        transferOptions.outputDir = outDir.path();
        engine = std::make_unique<TransferEngine>(transport, waiter, transferOptions);
        annotator = std::make_unique<LinkAnnotator>(mark, out);

        LinkOptions linkOptions;
        linkOptions.scratchDir = scratch.path();
        linkOptions.stopRequested = &gStop;
        pipeline = std::make_unique<LinkPipeline>(linkOptions, *engine, waiter, *annotator, out);
        driver = std::make_unique<BatchDriver>(registry, *pipeline, *annotator, transport, batchOptions, out);
    }

    std::shared_ptr<ScriptedResolver> addModule(const std::string &name, const std::string &pattern,
                                                std::vector<ResolveOutcome> script)
    {
        auto resolver = std::make_shared<ScriptedResolver>(name, std::move(script));
        registry.add(pattern, resolver);
        return resolver;
    }
};
}

int main()
{
    Log::setLevel(LogLevel::None);
    TestReport report("BatchDriver");

    // Dead link listed in a file
    {
        Batch batch;
        batch.addModule("deadhost", "^https?://deadhost\\.example/", {ResolveOutcome::failure(ErrorKind::LinkDead)});
        auto list = batch.scratch / "links.txt";
        writeFile(list, "http://deadhost.example/file/1\n");

        int code = batch.driver->run({list.string()});
        report.check(code == 13, "single dead link exits with 13");
        report.check(readFile(list) == "#NOTFOUND http://deadhost.example/file/1\n", "dead link marked in its file");
    }

    // Successful link
    {
        Batch batch;
        auto module = batch.addModule("goodhost", "goodhost\\.example",
                                      {ResolveOutcome::success("http://cdn.example/movie.avi")});
        int code = batch.driver->run({"http://goodhost.example/f/9"});
        auto expected = (batch.outDir / "movie.avi").string();

        report.check(code == 0, "successful link exits with 0");
        report.check(batch.out.str().find(expected + "\n") == 0, "final path emitted first");
        report.check(batch.out.str().find("# http://goodhost.example/f/9\n") != std::string::npos,
                     "command-line link mark printed");
        report.check(module->calls == 1 && batch.transport.requests.size() == 1 && batch.waiter.waits.empty(),
                     "no retry on 200");
    }

    // One failure among two links: that failure's code
    {
        Batch batch;
        batch.addModule("loginhost", "loginhost", {ResolveOutcome::failure(ErrorKind::LoginFailed)});
        batch.addModule("goodhost", "goodhost", {ResolveOutcome::success("http://cdn.example/a.bin")});

        int code = batch.driver->run({"http://loginhost.example/1", "http://goodhost.example/2"});
        report.check(code == 4, "login failure + success exits with 4");
        report.check(batch.driver->failures() == std::vector<int>{4}, "one failure recorded");
    }

    // Two failures: multiple-failure base plus the first code
    {
        Batch batch;
        batch.addModule("deadhost", "deadhost", {ResolveOutcome::failure(ErrorKind::LinkDead)});
        batch.addModule("loginhost", "loginhost", {ResolveOutcome::failure(ErrorKind::LoginFailed)});

        int code = batch.driver->run({"http://deadhost.example/1", "http://loginhost.example/2"});
        report.check(code == MULTIPLE_FAILURES_BASE + 13, "two failures exit with 113");
    }

    // No module
    {
        Batch batch;
        int code = batch.driver->run({"http://unknown.example/x"});
        report.check(code == 2, "no module exits with 2");
        report.check(batch.out.str() == "#NOMODULE http://unknown.example/x\n", "NOMODULE mark printed");
        report.check(batch.transport.probes.size() == 1, "redirection probed once");
    }

    // Redirection to a known module
    {
        Batch batch;
        auto module = batch.addModule("goodhost", "goodhost", {ResolveOutcome::success("http://cdn.example/r.bin")});
        batch.transport.redirects["http://short.example/abc"] = "http://goodhost.example/real";

        int code = batch.driver->run({"http://short.example/abc"});
        report.check(code == 0, "redirected link downloaded");
        report.check(module->urls == std::vector<std::string>{"http://goodhost.example/real"},
                     "module resolved the redirection target");
    }

    // Fallback: plain GET of the input URL
    {
        BatchOptions options;
        options.moduleFallback = true;
        Batch batch(options, false);
        int code = batch.driver->run({"http://plain.example/dir/file.txt"});
        report.check(code == 0, "fallback download succeeds");
        report.check(batch.transport.requests.size() == 1 &&
                         batch.transport.requests[0].url == "http://plain.example/dir/file.txt",
                     "fallback fetches the input URL");
        report.check(std::filesystem::exists(batch.outDir / "file.txt"), "fallback file written");
    }

    // --get-module
    {
        BatchOptions options;
        options.getModule = true;
        Batch batch(options, false);
        auto module = batch.addModule("goodhost", "goodhost", {ResolveOutcome::success("http://cdn.example/a")});

        int code = batch.driver->run({"http://goodhost.example/1", "http://goodhost.example/2"});
        report.check(code == 0 && batch.out.str() == "goodhost\ngoodhost\n", "module name printed per link");
        report.check(module->calls == 0 && batch.transport.requests.empty(), "get-module does not download");
    }

    // Interrupted link stops the batch
    {
        Batch batch;
        auto stopper = batch.addModule("stophost", "stophost", {ResolveOutcome::failure(ErrorKind::Interrupted)});
        auto next = batch.addModule("goodhost", "goodhost", {ResolveOutcome::success("http://cdn.example/a")});

        int code = batch.driver->run({"http://stophost.example/1", "http://goodhost.example/2"});
        report.check(code == 130, "interrupt exits with 130");
        report.check(stopper->calls == 1 && next->calls == 0, "links after an interrupt are skipped");
    }

    // Ctrl-C reaching a module process: the module dies, the batch stops
    {
        Batch batch;
        auto script = batch.scratch / "ctrl-c.sh";
        writeFile(script, "#!/bin/sh\nkill -INT $PPID\nkill -INT $$\n");
        std::filesystem::permissions(script, std::filesystem::perms::owner_all);
        batch.registry.add("stophost", std::make_shared<ExternalResolver>("stophost", script.string(),
                                                                          ModuleCapabilities{}));
        auto next = batch.addModule("goodhost", "goodhost", {ResolveOutcome::success("http://cdn.example/a")});

        auto previous = std::signal(SIGINT, onSignal);
        int code = batch.driver->run(
            {"http://stophost.example/1", "http://goodhost.example/2", "http://goodhost.example/3"});
        std::signal(SIGINT, previous);

        report.check(gStop == 1, "signal reached linkgrab");
        report.check(code == 130, "killed module exits with 130");
        report.check(next->calls == 0 && batch.transport.requests.empty(), "remaining links skipped");
    }

    // Stop already requested when the batch starts
    {
        Batch batch;
        auto first = batch.addModule("goodhost", "goodhost", {ResolveOutcome::success("http://cdn.example/a")});
        gStop = 1;
        int code = batch.driver->run({"http://goodhost.example/1", "http://goodhost.example/2"});
        report.check(code == 130 && first->calls == 0, "pending stop prevents any link");
    }

    // Mixed file: comments skipped, every link processed in order
    {
        Batch batch;
        auto module = batch.addModule("goodhost", "goodhost", {ResolveOutcome::success("http://cdn.example/m.bin")});
        auto list = batch.scratch / "mixed.txt";
        writeFile(list, "# header\nhttp://goodhost.example/1\n\n#NOTFOUND http://goodhost.example/old\nhttp://goodhost.example/2\n");

        batch.driver->run({list.string()});
        report.check(module->urls == std::vector<std::string>{"http://goodhost.example/1", "http://goodhost.example/2"},
                     "only live lines processed");
    }

    return report.finish();
}
