#include "error_classifier.hpp"
#include "error_kind.hpp"
#include "batch_driver.hpp"
#include "test_helpers.hpp"

int main()
{
    TestReport report("ErrorClassifier");
    const std::string fn = "example_download";

    Classification success = classifyOutcome(ErrorKind::Success, fn);
    report.check(success.action == LinkAction::Transfer, "success falls through to transfer");
    report.check(success.exitKind == ErrorKind::Success && success.message.empty(), "success has no message");

    Classification dead = classifyOutcome(ErrorKind::LinkDead, fn);
    report.check(dead.action == LinkAction::Abort && dead.exitKind == ErrorKind::LinkDead,
                 "dead link aborts with LinkDead");
    report.check(dead.markTag && *dead.markTag == "NOTFOUND", "dead link is tagged NOTFOUND");

    Classification password = classifyOutcome(ErrorKind::PasswordRequired, fn);
    report.check(password.markTag && *password.markTag == "PASSWORD", "password link is tagged PASSWORD");
    report.check(password.message == "You must provide a password", "password message");

    Classification noModule = classifyOutcome(ErrorKind::NoModule, fn);
    report.check(noModule.markTag && *noModule.markTag == "NOMODULE", "no module is tagged NOMODULE");

    Classification login = classifyOutcome(ErrorKind::LoginFailed, fn);
    report.check(login.action == LinkAction::Abort && login.exitKind == ErrorKind::LoginFailed && !login.markTag,
                 "login failure aborts without tag");

    Classification tries = classifyOutcome(ErrorKind::MaxTriesReached, fn);
    report.check(tries.message == "Retry limit reached (example_download)", "retry limit message names the function");

    Classification delay = classifyOutcome(ErrorKind::MaxWaitReached, fn);
    report.check(delay.message == "Delay limit reached (example_download)", "delay limit message");

    Classification captcha = classifyOutcome(ErrorKind::CaptchaFailed, fn);
    report.check(captcha.exitKind == ErrorKind::CaptchaFailed, "captcha failure keeps its code");

    for (ErrorKind kind : {ErrorKind::NeedPermissions, ErrorKind::SystemFailure,
                           ErrorKind::TemporarilyUnavailable, ErrorKind::Interrupted})
    {
        Classification c = classifyOutcome(kind, fn);
        report.check(c.action == LinkAction::Abort && c.exitKind == kind && !c.isError,
                     fmt::format("{} aborts with its own code", errorKindName(kind)));
    }

    for (ErrorKind kind : {ErrorKind::Unclassified, ErrorKind::Network, ErrorKind::Fatal})
    {
        Classification c = classifyOutcome(kind, fn);
        report.check(c.action == LinkAction::Abort && c.exitKind == ErrorKind::Fatal && c.isError,
                     fmt::format("{} is treated as Fatal", errorKindName(kind)));
    }
    report.check(classifyOutcome(ErrorKind::Unclassified, fn).message.find("failed inside example_download()") == 0,
                 "generic message names the function");

    // Exit codes
    report.check(errorKindFromCode(13) == ErrorKind::LinkDead, "code 13 is LinkDead");
    report.check(errorKindFromCode(10) == ErrorKind::TemporarilyUnavailable, "code 10 is TemporarilyUnavailable");
    report.check(errorKindFromCode(9) == ErrorKind::Unclassified, "code 9 is unknown");
    report.check(errorKindFromCode(42) == ErrorKind::Unclassified, "code 42 is unknown");
    report.check(exitCodeOf(ErrorKind::Unclassified) == 1, "unclassified exits as Fatal");
    report.check(exitCodeOf(ErrorKind::LoginFailed) == 4, "LoginFailed exits with 4");

    // Aggregation
    report.check(BatchDriver::aggregateExitCodes({}) == 0, "no failure gives 0");
    report.check(BatchDriver::aggregateExitCodes({4}) == 4, "one failure gives its code");
    report.check(BatchDriver::aggregateExitCodes({13, 4}) == MULTIPLE_FAILURES_BASE + 13,
                 "several failures give base + first code");

    return report.finish();
}
