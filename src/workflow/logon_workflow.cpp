#include <erpl_gui/workflow/logon_workflow.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/logon/connection_opener.hpp>
#include <erpl_gui/logon/outcome_verifier.hpp>
#include <erpl_gui/logon/screen_classifier.hpp>

#include <sstream>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "workflow";

std::string DescribePopups(const PopupReport& report) {
    if (report.resolved.empty()) {
        return "no popups";
    }
    std::ostringstream oss;
    for (size_t i = 0; i < report.resolved.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << ToString(report.resolved[i]);
    }
    if (report.exhausted) {
        oss << " (still open)";
    }
    return oss.str();
}

} // namespace

std::string ToString(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped:   return "skipped";
        case StepOutcome::Failed:    return "failed";
    }
    return "failed";
}

LogonWorkflow::LogonWorkflow(IScriptingEngineLocator& locator,
                             IProcessLauncher& launcher,
                             IClock& clock,
                             ICredentialPrompt* prompt,
                             LogonOptions options)
    : locator_(locator),
      launcher_(launcher),
      clock_(clock),
      prompt_(prompt),
      options_(std::move(options)) {}

LogonWorkflow::~LogonWorkflow() = default;

void LogonWorkflow::Record(std::string name, StepOutcome outcome,
                           std::string message, IClock::TimePoint start) {
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_.Now() - start);
    LogDebug(kComponent, name + ": " + ToString(outcome) +
                             (message.empty() ? "" : " - " + message));
    steps_.push_back(StepResult{std::move(name), outcome, std::move(message), duration});
}

Result<LogonResult, Error> LogonWorkflow::Connect(std::string_view system,
                                                  const Credentials& credentials) {
    steps_.clear();
    const auto total_start = clock_.Now();
    auto fail = [&](Error error, const char* step, IClock::TimePoint start) {
        Record(step, StepOutcome::Failed, error.message, start);
        return Result<LogonResult, Error>::Err(std::move(error));
    };

    // Step 1: SAP Logon running and scriptable.
    auto start = clock_.Now();
    auto engine = EnsureReady(locator_, launcher_, clock_, options_.bootstrap);
    if (engine.IsErr()) {
        return fail(std::move(engine).Error(), "bootstrap", start);
    }
    auto app = std::move(engine).Value();
    Record("bootstrap", StepOutcome::Completed, "", start);

    // Step 2: New connection with a queryable main window.
    start = clock_.Now();
    auto opened = OpenConnection(*app, system, clock_, options_.window_poll,
                                 options_.synchronous_open);
    if (opened.IsErr()) {
        return fail(std::move(opened).Error(), "open", start);
    }
    auto session = opened.Value().session;
    Record("open", StepOutcome::Completed, opened.Value().window_title, start);

    // Step 3: Which screen did we land on?
    start = clock_.Now();
    const auto screen = ClassifyScreen(*session);
    LogInfo(kComponent, "screen after OpenConnection: " + ToString(screen));
    Record("classify", StepOutcome::Completed, ToString(screen), start);

    // Step 4: Logon screen.
    start = clock_.Now();
    if (screen == ScreenState::Login) {
        auto submitted = SubmitLogin(*session, credentials, system, prompt_);
        if (submitted.IsErr()) {
            return fail(std::move(submitted).Error(), "login", start);
        }
        clock_.SleepFor(options_.login_settle);
        Record("login", StepOutcome::Completed, ToString(credentials.mode), start);
    } else if (screen == ScreenState::Menu) {
        LogInfo(kComponent, "authenticated automatically - no logon screen");
        Record("login", StepOutcome::Skipped, "already logged on", start);
    } else {
        LogWarn(kComponent, "unexpected screen state - attempting to continue");
        Record("login", StepOutcome::Skipped, "unexpected screen", start);
    }

    // Step 5: Post-logon dialogs.
    start = clock_.Now();
    auto popups = DrainPopups(*session, clock_, options_.popups);
    Record("popups", StepOutcome::Completed, DescribePopups(popups), start);

    // Step 6: Status bar.
    start = clock_.Now();
    auto verified = VerifyLogin(*session);
    if (verified.IsErr()) {
        auto error = std::move(verified).Error();
        error.target = std::string(system);
        return fail(std::move(error), "verify", start);
    }
    auto status = std::move(verified).Value();

    // A rejected logon can leave the logon screen up without an error message.
    if (ClassifyScreen(*session) == ScreenState::Login) {
        Error error;
        error.operation = "VerifyLogin";
        error.target = std::string(system);
        error.message = "Login failed: logon screen still displayed";
        error.hint = "Check username / password / client / system availability.";
        error.category = ErrorCategory::LoginFailed;
        return fail(std::move(error), "verify", start);
    }
    Record("verify", StepOutcome::Completed, MessageTypeCode(status.type), start);

    // Step 7: Wrap. The connection just opened is the last one.
    start = clock_.Now();
    auto count = app->ConnectionCount();
    if (count.IsErr()) {
        return fail(std::move(count).Error(), "attach", start);
    }
    if (count.Value() == 0) {
        Error error;
        error.operation = "AttachSession";
        error.target = std::string(system);
        error.message = "connection disappeared after logon";
        error.category = ErrorCategory::Unavailable;
        return fail(std::move(error), "attach", start);
    }
    auto attached = SapSession::Attach(app, count.Value() - 1, 0);
    if (attached.IsErr()) {
        return fail(std::move(attached).Error(), "attach", start);
    }
    auto sap = std::move(attached).Value();

    SessionInfo info = sap.Info().ValueOr(SessionInfo{});
    LogInfo(kComponent, "Connected - system=" + info.system_name +
                            ", client=" + info.client + ", user=" + info.user +
                            ", transaction=" + info.transaction);
    Record("attach", StepOutcome::Completed,
           std::to_string(sap.ConnectionIndex()) + ":" +
               std::to_string(sap.SessionIndex()),
           start);

    const auto total = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_.Now() - total_start);
    return Result<LogonResult, Error>::Ok(LogonResult{
        std::move(sap), std::move(info), screen, std::move(popups),
        std::move(status), steps_, total});
}

} // namespace erpl_gui
