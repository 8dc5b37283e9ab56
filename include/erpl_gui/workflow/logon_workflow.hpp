#pragma once

#include <erpl_gui/core/poll.hpp>
#include <erpl_gui/core/result.hpp>
#include <erpl_gui/core/types.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>
#include <erpl_gui/gui/process_launcher.hpp>
#include <erpl_gui/logon/login_driver.hpp>
#include <erpl_gui/logon/popup_resolver.hpp>
#include <erpl_gui/logon/process_bootstrapper.hpp>
#include <erpl_gui/logon/sap_session.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// LogonOptions - every wait and choice of the logon flow. Built from the
// configuration by the caller; the workflow never reads configuration.
// ---------------------------------------------------------------------------
struct LogonOptions {
    BootstrapOptions bootstrap;
    PollOptions window_poll{std::chrono::milliseconds{500},
                            std::chrono::milliseconds{30000}};
    PopupPolicy popups;
    std::chrono::milliseconds login_settle{2000};
    bool synchronous_open = true;
};

// ---------------------------------------------------------------------------
// StepOutcome - outcome for each phase of the workflow.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

std::string ToString(StepOutcome outcome);

// ---------------------------------------------------------------------------
// StepResult - outcome + timing for a single workflow step.
// ---------------------------------------------------------------------------
struct StepResult {
    std::string step_name;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// LogonResult - the verified session plus what it took to get there.
// ---------------------------------------------------------------------------
struct LogonResult {
    SapSession session;
    SessionInfo info;
    ScreenState initial_screen = ScreenState::Unknown;
    PopupReport popups;
    StatusMessage status;
    std::vector<StepResult> steps;
    std::chrono::milliseconds total_duration{0};
};

// ---------------------------------------------------------------------------
// LogonWorkflow - bootstrap -> open -> classify -> login -> popups ->
//                 verify -> attach.
//
// State machine:
//   OPENING -> {LOGIN, MENU, UNKNOWN}
//   LOGIN   -> submit -> settle -> popups -> verify -> re-classify
//   MENU / UNKNOWN    -> popups -> verify
// Any failure is terminal; no partial session is returned.
//
// Takes ownership of nothing. `prompt` may be null for non-interactive runs.
// ---------------------------------------------------------------------------
class LogonWorkflow {
public:
    LogonWorkflow(IScriptingEngineLocator& locator,
                  IProcessLauncher& launcher,
                  IClock& clock,
                  ICredentialPrompt* prompt,
                  LogonOptions options = {});

    ~LogonWorkflow();

    // Non-copyable, non-movable.
    LogonWorkflow(const LogonWorkflow&) = delete;
    LogonWorkflow& operator=(const LogonWorkflow&) = delete;
    LogonWorkflow(LogonWorkflow&&) = delete;
    LogonWorkflow& operator=(LogonWorkflow&&) = delete;

    /// Open `system` (the SAP Logon entry name) and log on.
    [[nodiscard]] Result<LogonResult, Error> Connect(std::string_view system,
                                                     const Credentials& credentials);

    /// Steps of the last Connect(), including the failed one.
    [[nodiscard]] const std::vector<StepResult>& Steps() const noexcept { return steps_; }

private:
    IScriptingEngineLocator& locator_;
    IProcessLauncher& launcher_;
    IClock& clock_;
    ICredentialPrompt* prompt_;
    LogonOptions options_;
    std::vector<StepResult> steps_;

    void Record(std::string name, StepOutcome outcome, std::string message,
                IClock::TimePoint start);
};

} // namespace erpl_gui
