#pragma once

#include <erpl_gui/cli/output_formatter.hpp>
#include <erpl_gui/config/app_config.hpp>
#include <erpl_gui/core/poll.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>
#include <erpl_gui/gui/process_launcher.hpp>
#include <erpl_gui/logon/login_driver.hpp>
#include <erpl_gui/workflow/logon_workflow.hpp>

#include <string>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// CommandContext - the outside world a CLI command talks to. References must
// outlive the call; prompt may be null.
// ---------------------------------------------------------------------------
struct CommandContext {
    IScriptingEngineLocator& locator;
    IProcessLauncher& launcher;
    IClock& clock;
    ICredentialPrompt* prompt;
    const OutputFormatter& formatter;
};

// Log on to config.logon.system and report the session. Returns the exit code.
int RunLogon(const AppConfig& config, CommandContext& ctx);

// List the sessions of a running SAP Logon without starting it. Returns the
// exit code.
int RunListSessions(const AppConfig& config, CommandContext& ctx);

// JSON document describing a successful logon.
std::string LogonResultToJson(const LogonResult& result);

} // namespace erpl_gui
