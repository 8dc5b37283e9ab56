#pragma once

#include <erpl_gui/core/poll.hpp>
#include <erpl_gui/core/result.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>
#include <erpl_gui/gui/process_launcher.hpp>

#include <string>
#include <vector>

namespace erpl_gui {

/// Default SAP Logon install locations, searched in order.
std::vector<std::string> DefaultSapLogonPaths();

struct BootstrapOptions {
    std::vector<std::string> candidate_paths = DefaultSapLogonPaths();
    PollOptions startup_poll{std::chrono::milliseconds{1000},
                             std::chrono::milliseconds{30000}};
};

// ---------------------------------------------------------------------------
// EnsureReady - attach to the running SAP Logon, starting it first if needed.
//
// 1. Attach via the locator. Success returns the engine immediately.
// 2. Otherwise pick the first candidate path that exists on disk and launch
//    it detached. No candidate: Unavailable, listing every searched path.
// 3. Poll Attach() every startup_poll.interval until startup_poll.timeout.
//    Each attempt is a fresh lookup. Deadline passed: Timeout.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ScriptingEnginePtr, Error> EnsureReady(
    IScriptingEngineLocator& locator,
    IProcessLauncher& launcher,
    IClock& clock,
    const BootstrapOptions& options = {});

/// First existing entry of `candidates`, or "" when none exists.
std::string FindSapLogon(const IProcessLauncher& launcher,
                         const std::vector<std::string>& candidates);

} // namespace erpl_gui
