#include <erpl_gui/logon/process_bootstrapper.hpp>

#include <erpl_gui/core/log.hpp>

#include <sstream>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "bootstrap";

} // namespace

std::vector<std::string> DefaultSapLogonPaths() {
    return {
        R"(C:\Program Files (x86)\SAP\FrontEnd\SAPgui\saplogon.exe)",
        R"(C:\Program Files\SAP\FrontEnd\SAPgui\saplogon.exe)",
        R"(C:\Program Files (x86)\SAP\SAPLogon\saplogon.exe)",
    };
}

std::string FindSapLogon(const IProcessLauncher& launcher,
                         const std::vector<std::string>& candidates) {
    for (const auto& path : candidates) {
        if (launcher.IsFile(path)) {
            return path;
        }
    }
    return "";
}

Result<ScriptingEnginePtr, Error> EnsureReady(
    IScriptingEngineLocator& locator,
    IProcessLauncher& launcher,
    IClock& clock,
    const BootstrapOptions& options) {

    // An Ok attach without an engine counts as not reachable.
    auto attached = locator.Attach();
    if (attached.IsOk() && attached.Value() != nullptr) {
        LogDebug(kComponent, "SAP Logon already running");
        return attached;
    }
    const std::string reason = attached.IsErr() ? attached.Error().message
                                                : "no scripting engine returned";
    LogInfo(kComponent, "SAP Logon not reachable (" + reason +
                            "), looking for saplogon.exe");

    const auto exe = FindSapLogon(launcher, options.candidate_paths);
    if (exe.empty()) {
        std::ostringstream searched;
        for (const auto& path : options.candidate_paths) {
            searched << "\n  " << path;
        }
        Error error;
        error.operation = "EnsureReady";
        error.target = "saplogon.exe";
        error.message = "saplogon.exe not found. Searched:" + searched.str();
        error.hint = "Start SAP Logon manually, or list its location under "
                     "saplogon_paths in the config file.";
        error.category = ErrorCategory::Unavailable;
        return Result<ScriptingEnginePtr, Error>::Err(std::move(error));
    }

    LogInfo(kComponent, "starting " + exe);
    auto launched = launcher.LaunchDetached(exe);
    if (launched.IsErr()) {
        return Result<ScriptingEnginePtr, Error>::Err(std::move(launched).Error());
    }

    ScriptingEnginePtr engine;
    const auto stats = PollUntil(clock, options.startup_poll, [&]() {
        auto attempt = locator.Attach();
        if (attempt.IsErr()) {
            return false;
        }
        engine = std::move(attempt).Value();
        return engine != nullptr;
    });

    if (stats.outcome == PollOutcome::TimedOut) {
        Error error;
        error.operation = "EnsureReady";
        error.target = exe;
        error.message = "SAP Logon did not become reachable within " +
                        std::to_string(options.startup_poll.timeout.count() / 1000) + "s";
        error.hint = "Check that scripting is enabled: SAP GUI Options > "
                     "Accessibility & Scripting > Scripting.";
        error.category = ErrorCategory::Timeout;
        return Result<ScriptingEnginePtr, Error>::Err(std::move(error));
    }

    LogInfo(kComponent, "SAP Logon ready after " + std::to_string(stats.attempts) +
                            " attempt(s)");
    return Result<ScriptingEnginePtr, Error>::Ok(std::move(engine));
}

} // namespace erpl_gui
