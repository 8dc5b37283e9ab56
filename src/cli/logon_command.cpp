#include <erpl_gui/cli/logon_command.hpp>

#include <erpl_gui/config/config_loader.hpp>
#include <erpl_gui/core/log.hpp>
#include <erpl_gui/logon/sap_session.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace erpl_gui {

namespace {

constexpr int kExitSuccess = 0;

std::string DescribeMode(const Credentials& creds) {
    if (creds.mode == LogonMode::Sso) {
        return "SSO";
    }
    return "password (user=" + (creds.user.empty() ? std::string("prompt") : creds.user) + ")";
}

} // anonymous namespace

std::string LogonResultToJson(const LogonResult& result) {
    nlohmann::json j;
    j["success"] = true;
    j["system"] = result.info.system_name;
    j["client"] = result.info.client;
    j["user"] = result.info.user;
    j["language"] = result.info.language;
    j["transaction"] = result.info.transaction;
    j["program"] = result.info.program;
    j["screen_number"] = result.info.screen_number;
    j["response_time_ms"] = result.info.response_time_ms;
    j["connection_index"] = result.session.ConnectionIndex();
    j["session_index"] = result.session.SessionIndex();
    j["initial_screen"] = ToString(result.initial_screen);

    nlohmann::json popups = nlohmann::json::array();
    for (auto kind : result.popups.resolved) {
        popups.push_back(ToString(kind));
    }
    j["popups"] = popups;
    j["status"] = {{"type", MessageTypeCode(result.status.type)},
                   {"text", result.status.text}};

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : result.steps) {
        steps.push_back({{"name", step.step_name},
                         {"outcome", ToString(step.outcome)},
                         {"message", step.message},
                         {"duration_ms", step.duration.count()}});
    }
    j["steps"] = steps;
    j["elapsed_ms"] = result.total_duration.count();
    return j.dump();
}

int RunLogon(const AppConfig& config, CommandContext& ctx) {
    const auto& fmt = ctx.formatter;
    const auto creds = ToCredentials(config);
    const std::string client = creds.client ? creds.client->Value() : "(default)";

    fmt.PrintInfo("Connecting to " + config.logon.system + " / client " + client +
                  "  [" + DescribeMode(creds) + "] ...");

    LogonWorkflow workflow(ctx.locator, ctx.launcher, ctx.clock, ctx.prompt,
                           ToLogonOptions(config));
    auto result = workflow.Connect(config.logon.system, creds);
    if (result.IsErr()) {
        LogError("workflow", result.Error().ToString());
        fmt.PrintError(result.Error());
        return result.Error().ExitCode();
    }

    const auto& logon = result.Value();
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(LogonResultToJson(logon));
        return kExitSuccess;
    }

    fmt.PrintSuccess("Connected: " + logon.info.system_name + " / " +
                     logon.info.client + " / " + logon.info.user);
    fmt.PrintDetail("Session " + std::to_string(logon.session.ConnectionIndex()) + ":" +
                        std::to_string(logon.session.SessionIndex()),
                    {
                        {"Transaction", logon.info.transaction},
                        {"Server", std::to_string(logon.info.response_time_ms) +
                                       " ms response"},
                    });
    return kExitSuccess;
}

int RunListSessions(const AppConfig& /*config*/, CommandContext& ctx) {
    const auto& fmt = ctx.formatter;

    std::vector<ActiveSession> sessions;
    auto engine = ctx.locator.Attach();
    if (engine.IsErr()) {
        LogWarn("session", "SAP Logon not reachable: " + engine.Error().message);
    } else if (engine.Value() == nullptr) {
        LogWarn("session", "SAP Logon not reachable: no scripting engine returned");
    } else {
        auto listed = ListActiveSessions(*engine.Value());
        if (listed.IsErr()) {
            LogWarn("session", "cannot list sessions: " + listed.Error().message);
        } else {
            sessions = std::move(listed).Value();
        }
    }

    if (fmt.IsJsonMode()) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& s : sessions) {
            j.push_back({{"conn_idx", s.connection_index},
                         {"sess_idx", s.session_index},
                         {"system", s.info.system_name},
                         {"client", s.info.client},
                         {"user", s.info.user},
                         {"tcode", s.info.transaction}});
        }
        fmt.PrintJson(j.dump());
        return kExitSuccess;
    }

    if (sessions.empty()) {
        fmt.PrintInfo("No active SAP sessions found.");
        return kExitSuccess;
    }

    fmt.PrintInfo("Active SAP sessions (" + std::to_string(sessions.size()) + "):");
    std::vector<std::vector<std::string>> rows;
    for (const auto& s : sessions) {
        rows.push_back({"[" + std::to_string(s.connection_index) + ":" +
                            std::to_string(s.session_index) + "]",
                        s.info.system_name + "/" + s.info.client,
                        s.info.user,
                        s.info.transaction});
    }
    fmt.PrintTable({"Session", "System", "User", "Tcode"}, rows);
    return kExitSuccess;
}

} // namespace erpl_gui
