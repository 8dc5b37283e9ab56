#pragma once

#include <erpl_gui/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace erpl_gui {

// Fields left unset fall back to built-in defaults when the configuration is
// turned into option structs.
struct LogonConfig {
    std::string system;                       // SAP Logon entry name
    std::optional<SapClient> client;
    std::string user;
    SecretString password;                    // never read from files
    std::optional<std::string> password_env;  // env var name to read password from
    std::optional<std::string> language;      // default "EN"
    std::optional<bool> sso;                  // default true
    std::optional<MultipleLogonChoice> multiple_logon;
};

struct TimingConfig {
    std::optional<int> process_poll_interval_ms;  // 1000
    std::optional<int> process_start_timeout_s;   // 30
    std::optional<int> window_poll_interval_ms;   // 500
    std::optional<int> window_timeout_s;          // 30
    std::optional<int> popup_settle_ms;           // 500
    std::optional<int> popup_max_iterations;      // 5
    std::optional<int> login_settle_ms;           // 2000
};

struct AppConfig {
    LogonConfig logon;
    TimingConfig timings;
    std::vector<std::string> saplogon_paths;  // empty: built-in list
    bool list_sessions = false;
    bool json_output = false;
    int verbosity = 0;                        // -v = 1, -vv = 2
    bool quiet = false;
    std::optional<bool> color;                // unset: detect TTY
};

} // namespace erpl_gui
