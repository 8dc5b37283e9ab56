#include <erpl_gui/config/config_loader.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace erpl_gui {

namespace {

using std::chrono::milliseconds;

Error MakeConfigError(const std::string& message) {
    Error error;
    error.operation = "ConfigLoader";
    error.message = message;
    error.category = ErrorCategory::Config;
    return error;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<MultipleLogonChoice> ParseMultipleLogon(const std::string& value) {
    const auto lower = ToLower(value);
    if (lower == "keep" || lower == "continue") {
        return MultipleLogonChoice::ContinueKeepOthers;
    }
    if (lower == "terminate") {
        return MultipleLogonChoice::ContinueTerminateOthers;
    }
    return std::nullopt;
}

// Copy an int timing from YAML when present.
void ReadTiming(const YAML::Node& node, const char* key, std::optional<int>& target) {
    if (node[key]) {
        target = node[key].as<int>();
    }
}

template <typename T>
void Override(std::optional<T>& target, const std::optional<T>& source) {
    if (source.has_value()) {
        target = source;
    }
}

milliseconds Millis(const std::optional<int>& value, int fallback) {
    return milliseconds{value.value_or(fallback)};
}

milliseconds Seconds(const std::optional<int>& value, int fallback) {
    return milliseconds{static_cast<long long>(value.value_or(fallback)) * 1000};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;

    try {
        // -- Logon --
        if (root["logon"]) {
            const auto& logon = root["logon"];
            if (logon["password"]) {
                return Result<AppConfig, Error>::Err(MakeConfigError(
                    "Passwords are not read from config files; use password_env"));
            }
            if (logon["system"]) {
                config.logon.system = logon["system"].as<std::string>();
            }
            if (logon["client"]) {
                auto client_str = logon["client"].as<std::string>();
                if (!client_str.empty()) {
                    auto client_result = SapClient::Create(client_str);
                    if (client_result.IsErr()) {
                        return Result<AppConfig, Error>::Err(
                            MakeConfigError("Invalid SAP client: " + client_result.Error()));
                    }
                    config.logon.client = std::move(client_result).Value();
                }
            }
            if (logon["user"]) {
                config.logon.user = logon["user"].as<std::string>();
            }
            if (logon["password_env"]) {
                config.logon.password_env = logon["password_env"].as<std::string>();
            }
            if (logon["language"]) {
                config.logon.language = logon["language"].as<std::string>();
            }
            if (logon["sso"]) {
                config.logon.sso = logon["sso"].as<bool>();
            }
            if (logon["multiple_logon"]) {
                const auto value = logon["multiple_logon"].as<std::string>();
                auto choice = ParseMultipleLogon(value);
                if (!choice.has_value()) {
                    return Result<AppConfig, Error>::Err(MakeConfigError(
                        "Invalid multiple_logon '" + value + "' (expected keep or terminate)"));
                }
                config.logon.multiple_logon = *choice;
            }
        }

        // -- Timings --
        if (root["timings"]) {
            const auto& t = root["timings"];
            ReadTiming(t, "process_poll_interval_ms", config.timings.process_poll_interval_ms);
            ReadTiming(t, "process_start_timeout_s", config.timings.process_start_timeout_s);
            ReadTiming(t, "window_poll_interval_ms", config.timings.window_poll_interval_ms);
            ReadTiming(t, "window_timeout_s", config.timings.window_timeout_s);
            ReadTiming(t, "popup_settle_ms", config.timings.popup_settle_ms);
            ReadTiming(t, "popup_max_iterations", config.timings.popup_max_iterations);
            ReadTiming(t, "login_settle_ms", config.timings.login_settle_ms);
        }

        // -- SAP Logon locations --
        if (root["saplogon_paths"]) {
            for (const auto& path : root["saplogon_paths"]) {
                config.saplogon_paths.push_back(path.as<std::string>());
            }
        }

        // -- Options --
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbosity = root["verbose"].as<bool>() ? 1 : 0;
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    LogDebug("config", "loaded " + std::string(file_path));
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::optional<std::string>* config_path) {
    // -v is taken by --verbose; --version is added below.
    argparse::ArgumentParser program("erpl-gui", kVersion,
                                     argparse::default_arguments::help);
    program.add_description("Open a new SAP GUI session from SAP Logon and log on.");
    program.add_epilog(
        "Examples:\n"
        "  erpl-gui --system \"DEV SSO\" --client 100       SSO logon\n"
        "  erpl-gui --system DEV --no-sso --user JDOE     password logon\n"
        "  erpl-gui --list                                active sessions");

    int verbosity = 0;

    // Logon flags
    program.add_argument("--system")
        .help("SAP Logon entry name (exact, case-sensitive)");
    program.add_argument("--client")
        .help("SAP client (3 digits)");
    program.add_argument("--user")
        .help("SAP username (prompted if missing; ignored for SSO)");
    program.add_argument("--language")
        .help("Logon language (default EN)");
    program.add_argument("--no-sso")
        .help("Use username + password instead of SSO")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--password-env")
        .help("Environment variable containing the SAP password");
    program.add_argument("--terminate-other-sessions")
        .help("Answer the multiple logon dialog by ending other sessions")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--list")
        .help("List active SAP sessions and exit")
        .default_value(false)
        .implicit_value(true);

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--timeout")
        .help("Seconds to wait for the SAP window")
        .scan<'i', int>();
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("-q", "--quiet")
        .help("Errors only")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--system")) {
        config.logon.system = *val;
    }
    if (auto val = program.present("--client")) {
        auto client_result = SapClient::Create(*val);
        if (client_result.IsErr()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --client: " + client_result.Error()));
        }
        config.logon.client = std::move(client_result).Value();
    }
    if (auto val = program.present("--user")) {
        config.logon.user = *val;
    }
    if (auto val = program.present("--language")) {
        config.logon.language = *val;
    }
    if (program.get<bool>("--no-sso")) {
        config.logon.sso = false;
    }
    if (auto val = program.present("--password-env")) {
        config.logon.password_env = *val;
    }
    if (program.get<bool>("--terminate-other-sessions")) {
        config.logon.multiple_logon = MultipleLogonChoice::ContinueTerminateOthers;
    }
    if (program.get<bool>("--list")) {
        config.list_sessions = true;
    }

    if (auto val = program.present("--config")) {
        if (config_path != nullptr) {
            *config_path = *val;
        }
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timings.window_timeout_s = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    config.verbosity = verbosity;
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    // Logon overrides
    const auto& cli = cli_overrides.logon;
    if (!cli.system.empty()) {
        merged.logon.system = cli.system;
    }
    Override(merged.logon.client, cli.client);
    if (!cli.user.empty()) {
        merged.logon.user = cli.user;
    }
    if (!cli.password.Empty()) {
        merged.logon.password = cli.password;
    }
    Override(merged.logon.password_env, cli.password_env);
    Override(merged.logon.language, cli.language);
    Override(merged.logon.sso, cli.sso);
    Override(merged.logon.multiple_logon, cli.multiple_logon);

    // Timings
    const auto& t = cli_overrides.timings;
    Override(merged.timings.process_poll_interval_ms, t.process_poll_interval_ms);
    Override(merged.timings.process_start_timeout_s, t.process_start_timeout_s);
    Override(merged.timings.window_poll_interval_ms, t.window_poll_interval_ms);
    Override(merged.timings.window_timeout_s, t.window_timeout_s);
    Override(merged.timings.popup_settle_ms, t.popup_settle_ms);
    Override(merged.timings.popup_max_iterations, t.popup_max_iterations);
    Override(merged.timings.login_settle_ms, t.login_settle_ms);

    if (!cli_overrides.saplogon_paths.empty()) {
        merged.saplogon_paths = cli_overrides.saplogon_paths;
    }

    // Options
    if (cli_overrides.list_sessions) {
        merged.list_sessions = true;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbosity > 0) {
        merged.verbosity = cli_overrides.verbosity;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    Override(merged.color, cli_overrides.color);

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config) {
    if (config.logon.password.Empty() && config.logon.password_env.has_value()) {
        const auto& env_var = *config.logon.password_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.logon.password = SecretString(env_val);
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (!config.list_sessions && config.logon.system.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: system"));
    }
    if (config.logon.language.has_value() && config.logon.language->size() > 2) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid language '" + *config.logon.language + "' (at most 2 characters)"));
    }

    const auto& t = config.timings;
    const std::pair<const char*, const std::optional<int>*> timings[] = {
        {"process_poll_interval_ms", &t.process_poll_interval_ms},
        {"process_start_timeout_s", &t.process_start_timeout_s},
        {"window_poll_interval_ms", &t.window_poll_interval_ms},
        {"window_timeout_s", &t.window_timeout_s},
        {"popup_settle_ms", &t.popup_settle_ms},
        {"popup_max_iterations", &t.popup_max_iterations},
        {"login_settle_ms", &t.login_settle_ms},
    };
    for (const auto& [name, value] : timings) {
        if (value->has_value() && **value <= 0) {
            return Result<void, Error>::Err(MakeConfigError(
                std::string(name) + " must be positive, got " + std::to_string(**value)));
        }
    }

    if (config.verbosity > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Conversion to core option structs
// ---------------------------------------------------------------------------
Credentials ToCredentials(const AppConfig& config) {
    Credentials creds;
    creds.client = config.logon.client;
    creds.user = config.logon.user;
    creds.password = config.logon.password;
    creds.language = config.logon.language.value_or("EN");
    creds.mode = config.logon.sso.value_or(true) ? LogonMode::Sso : LogonMode::Password;
    return creds;
}

LogonOptions ToLogonOptions(const AppConfig& config) {
    const auto& t = config.timings;
    LogonOptions options;

    if (!config.saplogon_paths.empty()) {
        options.bootstrap.candidate_paths = config.saplogon_paths;
    }
    options.bootstrap.startup_poll.interval = Millis(t.process_poll_interval_ms, 1000);
    options.bootstrap.startup_poll.timeout = Seconds(t.process_start_timeout_s, 30);

    options.window_poll.interval = Millis(t.window_poll_interval_ms, 500);
    options.window_poll.timeout = Seconds(t.window_timeout_s, 30);

    options.popups.multiple_logon =
        config.logon.multiple_logon.value_or(MultipleLogonChoice::ContinueKeepOthers);
    options.popups.max_iterations = t.popup_max_iterations.value_or(5);
    options.popups.settle = Millis(t.popup_settle_ms, 500);

    options.login_settle = Millis(t.login_settle_ms, 2000);
    return options;
}

} // namespace erpl_gui
