#pragma once

#include <erpl_gui/config/app_config.hpp>
#include <erpl_gui/core/result.hpp>
#include <erpl_gui/workflow/logon_workflow.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace erpl_gui {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. The -c/--config path, if any, is
// returned through `config_path`.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::optional<std::string>* config_path = nullptr);

// Merge two configs: fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// If password is empty and password_env is set, read the environment variable
// and populate password. An unset variable is an error.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Credentials for the logon screen.
Credentials ToCredentials(const AppConfig& config);

// Every wait and choice of the logon workflow, defaults filled in.
LogonOptions ToLogonOptions(const AppConfig& config);

} // namespace erpl_gui
