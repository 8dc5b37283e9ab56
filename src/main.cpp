#include <erpl_gui/cli/credential_prompt.hpp>
#include <erpl_gui/cli/logon_command.hpp>
#include <erpl_gui/cli/output_formatter.hpp>
#include <erpl_gui/config/config_loader.hpp>
#include <erpl_gui/core/log.hpp>
#include <erpl_gui/core/poll.hpp>
#include <erpl_gui/core/terminal.hpp>
#include <erpl_gui/core/version.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>
#include <erpl_gui/gui/process_launcher.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess  = 0;
constexpr int kExitConfig   = 2;
constexpr int kExitInternal = 99;

// --version is answered before any parsing so it works next to other flags.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "erpl-gui " << erpl_gui::kVersion << "\n";
            return true;
        }
    }
    return false;
}

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") {
            return true;
        }
    }
    return false;
}

int Run(int argc, const char* const* argv) {
    using namespace erpl_gui;

    // Step 1: Command line.
    std::optional<std::string> config_path;
    auto cli = LoadFromCli(argc, argv, &config_path);
    if (cli.IsErr()) {
        OutputFormatter(HasJsonFlag(argc, argv)).PrintError(cli.Error());
        return kExitConfig;
    }
    AppConfig config = std::move(cli).Value();

    // Step 2: YAML file, overridden by flags.
    if (config_path.has_value()) {
        auto yaml = LoadFromYaml(*config_path);
        if (yaml.IsErr()) {
            OutputFormatter(config.json_output).PrintError(yaml.Error());
            return kExitConfig;
        }
        config = MergeConfigs(yaml.Value(), config);
    }

    // Step 3: Secrets and validation.
    auto resolved = ResolvePasswordEnv(std::move(config));
    if (resolved.IsErr()) {
        OutputFormatter(HasJsonFlag(argc, argv)).PrintError(resolved.Error());
        return kExitConfig;
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        OutputFormatter(config.json_output).PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 4: Logging and output.
    const bool force_color = config.color.value_or(false);
    const bool force_no_color = config.color.has_value() && !*config.color;
    const auto log_level = LogLevelFromVerbosity(config.verbosity, config.quiet);
    if (config.json_output) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log_level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(
                             ResolveColor(StdStream::Err, force_color, force_no_color)),
                         log_level);
    }
    OutputFormatter formatter(config.json_output,
                              ResolveColor(StdStream::Out, force_color, force_no_color));

    // Step 5: Platform services.
    auto locator = MakeDefaultEngineLocator();
    OsProcessLauncher launcher;
    SystemClock clock;
    ConsoleCredentialPrompt prompt(SelectPromptMode(IsStdinTty()));
    CommandContext ctx{*locator, launcher, clock, &prompt, formatter};

    // Step 6: Execute.
    if (config.list_sessions) {
        return RunListSessions(config, ctx);
    }
    return RunLogon(config, ctx);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }
    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: internal: " << e.what() << "\n";
        return kExitInternal;
    }
}
