#include <erpl_gui/cli/credential_prompt.hpp>

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <string>

namespace erpl_gui {

PromptMode SelectPromptMode(bool stdin_is_tty) {
    return stdin_is_tty ? PromptMode::MaskedForm : PromptMode::LineInput;
}

ConsoleCredentialPrompt::ConsoleCredentialPrompt(PromptMode mode,
                                                 std::istream& in,
                                                 std::ostream& out)
    : mode_(mode), in_(in), out_(out) {}

std::optional<std::string> ConsoleCredentialPrompt::ReadLine(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<std::string> ConsoleCredentialPrompt::ReadUser(const std::string& prompt) {
    if (mode_ == PromptMode::MaskedForm) {
        return RunPromptForm(prompt, false);
    }
    return ReadLine(prompt);
}

std::optional<SecretString> ConsoleCredentialPrompt::ReadPassword(const std::string& prompt) {
    const bool form = mode_ == PromptMode::MaskedForm;
    auto value = form ? RunPromptForm(prompt, true) : ReadLine(prompt);
    if (!form) {
        out_ << "\n";
    }
    if (!value.has_value()) {
        return std::nullopt;
    }
    return SecretString(std::move(*value));
}

std::optional<std::string> RunPromptForm(const std::string& prompt, bool masked) {
    using namespace ftxui;

    std::string value;
    bool submitted = false;

    auto screen = ScreenInteractive::FitComponent();

    InputOption option;
    option.password = masked;
    option.on_enter = [&] {
        submitted = true;
        screen.Exit();
    };
    auto input = Input(&value, masked ? "password" : "username", option);

    // Escape to cancel.
    input |= CatchEvent([&](Event event) {
        if (event == Event::Escape) {
            screen.Exit();
            return true;
        }
        return false;
    });

    auto renderer = Renderer(input, [&] {
        return vbox({
                   text("SAP Logon") | bold | center,
                   separator(),
                   hbox({text(prompt), input->Render() | flex}),
               }) |
               border | size(WIDTH, LESS_THAN, 70);
    });

    screen.Loop(renderer);

    if (!submitted) {
        return std::nullopt;
    }
    return value;
}

} // namespace erpl_gui
