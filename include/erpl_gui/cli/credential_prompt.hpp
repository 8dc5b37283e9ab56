#pragma once

#include <erpl_gui/logon/login_driver.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace erpl_gui {

enum class PromptMode {
    MaskedForm,  // FTXUI form, password input masked
    LineInput,   // one line per answer from a pipe or file
};

// A terminal on stdin always gets the masked form, wherever stdout and
// stderr point. Line input would echo what is typed.
PromptMode SelectPromptMode(bool stdin_is_tty);

// ---------------------------------------------------------------------------
// ConsoleCredentialPrompt - asks for a missing user or password.
//
// MaskedForm: a small FTXUI form. LineInput: the prompt goes to `out` and
// one line is read from `in`. End of input means "no answer".
// ---------------------------------------------------------------------------
class ConsoleCredentialPrompt : public ICredentialPrompt {
public:
    explicit ConsoleCredentialPrompt(PromptMode mode,
                                     std::istream& in = std::cin,
                                     std::ostream& out = std::cerr);

    [[nodiscard]] std::optional<std::string> ReadUser(const std::string& prompt) override;
    [[nodiscard]] std::optional<SecretString> ReadPassword(const std::string& prompt) override;

private:
    PromptMode mode_;
    std::istream& in_;
    std::ostream& out_;

    std::optional<std::string> ReadLine(const std::string& prompt);
};

// Show a one-field FTXUI form. Returns the entered text on Enter,
// std::nullopt on Escape.
std::optional<std::string> RunPromptForm(const std::string& prompt, bool masked);

} // namespace erpl_gui
