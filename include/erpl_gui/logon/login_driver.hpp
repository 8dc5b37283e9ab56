#pragma once

#include <erpl_gui/core/result.hpp>
#include <erpl_gui/core/types.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// ICredentialPrompt - interactive source for a missing user or password.
// Implementations must not echo the password. nullopt means the user
// cancelled or no input is available.
// ---------------------------------------------------------------------------
class ICredentialPrompt {
public:
    virtual ~ICredentialPrompt() = default;

    [[nodiscard]] virtual std::optional<std::string> ReadUser(const std::string& prompt) = 0;
    [[nodiscard]] virtual std::optional<SecretString> ReadPassword(const std::string& prompt) = 0;
};

/// "SAP user for <system>/<client>: "
std::string UserPromptText(std::string_view system, std::string_view client);

/// "Password for <user>@<system>: "
std::string PasswordPromptText(std::string_view user, std::string_view system);

// ---------------------------------------------------------------------------
// CompleteCredentials - in Password mode, ask `prompt` for whatever of
// user/password is empty. Sso credentials are returned unchanged. Missing
// input (no prompt, cancel, empty answer) is a Config error.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<Credentials, Error> CompleteCredentials(
    const Credentials& credentials,
    std::string_view system,
    ICredentialPrompt* prompt);

// ---------------------------------------------------------------------------
// SubmitLogin - fill the SAP logon screen and press Enter.
//
// Credentials are completed through `prompt` first, so nothing is written
// to the screen when input is missing. Then:
//   client   (txtRSYST-MANDT)  always, when given
//   user     (txtRSYST-BNAME)  Password mode only
//   password (pwdRSYST-BCODE)  Password mode only, never read back
//   language (txtRSYST-LANGU)  Password mode only
// Each field is written only if it reports itself changeable. Returns right
// after sending Enter; the caller waits for the screen to settle.
//
// Element interaction failures are LoginScreen errors.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<void, Error> SubmitLogin(
    IGuiSession& session,
    const Credentials& credentials,
    std::string_view system,
    ICredentialPrompt* prompt = nullptr);

} // namespace erpl_gui
