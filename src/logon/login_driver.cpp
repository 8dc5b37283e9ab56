#include <erpl_gui/logon/login_driver.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/gui/element_access.hpp>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "login";
constexpr const char* kFieldHint =
    "Field IDs may differ - check the SAP GUI version and logon screen layout.";

Error MakeScreenError(std::string_view id, const std::string& message) {
    Error error;
    error.operation = "SubmitLogin";
    error.target = std::string(id);
    error.message = message;
    error.hint = kFieldHint;
    error.category = ErrorCategory::LoginScreen;
    return error;
}

Error MakeMissingInput(const std::string& what) {
    Error error;
    error.operation = "SubmitLogin";
    error.message = what + " required for password logon";
    error.hint = "Pass --user, set password_env, or run interactively.";
    error.category = ErrorCategory::Config;
    return error;
}

// Write one logon field if present and changeable. `label` is what gets
// logged; the value itself never is.
Result<void, Error> WriteField(IGuiSession& session,
                               std::string_view id,
                               const std::string& value,
                               const std::string& label) {
    auto element = FindElement(session, id);
    if (!element.has_value()) {
        LogInfo(kComponent, label + " field not present - skipped");
        return Result<void, Error>::Ok();
    }

    auto changeable = (*element)->IsChangeable();
    if (changeable.IsErr()) {
        return Result<void, Error>::Err(MakeScreenError(
            id, "cannot query " + label + " field: " + changeable.Error().message));
    }
    if (!changeable.Value()) {
        LogInfo(kComponent, label + " field not changeable - using pre-set value");
        return Result<void, Error>::Ok();
    }

    auto written = (*element)->SetText(value);
    if (written.IsErr()) {
        return Result<void, Error>::Err(MakeScreenError(
            id, "cannot set " + label + " field: " + written.Error().message));
    }
    return Result<void, Error>::Ok();
}

} // namespace

std::string UserPromptText(std::string_view system, std::string_view client) {
    return "SAP user for " + std::string(system) + "/" + std::string(client) + ": ";
}

std::string PasswordPromptText(std::string_view user, std::string_view system) {
    return "Password for " + std::string(user) + "@" + std::string(system) + ": ";
}

Result<Credentials, Error> CompleteCredentials(
    const Credentials& credentials,
    std::string_view system,
    ICredentialPrompt* prompt) {

    Credentials result = credentials;
    if (result.mode == LogonMode::Sso) {
        return Result<Credentials, Error>::Ok(std::move(result));
    }

    if (result.user.empty()) {
        if (prompt == nullptr) {
            return Result<Credentials, Error>::Err(MakeMissingInput("SAP user"));
        }
        const std::string client = result.client ? result.client->Value() : "";
        auto user = prompt->ReadUser(UserPromptText(system, client));
        if (!user.has_value() || Trim(*user).empty()) {
            return Result<Credentials, Error>::Err(MakeMissingInput("SAP user"));
        }
        result.user = Trim(*user);
    }

    if (result.password.Empty()) {
        if (prompt == nullptr) {
            return Result<Credentials, Error>::Err(MakeMissingInput("Password"));
        }
        auto password = prompt->ReadPassword(PasswordPromptText(result.user, system));
        if (!password.has_value() || password->Empty()) {
            return Result<Credentials, Error>::Err(MakeMissingInput("Password"));
        }
        result.password = std::move(*password);
    }

    return Result<Credentials, Error>::Ok(std::move(result));
}

Result<void, Error> SubmitLogin(
    IGuiSession& session,
    const Credentials& credentials,
    std::string_view system,
    ICredentialPrompt* prompt) {

    auto completed = CompleteCredentials(credentials, system, prompt);
    if (completed.IsErr()) {
        return Result<void, Error>::Err(std::move(completed).Error());
    }
    const auto& creds = completed.Value();

    if (creds.client.has_value()) {
        auto client = WriteField(session, element_id::kClientField,
                                 creds.client->Value(), "client");
        if (client.IsErr()) {
            return client;
        }
        LogInfo(kComponent, "client " + creds.client->Value());
    } else {
        LogInfo(kComponent, "no client given - using pre-set value");
    }

    if (creds.mode == LogonMode::Password) {
        auto user = WriteField(session, element_id::kUserField, creds.user, "user");
        if (user.IsErr()) {
            return user;
        }
        // Write-only: GuiPasswordField.Text reads back empty anyway.
        auto password = WriteField(session, element_id::kPasswordField,
                                   creds.password.Reveal(), "password");
        if (password.IsErr()) {
            return password;
        }
        auto language = WriteField(session, element_id::kLanguageField,
                                   creds.language, "language");
        if (language.IsErr()) {
            return language;
        }
        LogInfo(kComponent, "credentials filled: user=" + creds.user +
                                ", language=" + creds.language);
    } else {
        LogInfo(kComponent, "SSO mode - skipping user and password fields");
    }

    auto window = FindElement(session, element_id::kMainWindow);
    if (!window.has_value()) {
        return Result<void, Error>::Err(
            MakeScreenError(element_id::kMainWindow, "main window not found"));
    }
    auto sent = (*window)->SendVKey(vkey::kEnter);
    if (sent.IsErr()) {
        return Result<void, Error>::Err(MakeScreenError(
            element_id::kMainWindow, "cannot submit logon: " + sent.Error().message));
    }

    LogInfo(kComponent, "logon submitted (Enter)");
    return Result<void, Error>::Ok();
}

} // namespace erpl_gui
