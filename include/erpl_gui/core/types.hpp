#pragma once

#include <erpl_gui/core/result.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// SapClient - exactly 3 digits (e.g. "100").
// ---------------------------------------------------------------------------
class SapClient {
public:
    static Result<SapClient, std::string> Create(std::string_view client);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const SapClient& other) const { return value_ == other.value_; }
    bool operator!=(const SapClient& other) const { return value_ != other.value_; }

    SapClient(const SapClient&) = default;
    SapClient& operator=(const SapClient&) = default;
    SapClient(SapClient&&) noexcept = default;
    SapClient& operator=(SapClient&&) noexcept = default;

private:
    explicit SapClient(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// SecretString - a password. Streams as "********"; the plain text is only
// reachable through Reveal().
// ---------------------------------------------------------------------------
class SecretString {
public:
    SecretString() = default;
    explicit SecretString(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] bool Empty() const noexcept { return value_.empty(); }
    [[nodiscard]] const std::string& Reveal() const noexcept { return value_; }

    bool operator==(const SecretString& other) const { return value_ == other.value_; }
    bool operator!=(const SecretString& other) const { return value_ != other.value_; }

    friend std::ostream& operator<<(std::ostream& os, const SecretString&) {
        return os << "********";
    }

private:
    std::string value_;
};

// ---------------------------------------------------------------------------
// LogonMode - SSO trusts the desktop identity; Password fills user + password.
// ---------------------------------------------------------------------------
enum class LogonMode {
    Sso,
    Password,
};

// ---------------------------------------------------------------------------
// Credentials - what the login screen needs. Without a client the value
// preset by the SAP Logon entry is kept.
// ---------------------------------------------------------------------------
struct Credentials {
    std::optional<SapClient> client;
    std::string user;
    SecretString password;
    std::string language = "EN";
    LogonMode mode = LogonMode::Sso;
};

// ---------------------------------------------------------------------------
// ScreenState - what the main window shows right after OpenConnection.
// ---------------------------------------------------------------------------
enum class ScreenState {
    Login,
    Menu,
    Unknown,
};

// ---------------------------------------------------------------------------
// PopupKind - shape of the modal window wnd[1].
// ---------------------------------------------------------------------------
enum class PopupKind {
    MultipleLogon,
    InfoDialog,
    None,
};

// ---------------------------------------------------------------------------
// MultipleLogonChoice - answer given to the "user already logged on" dialog.
// ---------------------------------------------------------------------------
enum class MultipleLogonChoice {
    ContinueKeepOthers,       // radMULTI_LOGON_OPT2
    ContinueTerminateOthers,  // radMULTI_LOGON_OPT1
};

// ---------------------------------------------------------------------------
// MessageType - status bar severity (GuiStatusbar.MessageType).
// ---------------------------------------------------------------------------
enum class MessageType {
    None,
    Success,      // S
    Information,  // I
    Warning,      // W
    Error,        // E
    Abort,        // A
};

/// Map a MessageType letter to the enum. Unknown letters map to None.
MessageType ParseMessageType(std::string_view code);

/// Single-letter code ("S", "W", ...) or "" for None.
std::string MessageTypeCode(MessageType type);

/// True for E and A.
[[nodiscard]] inline bool IsFailure(MessageType type) noexcept {
    return type == MessageType::Error || type == MessageType::Abort;
}

// ---------------------------------------------------------------------------
// StatusMessage - one status bar reading.
// ---------------------------------------------------------------------------
struct StatusMessage {
    MessageType type = MessageType::None;
    std::string text;
};

std::string ToString(ScreenState state);
std::string ToString(PopupKind kind);
std::string ToString(LogonMode mode);

} // namespace erpl_gui
