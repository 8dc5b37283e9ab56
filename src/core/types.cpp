#include <erpl_gui/core/types.hpp>

#include <algorithm>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// SapClient
// ---------------------------------------------------------------------------
Result<SapClient, std::string> SapClient::Create(std::string_view client) {
    if (client.size() != 3) {
        return Result<SapClient, std::string>::Err(
            "SAP client must be exactly 3 digits, got " +
            std::to_string(client.size()) + " characters");
    }
    if (!std::all_of(client.begin(), client.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        return Result<SapClient, std::string>::Err(
            "SAP client must contain only digits");
    }
    return Result<SapClient, std::string>::Ok(SapClient(std::string(client)));
}

// ---------------------------------------------------------------------------
// MessageType
// ---------------------------------------------------------------------------
MessageType ParseMessageType(std::string_view code) {
    // SAP pads the property with blanks on some releases.
    while (!code.empty() && code.front() == ' ') code.remove_prefix(1);
    while (!code.empty() && code.back() == ' ') code.remove_suffix(1);
    if (code.size() != 1) {
        return MessageType::None;
    }
    switch (code[0]) {
        case 'S': case 's': return MessageType::Success;
        case 'I': case 'i': return MessageType::Information;
        case 'W': case 'w': return MessageType::Warning;
        case 'E': case 'e': return MessageType::Error;
        case 'A': case 'a': return MessageType::Abort;
        default:            return MessageType::None;
    }
}

std::string MessageTypeCode(MessageType type) {
    switch (type) {
        case MessageType::None:        return "";
        case MessageType::Success:     return "S";
        case MessageType::Information: return "I";
        case MessageType::Warning:     return "W";
        case MessageType::Error:       return "E";
        case MessageType::Abort:       return "A";
    }
    return "";
}

// ---------------------------------------------------------------------------
// ToString
// ---------------------------------------------------------------------------
std::string ToString(ScreenState state) {
    switch (state) {
        case ScreenState::Login:   return "LOGIN";
        case ScreenState::Menu:    return "MENU";
        case ScreenState::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string ToString(PopupKind kind) {
    switch (kind) {
        case PopupKind::MultipleLogon: return "MULTIPLE_LOGON";
        case PopupKind::InfoDialog:    return "INFO_DIALOG";
        case PopupKind::None:          return "NONE";
    }
    return "NONE";
}

std::string ToString(LogonMode mode) {
    return mode == LogonMode::Sso ? "SSO" : "PASSWORD";
}

} // namespace erpl_gui
