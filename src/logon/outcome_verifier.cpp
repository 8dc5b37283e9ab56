#include <erpl_gui/logon/outcome_verifier.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/gui/element_access.hpp>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "verify";

} // namespace

std::optional<StatusMessage> ReadStatusBar(IGuiSession& session) {
    auto sbar = FindElement(session, element_id::kStatusBar);
    if (!sbar.has_value()) {
        return std::nullopt;
    }
    auto type = (*sbar)->Property("MessageType");
    auto text = (*sbar)->Text();
    if (type.IsErr() || text.IsErr()) {
        return std::nullopt;
    }
    return StatusMessage{ParseMessageType(type.Value()), Trim(text.Value())};
}

Result<StatusMessage, Error> VerifyLogin(IGuiSession& session) {
    auto status = ReadStatusBar(session);
    if (!status.has_value()) {
        LogDebug(kComponent, "status bar not readable - assuming success");
        return Result<StatusMessage, Error>::Ok(StatusMessage{});
    }

    const auto code = MessageTypeCode(status->type);
    if (IsFailure(status->type)) {
        return Result<StatusMessage, Error>::Err(
            Error::FromStatusBar("VerifyLogin", code, status->text));
    }

    if (status->type == MessageType::Warning) {
        LogWarn(kComponent, "logon warning [W]: " + status->text);
    } else if (!status->text.empty() && status->type != MessageType::None) {
        LogInfo(kComponent, "logon status [" + code + "]: " + status->text);
    }
    return Result<StatusMessage, Error>::Ok(std::move(*status));
}

} // namespace erpl_gui
