#include <erpl_gui/logon/screen_classifier.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/gui/element_access.hpp>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "screen";

} // namespace

ScreenState ClassifyScreen(IGuiSession& session) {
    if (FindElement(session, element_id::kClientField).has_value()) {
        LogDebug(kComponent, "client field present");
        return ScreenState::Login;
    }

    auto info = session.Info();
    if (info.IsOk()) {
        const auto tcode = Trim(info.Value().transaction);
        if (!tcode.empty() && tcode != "LOGIN") {
            LogDebug(kComponent, "transaction " + tcode);
            return ScreenState::Menu;
        }
    } else {
        LogDebug(kComponent, "session info unavailable: " + info.Error().message);
    }

    // Any non-blank title is taken as logged in.
    const auto title = ReadText(session, element_id::kMainWindow);
    if (title.has_value() && !Trim(*title).empty()) {
        LogDebug(kComponent, "window title '" + Trim(*title) + "'");
        return ScreenState::Menu;
    }

    return ScreenState::Unknown;
}

} // namespace erpl_gui
