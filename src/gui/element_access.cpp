#include <erpl_gui/gui/element_access.hpp>

#include <erpl_gui/core/log.hpp>

namespace erpl_gui {

std::optional<GuiElementPtr> FindElement(IGuiSession& session, std::string_view id) {
    auto found = session.FindById(id);
    if (found.IsErr()) {
        LogDebug("element", std::string(id) + " not found: " + found.Error().message);
        return std::nullopt;
    }
    auto element = std::move(found).Value();
    if (!element) {
        return std::nullopt;
    }
    return element;
}

std::optional<std::string> ReadText(IGuiSession& session, std::string_view id) {
    auto element = FindElement(session, id);
    if (!element.has_value()) {
        return std::nullopt;
    }
    auto text = (*element)->Text();
    if (text.IsErr()) {
        LogDebug("element", std::string(id) + " not readable: " + text.Error().message);
        return std::nullopt;
    }
    return std::move(text).Value();
}

std::string Trim(std::string_view text) {
    constexpr std::string_view kBlanks = " \t\r\n";
    const auto first = text.find_first_not_of(kBlanks);
    if (first == std::string_view::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(kBlanks);
    return std::string(text.substr(first, last - first + 1));
}

} // namespace erpl_gui
