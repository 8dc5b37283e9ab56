#pragma once

#include <erpl_gui/gui/i_scripting_engine.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// Element ids on the SAP logon screen (SAPMSYST 0020) and its popups.
// ---------------------------------------------------------------------------
namespace element_id {

constexpr const char* kMainWindow = "wnd[0]";
constexpr const char* kPopupWindow = "wnd[1]";
constexpr const char* kStatusBar = "wnd[0]/sbar";

constexpr const char* kClientField = "wnd[0]/usr/txtRSYST-MANDT";
constexpr const char* kUserField = "wnd[0]/usr/txtRSYST-BNAME";
constexpr const char* kPasswordField = "wnd[0]/usr/pwdRSYST-BCODE";
constexpr const char* kLanguageField = "wnd[0]/usr/txtRSYST-LANGU";

// Multiple logon dialog: OPT1 = continue and end other sessions,
// OPT2 = continue and keep them, OPT3 = cancel.
constexpr const char* kMultiLogonTerminate = "wnd[1]/usr/radMULTI_LOGON_OPT1";
constexpr const char* kMultiLogonContinue = "wnd[1]/usr/radMULTI_LOGON_OPT2";
constexpr const char* kPopupConfirmButton = "wnd[1]/tbar[0]/btn[0]";

} // namespace element_id

/// Resolve an element id. Absent when the id does not resolve or the lookup
/// itself fails; never returns a null pointer.
std::optional<GuiElementPtr> FindElement(IGuiSession& session, std::string_view id);

/// Text of an element, absent when the element is missing or unreadable.
std::optional<std::string> ReadText(IGuiSession& session, std::string_view id);

/// Strip leading and trailing whitespace.
std::string Trim(std::string_view text);

} // namespace erpl_gui
