#pragma once

#include <erpl_gui/core/result.hpp>
#include <erpl_gui/core/types.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// VerifyLogin - read the status bar (wnd[0]/sbar) once.
//
// MessageType E or A: LoginFailed carrying severity and the status text
// verbatim. W is logged as a warning, S and I with text as info. An absent
// or unreadable status bar passes with MessageType::None.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<StatusMessage, Error> VerifyLogin(IGuiSession& session);

/// Current status bar contents, nullopt when it cannot be read.
std::optional<StatusMessage> ReadStatusBar(IGuiSession& session);

} // namespace erpl_gui
