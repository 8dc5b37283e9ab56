#pragma once

#include <erpl_gui/core/types.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// ClassifyScreen - what the main window of a freshly opened session shows.
//
// Checked in priority order:
//   1. client field wnd[0]/usr/txtRSYST-MANDT present   -> Login
//   2. Info.Transaction trimmed, non-empty, not "LOGIN" -> Menu
//   3. wnd[0] title trimmed, non-empty                  -> Menu
//   4.                                                  -> Unknown
//
// Pure inspection: lookup failures count as "absent" and never propagate.
// ---------------------------------------------------------------------------
ScreenState ClassifyScreen(IGuiSession& session);

} // namespace erpl_gui
