#pragma once

#include <erpl_gui/core/poll.hpp>
#include <erpl_gui/core/result.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>

#include <string>
#include <string_view>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// OpenedConnection - a new connection whose first session has a queryable
// main window.
// ---------------------------------------------------------------------------
struct OpenedConnection {
    GuiConnectionPtr connection;
    GuiSessionPtr session;
    std::string window_title;
};

// ---------------------------------------------------------------------------
// OpenConnection - GuiApplication.OpenConnection(system, synchronous), then
// poll until Children(0).findById("wnd[0]").Text reads without error.
//
// The SAP Logon entry name is matched exactly (case-sensitive). Unknown or
// unopenable entries fail with Unavailable; a window that never becomes
// readable fails with Timeout.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<OpenedConnection, Error> OpenConnection(
    IScriptingEngine& engine,
    std::string_view system,
    IClock& clock,
    const PollOptions& window_poll = {},
    bool synchronous = true);

} // namespace erpl_gui
