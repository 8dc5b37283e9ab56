#pragma once

#include <erpl_gui/core/result.hpp>
#include <erpl_gui/gui/i_scripting_engine.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// SapSession - a logged-on session, addressed by its connection and session
// index in the scripting engine.
//
// Only the named factories construct one. AttachFirst binds to connection 0,
// session 0; Attach binds to any existing pair (the logon workflow uses the
// last connection, which is the one it just opened).
// ---------------------------------------------------------------------------
class SapSession {
public:
    [[nodiscard]] static Result<SapSession, Error> AttachFirst(ScriptingEnginePtr engine);

    [[nodiscard]] static Result<SapSession, Error> Attach(ScriptingEnginePtr engine,
                                                          size_t connection_index,
                                                          size_t session_index = 0);

    [[nodiscard]] size_t ConnectionIndex() const noexcept { return connection_index_; }
    [[nodiscard]] size_t SessionIndex() const noexcept { return session_index_; }

    [[nodiscard]] IGuiSession& Session() const { return *session_; }

    /// Element lookup on this session; nullopt when the id does not resolve.
    [[nodiscard]] std::optional<GuiElementPtr> FindById(std::string_view id) const;

    [[nodiscard]] Result<SessionInfo, Error> Info() const;

private:
    SapSession(ScriptingEnginePtr engine, GuiConnectionPtr connection,
               GuiSessionPtr session, size_t connection_index, size_t session_index);

    ScriptingEnginePtr engine_;
    GuiConnectionPtr connection_;
    GuiSessionPtr session_;
    size_t connection_index_ = 0;
    size_t session_index_ = 0;
};

// ---------------------------------------------------------------------------
// ListActiveSessions - every session of every connection of a running
// SAP Logon. Sessions whose info cannot be read (busy) are skipped.
// ---------------------------------------------------------------------------
struct ActiveSession {
    size_t connection_index = 0;
    size_t session_index = 0;
    SessionInfo info;
};

[[nodiscard]] Result<std::vector<ActiveSession>, Error> ListActiveSessions(
    IScriptingEngine& engine);

} // namespace erpl_gui
