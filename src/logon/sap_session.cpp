#include <erpl_gui/logon/sap_session.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/gui/element_access.hpp>

#include <string>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "session";

Error MakeAttachError(const std::string& target, const std::string& message) {
    Error error;
    error.operation = "AttachSession";
    error.target = target;
    error.message = message;
    error.category = ErrorCategory::Unavailable;
    return error;
}

std::string IndexTarget(size_t connection_index, size_t session_index) {
    return std::to_string(connection_index) + ":" + std::to_string(session_index);
}

} // namespace

SapSession::SapSession(ScriptingEnginePtr engine, GuiConnectionPtr connection,
                       GuiSessionPtr session, size_t connection_index,
                       size_t session_index)
    : engine_(std::move(engine)),
      connection_(std::move(connection)),
      session_(std::move(session)),
      connection_index_(connection_index),
      session_index_(session_index) {}

Result<SapSession, Error> SapSession::AttachFirst(ScriptingEnginePtr engine) {
    return Attach(std::move(engine), 0, 0);
}

Result<SapSession, Error> SapSession::Attach(ScriptingEnginePtr engine,
                                             size_t connection_index,
                                             size_t session_index) {
    const auto target = IndexTarget(connection_index, session_index);
    if (!engine) {
        return Result<SapSession, Error>::Err(
            MakeAttachError(target, "no scripting engine"));
    }

    auto connection_count = engine->ConnectionCount();
    if (connection_count.IsErr()) {
        return Result<SapSession, Error>::Err(std::move(connection_count).Error());
    }
    if (connection_index >= connection_count.Value()) {
        return Result<SapSession, Error>::Err(MakeAttachError(
            target, "connection " + std::to_string(connection_index) +
                        " does not exist (" +
                        std::to_string(connection_count.Value()) + " open)"));
    }

    auto connection = engine->Connection(connection_index);
    if (connection.IsErr()) {
        return Result<SapSession, Error>::Err(std::move(connection).Error());
    }
    auto conn = std::move(connection).Value();

    auto session_count = conn->SessionCount();
    if (session_count.IsErr()) {
        return Result<SapSession, Error>::Err(std::move(session_count).Error());
    }
    if (session_index >= session_count.Value()) {
        return Result<SapSession, Error>::Err(MakeAttachError(
            target, "session " + std::to_string(session_index) +
                        " does not exist on connection " +
                        std::to_string(connection_index)));
    }

    auto session = conn->Session(session_index);
    if (session.IsErr()) {
        return Result<SapSession, Error>::Err(std::move(session).Error());
    }

    LogDebug(kComponent, "attached to session " + target);
    return Result<SapSession, Error>::Ok(SapSession(std::move(engine), std::move(conn),
                                                    std::move(session).Value(),
                                                    connection_index, session_index));
}

std::optional<GuiElementPtr> SapSession::FindById(std::string_view id) const {
    return FindElement(*session_, id);
}

Result<SessionInfo, Error> SapSession::Info() const {
    return session_->Info();
}

Result<std::vector<ActiveSession>, Error> ListActiveSessions(IScriptingEngine& engine) {
    auto connection_count = engine.ConnectionCount();
    if (connection_count.IsErr()) {
        return Result<std::vector<ActiveSession>, Error>::Err(
            std::move(connection_count).Error());
    }

    std::vector<ActiveSession> sessions;
    for (size_t i = 0; i < connection_count.Value(); ++i) {
        auto connection = engine.Connection(i);
        if (connection.IsErr()) {
            LogDebug(kComponent, "connection " + std::to_string(i) + ": " +
                                     connection.Error().message);
            continue;
        }
        auto session_count = connection.Value()->SessionCount();
        if (session_count.IsErr()) {
            continue;
        }
        for (size_t j = 0; j < session_count.Value(); ++j) {
            auto session = connection.Value()->Session(j);
            if (session.IsErr()) {
                continue;
            }
            auto info = session.Value()->Info();
            if (info.IsErr()) {
                LogDebug(kComponent, "session " + IndexTarget(i, j) +
                                         " busy: " + info.Error().message);
                continue;
            }
            sessions.push_back(ActiveSession{i, j, std::move(info).Value()});
        }
    }
    return Result<std::vector<ActiveSession>, Error>::Ok(std::move(sessions));
}

} // namespace erpl_gui
