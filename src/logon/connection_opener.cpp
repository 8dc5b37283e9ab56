#include <erpl_gui/logon/connection_opener.hpp>

#include <erpl_gui/core/log.hpp>
#include <erpl_gui/gui/element_access.hpp>

namespace erpl_gui {

namespace {

constexpr const char* kComponent = "connect";

std::string OpenHint(std::string_view system) {
    return "Does '" + std::string(system) + "' exist in SAP Logon? The entry name "
           "is case-sensitive. SSO entries often end with ' SSO'.";
}

} // namespace

Result<OpenedConnection, Error> OpenConnection(
    IScriptingEngine& engine,
    std::string_view system,
    IClock& clock,
    const PollOptions& window_poll,
    bool synchronous) {

    const std::string target(system);
    LogInfo(kComponent, "opening connection to '" + target + "'");

    auto opened = engine.OpenConnection(system, synchronous);
    if (opened.IsErr() || !opened.Value()) {
        Error error;
        error.operation = "OpenConnection";
        error.target = target;
        error.message = "Cannot open connection to '" + target + "'";
        if (opened.IsErr()) {
            error.message += ": " + opened.Error().message;
        }
        error.hint = OpenHint(system);
        error.category = ErrorCategory::Unavailable;
        return Result<OpenedConnection, Error>::Err(std::move(error));
    }

    OpenedConnection result;
    result.connection = std::move(opened).Value();

    // wnd[0] raises "data not yet available" while the window is painting.
    const auto stats = PollUntil(clock, window_poll, [&]() {
        auto session = result.connection->Session(0);
        if (session.IsErr() || !session.Value()) {
            return false;
        }
        auto window = session.Value()->FindById(element_id::kMainWindow);
        if (window.IsErr() || !window.Value()) {
            return false;
        }
        auto title = window.Value()->Text();
        if (title.IsErr()) {
            return false;
        }
        result.session = std::move(session).Value();
        result.window_title = std::move(title).Value();
        return true;
    });

    if (stats.outcome == PollOutcome::TimedOut) {
        Error error;
        error.operation = "OpenConnection";
        error.target = target;
        error.message = "SAP window did not become ready within " +
                        std::to_string(window_poll.timeout.count() / 1000) +
                        "s after OpenConnection";
        error.category = ErrorCategory::Timeout;
        return Result<OpenedConnection, Error>::Err(std::move(error));
    }

    LogInfo(kComponent, "session opened, window title '" + result.window_title + "'");
    return Result<OpenedConnection, Error>::Ok(std::move(result));
}

} // namespace erpl_gui
