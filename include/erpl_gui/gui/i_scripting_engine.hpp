#pragma once

#include <erpl_gui/core/result.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// Virtual key codes accepted by GuiFrameWindow.sendVKey.
// ---------------------------------------------------------------------------
namespace vkey {
constexpr int kEnter = 0;
} // namespace vkey

// ---------------------------------------------------------------------------
// SessionInfo - GuiSession.Info, read in one go.
// ---------------------------------------------------------------------------
struct SessionInfo {
    std::string system_name;
    std::string client;
    std::string user;
    std::string language;
    std::string transaction;
    std::string program;
    int screen_number = 0;
    int response_time_ms = 0;
};

// ---------------------------------------------------------------------------
// The SAP GUI Scripting object model, reduced to what the logon flow needs:
//
//   IScriptingEngine (GuiApplication)
//     └── IGuiConnection (GuiConnection)  - Children(i)
//           └── IGuiSession (GuiSession)  - Children(i)
//                 └── IGuiElement         - findById("wnd[0]/usr/...")
//
// Any call may fail because the GUI is still painting, an element went
// stale, or a window was closed. Methods return Result<T, Error> and never
// throw; callers decide whether a failure is fatal.
// ---------------------------------------------------------------------------

class IGuiElement {
public:
    virtual ~IGuiElement() = default;

    [[nodiscard]] virtual std::string Id() const = 0;

    /// GuiComponent.Text.
    [[nodiscard]] virtual Result<std::string, Error> Text() = 0;

    /// Write GuiComponent.Text. Password fields are write-only.
    [[nodiscard]] virtual Result<void, Error> SetText(std::string_view text) = 0;

    /// GuiVComponent.Changeable.
    [[nodiscard]] virtual Result<bool, Error> IsChangeable() = 0;

    /// press() for buttons, select() for radio buttons and menu entries.
    [[nodiscard]] virtual Result<void, Error> Invoke() = 0;

    /// GuiFrameWindow.sendVKey.
    [[nodiscard]] virtual Result<void, Error> SendVKey(int code) = 0;

    /// Read any other property by name (e.g. GuiStatusbar.MessageType).
    [[nodiscard]] virtual Result<std::string, Error> Property(std::string_view name) = 0;

protected:
    IGuiElement() = default;
};

using GuiElementPtr = std::shared_ptr<IGuiElement>;

class IGuiSession {
public:
    virtual ~IGuiSession() = default;

    IGuiSession(const IGuiSession&) = delete;
    IGuiSession& operator=(const IGuiSession&) = delete;
    IGuiSession(IGuiSession&&) = delete;
    IGuiSession& operator=(IGuiSession&&) = delete;

    /// GuiSession.findById. Err when the id does not resolve.
    [[nodiscard]] virtual Result<GuiElementPtr, Error> FindById(std::string_view id) = 0;

    /// GuiSession.Info.
    [[nodiscard]] virtual Result<SessionInfo, Error> Info() = 0;

protected:
    IGuiSession() = default;
};

using GuiSessionPtr = std::shared_ptr<IGuiSession>;

class IGuiConnection {
public:
    virtual ~IGuiConnection() = default;

    IGuiConnection(const IGuiConnection&) = delete;
    IGuiConnection& operator=(const IGuiConnection&) = delete;
    IGuiConnection(IGuiConnection&&) = delete;
    IGuiConnection& operator=(IGuiConnection&&) = delete;

    /// GuiConnection.Description - the SAP Logon entry name.
    [[nodiscard]] virtual std::string Description() const = 0;

    [[nodiscard]] virtual Result<size_t, Error> SessionCount() = 0;
    [[nodiscard]] virtual Result<GuiSessionPtr, Error> Session(size_t index) = 0;

protected:
    IGuiConnection() = default;
};

using GuiConnectionPtr = std::shared_ptr<IGuiConnection>;

// ---------------------------------------------------------------------------
// IScriptingEngine - the client handle (GuiApplication). One per run.
// ---------------------------------------------------------------------------
class IScriptingEngine {
public:
    virtual ~IScriptingEngine() = default;

    IScriptingEngine(const IScriptingEngine&) = delete;
    IScriptingEngine& operator=(const IScriptingEngine&) = delete;
    IScriptingEngine(IScriptingEngine&&) = delete;
    IScriptingEngine& operator=(IScriptingEngine&&) = delete;

    [[nodiscard]] virtual Result<size_t, Error> ConnectionCount() = 0;
    [[nodiscard]] virtual Result<GuiConnectionPtr, Error> Connection(size_t index) = 0;

    /// GuiApplication.OpenConnection(description, sync).
    [[nodiscard]] virtual Result<GuiConnectionPtr, Error> OpenConnection(
        std::string_view description, bool synchronous) = 0;

protected:
    IScriptingEngine() = default;
};

using ScriptingEnginePtr = std::shared_ptr<IScriptingEngine>;

// ---------------------------------------------------------------------------
// IScriptingEngineLocator - looks up the running SAP Logon instance
// ("SAPGUI" in the running object table). Every call is a fresh lookup.
// ---------------------------------------------------------------------------
class IScriptingEngineLocator {
public:
    virtual ~IScriptingEngineLocator() = default;

    [[nodiscard]] virtual Result<ScriptingEnginePtr, Error> Attach() = 0;
};

/// The locator for this platform: COM on Windows, otherwise one that always
/// reports SAP Logon as unavailable.
std::unique_ptr<IScriptingEngineLocator> MakeDefaultEngineLocator();

} // namespace erpl_gui
