#pragma once

#include <erpl_gui/gui/i_scripting_engine.hpp>

#include <memory>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// ComEngineLocator - SAP GUI Scripting over COM automation (Windows only).
//
// Attach() mirrors VBScript's GetObject("SAPGUI").GetScriptingEngine:
//   SapROTWr.SapROTWrapper.GetROTEntry("SAPGUI") -> GetScriptingEngine
// All objects handed out keep the calling thread's COM apartment alive.
// ---------------------------------------------------------------------------
class ComEngineLocator : public IScriptingEngineLocator {
public:
    ComEngineLocator();
    ~ComEngineLocator() override;

    ComEngineLocator(const ComEngineLocator&) = delete;
    ComEngineLocator& operator=(const ComEngineLocator&) = delete;

    [[nodiscard]] Result<ScriptingEnginePtr, Error> Attach() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace erpl_gui
