#include <erpl_gui/gui/i_scripting_engine.hpp>

#ifdef _WIN32
#include <erpl_gui/gui/com_scripting_engine.hpp>
#endif

namespace erpl_gui {

namespace {

#ifndef _WIN32
// SAP GUI Scripting is a COM automation server; there is nothing to attach
// to on other platforms.
class UnsupportedPlatformLocator : public IScriptingEngineLocator {
public:
    Result<ScriptingEnginePtr, Error> Attach() override {
        Error error;
        error.operation = "AttachSapGui";
        error.target = "SAPGUI";
        error.message = "SAP GUI Scripting requires Windows";
        error.category = ErrorCategory::Unavailable;
        return Result<ScriptingEnginePtr, Error>::Err(std::move(error));
    }
};
#endif

} // anonymous namespace

std::unique_ptr<IScriptingEngineLocator> MakeDefaultEngineLocator() {
#ifdef _WIN32
    return std::make_unique<ComEngineLocator>();
#else
    return std::make_unique<UnsupportedPlatformLocator>();
#endif
}

} // namespace erpl_gui
