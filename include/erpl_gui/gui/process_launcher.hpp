#pragma once

#include <erpl_gui/core/result.hpp>

#include <string>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// IProcessLauncher - file lookup and detached start of the SAP Logon
// executable.
// ---------------------------------------------------------------------------
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    /// True if `path` names an existing regular file.
    [[nodiscard]] virtual bool IsFile(const std::string& path) const = 0;

    /// Start `path` without arguments and without waiting for it.
    [[nodiscard]] virtual Result<void, Error> LaunchDetached(const std::string& path) = 0;
};

// CreateProcessW on Windows, posix_spawn elsewhere.
class OsProcessLauncher : public IProcessLauncher {
public:
    [[nodiscard]] bool IsFile(const std::string& path) const override;
    [[nodiscard]] Result<void, Error> LaunchDetached(const std::string& path) override;
};

} // namespace erpl_gui
