#include <erpl_gui/gui/process_launcher.hpp>

#include <filesystem>
#include <system_error>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <spawn.h>
#include <sys/types.h>
#include <cstring>
extern char** environ;
#endif

namespace erpl_gui {

namespace {

Error MakeLaunchError(const std::string& path, const std::string& message) {
    Error error;
    error.operation = "LaunchSapLogon";
    error.target = path;
    error.message = message;
    error.category = ErrorCategory::Unavailable;
    return error;
}

#ifdef _WIN32
std::wstring Widen(const std::string& utf8) {
    if (utf8.empty()) return std::wstring();
    const int size = MultiByteToWideChar(CP_UTF8, 0, utf8.data(),
                                         static_cast<int>(utf8.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                        wide.data(), size);
    return wide;
}
#endif

} // anonymous namespace

bool OsProcessLauncher::IsFile(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::u8path(path), ec);
}

Result<void, Error> OsProcessLauncher::LaunchDetached(const std::string& path) {
#ifdef _WIN32
    auto wide_path = Widen(path);
    std::wstring command_line = L"\"" + wide_path + L"\"";

    STARTUPINFOW startup{};
    startup.cb = sizeof(startup);
    PROCESS_INFORMATION process{};

    if (!CreateProcessW(wide_path.c_str(), command_line.data(), nullptr, nullptr,
                        FALSE, DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP,
                        nullptr, nullptr, &startup, &process)) {
        return Result<void, Error>::Err(MakeLaunchError(
            path, "CreateProcess failed with error " + std::to_string(GetLastError())));
    }
    CloseHandle(process.hThread);
    CloseHandle(process.hProcess);
    return Result<void, Error>::Ok();
#else
    pid_t pid = 0;
    char* const argv[] = {const_cast<char*>(path.c_str()), nullptr};

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    const int rc = posix_spawn(&pid, path.c_str(), nullptr, &attr, argv, environ);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        return Result<void, Error>::Err(MakeLaunchError(
            path, std::string("posix_spawn failed: ") + std::strerror(rc)));
    }
    return Result<void, Error>::Ok();
#endif
}

} // namespace erpl_gui
