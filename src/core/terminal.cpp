#include <erpl_gui/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace erpl_gui {

namespace {

int FileDescriptor(StdStream stream) {
#ifdef _WIN32
    switch (stream) {
        case StdStream::In:  return _fileno(stdin);
        case StdStream::Out: return _fileno(stdout);
        case StdStream::Err: return _fileno(stderr);
    }
    return _fileno(stderr);
#else
    switch (stream) {
        case StdStream::In:  return STDIN_FILENO;
        case StdStream::Out: return STDOUT_FILENO;
        case StdStream::Err: return STDERR_FILENO;
    }
    return STDERR_FILENO;
#endif
}

} // anonymous namespace

bool IsTty(StdStream stream) {
#ifdef _WIN32
    return _isatty(FileDescriptor(stream)) != 0;
#else
    return isatty(FileDescriptor(stream)) != 0;
#endif
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveColor(StdStream stream, bool force_color, bool force_no_color) {
    if (force_no_color || NoColorEnvSet()) {
        return false;
    }
    return force_color || IsTty(stream);
}

} // namespace erpl_gui
