#pragma once

namespace erpl_gui {

// ANSI escape sequences used by the colored log sink and the output formatter.
namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

} // namespace ansi

enum class StdStream {
    In,
    Out,
    Err,
};

/// Returns true if the given standard stream is attached to a terminal.
bool IsTty(StdStream stream);

/// Shorthand for stdin.
inline bool IsStdinTty() { return IsTty(StdStream::In); }

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve whether colored output should be used for a stream, honoring
/// explicit --color / --no-color flags and NO_COLOR.
bool ResolveColor(StdStream stream, bool force_color, bool force_no_color);

} // namespace erpl_gui
