#include <catch2/catch_test_macros.hpp>

#include <erpl_gui/core/log.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace erpl_gui;

namespace {

struct Line {
    LogLevel level;
    std::string component;
    std::string message;
};

class RecordingSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        lines.push_back({level, std::string(component), std::string(message)});
    }

    std::vector<Line> lines;
};

// Runs one logon-shaped burst of messages through a logger at `level`.
std::vector<Line> LogBurst(LogLevel level) {
    auto sink = std::make_unique<RecordingSink>();
    auto* recorded = sink.get();
    Logger logger(std::move(sink), level);
    logger.Debug("screen", "window title 'SAP'");
    logger.Info("connect", "opening 'DEV SSO'");
    logger.Warn("popup", "popup still open after 5 probes");
    logger.Error("workflow", "Login failed [E]: Name or password is incorrect");
    return recorded->lines;
}

} // anonymous namespace

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: plain layout is ISO timestamp, level, component", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "connect", "opening 'DEV SSO'");

    auto output = oss.str();
    CHECK(output.find("Z [INFO] [connect] opening 'DEV SSO'") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
    CHECK(output.back() == '\n');
}

TEST_CASE("ConsoleSink: color layout uses a short clock and level colors", "[log]") {
    std::ostringstream debug_oss, info_oss, warn_oss, error_oss;
    ConsoleSink(true, debug_oss).Write(LogLevel::Debug, "screen", "probe");
    ConsoleSink(true, info_oss).Write(LogLevel::Info, "connect", "open");
    ConsoleSink(true, warn_oss).Write(LogLevel::Warn, "verify", "W message");
    ConsoleSink(true, error_oss).Write(LogLevel::Error, "workflow", "failed");

    CHECK(debug_oss.str().find("\033[90m") != std::string::npos);
    CHECK(info_oss.str().find("\033[36m") != std::string::npos);
    CHECK(warn_oss.str().find("\033[33m") != std::string::npos);

    // Errors color the tag and the text.
    const auto error = error_oss.str();
    auto first = error.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(error.find("\033[1;31m", first + 1) != std::string::npos);

    // HH:MM:SS, no ISO date.
    CHECK(info_oss.str().find('T') == std::string::npos);
    CHECK(info_oss.str().find('Z') == std::string::npos);
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one object per line with ts, level, component, message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "bootstrap", "SAP Logon started");
    sink.Write(LogLevel::Warn, "verify", "status bar [W]");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"component\":\"bootstrap\"") != std::string::npos);
    CHECK(output.find("\"message\":\"SAP Logon started\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes quotes, backslashes and control characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "popup",
               "popup 'C:\\SAP' \"Info\"\nline2\x02");

    auto output = oss.str();
    CHECK(output.find("C:\\\\SAP") != std::string::npos);
    CHECK(output.find("\\\"Info\\\"") != std::string::npos);
    CHECK(output.find("\\nline2\\u0002") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: default verbosity shows warnings and errors", "[log]") {
    auto lines = LogBurst(LogLevelFromVerbosity(0, false));
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].level == LogLevel::Warn);
    CHECK(lines[0].component == "popup");
    CHECK(lines[1].message == "Login failed [E]: Name or password is incorrect");
}

TEST_CASE("Logger: -v adds info, -vv adds debug, -q keeps errors only", "[log]") {
    CHECK(LogBurst(LogLevelFromVerbosity(1, false)).size() == 3);
    CHECK(LogBurst(LogLevelFromVerbosity(2, false)).size() == 4);
    CHECK(LogBurst(LogLevelFromVerbosity(5, false)).size() == 4);

    auto quiet = LogBurst(LogLevelFromVerbosity(2, true));
    REQUIRE(quiet.size() == 1);
    CHECK(quiet[0].level == LogLevel::Error);
}

TEST_CASE("Logger: concurrent writers each land whole", "[log]") {
    std::ostringstream oss;
    Logger logger(std::make_unique<ConsoleSink>(true, oss), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessages = 50;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessages; ++i) {
                logger.Info("session-" + std::to_string(t), "probe " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == kThreads * kMessages);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("InitGlobalLogger: routes free functions to the installed sink", "[log]") {
    auto sink = std::make_unique<RecordingSink>();
    auto* recorded = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("login", "filtered");
    LogInfo("login", "credentials filled");
    LogWarn("popup", "still open");
    LogError("workflow", "failed");

    REQUIRE(recorded->lines.size() == 3);
    CHECK(recorded->lines[0].component == "login");
    CHECK(recorded->lines[1].level == LogLevel::Warn);
    CHECK(recorded->lines[2].message == "failed");

    InitGlobalLogger(std::make_unique<RecordingSink>(), LogLevel::Error);
}
