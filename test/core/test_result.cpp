#include <catch2/catch_test_macros.hpp>

#include <erpl_gui/core/result.hpp>
#include <erpl_gui/core/types.hpp>

#include <string>
#include <utility>

using namespace erpl_gui;

// ===========================================================================
// Result
// ===========================================================================

TEST_CASE("Result: Ok carries a client", "[result]") {
    auto r = SapClient::Create("100");
    REQUIRE(r.IsOk());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value().Value() == "100");
}

TEST_CASE("Result: Err carries the validation message", "[result]") {
    auto r = SapClient::Create("1x0");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK_FALSE(r.Error().empty());
}

TEST_CASE("Result: ValueOr falls back for an unreadable property", "[result]") {
    auto read = Result<std::string, Error>::Ok("DEV");
    auto unreadable = Result<std::string, Error>::Err(
        Error{"SystemName", "GuiSessionInfo", "busy", std::nullopt, std::nullopt,
              std::nullopt, ErrorCategory::Unavailable});
    CHECK(read.ValueOr("") == "DEV");
    CHECK(unreadable.ValueOr("") == "");
    CHECK(std::move(unreadable).ValueOr("?") == "?");
}

TEST_CASE("Result: moving the Error out keeps its fields", "[result]") {
    auto r = Result<int, Error>::Err(Error{"ConnectionCount", "GuiApplication", "gone",
                                           std::nullopt, std::nullopt, std::nullopt,
                                           ErrorCategory::Unavailable});
    Error e = std::move(r).Error();
    CHECK(e.operation == "ConnectionCount");
    CHECK(e.category == ErrorCategory::Unavailable);
}

// ===========================================================================
// Error struct
// ===========================================================================

TEST_CASE("Error: ToString with all fields", "[error]") {
    Error e{"VerifyLogin", "DEV", "Login failed [E]: Name or password is incorrect",
            "Name or password is incorrect", "E", std::nullopt,
            ErrorCategory::LoginFailed};
    auto s = e.ToString();
    CHECK(s.find("VerifyLogin") != std::string::npos);
    CHECK(s.find("[DEV]") != std::string::npos);
    CHECK(s.find("(E)") != std::string::npos);
    CHECK(s.find("SAP: Name or password is incorrect") != std::string::npos);
}

TEST_CASE("Error: ToString without optional fields", "[error]") {
    Error e{"OpenConnection", "", "window not ready", std::nullopt, std::nullopt,
            std::nullopt, ErrorCategory::Timeout};
    auto s = e.ToString();
    CHECK(s == "OpenConnection: window not ready");
}

TEST_CASE("Error: equality", "[error]") {
    Error e1{"Op", "wnd[0]", "msg", std::nullopt, std::nullopt, std::nullopt,
             ErrorCategory::LoginScreen};
    Error e2 = e1;
    Error e3 = e1;
    e3.hint = "different";
    CHECK(e1 == e2);
    CHECK(e1 != e3);
}

TEST_CASE("Result with Error type", "[result][error]") {
    auto r = Result<std::string, Error>::Err(
        Error{"AttachSapGui", "SAPGUI", "not running", std::nullopt, std::nullopt,
              std::nullopt, ErrorCategory::Unavailable});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Unavailable);
    CHECK(r.Error().operation == "AttachSapGui");
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error{"SetText", "wnd[0]/usr/txtRSYST-BNAME",
                                              "read-only", std::nullopt, std::nullopt,
                                              std::nullopt, ErrorCategory::LoginScreen});
    REQUIRE(err.IsErr());
    CHECK(err.Error().target == "wnd[0]/usr/txtRSYST-BNAME");

    ok = err;
    CHECK(ok.IsErr());
}

// ===========================================================================
// ErrorCategory & ExitCode
// ===========================================================================

namespace {

Error WithCategory(ErrorCategory category) {
    Error e;
    e.operation = "Op";
    e.message = "msg";
    e.category = category;
    return e;
}

} // anonymous namespace

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e;
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: ExitCode mapping", "[error]") {
    CHECK(WithCategory(ErrorCategory::Unavailable).ExitCode() == 1);
    CHECK(WithCategory(ErrorCategory::Timeout).ExitCode() == 1);
    CHECK(WithCategory(ErrorCategory::LoginScreen).ExitCode() == 1);
    CHECK(WithCategory(ErrorCategory::LoginFailed).ExitCode() == 1);
    CHECK(WithCategory(ErrorCategory::Config).ExitCode() == 2);
    CHECK(WithCategory(ErrorCategory::Internal).ExitCode() == 99);
}

TEST_CASE("Error: CategoryName", "[error]") {
    CHECK(WithCategory(ErrorCategory::Unavailable).CategoryName() == "unavailable");
    CHECK(WithCategory(ErrorCategory::Timeout).CategoryName() == "timeout");
    CHECK(WithCategory(ErrorCategory::LoginScreen).CategoryName() == "login_screen");
    CHECK(WithCategory(ErrorCategory::LoginFailed).CategoryName() == "login_failed");
    CHECK(WithCategory(ErrorCategory::Config).CategoryName() == "config");
    CHECK(WithCategory(ErrorCategory::Internal).CategoryName() == "internal");
}

TEST_CASE("Error: ToJson contains required fields", "[error]") {
    Error e{"VerifyLogin", "DEV", "Login failed [A]: System locked", "System locked",
            "A", "Check username / password / client / system availability.",
            ErrorCategory::LoginFailed};
    auto json = e.ToJson();
    CHECK(json.find("\"category\":\"login_failed\"") != std::string::npos);
    CHECK(json.find("\"operation\":\"VerifyLogin\"") != std::string::npos);
    CHECK(json.find("\"target\":\"DEV\"") != std::string::npos);
    CHECK(json.find("\"severity\":\"A\"") != std::string::npos);
    CHECK(json.find("\"sap_message\":\"System locked\"") != std::string::npos);
    CHECK(json.find("\"hint\":") != std::string::npos);
    CHECK(json.find("\"exit_code\":1") != std::string::npos);
}

TEST_CASE("Error: ToJson without optional fields", "[error]") {
    Error e;
    e.operation = "Connect";
    e.message = "timeout";
    auto json = e.ToJson();
    CHECK(json.find("\"category\":\"internal\"") != std::string::npos);
    CHECK(json.find("\"target\"") == std::string::npos);
    CHECK(json.find("\"severity\"") == std::string::npos);
    CHECK(json.find("\"sap_message\"") == std::string::npos);
    CHECK(json.find("\"hint\"") == std::string::npos);
}

TEST_CASE("Error: ToJson escapes special characters", "[error]") {
    Error e;
    e.operation = "Op\"Quoted\"";
    e.message = "line1\nline2\t\"quoted\"";
    e.sap_message = std::string("backslash\\value");
    auto json = e.ToJson();
    CHECK(json.find("\\n") != std::string::npos);
    CHECK(json.find("\\t") != std::string::npos);
    CHECK(json.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(json.find("backslash\\\\value") != std::string::npos);
}

TEST_CASE("Error: ToJson escapes control characters as \\u00XX", "[error]") {
    Error e;
    e.operation = "ReadStatusBar";
    e.message = std::string("bad\x01text\x1f");
    auto json = e.ToJson();
    CHECK(json.find("bad\\u0001text\\u001f") != std::string::npos);
    CHECK(json.find('\x01') == std::string::npos);
    CHECK(json.find('\x1f') == std::string::npos);
}

// ===========================================================================
// Error::FromStatusBar
// ===========================================================================

TEST_CASE("FromStatusBar: builds LoginFailed with severity and text", "[error]") {
    auto e = Error::FromStatusBar("VerifyLogin", "E", "Name or password is incorrect (repeat logon)");
    CHECK(e.category == ErrorCategory::LoginFailed);
    CHECK(e.operation == "VerifyLogin");
    CHECK(e.message == "Login failed [E]: Name or password is incorrect (repeat logon)");
    REQUIRE(e.sap_message.has_value());
    CHECK(*e.sap_message == "Name or password is incorrect (repeat logon)");
    REQUIRE(e.severity.has_value());
    CHECK(*e.severity == "E");
    REQUIRE(e.hint.has_value());
    CHECK(e.hint->find("password") != std::string::npos);
    CHECK(e.ExitCode() == 1);
}

TEST_CASE("FromStatusBar: abort severity", "[error]") {
    auto e = Error::FromStatusBar("VerifyLogin", "A", "Client 999 is not available in this system");
    CHECK(e.message == "Login failed [A]: Client 999 is not available in this system");
    CHECK(e.category == ErrorCategory::LoginFailed);
}
