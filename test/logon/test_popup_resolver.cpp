#include <catch2/catch_test_macros.hpp>

#include <erpl_gui/gui/element_access.hpp>
#include <erpl_gui/logon/popup_resolver.hpp>

#include "../mocks/mock_gui.hpp"

#include <chrono>

using namespace erpl_gui;
using namespace erpl_gui::testing;
using namespace std::chrono_literals;

namespace {

// The "user already logged on" dialog on top of the main window.
void ShowMultipleLogon(MockGuiSession& session) {
    session.Add(element_id::kPopupWindow, "License Information for Multiple Logons");
    session.Add(element_id::kMultiLogonTerminate);
    session.Add(element_id::kMultiLogonContinue);
    session.Add(element_id::kPopupConfirmButton);
}

void HideMultipleLogon(MockGuiSession& session) {
    session.Remove(element_id::kMultiLogonTerminate);
    session.Remove(element_id::kMultiLogonContinue);
    session.Remove(element_id::kPopupConfirmButton);
}

} // anonymous namespace

// ===========================================================================
// ClassifyPopup
// ===========================================================================

TEST_CASE("ClassifyPopup: no wnd[1] is None", "[logon][popup]") {
    auto session = MakeMenuScreen();
    CHECK(ClassifyPopup(*session) == PopupKind::None);
}

TEST_CASE("ClassifyPopup: multiple logon radio button", "[logon][popup]") {
    auto session = MakeMenuScreen();
    ShowMultipleLogon(*session);
    CHECK(ClassifyPopup(*session) == PopupKind::MultipleLogon);
}

TEST_CASE("ClassifyPopup: any other wnd[1] is an info dialog", "[logon][popup]") {
    auto session = MakeMenuScreen();
    session->Add(element_id::kPopupWindow, "Copyright");
    CHECK(ClassifyPopup(*session) == PopupKind::InfoDialog);
}

// ===========================================================================
// DrainPopups
// ===========================================================================

TEST_CASE("DrainPopups: nothing to do takes one probe", "[logon][popup]") {
    auto session = MakeMenuScreen();
    FakeClock clock;

    auto report = DrainPopups(*session, clock);
    CHECK(report.probes == 1);
    CHECK(report.resolved.empty());
    CHECK_FALSE(report.exhausted);
    REQUIRE(clock.sleeps.size() == 1);
    CHECK(clock.sleeps[0] == 500ms);
    CHECK(session->Get(element_id::kMainWindow)->vkeys.empty());
}

TEST_CASE("DrainPopups: info dialog is closed with Enter on wnd[0]", "[logon][popup]") {
    auto session = MakeMenuScreen();
    session->Add(element_id::kPopupWindow, "Copyright");
    auto main = session->Get(element_id::kMainWindow);
    main->on_vkey = [&session](int) { session->Remove(element_id::kPopupWindow); };
    FakeClock clock;

    auto report = DrainPopups(*session, clock);
    CHECK(report.probes == 2);
    CHECK(report.resolved == std::vector<PopupKind>{PopupKind::InfoDialog});
    CHECK(main->vkeys == std::vector<int>{vkey::kEnter});
}

TEST_CASE("DrainPopups: multiple logon then info dialog", "[logon][popup]") {
    ScopedLogCapture logs;
    auto session = MakeMenuScreen();
    ShowMultipleLogon(*session);

    // Confirming the multiple logon dialog brings up an info dialog, which
    // Enter on the main window closes.
    session->Get(element_id::kPopupConfirmButton)->on_invoke = [&session] {
        HideMultipleLogon(*session);
        session->Get(element_id::kPopupWindow)->text = "System Messages";
    };
    session->Get(element_id::kMainWindow)->on_vkey = [&session](int) {
        session->Remove(element_id::kPopupWindow);
    };
    auto keep = session->Get(element_id::kMultiLogonContinue);
    auto terminate = session->Get(element_id::kMultiLogonTerminate);
    FakeClock clock;

    auto report = DrainPopups(*session, clock);

    CHECK(report.probes == 3);
    CHECK(report.resolved ==
          std::vector<PopupKind>{PopupKind::MultipleLogon, PopupKind::InfoDialog});
    CHECK_FALSE(report.exhausted);
    CHECK(keep->invoke_count == 1);
    CHECK(terminate->invoke_count == 0);
    CHECK(clock.TotalSlept() == 1500ms);
    CHECK(logs.Contains("popup detected: 'License Information for Multiple Logons' (MULTIPLE_LOGON)"));
    CHECK(logs.Contains("popup detected: 'System Messages' (INFO_DIALOG)"));
}

TEST_CASE("DrainPopups: terminate choice selects OPT1", "[logon][popup]") {
    auto session = MakeMenuScreen();
    ShowMultipleLogon(*session);
    session->Get(element_id::kPopupConfirmButton)->on_invoke = [&session] {
        HideMultipleLogon(*session);
        session->Remove(element_id::kPopupWindow);
    };
    auto keep = session->Get(element_id::kMultiLogonContinue);
    auto terminate = session->Get(element_id::kMultiLogonTerminate);
    FakeClock clock;

    PopupPolicy policy;
    policy.multiple_logon = MultipleLogonChoice::ContinueTerminateOthers;
    auto report = DrainPopups(*session, clock, policy);

    CHECK(report.resolved == std::vector<PopupKind>{PopupKind::MultipleLogon});
    CHECK(terminate->invoke_count == 1);
    CHECK(keep->invoke_count == 0);
}

TEST_CASE("DrainPopups: missing confirm button falls back to Enter on wnd[1]", "[logon][popup]") {
    auto session = MakeMenuScreen();
    ShowMultipleLogon(*session);
    session->Remove(element_id::kPopupConfirmButton);
    auto popup = session->Get(element_id::kPopupWindow);
    popup->on_vkey = [&session](int) {
        HideMultipleLogon(*session);
        session->Remove(element_id::kPopupWindow);
    };
    FakeClock clock;

    auto report = DrainPopups(*session, clock);
    CHECK(popup->vkeys == std::vector<int>{vkey::kEnter});
    CHECK(report.resolved.size() == 1);
    CHECK(report.probes == 2);
}

TEST_CASE("DrainPopups: failed resolution falls back to Enter on wnd[0]", "[logon][popup]") {
    ScopedLogCapture logs;
    auto session = MakeMenuScreen();
    ShowMultipleLogon(*session);
    session->Get(element_id::kPopupConfirmButton)->invoke_error =
        MockError("press", "button disabled");
    session->Get(element_id::kMainWindow)->on_vkey = [&session](int) {
        HideMultipleLogon(*session);
        session->Remove(element_id::kPopupWindow);
    };
    FakeClock clock;

    auto report = DrainPopups(*session, clock);
    CHECK(report.resolved == std::vector<PopupKind>{PopupKind::MultipleLogon});
    CHECK(session->Get(element_id::kMainWindow)->vkeys.size() == 1);
    CHECK(logs.Contains("button disabled"));
    CHECK(logs.Count(LogLevel::Warn) >= 1);
}

TEST_CASE("DrainPopups: stops after five attempts on a stuck popup", "[logon][popup]") {
    ScopedLogCapture logs;
    auto session = MakeMenuScreen();
    session->Add(element_id::kPopupWindow, "Stuck");
    FakeClock clock;

    auto report = DrainPopups(*session, clock);
    CHECK(report.probes == 5);
    CHECK(report.resolved.size() == 5);
    CHECK(report.exhausted);
    CHECK(clock.sleeps.size() == 5);
    CHECK(session->Get(element_id::kMainWindow)->vkeys.size() == 5);
    CHECK(logs.Contains("still open after 5 attempts"));
}

TEST_CASE("DrainPopups: honors a custom bound and settle time", "[logon][popup]") {
    auto session = MakeMenuScreen();
    session->Add(element_id::kPopupWindow, "Stuck");
    FakeClock clock;

    PopupPolicy policy;
    policy.max_iterations = 2;
    policy.settle = 100ms;
    auto report = DrainPopups(*session, clock, policy);
    CHECK(report.probes == 2);
    CHECK(report.exhausted);
    CHECK(clock.TotalSlept() == 200ms);
}
