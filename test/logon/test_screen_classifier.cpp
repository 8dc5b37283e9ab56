#include <catch2/catch_test_macros.hpp>

#include <erpl_gui/gui/element_access.hpp>
#include <erpl_gui/logon/screen_classifier.hpp>

#include "../mocks/mock_gui.hpp"

using namespace erpl_gui;
using namespace erpl_gui::testing;

TEST_CASE("ClassifyScreen: client field means LOGIN", "[logon][screen]") {
    auto session = MakeLoginScreen();
    CHECK(ClassifyScreen(*session) == ScreenState::Login);
}

TEST_CASE("ClassifyScreen: client field wins over a transaction", "[logon][screen]") {
    auto session = MakeLoginScreen();
    session->SetTransaction("SESSION_MANAGER");
    CHECK(ClassifyScreen(*session) == ScreenState::Login);
    CHECK(session->info_calls == 0);
}

TEST_CASE("ClassifyScreen: Easy Access is MENU", "[logon][screen]") {
    auto session = MakeMenuScreen();
    CHECK(ClassifyScreen(*session) == ScreenState::Menu);
}

TEST_CASE("ClassifyScreen: non-blank transaction other than LOGIN is MENU", "[logon][screen]") {
    MockGuiSession session;
    session.SetTransaction("  SE80 ");
    CHECK(ClassifyScreen(session) == ScreenState::Menu);
}

TEST_CASE("ClassifyScreen: LOGIN transaction falls through to the title", "[logon][screen]") {
    MockGuiSession session;
    session.SetTransaction("LOGIN");
    CHECK(ClassifyScreen(session) == ScreenState::Unknown);

    session.Add(element_id::kMainWindow, "SAP");
    CHECK(ClassifyScreen(session) == ScreenState::Menu);
}

TEST_CASE("ClassifyScreen: any non-blank title counts as logged in", "[logon][screen]") {
    MockGuiSession session;
    session.info = Result<SessionInfo, Error>::Err(MockError("Info", "busy"));
    session.Add(element_id::kMainWindow, "Change Password");
    CHECK(ClassifyScreen(session) == ScreenState::Menu);
}

TEST_CASE("ClassifyScreen: nothing readable is UNKNOWN", "[logon][screen]") {
    MockGuiSession session;
    session.info = Result<SessionInfo, Error>::Err(MockError("Info", "busy"));
    CHECK(ClassifyScreen(session) == ScreenState::Unknown);

    auto wnd = session.Add(element_id::kMainWindow, "   ");
    CHECK(ClassifyScreen(session) == ScreenState::Unknown);

    wnd->text_error = MockError("Text", "stale");
    CHECK(ClassifyScreen(session) == ScreenState::Unknown);
}

TEST_CASE("ClassifyScreen: is read-only", "[logon][screen]") {
    auto session = MakeLoginScreen();
    (void)ClassifyScreen(*session);
    for (const char* id : {element_id::kClientField, element_id::kUserField,
                           element_id::kPasswordField, element_id::kLanguageField,
                           element_id::kMainWindow}) {
        auto element = session->Get(id);
        CHECK(element->set_text_calls.empty());
        CHECK(element->vkeys.empty());
        CHECK(element->invoke_count == 0);
    }
}
