#include <catch2/catch_test_macros.hpp>

#include <erpl_gui/gui/i_scripting_engine.hpp>

using namespace erpl_gui;

TEST_CASE("MakeDefaultEngineLocator: returns a locator", "[gui][locator]") {
    auto locator = MakeDefaultEngineLocator();
    REQUIRE(locator != nullptr);
}

#ifndef _WIN32
TEST_CASE("MakeDefaultEngineLocator: unavailable off Windows", "[gui][locator]") {
    auto locator = MakeDefaultEngineLocator();
    auto attached = locator->Attach();
    REQUIRE(attached.IsErr());
    CHECK(attached.Error().category == ErrorCategory::Unavailable);
    CHECK(attached.Error().operation == "AttachSapGui");
    CHECK(attached.Error().target == "SAPGUI");
    CHECK(attached.Error().message.find("Windows") != std::string::npos);
}

TEST_CASE("MakeDefaultEngineLocator: every Attach is a fresh lookup", "[gui][locator]") {
    auto locator = MakeDefaultEngineLocator();
    CHECK(locator->Attach().IsErr());
    CHECK(locator->Attach().IsErr());
}
#endif

#ifdef _WIN32
#include <erpl_gui/gui/com_scripting_engine.hpp>

TEST_CASE("ComEngineLocator: attach either yields a live engine or Unavailable",
          "[gui][locator][com]") {
    ComEngineLocator locator;
    auto attached = locator.Attach();
    if (attached.IsOk()) {
        REQUIRE(attached.Value() != nullptr);
        CHECK(attached.Value()->ConnectionCount().IsOk());
    } else {
        CHECK(attached.Error().category == ErrorCategory::Unavailable);
        CHECK(attached.Error().operation == "AttachSapGui");
    }
}
#endif
