#include <catch2/catch_test_macros.hpp>

#include <erpl_gui/cli/credential_prompt.hpp>

#include <sstream>
#include <string>

using namespace erpl_gui;

// The FTXUI form needs a terminal; only the line-based mode is tested here.

TEST_CASE("ConsoleCredentialPrompt: reads the user from a line", "[cli][prompt]") {
    std::istringstream in("JDOE\n");
    std::ostringstream out;
    ConsoleCredentialPrompt prompt(PromptMode::LineInput, in, out);

    auto user = prompt.ReadUser("SAP user for DEV/100: ");
    REQUIRE(user.has_value());
    CHECK(*user == "JDOE");
    CHECK(out.str() == "SAP user for DEV/100: ");
}

TEST_CASE("ConsoleCredentialPrompt: password is wrapped and not echoed", "[cli][prompt]") {
    std::istringstream in("Welcome1!\r\n");
    std::ostringstream out;
    ConsoleCredentialPrompt prompt(PromptMode::LineInput, in, out);

    auto password = prompt.ReadPassword("Password for JDOE@DEV: ");
    REQUIRE(password.has_value());
    CHECK(password->Reveal() == "Welcome1!");
    CHECK(out.str() == "Password for JDOE@DEV: \n");
    CHECK(out.str().find("Welcome1!") == std::string::npos);
}

TEST_CASE("ConsoleCredentialPrompt: end of input is no answer", "[cli][prompt]") {
    std::istringstream in("");
    std::ostringstream out;
    ConsoleCredentialPrompt prompt(PromptMode::LineInput, in, out);

    CHECK_FALSE(prompt.ReadUser("user: ").has_value());
    CHECK_FALSE(prompt.ReadPassword("password: ").has_value());
}

TEST_CASE("ConsoleCredentialPrompt: reads user then password in order", "[cli][prompt]") {
    std::istringstream in("JDOE\nsecret\n");
    std::ostringstream out;
    ConsoleCredentialPrompt prompt(PromptMode::LineInput, in, out);

    CHECK(prompt.ReadUser("user: ") == std::optional<std::string>("JDOE"));
    auto password = prompt.ReadPassword("password: ");
    REQUIRE(password.has_value());
    CHECK(password->Reveal() == "secret");
}

TEST_CASE("ConsoleCredentialPrompt: empty line is an empty answer", "[cli][prompt]") {
    std::istringstream in("\n");
    std::ostringstream out;
    ConsoleCredentialPrompt prompt(PromptMode::LineInput, in, out);

    auto user = prompt.ReadUser("user: ");
    REQUIRE(user.has_value());
    CHECK(user->empty());
}

TEST_CASE("SelectPromptMode: a terminal on stdin gets the masked form", "[cli][prompt]") {
    // Holds even when stderr or stdout is redirected to a file.
    CHECK(SelectPromptMode(true) == PromptMode::MaskedForm);
}

TEST_CASE("SelectPromptMode: piped stdin reads lines", "[cli][prompt]") {
    CHECK(SelectPromptMode(false) == PromptMode::LineInput);
}
