#include <erpl_gui/core/result.hpp>

#include <cstdio>

namespace erpl_gui {

namespace {

// Minimal JSON string escaping. core/ has no JSON library dependency.
std::string JsonEscape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += buffer;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // anonymous namespace

Error Error::FromStatusBar(const std::string& operation,
                           const std::string& severity,
                           const std::string& text) {
    Error error;
    error.operation = operation;
    error.message = "Login failed [" + severity + "]: " + text;
    error.sap_message = text;
    error.severity = severity;
    error.hint = "Check username / password / client / system availability.";
    error.category = ErrorCategory::LoginFailed;
    return error;
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":")" << CategoryName() << R"(",)";
    oss << R"("operation":")" << JsonEscape(operation) << R"(",)";
    if (!target.empty()) {
        oss << R"("target":")" << JsonEscape(target) << R"(",)";
    }
    if (severity.has_value() && !severity->empty()) {
        oss << R"("severity":")" << JsonEscape(*severity) << R"(",)";
    }
    oss << R"("message":")" << JsonEscape(message) << R"(",)";
    if (sap_message.has_value() && !sap_message->empty()) {
        oss << R"("sap_message":")" << JsonEscape(*sap_message) << R"(",)";
    }
    if (hint.has_value() && !hint->empty()) {
        oss << R"("hint":")" << JsonEscape(*hint) << R"(",)";
    }
    oss << R"("exit_code":)" << ExitCode();
    oss << R"(}})";
    return oss.str();
}

} // namespace erpl_gui
