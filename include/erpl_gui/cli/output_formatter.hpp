#pragma once

#include <erpl_gui/core/result.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace erpl_gui {

// ---------------------------------------------------------------------------
// OutputFormatter - human-readable and JSON output for the CLI.
//
// When color_mode is true and json_mode is false, tables are rendered with
// FTXUI and messages carry ANSI escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Table with headers and rows. JSON mode: array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Aligned "key : value" lines under a title.
    void PrintDetail(const std::string& title,
                     const std::vector<std::pair<std::string, std::string>>& entries) const;

    // Raw JSON document to stdout.
    void PrintJson(const std::string& json) const;

    // Error to stderr, with SAP message and hint when present.
    void PrintError(const Error& error) const;

    // One-line success message.
    void PrintSuccess(const std::string& message) const;

    // Informational line; suppressed in JSON mode.
    void PrintInfo(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace erpl_gui
