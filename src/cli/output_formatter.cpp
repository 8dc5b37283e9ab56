#include <erpl_gui/cli/output_formatter.hpp>
#include <erpl_gui/core/terminal.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace erpl_gui {

using namespace erpl_gui::ansi;

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            j.push_back(std::move(obj));
        }
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& row) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<std::pair<std::string, std::string>>& entries) const {

    if (json_mode_) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [key, value] : entries) {
            j[key] = value;
        }
        out_ << j.dump() << "\n";
        return;
    }

    size_t width = 0;
    for (const auto& entry : entries) {
        width = std::max(width, entry.first.size());
    }

    if (color_mode_) {
        out_ << kBold << title << kReset << "\n";
    } else {
        out_ << title << "\n";
    }
    for (const auto& [key, value] : entries) {
        out_ << "  ";
        if (color_mode_) out_ << kDim;
        out_ << std::left << std::setw(static_cast<int>(width)) << key << " :";
        if (color_mode_) out_ << kReset;
        out_ << " " << value << "\n";
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << kBold << error.operation << kReset;
        if (!error.target.empty()) {
            err_ << kDim << " [" << error.target << "]" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (error.hint.has_value() && !error.hint->empty()) {
            err_ << "  " << kYellow << "Hint: " << kReset << *error.hint << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.target.empty()) {
        err_ << " [" << error.target << "]";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  Hint: " << *error.hint << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json j = {{"success", true}, {"message", message}};
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "[OK]" << kReset << " " << message << "\n";
        return;
    }

    out_ << "[OK] " << message << "\n";
}

void OutputFormatter::PrintInfo(const std::string& message) const {
    if (json_mode_) {
        return;
    }
    out_ << message << "\n";
}

} // namespace erpl_gui
