#ifndef MOLPROP_LOSS_REPORT_HPP
#define MOLPROP_LOSS_REPORT_HPP

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "registry.hpp"
#include "../utils/terminal.hpp"

namespace Molprop::Loss {
    struct ReportOptions {
        bool color{true};
    };

    /*
     * Table of every registered (dataset type, loss name) pair with the loss it resolves to.
     * Printed by training front-ends next to an UnsupportedLossFunction message.
     */
    inline std::string registry_report(const ReportOptions& options = {})
    {
        namespace Terminal = Utils::Terminal;
        const std::string_view frame = options.color ? Terminal::Colors::kBrightBlack : std::string_view{};
        const std::string_view header = options.color ? Terminal::Colors::kGoldenrod : std::string_view{};

        std::vector<std::vector<std::string>> rows;
        for (const auto type : kDatasetTypes) {
            const auto fallback = default_loss(type);
            for (const auto& loss_name : available(type)) {
                const bool is_default = fallback.has_value() && *fallback == loss_name;
                rows.push_back({std::string{to_string(type)}, loss_name, name(select(type, loss_name)), is_default ? "yes" : ""});
            }
        }

        const std::vector<std::string> titles{"dataset type", "loss function", "computes", "default"};
        std::vector<std::size_t> spacings(titles.size());
        for (std::size_t column = 0; column < titles.size(); ++column) {
            std::size_t width = titles[column].size();
            for (const auto& row : rows) {
                width = std::max(width, row[column].size());
            }
            spacings[column] = width + 2;
        }

        std::ostringstream stream;
        stream << Terminal::HTop(spacings, frame) << '\n';
        // Titles are padded before colouring; escape codes would otherwise count as width.
        const auto bar = Terminal::ApplyColor(Terminal::Symbols::kBoxVertical, frame);
        stream << bar;
        for (std::size_t column = 0; column < titles.size(); ++column) {
            stream << ' ' << Terminal::ApplyColor(Terminal::Pad(titles[column], spacings[column] - 2), header) << ' ' << bar;
        }
        stream << '\n' << Terminal::HMid(spacings, frame) << '\n';
        for (const auto& row : rows) {
            stream << Terminal::Row(row, spacings, frame) << '\n';
        }
        stream << Terminal::HBottom(spacings, frame) << '\n';
        return stream.str();
    }

    inline void print_registry(std::ostream& stream, const ReportOptions& options = {})
    {
        stream << registry_report(options);
    }
}

#endif // MOLPROP_LOSS_REPORT_HPP
