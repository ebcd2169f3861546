#ifndef STRATA_UTILS_TERMINAL_HPP
#define STRATA_UTILS_TERMINAL_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Strata::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kNone   = "";
        inline constexpr std::string_view kReset  = "\033[0m";
        inline constexpr std::string_view kCyan   = "\033[36m";
        inline constexpr std::string_view kBrightBlack = "\033[90m";
        inline constexpr std::string_view kOrange = "\033[38;5;208m";
    }

    namespace Symbols {
        inline constexpr std::string_view kDot  = "•";
        inline constexpr std::string_view kInfo = "ℹ";
        inline constexpr std::string_view kWarn = "⚠";
    }

    // An empty color leaves the text untouched so plain streams stay escape-free.
    inline std::string ApplyColor(std::string_view text, std::string_view color) {
        if (color.empty()) return std::string(text);
        std::string out;
        out.reserve(color.size() + text.size() + Colors::kReset.size());
        out.append(color).append(text).append(Colors::kReset);
        return out;
    }

    // Heavy box table; the first row is the header. Column widths fit the widest
    // cell (byte length) plus one space on each side.
    class Table {
    public:
        explicit Table(std::vector<std::string> header, std::string_view color = Colors::kNone)
            : color_(color)
        {
            rows_.push_back(std::move(header));
        }

        Table& add_row(std::vector<std::string> cells)
        {
            cells.resize(rows_.front().size());
            rows_.push_back(std::move(cells));
            return *this;
        }

        [[nodiscard]] std::string render() const
        {
            std::vector<std::size_t> widths(rows_.front().size(), 0);
            for (const auto& row : rows_) {
                for (std::size_t column = 0; column < widths.size(); ++column) {
                    widths[column] = std::max(widths[column], row[column].size() + 2);
                }
            }

            std::string out = border(widths, "┏", "┳", "┓") + '\n' + line(rows_.front(), widths) + '\n'
                              + border(widths, "┣", "╋", "┫") + '\n';
            for (std::size_t i = 1; i < rows_.size(); ++i) {
                out += line(rows_[i], widths) + '\n';
            }
            out += border(widths, "┗", "┻", "┛") + '\n';
            return out;
        }

    private:
        [[nodiscard]] std::string border(const std::vector<std::size_t>& widths, std::string_view left,
                                         std::string_view junction, std::string_view right) const
        {
            std::string out(left);
            for (std::size_t column = 0; column < widths.size(); ++column) {
                for (std::size_t i = 0; i < widths[column]; ++i) out.append("━");
                out.append(column + 1 < widths.size() ? junction : right);
            }
            return ApplyColor(out, color_);
        }

        [[nodiscard]] std::string line(const std::vector<std::string>& cells, const std::vector<std::size_t>& widths) const
        {
            const auto bar = ApplyColor("┃", color_);
            std::string out = bar;
            for (std::size_t column = 0; column < widths.size(); ++column) {
                std::string cell = " " + cells[column];
                cell.append(widths[column] - cell.size(), ' ');
                out.append(cell).append(bar);
            }
            return out;
        }

        std::string_view color_;
        std::vector<std::vector<std::string>> rows_{};
    };
}

#endif // STRATA_UTILS_TERMINAL_HPP
