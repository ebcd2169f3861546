#ifndef STRATA_COMMON_LOGGING_HPP
#define STRATA_COMMON_LOGGING_HPP

#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include "../utils/terminal.hpp"

namespace Strata {
    enum class LogLevel {
        Silent,
        Warning,
        Info,
        Debug
    };

    struct LogOptions {
        std::ostream* stream{&std::cout};   // nullptr silences every message
        LogLevel level{LogLevel::Warning};
        bool colorize{false};
    };

    namespace Log {
        [[nodiscard]] inline bool enabled(const LogOptions& options, LogLevel level) noexcept
        {
            return options.stream != nullptr && level != LogLevel::Silent
                && static_cast<int>(level) <= static_cast<int>(options.level);
        }

        inline void write(const LogOptions& options, LogLevel level, std::string_view message)
        {
            if (!enabled(options, level)) {
                return;
            }
            namespace Terminal = Utils::Terminal;
            std::string_view symbol = Terminal::Symbols::kDot;
            std::string_view color = Terminal::Colors::kNone;
            switch (level) {
                case LogLevel::Warning:
                    symbol = Terminal::Symbols::kWarn;
                    color = Terminal::Colors::kOrange;
                    break;
                case LogLevel::Info:
                    symbol = Terminal::Symbols::kInfo;
                    color = Terminal::Colors::kCyan;
                    break;
                case LogLevel::Debug:
                    color = Terminal::Colors::kBrightBlack;
                    break;
                case LogLevel::Silent:
                    return;
            }
            if (!options.colorize) {
                color = Terminal::Colors::kNone;
            }
            *options.stream << "[Strata] " << Terminal::ApplyColor(symbol, color) << ' ' << message << std::endl;
        }

        inline void warning(const LogOptions& options, std::string_view message) { write(options, LogLevel::Warning, message); }
        inline void info(const LogOptions& options, std::string_view message) { write(options, LogLevel::Info, message); }
        inline void debug(const LogOptions& options, std::string_view message) { write(options, LogLevel::Debug, message); }
    }
}

#endif // STRATA_COMMON_LOGGING_HPP
