#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace idtoken::log {

namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[0;31m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
    constexpr const char* BOLD_RED = "\033[1;31m";
}

// Colours follow the TTY check of the target stream unless overridden.
bool ColorsEnabled(std::ostream& os = std::cerr);
void SetColorsEnabled(bool enabled);
std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cerr);

// Debug output is off unless IDTOKEN_DEBUG is set or SetDebugEnabled(true) was called.
bool DebugEnabled();
void SetDebugEnabled(bool enabled);

void Debug(const std::string& message);
void Warn(const std::string& message);
void Error(const std::string& message);

}  // namespace idtoken::log
