#ifndef PDFSHRINK_COLOR_HPP
#define PDFSHRINK_COLOR_HPP

// ANSI escape sequences for console output
inline constexpr const char* RESET  = "\033[0m";
inline constexpr const char* RED    = "\033[31m";
inline constexpr const char* GREEN  = "\033[32m";
inline constexpr const char* YELLOW = "\033[33m";
inline constexpr const char* BLUE   = "\033[34m";
inline constexpr const char* CYAN   = "\033[36m";
inline constexpr const char* GRAY   = "\033[90m";

#endif // PDFSHRINK_COLOR_HPP
