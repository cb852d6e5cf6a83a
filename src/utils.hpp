#pragma once

#include "exception.hpp"
#include <filesystem>
#include <string>
#include <string_view>

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_GRAY = "\033[0;37m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_debug(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Output modes
void set_verbose_mode(bool enable);
void set_quiet_mode(bool enable);
void set_dry_run_mode(bool enable);
bool get_dry_run_mode();

// String utilities
std::string trim(std::string_view s);
std::string trim_trailing_slashes(std::string s);

// Filesystem utilities
void ensure_existing_file(const std::filesystem::path& path, const std::string& label);
std::string read_file(const std::filesystem::path& path);
