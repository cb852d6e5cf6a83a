#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    bool verbose_mode = false;
    bool quiet_mode = false;
    bool dry_run_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    if (quiet_mode) return;
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_debug(std::string_view msg) {
    if (quiet_mode || !verbose_mode) return;
    log_internal(get_string("debug.prefix"), COLOR_GRAY, msg, std::cerr);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

void set_quiet_mode(bool enable) {
    quiet_mode = enable;
}

void set_dry_run_mode(bool enable) {
    dry_run_mode = enable;
}

bool get_dry_run_mode() {
    return dry_run_mode;
}

std::string trim(std::string_view s) {
    const char* ws = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string_view::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return std::string(s.substr(start, end - start + 1));
}

std::string trim_trailing_slashes(std::string s) {
    while (!s.empty() && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

void ensure_existing_file(const fs::path& path, const std::string& label) {
    if (path.empty()) {
        throw CdnsnipException(string_format("error.required", label));
    }
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw CdnsnipException(string_format("error.not_found", label, path.string()));
    }
    if (fs::is_directory(status)) {
        throw CdnsnipException(string_format("error.is_directory", label, path.string()));
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CdnsnipException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}
