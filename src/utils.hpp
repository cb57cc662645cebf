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
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);
void end_progress_line();

// Concurrency control (RAII lock on the install lock file)
class InstallLock {
public:
    explicit InstallLock(const std::filesystem::path& lock_file);
    ~InstallLock();
    InstallLock(const InstallLock&) = delete;
    InstallLock& operator=(const InstallLock&) = delete;
private:
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const std::filesystem::path& path);
std::filesystem::path validate_path(const std::filesystem::path& path, const std::filesystem::path& root);

// String utilities
std::string trim(std::string_view text);
