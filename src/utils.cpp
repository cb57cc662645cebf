#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_line_open = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        if (progress_line_open) {
            std::cout << std::endl;
            progress_line_open = false;
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
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

// Redraws the bar in place on a TTY; prints one line per update otherwise.
void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();

    if (!is_stdout_tty) {
        std::cout << get_string("info.log_prefix") << msg << " " << std::fixed << std::setprecision(1)
                  << percentage << "%" << std::endl;
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
    progress_line_open = true;
}

void end_progress_line() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_line_open) {
        std::cout << std::endl;
        progress_line_open = false;
    }
}

InstallLock::InstallLock(const fs::path& lock_file) {
    ensure_dir_exists(lock_file.parent_path());
    lock_fd = open(lock_file.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw VciException(ErrorKind::Filesystem,
            string_format("error.create_file_failed", lock_file.string()) + ": " + std::strerror(errno));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw VciException(ErrorKind::Locked, string_format("error.install_locked", lock_file.string()));
        }
        throw VciException(ErrorKind::Locked,
            string_format("error.install_lock_failed", lock_file.string()) + ": " + std::strerror(err));
    }
}

InstallLock::~InstallLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (path.empty()) return;
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw VciException(ErrorKind::Filesystem,
                string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw VciException(ErrorKind::Filesystem, string_format("error.path_not_dir", path.string()));
    }
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw VciException(ErrorKind::Filesystem, string_format("error.path_not_relative", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw VciException(ErrorKind::Filesystem, string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

std::string trim(std::string_view text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return std::string(text.substr(begin, end - begin + 1));
}
