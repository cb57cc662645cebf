#include "path_manager.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace {
    constexpr std::string_view path_key = "PATH=";

    std::string unquote(std::string value) {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    std::string process_path() {
        const char* value = std::getenv("PATH");
        return value ? value : "";
    }
}

std::vector<std::string> split_path_list(const std::string& text, char delimiter) {
    std::vector<std::string> entries;
    if (text.empty()) {
        return entries;
    }
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            entries.push_back(text.substr(start));
            break;
        }
        entries.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return entries;
}

std::string join_path_list(const std::vector<std::string>& entries, char delimiter) {
    std::string joined;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) joined += delimiter;
        joined += entries[i];
    }
    return joined;
}

std::vector<std::string> update_path(const std::vector<std::string>& current,
                                     const std::string& to_remove, const std::string& to_add) {
    std::vector<std::string> updated;
    updated.reserve(current.size() + 1);
    for (const auto& entry : current) {
        if (entry != to_remove) {
            updated.push_back(entry);
        }
    }
    if (!to_add.empty()) {
        updated.push_back(to_add);
    }
    return updated;
}

EnvFileStore::EnvFileStore(fs::path env_file) : env_file_(std::move(env_file)) {}

std::vector<std::string> EnvFileStore::read_lines() const {
    std::vector<std::string> lines;
    std::ifstream file(env_file_);
    if (!file.is_open()) {
        return lines;
    }
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::string EnvFileStore::read_path() {
    for (const auto& line : read_lines()) {
        std::string entry = trim(line);
        if (entry.starts_with(path_key)) {
            return unquote(entry.substr(path_key.size()));
        }
    }
    return process_path();
}

void EnvFileStore::write_path(const std::string& value) {
    std::vector<std::string> lines = read_lines();
    std::string path_line = std::string(path_key) + "\"" + value + "\"";

    bool replaced = false;
    for (auto& line : lines) {
        if (trim(line).starts_with(path_key)) {
            if (!replaced) {
                line = path_line;
                replaced = true;
            } else {
                line.clear();
            }
        }
    }
    if (!replaced) {
        lines.push_back(path_line);
    }

    fs::path tmp_path = env_file_.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw VciException(ErrorKind::Permission,
                string_format("error.path_write_failed", env_file_.string()) + ": " + std::strerror(errno));
        }
        for (const auto& line : lines) {
            file << line << "\n";
        }
        file.flush();
        if (!file) {
            throw VciException(ErrorKind::Permission, string_format("error.path_write_failed", env_file_.string()));
        }
    }

    std::error_code ec;
    fs::file_status original = fs::status(env_file_, ec);
    if (!ec && fs::exists(original)) {
        fs::permissions(tmp_path, original.permissions(), ec);
    }
    if (!ec) {
        fs::rename(tmp_path, env_file_, ec);
    }
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw VciException(ErrorKind::Permission,
            string_format("error.path_write_failed", env_file_.string()) + ": " + ec.message());
    }
}

void set_process_path(const std::string& value) {
    if (setenv("PATH", value.c_str(), 1) != 0) {
        throw VciException(ErrorKind::Permission,
            string_format("error.process_path_failed", std::string(std::strerror(errno))));
    }
}

void remove_stale_path_entry(EnvironmentStore& store, const fs::path& install_dir) {
    std::string dir = install_dir.string();
    std::vector<std::string> current = split_path_list(store.read_path());
    std::vector<std::string> updated = update_path(current, dir, "");
    if (updated.size() == current.size()) {
        return;
    }
    log_info(string_format("info.removing_path_entry", dir));
    store.write_path(join_path_list(updated));
}

void add_path_entry(EnvironmentStore& store, const fs::path& install_dir) {
    std::string dir = install_dir.string();
    std::vector<std::string> persistent = split_path_list(store.read_path());
    persistent.push_back(dir);
    store.write_path(join_path_list(persistent));

    std::vector<std::string> session = split_path_list(process_path());
    set_process_path(join_path_list(update_path(session, dir, dir)));
    log_info(string_format("info.added_path_entry", dir));
}
