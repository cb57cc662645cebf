#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = VCI_CONF_DIR;
fs::path L10N_DIR = VCI_L10N_DIR;
fs::path CONFIG_FILE = fs::path(VCI_CONF_DIR) / "vcinstall.conf";

fs::path APP_DATA_DIR = default_app_data_path();
fs::path INSTALL_DIR = APP_DATA_DIR / TOOL_DIR_NAME;
fs::path TEMP_DIR = APP_DATA_DIR / TEMP_DIR_NAME;
fs::path LOCK_FILE = APP_DATA_DIR / LOCK_FILE_NAME;

fs::path ENV_FILE = std::string(DEFAULT_ENV_FILE);

std::string BASE_URL = std::string(DEFAULT_BASE_URL);
std::string ARTIFACT_OS = std::string(DEFAULT_ARTIFACT_OS);
std::string PROXY_URL;
std::string ARCH_OVERRIDE;
std::chrono::milliseconds PROGRESS_INTERVAL{1000};

fs::path default_app_data_path() {
    if (const char* app_data = std::getenv("APPDATA"); app_data && *app_data) {
        return app_data;
    }
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return xdg;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::temp_directory_path();
}

void set_app_data_path(const fs::path& app_data) {
    APP_DATA_DIR = fs::absolute(app_data).lexically_normal();
    // lexically_normal keeps a trailing separator as an empty filename
    if (!APP_DATA_DIR.has_filename() && APP_DATA_DIR.has_parent_path() && APP_DATA_DIR != APP_DATA_DIR.root_path()) {
        APP_DATA_DIR = APP_DATA_DIR.parent_path();
    }
    INSTALL_DIR = APP_DATA_DIR / TOOL_DIR_NAME;
    TEMP_DIR = APP_DATA_DIR / TEMP_DIR_NAME;
    LOCK_FILE = APP_DATA_DIR / LOCK_FILE_NAME;
}

void reset_config() {
    set_app_data_path(default_app_data_path());
    ENV_FILE = std::string(DEFAULT_ENV_FILE);
    BASE_URL = std::string(DEFAULT_BASE_URL);
    ARTIFACT_OS = std::string(DEFAULT_ARTIFACT_OS);
    PROXY_URL.clear();
    ARCH_OVERRIDE.clear();
    PROGRESS_INTERVAL = std::chrono::milliseconds(1000);
}

std::string get_base_url() {
    if (BASE_URL.empty()) {
        throw VciException(ErrorKind::Configuration, get_string("error.empty_base_url"));
    }
    std::string url = BASE_URL;
    while (url.size() > 1 && url.back() == '/') {
        url.pop_back();
    }
    return url + '/';
}

bool apply_config_value(const std::string& key, const std::string& value) {
    if (key == "base_url") {
        BASE_URL = value;
    } else if (key == "proxy") {
        PROXY_URL = value;
    } else if (key == "app_data") {
        if (value.empty()) {
            throw VciException(ErrorKind::Configuration, string_format("error.invalid_config_value", key, value));
        }
        set_app_data_path(value);
    } else if (key == "env_file") {
        if (value.empty()) {
            throw VciException(ErrorKind::Configuration, string_format("error.invalid_config_value", key, value));
        }
        ENV_FILE = value;
    } else if (key == "arch") {
        ARCH_OVERRIDE = value;
    } else if (key == "os") {
        if (value.empty()) {
            throw VciException(ErrorKind::Configuration, string_format("error.invalid_config_value", key, value));
        }
        ARTIFACT_OS = value;
    } else if (key == "progress_interval_ms") {
        try {
            size_t consumed = 0;
            long long ms = std::stoll(value, &consumed);
            if (consumed != value.size() || ms < 0) {
                throw std::invalid_argument(value);
            }
            PROGRESS_INTERVAL = std::chrono::milliseconds(ms);
        } catch (const std::logic_error&) {
            throw VciException(ErrorKind::Configuration, string_format("error.invalid_config_value", key, value));
        }
    } else {
        return false;
    }
    return true;
}

void load_config_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw VciException(ErrorKind::Configuration, string_format("error.open_file_failed", path.string()));
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;

        size_t pos = entry.find('=');
        if (pos == std::string::npos) {
            log_warning(string_format("warning.config_malformed_line", path.string(), line_no));
            continue;
        }
        std::string key = trim(std::string_view(entry).substr(0, pos));
        std::string value = trim(std::string_view(entry).substr(pos + 1));
        if (!apply_config_value(key, value)) {
            log_warning(string_format("warning.config_unknown_key", path.string(), key));
        }
    }
}
