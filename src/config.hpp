#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#ifndef VCI_CONF_DIR
#define VCI_CONF_DIR "/etc/vcinstall"
#endif
#ifndef VCI_L10N_DIR
#define VCI_L10N_DIR "/usr/share/vcinstall/l10n"
#endif

// Fixed names of the distribution layout
inline constexpr std::string_view TOOL_DIR_NAME = "veracode";
inline constexpr std::string_view TEMP_DIR_NAME = "veracode-temp";
inline constexpr std::string_view ARTIFACT_PREFIX = "veracode-cli_";
inline constexpr std::string_view LATEST_VERSION_FILE = "LATEST_VERSION";
inline constexpr std::string_view LOCK_FILE_NAME = ".veracode-install.lck";
inline constexpr std::string_view SUPPORT_CONTACT = "support@veracode.com";
inline constexpr std::string_view DEFAULT_BASE_URL = "https://tools.veracode.com/veracode-cli";
inline constexpr std::string_view DEFAULT_ARTIFACT_OS = "windows";
inline constexpr std::string_view DEFAULT_ENV_FILE = "/etc/environment";

// Build-time locations
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path CONFIG_FILE;

// Install layout, all derived from APP_DATA_DIR
extern std::filesystem::path APP_DATA_DIR;
extern std::filesystem::path INSTALL_DIR;
extern std::filesystem::path TEMP_DIR;
extern std::filesystem::path LOCK_FILE;

// Persistent PATH store
extern std::filesystem::path ENV_FILE;

// Run settings (empty string means "not set")
extern std::string BASE_URL;
extern std::string ARTIFACT_OS;
extern std::string PROXY_URL;
extern std::string ARCH_OVERRIDE;
extern std::chrono::milliseconds PROGRESS_INTERVAL;

std::filesystem::path default_app_data_path();
void set_app_data_path(const std::filesystem::path& app_data);
void reset_config();

// Base URL with exactly one trailing slash
std::string get_base_url();

// Returns false for unknown keys; throws VciException on invalid values.
bool apply_config_value(const std::string& key, const std::string& value);
void load_config_file(const std::filesystem::path& path);
