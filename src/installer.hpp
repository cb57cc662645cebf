#pragma once

#include "config.hpp"
#include "exception.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

class HttpClient;
class EnvironmentStore;

enum class InstallStep {
    ValidateOptions,
    AcquireLock,
    RemoveStalePath,
    ResolveVersion,
    DetectArchitecture,
    BuildUrl,
    Download,
    Extract,
    Relocate,
    CleanupArchives,
    UpdatePath,
    Done
};

const char* install_step_name(InstallStep step);

struct InstallOptions {
    std::optional<std::string> version;
    std::optional<std::string> proxy;
    std::string arch_override;
    std::string base_url;
    std::string artifact_os = std::string(DEFAULT_ARTIFACT_OS);
    std::filesystem::path app_data_dir;
    std::chrono::milliseconds progress_interval{1000};
};

struct InstallReport {
    bool succeeded = false;
    InstallStep failed_step = InstallStep::Done;
    ErrorKind error_kind = ErrorKind::Configuration;
    std::string message;
    std::string version;
    std::string artifact;
    std::filesystem::path install_dir;
};

// Runs the install sequence. The first failing step ends the run; steps
// already completed are left as they are.
class Installer {
public:
    Installer(HttpClient& client, EnvironmentStore& store);

    InstallReport run(const InstallOptions& options);

private:
    void execute(const InstallOptions& options, InstallReport& report);

    HttpClient& client_;
    EnvironmentStore& store_;
    InstallStep current_step_ = InstallStep::ValidateOptions;
};

// Options assembled from the global configuration.
InstallOptions options_from_config();
