#include "installer.hpp"
#include "architecture.hpp"
#include "archive.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "localization.hpp"
#include "path_manager.hpp"
#include "relocator.hpp"
#include "utils.hpp"
#include "version_resolver.hpp"

namespace fs = std::filesystem;

const char* install_step_name(InstallStep step) {
    switch (step) {
        case InstallStep::ValidateOptions: return "validate-options";
        case InstallStep::AcquireLock: return "acquire-lock";
        case InstallStep::RemoveStalePath: return "remove-stale-path";
        case InstallStep::ResolveVersion: return "resolve-version";
        case InstallStep::DetectArchitecture: return "detect-architecture";
        case InstallStep::BuildUrl: return "build-url";
        case InstallStep::Download: return "download";
        case InstallStep::Extract: return "extract";
        case InstallStep::Relocate: return "relocate";
        case InstallStep::CleanupArchives: return "cleanup-archives";
        case InstallStep::UpdatePath: return "update-path";
        case InstallStep::Done: return "done";
    }
    return "unknown";
}

InstallOptions options_from_config() {
    InstallOptions options;
    if (!PROXY_URL.empty()) {
        options.proxy = PROXY_URL;
    }
    options.arch_override = ARCH_OVERRIDE;
    options.base_url = get_base_url();
    options.artifact_os = ARTIFACT_OS;
    options.app_data_dir = APP_DATA_DIR;
    options.progress_interval = PROGRESS_INTERVAL;
    return options;
}

Installer::Installer(HttpClient& client, EnvironmentStore& store)
    : client_(client), store_(store) {}

InstallReport Installer::run(const InstallOptions& options) {
    InstallReport report;
    current_step_ = InstallStep::ValidateOptions;
    try {
        execute(options, report);
        report.succeeded = true;
        report.failed_step = InstallStep::Done;
    } catch (const VciException& e) {
        report.failed_step = current_step_;
        report.error_kind = e.kind();
        report.message = e.what();
    } catch (const fs::filesystem_error& e) {
        report.failed_step = current_step_;
        report.error_kind = ErrorKind::Filesystem;
        report.message = e.what();
    }
    return report;
}

void Installer::execute(const InstallOptions& options, InstallReport& report) {
    current_step_ = InstallStep::ValidateOptions;
    if (options.app_data_dir.empty()) {
        throw VciException(ErrorKind::Configuration, get_string("error.empty_app_data"));
    }
    if (options.base_url.empty()) {
        throw VciException(ErrorKind::Configuration, get_string("error.empty_base_url"));
    }
    if (options.proxy.has_value()) {
        client_.set_proxy(*options.proxy);
        log_info(string_format("info.using_proxy", *options.proxy));
    }
    const fs::path destination_dir = options.app_data_dir;
    const fs::path install_dir = destination_dir / TOOL_DIR_NAME;
    report.install_dir = install_dir;

    current_step_ = InstallStep::AcquireLock;
    ensure_dir_exists(destination_dir);
    InstallLock lock(destination_dir / LOCK_FILE_NAME);

    current_step_ = InstallStep::RemoveStalePath;
    remove_stale_path_entry(store_, install_dir);

    current_step_ = InstallStep::ResolveVersion;
    report.version = resolve_version(options.version, client_, options.base_url);

    current_step_ = InstallStep::DetectArchitecture;
    Bitness bitness = detect_bitness(options.arch_override);
    report.artifact = artifact_filename(report.version, bitness, options.artifact_os);

    current_step_ = InstallStep::BuildUrl;
    std::string base_url = options.base_url;
    if (base_url.back() != '/') {
        base_url += '/';
    }
    const std::string url = base_url + report.artifact;
    const fs::path archive_path = destination_dir / report.artifact;

    current_step_ = InstallStep::Download;
    if (download_artifact(client_, url, archive_path, options.progress_interval) == DownloadStatus::NotFound) {
        throw VciException(ErrorKind::NotFound, string_format("error.artifact_not_found", url));
    }

    current_step_ = InstallStep::Extract;
    extract_to_temp(archive_path, destination_dir);

    current_step_ = InstallStep::Relocate;
    relocate_installation(report.artifact, destination_dir);

    current_step_ = InstallStep::CleanupArchives;
    cleanup_downloaded_archives(destination_dir);

    current_step_ = InstallStep::UpdatePath;
    add_path_entry(store_, install_dir);

    current_step_ = InstallStep::Done;
}
