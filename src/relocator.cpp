#include "relocator.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {
    constexpr std::array<std::string_view, 3> archive_extensions = {".zip", ".tar.gz", ".tgz"};

    void remove_tree(const fs::path& path) {
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) {
            throw VciException(ErrorKind::Filesystem,
                string_format("error.remove_dir_failed", path.string()) + ": " + ec.message());
        }
    }
}

std::string extracted_folder_name(const std::string& artifact_filename) {
    for (auto extension : archive_extensions) {
        if (artifact_filename.size() > extension.size() && artifact_filename.ends_with(extension)) {
            return artifact_filename.substr(0, artifact_filename.size() - extension.size());
        }
    }
    return artifact_filename;
}

fs::path relocate_installation(const std::string& artifact_filename, const fs::path& destination_dir) {
    fs::path temp_root = destination_dir / TEMP_DIR_NAME;
    fs::path source = temp_root / extracted_folder_name(artifact_filename);
    fs::path target = destination_dir / TOOL_DIR_NAME;

    if (!fs::is_directory(source)) {
        throw VciException(ErrorKind::Filesystem, string_format("error.extracted_folder_missing", source.string()));
    }

    if (fs::exists(fs::symlink_status(target))) {
        log_info(string_format("info.removing_previous_install", target.string()));
        remove_tree(target);
    }

    std::error_code ec;
    fs::rename(source, target, ec);
    if (ec) {
        throw VciException(ErrorKind::Filesystem,
            string_format("error.move_failed", source.string(), target.string()) + ": " + ec.message());
    }
    log_info(string_format("info.installed_to", target.string()));

    remove_tree(temp_root);
    return target;
}

int cleanup_downloaded_archives(const fs::path& destination_dir) {
    std::error_code ec;
    fs::directory_iterator it(destination_dir, ec);
    if (ec) {
        throw VciException(ErrorKind::Filesystem,
            string_format("error.open_dir_failed", destination_dir.string()) + ": " + ec.message());
    }

    std::vector<fs::path> archives;
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.starts_with(ARTIFACT_PREFIX) && extracted_folder_name(name) != name) {
            archives.push_back(entry.path());
        }
    }

    for (const auto& archive : archives) {
        fs::remove(archive, ec);
        if (ec) {
            throw VciException(ErrorKind::Filesystem,
                string_format("error.remove_file_failed", archive.string()) + ": " + ec.message());
        }
        log_info(string_format("info.removed_archive", archive.filename().string()));
    }
    return static_cast<int>(archives.size());
}
