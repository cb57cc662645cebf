#include "archive.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {
    // Custom deleters for libarchive handles
    struct ArchiveReadDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_read_close(a);
                archive_read_free(a);
            }
        }
    };

    struct ArchiveWriteDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_write_close(a);
                archive_write_free(a);
            }
        }
    };

    using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
    using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

    std::string archive_message(struct archive* a) {
        const char* err = archive_error_string(a);
        return err ? err : get_string("error.unknown");
    }

    [[noreturn]] void fail(const fs::path& archive_path, struct archive* a, const std::string& fallback_key) {
        const char* err = archive_error_string(a);
        throw VciException(ErrorKind::Filesystem,
            string_format("error.extract_failed", archive_path.string()) + ": " + (err ? err : get_string(fallback_key)));
    }
}

long long extract_archive(const fs::path& archive_path, const fs::path& output_dir) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK
    );

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        fail(archive_path, a.get(), "error.unknown");
    }

    struct archive_entry* entry;
    long long count = 0;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, a.get(), "error.fatal_read");
            }
            log_warning(archive_message(a.get()));
        }

        const char* current_path = archive_entry_pathname(entry);
        if (!current_path) continue;
        const std::string entry_name = current_path;

        fs::path dest_path;
        try {
            dest_path = validate_path(entry_name, output_dir);
        } catch (const VciException&) {
            throw VciException(ErrorKind::Filesystem, string_format("error.malicious_path_in_archive", entry_name));
        }

        // Absolute link targets are rebased under output_dir; relative ones
        // must not leave it.
        if (const char* symlink = archive_entry_symlink(entry)) {
            fs::path target(symlink);
            try {
                if (target.is_absolute()) {
                    fs::path link_dest = validate_path(target.relative_path(), output_dir);
                    archive_entry_set_symlink(entry, link_dest.c_str());
                } else {
                    validate_path(fs::path(entry_name).parent_path() / target, output_dir);
                }
            } catch (const VciException&) {
                log_warning(string_format("warning.unsafe_symlink_skipped", entry_name, target.string()));
                if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
                    fail(archive_path, a.get(), "error.fatal_read");
                }
                continue;
            }
        }

        archive_entry_set_pathname(entry, dest_path.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            try {
                fs::path link_dest = validate_path(hardlink, output_dir);
                archive_entry_set_hardlink(entry, link_dest.c_str());
            } catch (const VciException& e) {
                log_warning(e.what());
                archive_entry_set_hardlink(entry, nullptr);
            }
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, ext.get(), "error.fatal_write");
            }
            log_warning(archive_message(ext.get()));
        } else {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        fail(archive_path, a.get(), "error.data_block_read");
                    }
                    log_warning(archive_message(a.get()));
                    break;
                }
                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    fail(archive_path, ext.get(), "error.data_block_write");
                }
            }
        }
        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            fail(archive_path, ext.get(), "error.fatal_write");
        }

        if (++count % 100 == 0) {
            log_info(string_format("info.extracting", count));
        }
    }

    log_info(string_format("info.extract_complete", count));
    return count;
}

fs::path extract_to_temp(const fs::path& archive_path, const fs::path& destination_dir) {
    fs::path temp_root = destination_dir / TEMP_DIR_NAME;

    std::error_code ec;
    fs::remove_all(temp_root, ec);
    if (ec) {
        throw VciException(ErrorKind::Filesystem,
            string_format("error.remove_dir_failed", temp_root.string()) + ": " + ec.message());
    }
    ensure_dir_exists(temp_root);

    log_info(string_format("info.extracting_to", archive_path.filename().string(), temp_root.string()));
    extract_archive(archive_path, temp_root);
    return temp_root;
}
