#pragma once

#include <filesystem>

// Expands every entry of the archive below output_dir.
// Returns the number of entries written.
long long extract_archive(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir);

// Clears <destination_dir>/veracode-temp, then extracts the archive into it.
// Returns the temporary extraction root.
std::filesystem::path extract_to_temp(const std::filesystem::path& archive_path,
                                      const std::filesystem::path& destination_dir);
