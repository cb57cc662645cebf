#pragma once

#include <filesystem>
#include <string>

// Folder the archive unpacks to: the filename without its archive extension.
std::string extracted_folder_name(const std::string& artifact_filename);

// Moves <destination_dir>/veracode-temp/<folder> to <destination_dir>/veracode,
// replacing any earlier installation, then removes the temporary root.
std::filesystem::path relocate_installation(const std::string& artifact_filename,
                                            const std::filesystem::path& destination_dir);

// Deletes veracode-cli_* archives left in destination_dir.
int cleanup_downloaded_archives(const std::filesystem::path& destination_dir);
