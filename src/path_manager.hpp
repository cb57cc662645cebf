#pragma once

#include <filesystem>
#include <string>
#include <vector>

#ifdef _WIN32
inline constexpr char PATH_LIST_DELIMITER = ';';
#else
inline constexpr char PATH_LIST_DELIMITER = ':';
#endif

// "" splits to no entries; empty inner segments are kept.
std::vector<std::string> split_path_list(const std::string& text, char delimiter = PATH_LIST_DELIMITER);
std::string join_path_list(const std::vector<std::string>& entries, char delimiter = PATH_LIST_DELIMITER);

// Drops every entry equal to to_remove, then appends to_add if non-empty.
std::vector<std::string> update_path(const std::vector<std::string>& current,
                                     const std::string& to_remove, const std::string& to_add);

// Where the persistent, machine-wide PATH lives.
class EnvironmentStore {
public:
    virtual ~EnvironmentStore() = default;
    virtual std::string read_path() = 0;
    virtual void write_path(const std::string& value) = 0;
};

// PATH kept as a PATH="..." line of a pam_env style file such as /etc/environment.
class EnvFileStore : public EnvironmentStore {
public:
    explicit EnvFileStore(std::filesystem::path env_file);

    // Falls back to the process PATH when the file has no PATH line.
    std::string read_path() override;
    // Rewrites the file through a temporary, keeping every other line.
    void write_path(const std::string& value) override;

    const std::filesystem::path& file() const { return env_file_; }

private:
    std::vector<std::string> read_lines() const;

    std::filesystem::path env_file_;
};

void set_process_path(const std::string& value);

void remove_stale_path_entry(EnvironmentStore& store, const std::filesystem::path& install_dir);
void add_path_entry(EnvironmentStore& store, const std::filesystem::path& install_dir);
