#include "version_resolver.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <regex>

std::string latest_version_url(const std::string& base_url) {
    std::string url = base_url;
    if (url.empty() || url.back() != '/') {
        url += '/';
    }
    url += LATEST_VERSION_FILE;
    return url;
}

bool is_valid_version(const std::string& version) {
    static const std::regex version_regex(R"(^[0-9A-Za-z][0-9A-Za-z\.\-\+]*$)");
    return std::regex_match(version, version_regex);
}

std::string resolve_version(const std::optional<std::string>& requested, HttpClient& client,
                            const std::string& base_url) {
    if (requested.has_value()) {
        std::string version = trim(*requested);
        if (!is_valid_version(version)) {
            throw VciException(ErrorKind::Configuration, string_format("error.invalid_version", *requested));
        }
        log_info(string_format("info.using_requested_version", version));
        return version;
    }

    std::string url = latest_version_url(base_url);
    log_info(string_format("info.fetching_latest_version", url));
    std::string version = trim(client.get_text(url));
    if (version.empty()) {
        throw VciException(ErrorKind::Transport, string_format("error.empty_latest_version", url));
    }
    if (!is_valid_version(version)) {
        throw VciException(ErrorKind::Transport, string_format("error.invalid_latest_version", url, version));
    }
    log_info(string_format("info.latest_version", version));
    return version;
}
