#pragma once

#include <optional>
#include <string>

class HttpClient;

// <base-url>/LATEST_VERSION
std::string latest_version_url(const std::string& base_url);

// True for non-empty text of [0-9A-Za-z.+-] starting with an alphanumeric.
bool is_valid_version(const std::string& version);

// Returns the requested version trimmed, or the trimmed body of the
// latest-version endpoint when no version was requested.
std::string resolve_version(const std::optional<std::string>& requested, HttpClient& client,
                            const std::string& base_url);
