#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

// Bytes received so far and expected total (0 when the server did not say).
using ProgressCallback = std::function<void(std::uint64_t received, std::uint64_t total)>;

// Transport seam used by the version lookup and the artifact download.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Every later request is routed through this proxy.
    virtual void set_proxy(const std::string& proxy_url) = 0;

    // GET the URL and return the body. Throws VciException(Transport) on failure.
    virtual std::string get_text(const std::string& url) = 0;

    // HEAD the URL and return the HTTP status code.
    virtual long head_status(const std::string& url) = 0;

    virtual void download(const std::string& url, const std::filesystem::path& output_path,
                          const ProgressCallback& on_progress) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    void set_proxy(const std::string& proxy_url) override;
    std::string get_text(const std::string& url) override;
    long head_status(const std::string& url) override;
    void download(const std::string& url, const std::filesystem::path& output_path,
                  const ProgressCallback& on_progress) override;

private:
    std::string proxy_;
};

// Accepts only http:// proxies with a host part.
// Throws VciException(Configuration) otherwise.
void validate_proxy_url(const std::string& proxy_url);

// Rate-limits progress output: reports when the interval has elapsed since
// the previous report, and always when the transfer reaches its total.
class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;
    using Report = std::function<void(double percentage)>;

    ProgressThrottle(std::chrono::milliseconds interval, Report report);

    void update(std::uint64_t received, std::uint64_t total);
    void update(std::uint64_t received, std::uint64_t total, Clock::time_point now);

    int reports() const { return reports_; }

private:
    std::chrono::milliseconds interval_;
    Report report_;
    Clock::time_point last_report_{};
    bool reported_once_ = false;
    bool completed_ = false;
    int reports_ = 0;
};

enum class DownloadStatus {
    Downloaded,
    NotFound
};

// Checks that the artifact exists before downloading it to output_path.
// A missing artifact is reported and returned as NotFound, not thrown.
DownloadStatus download_artifact(HttpClient& client, const std::string& url,
                                 const std::filesystem::path& output_path,
                                 std::chrono::milliseconds progress_interval);
