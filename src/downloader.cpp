#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <ostream>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace {
    size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
        std::ostream* out = static_cast<std::ostream*>(stream);
        size_t bytes = size * nmemb;
        out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
        return out->good() ? bytes : 0;
    }

    size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
        std::string* out = static_cast<std::string*>(userdata);
        size_t bytes = size * nmemb;
        out->append(static_cast<char*>(ptr), bytes);
        return bytes;
    }

    int forward_progress(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                         [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
        ProgressCallback* on_progress = static_cast<ProgressCallback*>(clientp);
        if (on_progress && *on_progress) {
            (*on_progress)(static_cast<std::uint64_t>(dlnow < 0 ? 0 : dlnow),
                           static_cast<std::uint64_t>(dltotal < 0 ? 0 : dltotal));
        }
        return 0;
    }

    // Custom deleter for the CURL handle
    struct CurlDeleter {
        void operator()(CURL* curl) const {
            if (curl) {
                curl_easy_cleanup(curl);
            }
        }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

    CurlHandle open_handle(const std::string& url, const std::string& proxy) {
        CurlHandle curl(curl_easy_init());
        if (!curl) {
            throw VciException(ErrorKind::Transport, string_format("error.curl_init_failed", url));
        }
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "vcinstall");
        if (!proxy.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_PROXY, proxy.c_str());
        }
        return curl;
    }
}

void validate_proxy_url(const std::string& proxy_url) {
    constexpr std::string_view scheme = "http://";
    if (!proxy_url.starts_with(scheme) || proxy_url.size() == scheme.size() || proxy_url[scheme.size()] == '/') {
        throw VciException(ErrorKind::Configuration, string_format("error.invalid_proxy", proxy_url));
    }
}

void CurlHttpClient::set_proxy(const std::string& proxy_url) {
    validate_proxy_url(proxy_url);
    proxy_ = proxy_url;
}

std::string CurlHttpClient::get_text(const std::string& url) {
    CurlHandle curl = open_handle(url, proxy_);

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw VciException(ErrorKind::Transport,
            string_format("error.request_failed", url) + ": " + curl_easy_strerror(res));
    }
    return body;
}

long CurlHttpClient::head_status(const std::string& url) {
    CurlHandle curl = open_handle(url, proxy_);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw VciException(ErrorKind::Transport,
            string_format("error.request_failed", url) + ": " + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    return status;
}

void CurlHttpClient::download(const std::string& url, const fs::path& output_path,
                              const ProgressCallback& on_progress) {
    CurlHandle curl = open_handle(url, proxy_);
    ProgressCallback progress = on_progress;

    CURLcode res;
    {
        std::ofstream ofile(output_path, std::ios::binary | std::ios::trunc);
        if (!ofile) {
            throw VciException(ErrorKind::Filesystem, string_format("error.create_file_failed", output_path.string()));
        }

        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, forward_progress);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &progress);

        res = curl_easy_perform(curl.get());
    }

    if (res != CURLE_OK) {
        std::error_code ec;
        fs::remove(output_path, ec);
        throw VciException(ErrorKind::Transport,
            string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
}

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval, Report report)
    : interval_(interval), report_(std::move(report)) {}

void ProgressThrottle::update(std::uint64_t received, std::uint64_t total) {
    update(received, total, Clock::now());
}

void ProgressThrottle::update(std::uint64_t received, std::uint64_t total, Clock::time_point now) {
    if (total == 0 || completed_) {
        return;
    }
    bool complete = received >= total;
    if (!complete && reported_once_ && now - last_report_ < interval_) {
        return;
    }

    double percentage = complete ? 100.0 : static_cast<double>(received) / static_cast<double>(total) * 100.0;
    last_report_ = now;
    reported_once_ = true;
    completed_ = complete;
    ++reports_;
    if (report_) {
        report_(percentage);
    }
}

DownloadStatus download_artifact(HttpClient& client, const std::string& url,
                                 const fs::path& output_path,
                                 std::chrono::milliseconds progress_interval) {
    log_info(string_format("info.checking_artifact", url));
    long status = 0;
    try {
        status = client.head_status(url);
    } catch (const VciException& e) {
        log_warning(string_format("warning.artifact_check_failed", url, std::string(e.what())));
        return DownloadStatus::NotFound;
    }
    if (status != 200) {
        log_warning(string_format("warning.artifact_not_found", url, status));
        return DownloadStatus::NotFound;
    }

    log_info(string_format("info.downloading_to", url, output_path.string()));
    const std::string& label = get_string("info.downloading");
    ProgressThrottle throttle(progress_interval, [&label](double percentage) {
        log_progress(label, percentage);
    });

    try {
        client.download(url, output_path, [&throttle](std::uint64_t received, std::uint64_t total) {
            throttle.update(received, total);
        });
    } catch (const VciException&) {
        end_progress_line();
        throw;
    }
    end_progress_line();

    log_info(string_format("info.download_complete", output_path.filename().string()));
    return DownloadStatus::Downloaded;
}
