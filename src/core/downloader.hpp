#pragma once

#include "core/progress_channel.hpp"

#include <string>

enum class DownloadError {
    None,
    NetworkUnavailable,  // connect / DNS / timeout / TLS failure
    HttpStatus,          // non-2xx final response, see http_status
    WriteFailed          // local filesystem error
};

struct DownloadResult {
    bool success = false;
    DownloadError error = DownloadError::None;
    int http_status = 0;
    int64_t bytes = 0;
    std::string message;
};

class Downloader {
public:
    Downloader(int connect_timeout_s = 15, int read_timeout_s = 120);

    /// Stream url into dest_path. Redirects are followed. The body is written
    /// to "<dest_path>.part" and renamed on success; on failure neither file
    /// is left behind.
    DownloadResult download(const std::string& url,
                            const std::string& dest_path,
                            ProgressCallback on_progress = nullptr) const;

    static const char* error_name(DownloadError error);

    struct UrlParts {
        std::string scheme;
        std::string host;
        int port = 443;
        std::string path;
    };
    static UrlParts parse_url(const std::string& url);

private:
    int connect_timeout_s_;
    int read_timeout_s_;
};
