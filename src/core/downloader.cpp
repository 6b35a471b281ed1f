#include "core/downloader.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace {

// Report at most once per whole percent; unknown totals report every 256 KiB.
constexpr int64_t kUnknownTotalStep = 256 * 1024;

void remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

}  // namespace

Downloader::Downloader(int connect_timeout_s, int read_timeout_s)
    : connect_timeout_s_(connect_timeout_s), read_timeout_s_(read_timeout_s) {}

const char* Downloader::error_name(DownloadError error) {
    switch (error) {
        case DownloadError::None:               return "none";
        case DownloadError::NetworkUnavailable: return "network unavailable";
        case DownloadError::HttpStatus:         return "http status";
        case DownloadError::WriteFailed:        return "write failed";
    }
    return "unknown";
}

Downloader::UrlParts Downloader::parse_url(const std::string& url) {
    UrlParts parts;
    auto pos = url.find("://");
    if (pos != std::string::npos) {
        parts.scheme = url.substr(0, pos);
        auto rest = url.substr(pos + 3);
        auto path_pos = rest.find('/');
        if (path_pos != std::string::npos) {
            parts.host = rest.substr(0, path_pos);
            parts.path = rest.substr(path_pos);
        } else {
            parts.host = rest;
            parts.path = "/";
        }
    }
    auto colon = parts.host.find(':');
    if (colon != std::string::npos) {
        try {
            parts.port = std::stoi(parts.host.substr(colon + 1));
        } catch (...) {
            parts.port = 0;
        }
        parts.host = parts.host.substr(0, colon);
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }
    return parts;
}

DownloadResult Downloader::download(const std::string& url,
                                    const std::string& dest_path,
                                    ProgressCallback on_progress) const {
    DownloadResult result;
    const std::string part_path = dest_path + ".part";

    auto fail = [&](DownloadError error, const std::string& msg) {
        remove_quietly(part_path);
        remove_quietly(dest_path);
        result.success = false;
        result.error = error;
        result.message = msg;
        spdlog::warn("download {} failed: {} ({})", url, msg, error_name(error));
        return result;
    };

    auto parts = parse_url(url);
    if (parts.host.empty() || parts.port <= 0 ||
        (parts.scheme != "http" && parts.scheme != "https")) {
        return fail(DownloadError::NetworkUnavailable, "invalid URL: " + url);
    }

    std::error_code ec;
    auto parent = fs::path(dest_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return fail(DownloadError::WriteFailed,
                        "cannot create " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return fail(DownloadError::WriteFailed,
                    "cannot open " + part_path + ": " +
                    std::generic_category().message(errno));
    }

    spdlog::info("download {} -> {}", url, dest_path);

    int status = 0;
    int64_t total_bytes = 0;
    int64_t received_bytes = 0;
    int64_t last_reported = -1;
    int last_percent = -1;
    bool write_failed = false;
    std::string write_error;

    auto report = [&](bool final) {
        if (!on_progress) return;
        if (!final) {
            if (total_bytes > 0) {
                int pct = static_cast<int>(received_bytes * 100 / total_bytes);
                if (pct == last_percent) return;
                last_percent = pct;
            } else if (last_reported >= 0 &&
                       received_bytes - last_reported < kUnknownTotalStep) {
                return;
            }
        }
        if (received_bytes == last_reported) return;
        last_reported = received_bytes;

        ProgressEvent ev;
        ev.bytes_done = received_bytes;
        ev.bytes_total = (final && total_bytes <= 0) ? received_bytes : total_bytes;
        ev.phase = ProgressPhase::Downloading;
        on_progress(ev);
    };

    httplib::Headers headers = {
        {"User-Agent", std::string("imagetea-installer/") + APP_VERSION},
    };

    // Redirect responses never reach this handler; it sees the final one.
    auto response_handler = [&](const httplib::Response& response) -> bool {
        status = response.status;
        if (response.has_header("Content-Length")) {
            try {
                total_bytes = std::stoll(response.get_header_value("Content-Length"));
            } catch (...) {
                total_bytes = 0;
            }
        }
        return status >= 200 && status < 300;
    };

    auto content_receiver = [&](const char* data, size_t data_length) -> bool {
        out.write(data, static_cast<std::streamsize>(data_length));
        if (!out.good()) {
            write_failed = true;
            write_error = std::generic_category().message(errno);
            return false;
        }
        received_bytes += static_cast<int64_t>(data_length);
        report(false);
        return true;
    };

    bool got_response = false;
    httplib::Error transport_error = httplib::Error::Success;
    try {
        httplib::Client cli(parts.scheme + "://" + parts.host + ":" + std::to_string(parts.port));
        cli.set_connection_timeout(connect_timeout_s_, 0);
        cli.set_read_timeout(read_timeout_s_, 0);
        cli.set_follow_location(true);

        auto res = cli.Get(parts.path, headers, response_handler, content_receiver);
        got_response = static_cast<bool>(res);
        if (!got_response) transport_error = res.error();
    } catch (const std::exception& e) {
        out.close();
        return fail(DownloadError::NetworkUnavailable, e.what());
    }

    out.close();

    if (write_failed) {
        return fail(DownloadError::WriteFailed, "write to " + part_path + " failed: " + write_error);
    }
    if (status != 0 && (status < 200 || status >= 300)) {
        result.http_status = status;
        return fail(DownloadError::HttpStatus, "HTTP " + std::to_string(status));
    }
    if (!got_response) {
        return fail(DownloadError::NetworkUnavailable, httplib::to_string(transport_error));
    }
    if (out.fail()) {
        return fail(DownloadError::WriteFailed, "flush of " + part_path + " failed");
    }

    // Content-Length mismatch means the transfer was cut short.
    if (total_bytes > 0 && received_bytes != total_bytes) {
        return fail(DownloadError::NetworkUnavailable,
                    "connection closed after " + std::to_string(received_bytes) +
                    " of " + std::to_string(total_bytes) + " bytes");
    }

    fs::remove(dest_path, ec);
    fs::rename(part_path, dest_path, ec);
    if (ec) {
        return fail(DownloadError::WriteFailed,
                    "cannot rename " + part_path + ": " + ec.message());
    }

    report(true);

    result.success = true;
    result.http_status = status;
    result.bytes = received_bytes;
    spdlog::info("download complete: {} bytes", received_bytes);
    return result;
}
