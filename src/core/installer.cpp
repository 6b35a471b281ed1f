#include "core/installer.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iomanip>
#include <sstream>

#ifndef _WIN32
#include <sys/utsname.h>
#endif

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

// ════════════════════════════════════════════════════════════════
// Platform & asset resolution
// ════════════════════════════════════════════════════════════════

PlatformInfo Installer::detect_platform() {
    PlatformInfo info;

#if defined(__linux__)
    info.os = "linux";
#elif defined(__APPLE__)
    info.os = "darwin";
#elif defined(_WIN32)
    info.os = "windows";
#else
    info.os = "unknown";
#endif

#ifdef _WIN32
    SYSTEM_INFO si;
    GetNativeSystemInfo(&si);
    switch (si.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64: info.arch = "amd64"; break;
        case PROCESSOR_ARCHITECTURE_ARM64: info.arch = "arm64"; break;
        case PROCESSOR_ARCHITECTURE_INTEL: info.arch = "386"; break;
        default: info.arch = "unknown"; break;
    }
#else
    struct utsname uts;
    if (uname(&uts) == 0) {
        std::string machine(uts.machine);
        if (machine == "x86_64" || machine == "amd64") {
            info.arch = "amd64";
        } else if (machine == "aarch64" || machine == "arm64") {
            info.arch = "arm64";
        } else if (machine == "armv7l" || machine == "armv7") {
            info.arch = "armv7";
        } else if (machine == "i686" || machine == "i386") {
            info.arch = "386";
        } else {
            info.arch = machine;
        }
    } else {
        info.arch = "unknown";
    }
#endif

    return info;
}

std::string Installer::asset_name(const AppConfig& config, const PlatformInfo& platform) {
    if (platform.os == "windows") return config.asset_windows;
    if (platform.os == "darwin") return config.asset_darwin;
    return config.asset_linux;
}

ReleaseAsset Installer::release_asset(const AppConfig& config, const PlatformInfo& platform) {
    ReleaseAsset asset;
    asset.file_name = asset_name(config, platform);
    if (!config.release_url.empty()) {
        asset.url = config.release_url;
    } else {
        asset.url = "https://github.com/" + config.app_repo +
                    "/releases/latest/download/" + asset.file_name;
    }
    return asset;
}

std::string Installer::entry_point_name(const AppConfig& config, const PlatformInfo& platform) {
    return platform.os == "windows" ? config.entry_windows : config.entry_posix;
}

bool Installer::is_installed(const std::string& target_dir, const std::string& entry_name) {
    std::error_code ec;
    if (!fs::is_directory(target_dir, ec)) return false;
    return fs::is_regular_file(fs::path(target_dir) / entry_name, ec);
}

// ════════════════════════════════════════════════════════════════
// Release metadata
// ════════════════════════════════════════════════════════════════

ReleaseInfo Installer::parse_release_json(const std::string& body, const std::string& asset_name) {
    ReleaseInfo info;
    try {
        auto j = json::parse(body);
        info.tag = j.value("tag_name", "");
        info.name = j.value("name", "");
        info.published_at = j.value("published_at", "");
        if (j.contains("assets") && j["assets"].is_array()) {
            for (const auto& asset : j["assets"]) {
                if (asset.value("name", "") == asset_name) {
                    info.asset_size = asset.value("size", static_cast<int64_t>(0));
                    break;
                }
            }
        }
    } catch (const json::exception& e) {
        spdlog::warn("release metadata unreadable: {}", e.what());
        return ReleaseInfo{};
    }
    return info;
}

ReleaseInfo Installer::fetch_latest_release(const std::string& repo,
                                            const std::string& asset_name,
                                            int timeout_s) {
    try {
        httplib::SSLClient cli("api.github.com", 443);
        cli.set_connection_timeout(timeout_s, 0);
        cli.set_read_timeout(timeout_s, 0);

        httplib::Headers headers = {
            {"User-Agent", std::string("imagetea-installer/") + APP_VERSION},
            {"Accept", "application/vnd.github.v3+json"},
        };

        auto res = cli.Get("/repos/" + repo + "/releases/latest", headers);
        if (!res) {
            spdlog::warn("release metadata: {}", httplib::to_string(res.error()));
            return ReleaseInfo{};
        }
        if (res->status != 200) {
            spdlog::warn("release metadata: HTTP {}", res->status);
            return ReleaseInfo{};
        }
        return parse_release_json(res->body, asset_name);
    } catch (const std::exception& e) {
        spdlog::warn("release metadata: {}", e.what());
    }
    return ReleaseInfo{};
}

// ════════════════════════════════════════════════════════════════
// Uninstall
// ════════════════════════════════════════════════════════════════

UninstallResult Installer::uninstall(const std::string& target_dir) {
    UninstallResult result;

    fs::path target(target_dir);
    if (target_dir.empty() || target == target.root_path() || !target.has_parent_path()) {
        result.message = "refusing to remove '" + target_dir + "'";
        spdlog::error("uninstall: {}", result.message);
        return result;
    }

    std::error_code ec;
    auto status = fs::symlink_status(target, ec);
    if (ec || !fs::exists(status)) {
        result.success = true;
        result.message = "nothing to remove";
        return result;
    }

    spdlog::info("uninstall: removing {}", target.string());
    auto removed = fs::remove_all(target, ec);
    if (ec) {
        result.message = "failed to remove " + target.string() + ": " + ec.message();
        spdlog::error("uninstall: {}", result.message);
        return result;
    }

    result.success = true;
    result.message = "removed " + std::to_string(removed) + " entries";
    spdlog::info("uninstall: {}", result.message);
    return result;
}

std::string Installer::format_size(int64_t bytes) {
    if (bytes <= 0) return "?";
    if (bytes < 1024) return std::to_string(bytes) + " B";
    if (bytes < 1024 * 1024) return std::to_string(bytes / 1024) + " KB";
    double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << mb << " MB";
    return oss.str();
}
