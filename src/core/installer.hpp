#pragma once

#include "core/config.hpp"

#include <cstdint>
#include <string>

// ── Data structures ────────────────────────────────────────────

struct PlatformInfo {
    std::string os;    // "linux", "darwin", "windows"
    std::string arch;  // "amd64", "arm64", ...
};

struct ReleaseAsset {
    std::string url;
    std::string file_name;
};

struct ReleaseInfo {
    std::string tag;
    std::string name;
    std::string published_at;
    int64_t asset_size = 0;  // size of the asset matching our file name
};

struct UninstallResult {
    bool success = false;
    std::string message;
};

// ── Installer services ─────────────────────────────────────────

class Installer {
public:
    /// Detect current platform OS and architecture
    static PlatformInfo detect_platform();

    /// Asset file name configured for the platform's OS
    static std::string asset_name(const AppConfig& config, const PlatformInfo& platform);

    /// "Latest" download URL for the platform, or config.release_url if set
    static ReleaseAsset release_asset(const AppConfig& config, const PlatformInfo& platform);

    /// Entry point file name inside the install root
    static std::string entry_point_name(const AppConfig& config, const PlatformInfo& platform);

    /// An install is valid when the entry point exists inside target_dir
    static bool is_installed(const std::string& target_dir, const std::string& entry_name);

    /// Fetch release metadata from the GitHub API. Returns an empty tag on
    /// any failure; callers treat the result as informational only.
    static ReleaseInfo fetch_latest_release(const std::string& repo,
                                            const std::string& asset_name,
                                            int timeout_s = 10);

    /// Parse a GitHub "latest release" JSON document
    static ReleaseInfo parse_release_json(const std::string& body, const std::string& asset_name);

    /// Remove target_dir recursively. Nothing outside target_dir is touched.
    static UninstallResult uninstall(const std::string& target_dir);

    /// Human readable size: "512 B", "12 KB", "3.4 MB"
    static std::string format_size(int64_t bytes);
};
