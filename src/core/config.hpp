#pragma once

#include <string>

struct AppConfig {
    // Application
    std::string app_name = "Image Tea";
    std::string app_repo = "mudrikam/Image-Tea-nano";
    std::string install_dir = "Image-Tea";
    std::string release_url;  // empty = latest-download URL built from repo + asset

    std::string asset_windows = "Image-Tea-Windows.zip";
    std::string asset_linux = "Image-Tea-Linux.zip";
    std::string asset_darwin = "Image-Tea-macOS.zip";

    std::string entry_windows = "Image Tea.exe";
    std::string entry_posix = "Launcher.sh";

    // Network
    int connect_timeout_s = 15;
    int read_timeout_s = 120;
    bool fetch_release_info = true;

    // Display
    std::string language = "en";
    int frame_width = 60;

    // Logging
    std::string log_file = "installer.log";
    std::string log_level = "info";
};

class Config {
public:
    /// dir: directory holding installer_config.yaml (the installer directory)
    explicit Config(std::string dir);
    ~Config();

    /// Load the file if present. Returns false (defaults kept) when the file
    /// is missing or cannot be parsed.
    bool load();
    bool save() const;

    AppConfig& data();
    const AppConfig& data() const;

    std::string path() const;

    /// Effective configuration rendered as YAML
    std::string to_yaml() const;

    static constexpr const char* kFileName = "installer_config.yaml";

private:
    std::string dir_;
    AppConfig config_;
};
