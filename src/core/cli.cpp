#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/installer.hpp"

#include <cstring>
#include <filesystem>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace fs = std::filesystem;

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → interactive installer
    ExecutableLocator locator;
    return run(argc, argv, locator);
}

int CLI::run(int argc, char* argv[], const PathLocator& locator) {
    if (argc < 2) return -1;

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status(locator);
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config(argc, argv, locator);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'imagetea-installer help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "imagetea-installer - installer for Image Tea\n"
        "\n"
        "Usage:\n"
        "  imagetea-installer               Run the interactive installer (default)\n"
        "  imagetea-installer status        Show install location and state\n"
        "  imagetea-installer config        Print the effective configuration\n"
        "  imagetea-installer config init   Write installer_config.yaml with defaults\n"
        "  imagetea-installer version       Show version\n"
        "  imagetea-installer help          Show this help\n"
        "\n"
        "Keys (interactive mode):\n"
        "  L   Launch the application\n"
        "  R   Reinstall (download and unpack again)\n"
        "  U   Uninstall (asks twice)\n"
        "  X   Exit\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "imagetea-installer " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status(const PathLocator& locator) {
    Config config(locator.installer_dir());
    bool loaded = config.load();
    const auto& d = config.data();

    auto platform = Installer::detect_platform();
    auto asset = Installer::release_asset(d, platform);
    std::string target = locator.resolve(d.install_dir);
    bool installed = Installer::is_installed(target, Installer::entry_point_name(d, platform));

    std::cout << "Installer: " << locator.installer_dir() << "\n";
    std::cout << "Target:    " << target << "\n";
    std::cout << "Installed: " << (installed ? "yes" : "no") << "\n";
    std::cout << "Platform:  " << platform.os << "/" << platform.arch << "\n";
    std::cout << "Package:   " << asset.file_name << "\n";
    std::cout << "URL:       " << asset.url << "\n";
    std::cout << "Config:    " << config.path() << (loaded ? "" : " (defaults)") << "\n";
    return 0;
}

// ── config ──────────────────────────────────────────────────

int CLI::cmd_config(int argc, char* argv[], const PathLocator& locator) {
    Config config(locator.installer_dir());

    if (argc < 3) {
        if (!config.load()) {
            std::cout << "# " << config.path() << " not loaded, showing defaults\n";
        }
        std::cout << config.to_yaml();
        return 0;
    }

    if (std::strcmp(argv[2], "init") == 0) {
        std::error_code ec;
        if (fs::exists(config.path(), ec)) {
            std::cout << config.path() << " already exists\n";
            return 0;
        }
        if (!config.save()) {
            std::cerr << "Cannot write " << config.path() << "\n";
            return 1;
        }
        std::cout << "Wrote " << config.path() << "\n";
        return 0;
    }

    std::cerr << "Unknown config command: " << argv[2] << "\n";
    std::cerr << "Usage: imagetea-installer config [init]\n";
    return 1;
}
