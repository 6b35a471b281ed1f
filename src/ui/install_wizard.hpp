#pragma once

#include "core/config.hpp"
#include "core/downloader.hpp"
#include "core/extractor.hpp"
#include "core/installer.hpp"
#include "core/launcher.hpp"
#include "core/locator.hpp"
#include "ui/frame_renderer.hpp"
#include "ui/key_reader.hpp"

#include <functional>
#include <memory>
#include <string>

enum class WizardMode {
    Welcome,        // Not installed: show package info, then install
    Installing,     // Download + extract on the worker thread
    MainMenu,       // Launch / Reinstall / Uninstall / Exit
    Launching,      // Spawn the entry point detached
    Reinstalling,   // Installing over an existing install
    Uninstalling,   // Confirm twice, then remove the install root
    Failed,         // Error without a usable install: retry or exit
    Exited
};

const char* wizard_mode_name(WizardMode mode);

class InstallWizard {
public:
    /// Services the wizard drives. Members left empty keep the production
    /// implementation (Downloader, Extractor, Launcher, Installer).
    struct Callbacks {
        std::function<DownloadResult(const std::string& url, const std::string& dest,
                                     ProgressCallback on_progress)> download;
        std::function<ExtractResult(const std::string& archive, const std::string& dest_dir,
                                    ProgressCallback on_progress)> extract;
        std::function<LaunchResult(const std::string& entry, const std::string& working_dir)> launch;
        std::function<UninstallResult(const std::string& target_dir)> uninstall;
        std::function<ReleaseInfo()> fetch_release;
        std::function<void(WizardMode from, WizardMode to)> on_mode_change;
    };

    InstallWizard(const AppConfig& config,
                  const PlatformInfo& platform,
                  const PathLocator& locator,
                  KeyReader& keys,
                  FrameRenderer& renderer);
    ~InstallWizard();

    void set_callbacks(Callbacks cb);

    /// Drive the state machine until Exited. Returns the process exit code:
    /// 0 for a normal exit, 1 when leaving from Failed.
    int run();

    WizardMode mode() const;

    /// <installer dir>/<install_dir>
    std::string install_target() const;

    /// <installer dir>/<asset file name>, present only during an install
    std::string archive_path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
