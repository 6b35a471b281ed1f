#include "ui/install_wizard.hpp"
#include "core/progress_channel.hpp"
#include "i18n/i18n.hpp"
#include "ui/confirm_flow.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

const char* wizard_mode_name(WizardMode mode) {
    switch (mode) {
        case WizardMode::Welcome:      return "welcome";
        case WizardMode::Installing:   return "installing";
        case WizardMode::MainMenu:     return "main-menu";
        case WizardMode::Launching:    return "launching";
        case WizardMode::Reinstalling: return "reinstalling";
        case WizardMode::Uninstalling: return "uninstalling";
        case WizardMode::Failed:       return "failed";
        case WizardMode::Exited:       return "exited";
    }
    return "unknown";
}

namespace {

struct OperationOutcome {
    bool success = false;
    std::string message;
};

std::string describe(const DownloadResult& r) {
    switch (r.error) {
        case DownloadError::NetworkUnavailable:
            return std::string(T().err_network) + ": " + r.message;
        case DownloadError::HttpStatus:
            return std::string(T().err_http_status) + " " + std::to_string(r.http_status);
        case DownloadError::WriteFailed:
            return std::string(T().err_write_failed) + ": " + r.message;
        case DownloadError::None:
            break;
    }
    return r.message;
}

std::string describe(const ExtractResult& r) {
    switch (r.error) {
        case ExtractError::CorruptArchive:
            return std::string(T().err_corrupt_archive) + ": " + r.message;
        case ExtractError::DiskFull:
            return std::string(T().err_disk_full) + ": " + r.message;
        case ExtractError::PermissionDenied:
            return std::string(T().err_permission_denied) + ": " + r.message;
        case ExtractError::None:
            break;
    }
    return r.message;
}

std::string progress_detail(const ProgressEvent& ev) {
    if (ev.bytes_total > 0) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << static_cast<double>(ev.bytes_done) / (1024.0 * 1024.0) << "/"
            << static_cast<double>(ev.bytes_total) / (1024.0 * 1024.0) << " MB";
        return oss.str();
    }
    if (ev.bytes_done > 0) return Installer::format_size(ev.bytes_done);
    return "";
}

std::string frame_title(const char* section) {
    return std::string(T().app_title) + " - " + section;
}

}  // namespace

// ── Impl ────────────────────────────────────────────────────────

struct InstallWizard::Impl {
    AppConfig config;
    PlatformInfo platform;
    const PathLocator& locator;
    KeyReader& keys;
    FrameRenderer& renderer;
    Callbacks callbacks;

    WizardMode mode = WizardMode::Welcome;
    WizardMode retry_mode = WizardMode::Installing;  // what R repeats from Failed
    bool auto_install = true;                        // false after an uninstall
    int exit_code = 0;

    ReleaseAsset asset;
    std::string entry_name;
    ReleaseInfo release;
    bool release_checked = false;

    // Outcome of the last operation, shown on the next menu / welcome frame
    std::string notice;
    FrameRenderer::Tone notice_tone = FrameRenderer::Tone::Normal;
    std::string error_msg;

    Impl(const AppConfig& cfg, const PlatformInfo& plat, const PathLocator& loc,
         KeyReader& k, FrameRenderer& r)
        : config(cfg), platform(plat), locator(loc), keys(k), renderer(r) {
        asset = Installer::release_asset(config, platform);
        entry_name = Installer::entry_point_name(config, platform);
        install_default_callbacks();
    }

    void install_default_callbacks() {
        int connect = config.connect_timeout_s;
        int read = config.read_timeout_s;
        callbacks.download = [connect, read](const std::string& url, const std::string& dest,
                                             ProgressCallback on_progress) {
            return Downloader(connect, read).download(url, dest, std::move(on_progress));
        };
        callbacks.extract = [](const std::string& archive, const std::string& dest_dir,
                               ProgressCallback on_progress) {
            return Extractor::extract(archive, dest_dir, std::move(on_progress));
        };
        callbacks.launch = &Launcher::launch_detached;
        callbacks.uninstall = &Installer::uninstall;
        if (config.fetch_release_info) {
            std::string repo = config.app_repo;
            std::string name = asset.file_name;
            callbacks.fetch_release = [repo, name]() {
                return Installer::fetch_latest_release(repo, name);
            };
        }
    }

    // ── Helpers ─────────────────────────────────────────────────

    std::string target() const { return locator.resolve(config.install_dir); }
    std::string archive() const { return locator.resolve(asset.file_name); }

    bool installed() const { return Installer::is_installed(target(), entry_name); }

    void transition(WizardMode to) {
        WizardMode from = mode;
        mode = to;
        spdlog::info("mode: {} -> {}", wizard_mode_name(from), wizard_mode_name(to));
        if (callbacks.on_mode_change) callbacks.on_mode_change(from, to);
    }

    void exit_with(int code) {
        exit_code = code;
        transition(WizardMode::Exited);
    }

    void set_notice(const std::string& msg, FrameRenderer::Tone tone) {
        notice = msg;
        notice_tone = tone;
    }

    // ── States ──────────────────────────────────────────────────

    std::vector<std::string> welcome_body() const {
        std::vector<std::string> body;
        body.push_back(auto_install ? T().welcome_first_run : T().welcome_not_installed);
        body.push_back("");
        body.push_back(std::string(T().welcome_application) + ": " + config.app_name);
        body.push_back(std::string(T().welcome_repository) + ": " + config.app_repo);
        std::string package = std::string(T().welcome_package) + ": " + asset.file_name;
        if (release.asset_size > 0) package += " (" + Installer::format_size(release.asset_size) + ")";
        body.push_back(package);
        body.push_back(std::string(T().welcome_target) + ": " + target());
        if (!release.tag.empty()) {
            std::string line = std::string(T().welcome_release) + ": " + release.tag;
            if (release.published_at.size() >= 10) line += " (" + release.published_at.substr(0, 10) + ")";
            body.push_back(line);
        }
        if (!notice.empty()) {
            body.push_back("");
            body.push_back(notice);
        }
        return body;
    }

    void step_welcome() {
        const char* footer = auto_install ? T().welcome_starting : T().welcome_hint;

        // Frame first, then the release lookup
        if (!release_checked && callbacks.fetch_release) {
            renderer.render_frame(frame_title(T().welcome_title), welcome_body(), footer);
            release = callbacks.fetch_release();
            release_checked = true;
            if (!release.tag.empty()) spdlog::info("latest release: {}", release.tag);
        }

        renderer.render_frame(frame_title(T().welcome_title), welcome_body(), footer);
        if (auto_install) {
            transition(WizardMode::Installing);
            return;
        }

        auto key = keys.read_key();
        if (!key) {
            exit_with(0);
            return;
        }
        switch (std::tolower(static_cast<unsigned char>(*key))) {
            case 'i':
                notice.clear();
                transition(WizardMode::Installing);
                break;
            case 'x':
                exit_with(0);
                break;
            default:
                break;
        }
    }

    OperationOutcome perform_install(const std::string& target_dir,
                                     const std::string& archive_file,
                                     const ProgressCallback& on_progress) {
        OperationOutcome out;

        auto dl = callbacks.download(asset.url, archive_file, on_progress);
        if (!dl.success) {
            out.message = describe(dl);
            return out;
        }

        auto ex = callbacks.extract(archive_file, target_dir, on_progress);

        std::error_code ec;
        fs::remove(archive_file, ec);
        if (ec) spdlog::warn("could not remove {}: {}", archive_file, ec.message());

        if (!ex.success) {
            out.message = describe(ex);
            return out;
        }

        out.success = true;
        return out;
    }

    void step_install() {
        const bool reinstall = mode == WizardMode::Reinstalling;
        retry_mode = mode;

        const std::string target_dir = target();
        const std::string archive_file = archive();
        spdlog::info("{} {} from {}", reinstall ? "reinstall" : "install", target_dir, asset.url);

        ProgressChannel channel;
        OperationOutcome outcome;
        ProgressCallback push = [&channel](const ProgressEvent& ev) { channel.push(ev); };

        const std::string title = frame_title(reinstall ? T().reinstall_title : T().install_title);
        {
            // Keys typed mid-operation are neither shown nor kept for the menu
            MutedInput muted(keys);

            std::thread worker([&]() {
                try {
                    outcome = perform_install(target_dir, archive_file, push);
                } catch (const std::exception& e) {
                    outcome.success = false;
                    outcome.message = e.what();
                }
                channel.close();
            });

            renderer.render_progress(ProgressPhase::Downloading, 0.0f, "", title);
            while (auto ev = channel.pop()) {
                renderer.render_progress(ev->phase, ev->fraction(), progress_detail(*ev), title);
            }
            worker.join();
        }

        if (outcome.success && !installed()) {
            outcome.success = false;
            outcome.message = entry_name + " not found in " + asset.file_name;
        }

        if (outcome.success) {
            spdlog::info("{} complete", reinstall ? "reinstall" : "install");
            error_msg.clear();
            set_notice(reinstall ? T().reinstall_complete : T().install_complete,
                       FrameRenderer::Tone::Success);
            transition(WizardMode::MainMenu);
            return;
        }

        spdlog::error("{} failed: {}", reinstall ? "reinstall" : "install", outcome.message);
        if (installed()) {
            set_notice(std::string(T().install_failed) + ": " + outcome.message,
                       FrameRenderer::Tone::Error);
            transition(WizardMode::MainMenu);
        } else {
            error_msg = outcome.message;
            transition(WizardMode::Failed);
        }
    }

    void step_menu() {
        std::vector<std::string> body = {
            std::string(T().menu_installed_at) + ": " + target(),
            "",
            T().menu_launch,
            T().menu_reinstall,
            T().menu_uninstall,
            T().menu_exit,
        };
        if (!notice.empty()) {
            body.push_back("");
            body.push_back(notice);
        }
        renderer.render_frame(frame_title(T().menu_title), body, T().menu_hint,
                              notice.empty() ? FrameRenderer::Tone::Normal : notice_tone);

        auto key = keys.read_key();
        if (!key) {
            exit_with(0);
            return;
        }
        auto action = map_menu_key(*key);
        if (!action) return;

        spdlog::info("menu: {}", menu_action_name(*action));
        switch (*action) {
            case MenuAction::Launch:    transition(WizardMode::Launching); break;
            case MenuAction::Reinstall: transition(WizardMode::Reinstalling); break;
            case MenuAction::Uninstall: transition(WizardMode::Uninstalling); break;
            case MenuAction::Exit:      exit_with(0); break;
        }
    }

    void step_launch() {
        if (!installed()) {
            spdlog::warn("launch rejected: {} has no {}", target(), entry_name);
            auto_install = false;
            set_notice(T().launch_not_installed, FrameRenderer::Tone::Warning);
            transition(WizardMode::Welcome);
            return;
        }

        const std::string target_dir = target();
        const std::string entry = (fs::path(target_dir) / entry_name).string();
        auto res = callbacks.launch(entry, target_dir);
        if (res.success) {
            std::string msg = T().launch_started;
            if (res.pid > 0) msg += " (pid " + std::to_string(res.pid) + ")";
            spdlog::info("launched {} pid {}", entry, res.pid);
            set_notice(msg, FrameRenderer::Tone::Success);
        } else {
            spdlog::error("launch {} failed: {}", entry, res.message);
            set_notice(std::string(T().launch_failed) + ": " + res.message,
                       FrameRenderer::Tone::Error);
        }
        transition(WizardMode::MainMenu);
    }

    void step_uninstall() {
        const std::string target_dir = target();

        ConfirmationFlow flow(keys, renderer);
        if (!flow.confirm(MenuAction::Uninstall, 2, target_dir)) {
            set_notice(T().uninstall_cancelled, FrameRenderer::Tone::Normal);
            transition(WizardMode::MainMenu);
            return;
        }

        renderer.render_frame(frame_title(T().uninstall_title),
                              {T().uninstall_removing, target_dir}, "",
                              FrameRenderer::Tone::Warning);

        UninstallResult res;
        {
            MutedInput muted(keys);
            res = callbacks.uninstall(target_dir);
        }
        if (!res.success) {
            set_notice(std::string(T().uninstall_failed) + ": " + res.message,
                       FrameRenderer::Tone::Error);
            transition(WizardMode::MainMenu);
            return;
        }

        auto_install = false;
        set_notice(T().uninstall_complete, FrameRenderer::Tone::Success);
        transition(WizardMode::Welcome);
    }

    void step_failed() {
        renderer.render_frame(frame_title(T().failed_title),
                              {T().install_failed, "", error_msg},
                              T().failed_hint, FrameRenderer::Tone::Error);

        auto key = keys.read_key();
        if (!key) {
            exit_with(1);
            return;
        }
        switch (std::tolower(static_cast<unsigned char>(*key))) {
            case 'r':
                transition(retry_mode);
                break;
            case 'x':
                exit_with(1);
                break;
            default:
                break;
        }
    }

    int run() {
        spdlog::info("installer dir: {}, target: {}", locator.installer_dir(), target());
        if (installed()) transition(WizardMode::MainMenu);

        while (mode != WizardMode::Exited) {
            switch (mode) {
                case WizardMode::Welcome:      step_welcome(); break;
                case WizardMode::Installing:
                case WizardMode::Reinstalling: step_install(); break;
                case WizardMode::MainMenu:     step_menu(); break;
                case WizardMode::Launching:    step_launch(); break;
                case WizardMode::Uninstalling: step_uninstall(); break;
                case WizardMode::Failed:       step_failed(); break;
                case WizardMode::Exited:       break;
            }
        }

        renderer.finish();
        return exit_code;
    }
};

// ── Constructor / Destructor ────────────────────────────────────

InstallWizard::InstallWizard(const AppConfig& config,
                             const PlatformInfo& platform,
                             const PathLocator& locator,
                             KeyReader& keys,
                             FrameRenderer& renderer)
    : impl_(std::make_unique<Impl>(config, platform, locator, keys, renderer)) {}

InstallWizard::~InstallWizard() = default;

void InstallWizard::set_callbacks(Callbacks cb) {
    if (cb.download) impl_->callbacks.download = std::move(cb.download);
    if (cb.extract) impl_->callbacks.extract = std::move(cb.extract);
    if (cb.launch) impl_->callbacks.launch = std::move(cb.launch);
    if (cb.uninstall) impl_->callbacks.uninstall = std::move(cb.uninstall);
    if (cb.fetch_release) impl_->callbacks.fetch_release = std::move(cb.fetch_release);
    impl_->callbacks.on_mode_change = std::move(cb.on_mode_change);
}

int InstallWizard::run() {
    return impl_->run();
}

WizardMode InstallWizard::mode() const {
    return impl_->mode;
}

std::string InstallWizard::install_target() const {
    return impl_->target();
}

std::string InstallWizard::archive_path() const {
    return impl_->archive();
}
