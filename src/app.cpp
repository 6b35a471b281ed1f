#include "app.hpp"
#include "core/config.hpp"
#include "core/installer.hpp"
#include "core/locator.hpp"
#include "core/logging.hpp"
#include "i18n/i18n.hpp"
#include "ui/frame_renderer.hpp"
#include "ui/install_wizard.hpp"
#include "ui/key_reader.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

struct App::Impl {
    ExecutableLocator locator;
    Config config{locator.installer_dir()};
    std::unique_ptr<KeyReader> keys = make_terminal_key_reader();
    std::unique_ptr<FrameRenderer> renderer;
    std::unique_ptr<InstallWizard> wizard;
};

App::App() : impl_(std::make_unique<Impl>()) {
    // Load config (use defaults if file doesn't exist)
    bool loaded = impl_->config.load();
    const auto& d = impl_->config.data();

    // Log next to the installer, like everything else it writes
    if (!init_logging(impl_->locator.resolve(d.log_file), d.log_level)) {
        std::cerr << "warning: cannot open log file " << impl_->locator.resolve(d.log_file) << "\n";
    }
    spdlog::info("imagetea-installer {} starting in {}", APP_VERSION, impl_->locator.installer_dir());
    if (!loaded) spdlog::info("no usable {}, using defaults", impl_->config.path());

    current_lang = parse_lang(d.language);

    impl_->renderer = std::make_unique<FrameRenderer>(std::cout, d.frame_width);
    impl_->wizard = std::make_unique<InstallWizard>(
        d, Installer::detect_platform(), impl_->locator, *impl_->keys, *impl_->renderer);
}

App::~App() {
    spdlog::shutdown();
}

int App::run() {
    return impl_->wizard->run();
}
