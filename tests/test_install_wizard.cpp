#include <gtest/gtest.h>
#include "ui/install_wizard.hpp"
#include "i18n/i18n.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using Transition = std::pair<WizardMode, WizardMode>;

namespace {

/// Release zip with one top-level directory, as published upstream
std::string make_release_zip(const fs::path& path) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    archive_write_open_filename(a, path.string().c_str());

    struct File {
        const char* name;
        std::string content;
        int mode;
    };
    const File files[] = {
        {"Image-Tea/Launcher.sh", "#!/bin/sh\necho tea\n", 0755},
        {"Image-Tea/README.txt", "hello", 0644},
    };
    for (const auto& f : files) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, f.name);
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, f.mode);
        archive_entry_set_size(entry, static_cast<la_int64_t>(f.content.size()));
        archive_write_header(a, entry);
        archive_write_data(a, f.content.data(), f.content.size());
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);

    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace

class InstallWizardTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path target;
    AppConfig config;
    PlatformInfo platform{"linux", "amd64"};
    std::ostringstream out;
    std::vector<Transition> transitions;

    int download_calls = 0;
    int extract_calls = 0;
    int launch_calls = 0;
    int uninstall_calls = 0;

    void SetUp() override {
        current_lang = Lang::EN;
        test_dir = fs::temp_directory_path() / "imagetea-test-wizard";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        target = test_dir / "Image-Tea";
        config.fetch_release_info = false;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void make_install() {
        fs::create_directories(target);
        std::ofstream(target / "Launcher.sh") << "#!/bin/sh\n";
    }

    /// Stubs that succeed without network or archives
    InstallWizard::Callbacks stub_callbacks() {
        InstallWizard::Callbacks cb;
        cb.download = [this](const std::string&, const std::string& dest, ProgressCallback on_progress) {
            ++download_calls;
            std::ofstream(dest) << "zip";
            for (int64_t done = 250; done <= 1000; done += 250) {
                on_progress({done, 1000, ProgressPhase::Downloading});
            }
            DownloadResult r;
            r.success = true;
            r.bytes = 1000;
            return r;
        };
        cb.extract = [this](const std::string& archive, const std::string& dest_dir, ProgressCallback on_progress) {
            ++extract_calls;
            EXPECT_TRUE(fs::exists(archive));
            fs::create_directories(dest_dir);
            std::ofstream(fs::path(dest_dir) / "Launcher.sh") << "#!/bin/sh\n";
            on_progress({3, 3, ProgressPhase::Extracting});
            ExtractResult r;
            r.success = true;
            r.entries = 1;
            return r;
        };
        cb.launch = [this](const std::string&, const std::string&) {
            ++launch_calls;
            LaunchResult r;
            r.success = true;
            r.pid = 4242;
            return r;
        };
        cb.uninstall = [this](const std::string& dir) {
            ++uninstall_calls;
            return Installer::uninstall(dir);
        };
        cb.on_mode_change = [this](WizardMode from, WizardMode to) {
            transitions.emplace_back(from, to);
        };
        return cb;
    }

    int run_wizard(const std::string& keys, InstallWizard::Callbacks cb) {
        FixedLocator locator(test_dir.string());
        ScriptedKeyReader reader(keys);
        FrameRenderer renderer(out, 60, 200);
        InstallWizard wizard(config, platform, locator, reader, renderer);
        wizard.set_callbacks(std::move(cb));
        int code = wizard.run();
        EXPECT_EQ(wizard.mode(), WizardMode::Exited);
        return code;
    }

    bool saw(WizardMode from, WizardMode to) const {
        for (const auto& t : transitions) {
            if (t.first == from && t.second == to) return true;
        }
        return false;
    }
};

// ── Startup ─────────────────────────────────────────────────

TEST_F(InstallWizardTest, ValidInstallStartsAtMainMenu) {
    make_install();
    EXPECT_EQ(run_wizard("x", stub_callbacks()), 0);
    ASSERT_FALSE(transitions.empty());
    EXPECT_EQ(transitions.front(), Transition(WizardMode::Welcome, WizardMode::MainMenu));
    EXPECT_EQ(download_calls, 0);
}

TEST_F(InstallWizardTest, MissingInstallAutoInstalls) {
    EXPECT_EQ(run_wizard("x", stub_callbacks()), 0);
    EXPECT_EQ(transitions.front(), Transition(WizardMode::Welcome, WizardMode::Installing));
    EXPECT_TRUE(saw(WizardMode::Installing, WizardMode::MainMenu));
    EXPECT_EQ(download_calls, 1);
    EXPECT_EQ(extract_calls, 1);
    EXPECT_TRUE(fs::exists(target / "Launcher.sh"));
}

TEST_F(InstallWizardTest, ArchiveIsDeletedAfterInstall) {
    std::string archive;
    {
        FixedLocator locator(test_dir.string());
        ScriptedKeyReader reader("x");
        FrameRenderer renderer(out, 60, 200);
        InstallWizard wizard(config, platform, locator, reader, renderer);
        wizard.set_callbacks(stub_callbacks());
        archive = wizard.archive_path();
        EXPECT_EQ(fs::path(wizard.install_target()), target);
        EXPECT_EQ(wizard.run(), 0);
    }
    EXPECT_EQ(fs::path(archive), test_dir / "Image-Tea-Linux.zip");
    EXPECT_FALSE(fs::exists(archive));
}

TEST_F(InstallWizardTest, WelcomeShowsPackageAndTarget) {
    run_wizard("x", stub_callbacks());
    std::string s = out.str();
    EXPECT_NE(s.find("Image-Tea-Linux.zip"), std::string::npos);
    EXPECT_NE(s.find("mudrikam/Image-Tea-nano"), std::string::npos);
}

TEST_F(InstallWizardTest, ReleaseInfoShownWhenAvailable) {
    auto cb = stub_callbacks();
    int fetches = 0;
    cb.fetch_release = [&fetches]() {
        ++fetches;
        ReleaseInfo info;
        info.tag = "v9.9.9";
        info.published_at = "2024-05-01T10:00:00Z";
        return info;
    };
    run_wizard("x", std::move(cb));
    EXPECT_EQ(fetches, 1);
    EXPECT_NE(out.str().find("v9.9.9"), std::string::npos);
}

// ── Main menu ───────────────────────────────────────────────

TEST_F(InstallWizardTest, NonTriggerKeysLeaveMenuUnchanged) {
    make_install();
    EXPECT_EQ(run_wizard("abcz 19?\n\x1bqQyYnN", stub_callbacks()), 0);

    // Only the startup transition and the exit caused by end of input
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0], Transition(WizardMode::Welcome, WizardMode::MainMenu));
    EXPECT_EQ(transitions[1], Transition(WizardMode::MainMenu, WizardMode::Exited));
    EXPECT_EQ(launch_calls, 0);
    EXPECT_EQ(uninstall_calls, 0);
    EXPECT_EQ(download_calls, 0);
}

TEST_F(InstallWizardTest, EofAtMenuExitsCleanly) {
    make_install();
    EXPECT_EQ(run_wizard("", stub_callbacks()), 0);
}

TEST_F(InstallWizardTest, UppercaseExit) {
    make_install();
    EXPECT_EQ(run_wizard("X", stub_callbacks()), 0);
    EXPECT_TRUE(saw(WizardMode::MainMenu, WizardMode::Exited));
}

TEST_F(InstallWizardTest, LaunchReturnsToMenu) {
    make_install();
    EXPECT_EQ(run_wizard("lx", stub_callbacks()), 0);
    EXPECT_EQ(launch_calls, 1);
    EXPECT_TRUE(saw(WizardMode::MainMenu, WizardMode::Launching));
    EXPECT_TRUE(saw(WizardMode::Launching, WizardMode::MainMenu));
    EXPECT_NE(out.str().find("4242"), std::string::npos);
}

TEST_F(InstallWizardTest, LaunchFailureShownOnMenu) {
    make_install();
    auto cb = stub_callbacks();
    cb.launch = [](const std::string&, const std::string&) {
        LaunchResult r;
        r.message = "exec format error";
        return r;
    };
    EXPECT_EQ(run_wizard("Lx", std::move(cb)), 0);
    EXPECT_NE(out.str().find("exec format error"), std::string::npos);
}

TEST_F(InstallWizardTest, LaunchWithoutInstallRoutesToWelcome) {
    make_install();
    auto cb = stub_callbacks();
    // The install disappears behind the installer's back
    cb.launch = [](const std::string&, const std::string&) { return LaunchResult{}; };
    {
        FixedLocator locator(test_dir.string());
        ScriptedKeyReader reader("lx");
        FrameRenderer renderer(out, 60, 200);
        InstallWizard wizard(config, platform, locator, reader, renderer);
        cb.on_mode_change = [this](WizardMode from, WizardMode to) {
            transitions.emplace_back(from, to);
            if (to == WizardMode::Launching) fs::remove_all(target);
        };
        wizard.set_callbacks(std::move(cb));
        EXPECT_EQ(wizard.run(), 0);
    }
    EXPECT_TRUE(saw(WizardMode::Launching, WizardMode::Welcome));
    // Manual welcome: no automatic reinstall, x exits
    EXPECT_TRUE(saw(WizardMode::Welcome, WizardMode::Exited));
    EXPECT_EQ(download_calls, 0);
}

TEST_F(InstallWizardTest, ReinstallReturnsToMenu) {
    make_install();
    EXPECT_EQ(run_wizard("rx", stub_callbacks()), 0);
    EXPECT_TRUE(saw(WizardMode::MainMenu, WizardMode::Reinstalling));
    EXPECT_TRUE(saw(WizardMode::Reinstalling, WizardMode::MainMenu));
    EXPECT_EQ(download_calls, 1);
}

TEST_F(InstallWizardTest, ReinstallFailureKeepsInstallAndMenu) {
    make_install();
    auto cb = stub_callbacks();
    cb.download = [](const std::string&, const std::string&, ProgressCallback) {
        DownloadResult r;
        r.error = DownloadError::HttpStatus;
        r.http_status = 503;
        return r;
    };
    EXPECT_EQ(run_wizard("rx", std::move(cb)), 0);
    EXPECT_TRUE(saw(WizardMode::Reinstalling, WizardMode::MainMenu));
    EXPECT_FALSE(saw(WizardMode::Reinstalling, WizardMode::Failed));
    EXPECT_TRUE(fs::exists(target / "Launcher.sh"));
    EXPECT_NE(out.str().find("503"), std::string::npos);
}

// ── Uninstall ───────────────────────────────────────────────

TEST_F(InstallWizardTest, UninstallNeedsTwoConfirmations) {
    make_install();
    EXPECT_EQ(run_wizard("uyx", stub_callbacks()), 0);
    EXPECT_EQ(uninstall_calls, 0);
    EXPECT_TRUE(fs::exists(target));
    EXPECT_TRUE(saw(WizardMode::Uninstalling, WizardMode::MainMenu));
}

TEST_F(InstallWizardTest, UninstallAbortKeepsMenu) {
    make_install();
    EXPECT_EQ(run_wizard("unx", stub_callbacks()), 0);
    EXPECT_EQ(uninstall_calls, 0);
    EXPECT_TRUE(fs::exists(target / "Launcher.sh"));
}

TEST_F(InstallWizardTest, UninstallRemovesTargetOnly) {
    make_install();
    std::ofstream(test_dir / "keep.txt") << "keep";
    EXPECT_EQ(run_wizard("uyyx", stub_callbacks()), 0);
    EXPECT_EQ(uninstall_calls, 1);
    EXPECT_FALSE(fs::exists(target));
    EXPECT_TRUE(fs::exists(test_dir / "keep.txt"));
    EXPECT_TRUE(saw(WizardMode::Uninstalling, WizardMode::Welcome));
}

TEST_F(InstallWizardTest, UninstallErrorStaysOnMenu) {
    make_install();
    auto cb = stub_callbacks();
    cb.uninstall = [](const std::string&) {
        UninstallResult r;
        r.message = "device busy";
        return r;
    };
    EXPECT_EQ(run_wizard("uyyx", std::move(cb)), 0);
    EXPECT_TRUE(saw(WizardMode::Uninstalling, WizardMode::MainMenu));
    EXPECT_NE(out.str().find("device busy"), std::string::npos);
}

TEST_F(InstallWizardTest, ManualWelcomeInstallsOnI) {
    make_install();
    EXPECT_EQ(run_wizard("uyyix", stub_callbacks()), 0);
    EXPECT_TRUE(saw(WizardMode::Welcome, WizardMode::Installing));
    EXPECT_EQ(download_calls, 1);
    EXPECT_TRUE(fs::exists(target / "Launcher.sh"));
}

TEST_F(InstallWizardTest, ManualWelcomeIgnoresOtherKeys) {
    make_install();
    EXPECT_EQ(run_wizard("uyyabrlX", stub_callbacks()), 0);
    EXPECT_EQ(download_calls, 0);
    EXPECT_TRUE(saw(WizardMode::Welcome, WizardMode::Exited));
}

// ── Failure ─────────────────────────────────────────────────

TEST_F(InstallWizardTest, FailedInstallExitsWithOne) {
    auto cb = stub_callbacks();
    cb.download = [this](const std::string&, const std::string&, ProgressCallback) {
        ++download_calls;
        DownloadResult r;
        r.error = DownloadError::NetworkUnavailable;
        r.message = "Could not establish connection";
        return r;
    };
    EXPECT_EQ(run_wizard("x", std::move(cb)), 1);
    EXPECT_TRUE(saw(WizardMode::Installing, WizardMode::Failed));
    EXPECT_TRUE(saw(WizardMode::Failed, WizardMode::Exited));
    EXPECT_NE(out.str().find("Could not establish connection"), std::string::npos);
}

TEST_F(InstallWizardTest, EofAtFailedExitsWithOne) {
    auto cb = stub_callbacks();
    cb.extract = [](const std::string&, const std::string&, ProgressCallback) {
        ExtractResult r;
        r.error = ExtractError::CorruptArchive;
        r.message = "truncated";
        return r;
    };
    EXPECT_EQ(run_wizard("", std::move(cb)), 1);
}

TEST_F(InstallWizardTest, RetryAfterFailure) {
    auto cb = stub_callbacks();
    auto real_download = cb.download;
    int attempts = 0;
    cb.download = [&attempts, real_download](const std::string& url, const std::string& dest,
                                             ProgressCallback on_progress) {
        if (++attempts == 1) {
            DownloadResult r;
            r.error = DownloadError::NetworkUnavailable;
            r.message = "offline";
            return r;
        }
        return real_download(url, dest, std::move(on_progress));
    };
    EXPECT_EQ(run_wizard("qRx", std::move(cb)), 0);
    EXPECT_EQ(attempts, 2);
    EXPECT_TRUE(saw(WizardMode::Failed, WizardMode::Installing));
    EXPECT_TRUE(saw(WizardMode::Installing, WizardMode::MainMenu));
}

TEST_F(InstallWizardTest, PackageWithoutEntryPointFails) {
    auto cb = stub_callbacks();
    cb.extract = [](const std::string&, const std::string& dest_dir, ProgressCallback) {
        fs::create_directories(dest_dir);
        std::ofstream(fs::path(dest_dir) / "other.txt") << "x";
        ExtractResult r;
        r.success = true;
        r.entries = 1;
        return r;
    };
    EXPECT_EQ(run_wizard("x", std::move(cb)), 1);
    EXPECT_TRUE(saw(WizardMode::Installing, WizardMode::Failed));
}

// ── Input during operations ─────────────────────────────────

TEST_F(InstallWizardTest, KeysTypedDuringInstallAreDiscarded) {
    FixedLocator locator(test_dir.string());
    ScriptedKeyReader reader("x");
    FrameRenderer renderer(out, 60, 200);
    InstallWizard wizard(config, platform, locator, reader, renderer);

    bool muted_while_downloading = false;
    auto cb = stub_callbacks();
    auto download = cb.download;
    cb.download = [&](const std::string& url, const std::string& dest, ProgressCallback on_progress) {
        muted_while_downloading = reader.muted();
        // User mashes uninstall and both confirmations mid-download
        reader.type_ahead("uyy");
        return download(url, dest, std::move(on_progress));
    };
    wizard.set_callbacks(std::move(cb));

    EXPECT_EQ(wizard.run(), 0);
    EXPECT_TRUE(muted_while_downloading);
    EXPECT_FALSE(reader.muted());
    EXPECT_GE(reader.discards(), 1);
    EXPECT_EQ(uninstall_calls, 0);
    EXPECT_FALSE(saw(WizardMode::MainMenu, WizardMode::Uninstalling));
    EXPECT_TRUE(fs::exists(target / "Launcher.sh"));
}

TEST_F(InstallWizardTest, ReinstallUsesReinstallTitle) {
    make_install();
    run_wizard("rx", stub_callbacks());
    EXPECT_NE(out.str().find(T().reinstall_title), std::string::npos);
}

TEST_F(InstallWizardTest, WelcomeDrawnBeforeReleaseLookup) {
    auto cb = stub_callbacks();
    std::string seen_before_fetch;
    cb.fetch_release = [this, &seen_before_fetch]() {
        seen_before_fetch = out.str();
        return ReleaseInfo{};
    };
    run_wizard("x", std::move(cb));
    EXPECT_NE(seen_before_fetch.find(T().welcome_title), std::string::npos);
    EXPECT_NE(seen_before_fetch.find("Image-Tea-Linux.zip"), std::string::npos);
}

// ── End to end over HTTP ────────────────────────────────────

TEST_F(InstallWizardTest, EndToEndInstallUninstallExit) {
    std::string payload(1000, 'p');
    httplib::Server server;
    server.Get("/Image-Tea-Linux.zip", [&payload](const httplib::Request&, httplib::Response& res) {
        res.set_content(payload, "application/zip");
    });
    int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread server_thread([&server]() { server.listen_after_bind(); });
    server.wait_until_ready();

    config.release_url = "http://127.0.0.1:" + std::to_string(port) + "/Image-Tea-Linux.zip";
    config.connect_timeout_s = 5;
    config.read_timeout_s = 5;

    std::vector<ProgressEvent> download_events;
    auto cb = stub_callbacks();
    cb.download = [&download_events](const std::string& url, const std::string& dest,
                                     ProgressCallback on_progress) {
        return Downloader(5, 5).download(url, dest, [&](const ProgressEvent& ev) {
            download_events.push_back(ev);
            on_progress(ev);
        });
    };

    int code = run_wizard("uyyx", std::move(cb));

    server.stop();
    server_thread.join();

    EXPECT_EQ(code, 0);

    // Welcome → Installing → MainMenu → Uninstalling → Welcome → Exited
    std::vector<Transition> expected = {
        {WizardMode::Welcome, WizardMode::Installing},
        {WizardMode::Installing, WizardMode::MainMenu},
        {WizardMode::MainMenu, WizardMode::Uninstalling},
        {WizardMode::Uninstalling, WizardMode::Welcome},
        {WizardMode::Welcome, WizardMode::Exited},
    };
    EXPECT_EQ(transitions, expected);

    ASSERT_FALSE(download_events.empty());
    int64_t last = 0;
    for (const auto& ev : download_events) {
        EXPECT_EQ(ev.bytes_total, 1000);
        EXPECT_GE(ev.bytes_done, last);
        last = ev.bytes_done;
    }
    EXPECT_EQ(last, 1000);

    EXPECT_EQ(extract_calls, 1);
    EXPECT_FALSE(fs::exists(target));
    EXPECT_FALSE(fs::exists(test_dir / "Image-Tea-Linux.zip"));
}

TEST_F(InstallWizardTest, EndToEndWithRealArchive) {
    const std::string payload = make_release_zip(test_dir / "served.zip");
    fs::remove(test_dir / "served.zip");
    ASSERT_FALSE(payload.empty());

    httplib::Server server;
    server.Get("/Image-Tea-Linux.zip", [&payload](const httplib::Request&, httplib::Response& res) {
        res.set_content(payload, "application/zip");
    });
    int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    std::thread server_thread([&server]() { server.listen_after_bind(); });
    server.wait_until_ready();

    config.release_url = "http://127.0.0.1:" + std::to_string(port) + "/Image-Tea-Linux.zip";
    config.connect_timeout_s = 5;
    config.read_timeout_s = 5;

    // Production download and extract; only launch is stubbed
    auto cb = stub_callbacks();
    cb.download = nullptr;
    cb.extract = nullptr;
    std::string launched;
    cb.launch = [&launched](const std::string& entry, const std::string&) {
        launched = entry;
        LaunchResult r;
        r.success = true;
        r.pid = 7;
        return r;
    };

    int code = run_wizard("lx", std::move(cb));

    server.stop();
    server_thread.join();

    EXPECT_EQ(code, 0);
    EXPECT_TRUE(saw(WizardMode::Installing, WizardMode::MainMenu));
    EXPECT_TRUE(saw(WizardMode::Launching, WizardMode::MainMenu));
    EXPECT_EQ(fs::path(launched), target / "Launcher.sh");

    // The single top-level directory was flattened away
    EXPECT_TRUE(fs::is_regular_file(target / "Launcher.sh"));
    EXPECT_TRUE(fs::is_regular_file(target / "README.txt"));
    EXPECT_FALSE(fs::exists(target / "Image-Tea"));
    auto perms = fs::status(target / "Launcher.sh").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_FALSE(fs::exists(test_dir / "Image-Tea-Linux.zip"));
    EXPECT_FALSE(fs::exists(Extractor::staging_path(target.string())));
}
