#pragma once

#include <atomic>
#include <string>

enum class Lang { EN, ZH };

struct Strings {
    // General
    const char* app_title;
    const char* confirm;
    const char* confirm_prompt;
    const char* confirm_count;
    const char* confirm_hint;

    // Welcome
    const char* welcome_title;
    const char* welcome_first_run;
    const char* welcome_not_installed;
    const char* welcome_application;
    const char* welcome_repository;
    const char* welcome_package;
    const char* welcome_target;
    const char* welcome_release;
    const char* welcome_starting;
    const char* welcome_hint;

    // Install / reinstall
    const char* install_title;
    const char* reinstall_title;
    const char* reinstall_confirm;
    const char* install_downloading;
    const char* install_extracting;
    const char* install_complete;
    const char* reinstall_complete;
    const char* install_failed;

    // Main menu
    const char* menu_title;
    const char* menu_installed_at;
    const char* menu_launch;
    const char* menu_reinstall;
    const char* menu_uninstall;
    const char* menu_exit;
    const char* menu_hint;

    // Launch
    const char* launch_started;
    const char* launch_failed;
    const char* launch_not_installed;

    // Uninstall
    const char* uninstall_title;
    const char* uninstall_confirm;
    const char* uninstall_removing;
    const char* uninstall_complete;
    const char* uninstall_failed;
    const char* uninstall_cancelled;

    // Failure
    const char* failed_title;
    const char* failed_hint;

    // Errors
    const char* err_network;
    const char* err_http_status;
    const char* err_write_failed;
    const char* err_corrupt_archive;
    const char* err_disk_full;
    const char* err_permission_denied;
};

#include "i18n/en.hpp"
#include "i18n/zh.hpp"

inline const Strings EN_STRINGS = EN_STRINGS_DEF;
inline const Strings ZH_STRINGS = ZH_STRINGS_DEF;
inline std::atomic<Lang> current_lang{Lang::EN};

inline const Strings& T() {
    return current_lang.load() == Lang::ZH ? ZH_STRINGS : EN_STRINGS;
}

/// "zh" selects Chinese, anything else English
inline Lang parse_lang(const std::string& code) {
    return (code == "zh" || code == "zh_CN" || code == "zh-CN") ? Lang::ZH : Lang::EN;
}
