#pragma once

// English string table - included by i18n.hpp after Strings is defined

inline constexpr Strings EN_STRINGS_DEF = {
    // General
    "Image Tea Installer",
    "Confirm",
    "Continue with this action?",
    "Confirmations",
    "[Y] Yes   [N] No   [Esc] Cancel",

    // Welcome
    "Welcome",
    "Image Tea is not installed yet.",
    "Image Tea is not installed.",
    "Application",
    "Repository",
    "Package",
    "Target",
    "Latest release",
    "Starting installation...",
    "[I] Install   [X] Exit",

    // Install / reinstall
    "Installing",
    "Reinstalling",
    "Download the package again and replace the installed files?",
    "Downloading package...",
    "Extracting files...",
    "Installation complete.",
    "Reinstall complete.",
    "Installation failed",

    // Main menu
    "Main Menu",
    "Installed at",
    "[L] Launch",
    "[R] Reinstall",
    "[U] Uninstall",
    "[X] Exit",
    "Press a key to choose",

    // Launch
    "Application started",
    "Launch failed",
    "Application is not installed",

    // Uninstall
    "Uninstall",
    "Remove the installed application and all its files?",
    "Removing files...",
    "Application removed.",
    "Uninstall failed",
    "Uninstall cancelled.",

    // Failure
    "Error",
    "[R] Retry   [X] Exit",

    // Errors
    "Network unavailable",
    "Server returned HTTP",
    "Could not write file",
    "Archive is corrupt",
    "Disk is full",
    "Permission denied",
};
