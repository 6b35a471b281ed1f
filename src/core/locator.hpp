#pragma once

#include <string>

/// Resolves the directory every installer path is relative to.
class PathLocator {
public:
    virtual ~PathLocator() = default;

    /// Directory that holds the installer (never a temp directory)
    virtual std::string installer_dir() const = 0;

    /// <installer_dir>/<name>
    std::string resolve(const std::string& name) const;
};

/// Production locator: follows the running executable, an AppImage or a
/// macOS .app bundle back to the directory the user actually sees.
class ExecutableLocator : public PathLocator {
public:
    std::string installer_dir() const override;

    /// Absolute path of the running binary, empty if it cannot be determined
    static std::string self_path();

    /// Pure resolution step, separated out for testing.
    /// appimage: value of $APPIMAGE (may be empty)
    /// temp_dir: the system temp directory
    /// cwd: fallback when everything else resolves into temp_dir
    static std::string resolve_dir(const std::string& exe_path,
                                   const std::string& appimage,
                                   const std::string& temp_dir,
                                   const std::string& cwd);
};

/// Test locator: always answers with a fixed directory.
class FixedLocator : public PathLocator {
public:
    explicit FixedLocator(std::string dir) : dir_(std::move(dir)) {}
    std::string installer_dir() const override { return dir_; }

private:
    std::string dir_;
};
