#include "core/locator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iterator>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#elif defined(__APPLE__)
#include <climits>
#include <cstdint>
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

namespace {

/// True when path equals base or lies below it
bool is_within(const fs::path& path, const fs::path& base) {
    if (base.empty()) return false;
    auto p = path.lexically_normal();
    auto b = base.lexically_normal();
    auto mismatch = std::mismatch(b.begin(), b.end(), p.begin(), p.end());
    if (mismatch.first == b.end()) return true;
    // Tolerate a trailing separator on the base ("/tmp/")
    return std::next(mismatch.first) == b.end() && mismatch.first->empty();
}

}  // namespace

std::string PathLocator::resolve(const std::string& name) const {
    return (fs::path(installer_dir()) / name).string();
}

std::string ExecutableLocator::self_path() {
    try {
#if defined(_WIN32)
        std::vector<wchar_t> buf(MAX_PATH);
        for (;;) {
            DWORD n = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (n == 0) return "";
            if (n < buf.size()) return fs::path(std::wstring(buf.data(), n)).string();
            buf.resize(buf.size() * 2);
        }
#elif defined(__APPLE__)
        char raw_path[4096];
        uint32_t size = sizeof(raw_path);
        if (_NSGetExecutablePath(raw_path, &size) == 0) {
            char resolved[PATH_MAX];
            if (realpath(raw_path, resolved)) {
                return std::string(resolved);
            }
            return std::string(raw_path);
        }
#else
        return fs::canonical("/proc/self/exe").string();
#endif
    } catch (const std::exception& e) {
        spdlog::warn("cannot resolve executable path: {}", e.what());
    }
    return "";
}

std::string ExecutableLocator::resolve_dir(const std::string& exe_path,
                                           const std::string& appimage,
                                           const std::string& temp_dir,
                                           const std::string& cwd) {
    fs::path dir;

    if (!appimage.empty()) {
        // AppImages run from a read-only mount under the temp dir; the file
        // the user double-clicked is in $APPIMAGE.
        dir = fs::path(appimage).parent_path();
    } else if (!exe_path.empty()) {
        fs::path exe(exe_path);
        dir = exe.parent_path();

        // Foo.app/Contents/MacOS/binary -> directory holding Foo.app
        for (fs::path p = dir; !p.empty() && p != p.root_path(); p = p.parent_path()) {
            if (p.extension() == ".app") {
                dir = p.parent_path();
                break;
            }
        }
    }

    if (dir.empty() || is_within(dir, temp_dir)) {
        dir = cwd;
    }

    std::string result = dir.lexically_normal().string();
    // lexically_normal keeps a trailing separator on "a/b/" inputs
    while (result.size() > 1 && (result.back() == '/' || result.back() == '\\')) {
        result.pop_back();
    }
    return result;
}

std::string ExecutableLocator::installer_dir() const {
    std::string appimage;
#if defined(__linux__)
    if (const char* env = std::getenv("APPIMAGE")) appimage = env;
#endif

    std::error_code ec;
    std::string temp_dir = fs::temp_directory_path(ec).string();
    std::string cwd = fs::current_path(ec).string();

    return resolve_dir(self_path(), appimage, temp_dir, cwd);
}
