#include "core/launcher.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

#ifndef _WIN32

namespace {

// Message sent from the intermediate child / grandchild back to the parent.
struct ChildReport {
    int kind;   // 1 = grandchild pid, 2 = exec errno
    int value;
};

void write_report(int fd, int kind, int value) {
    ChildReport report{kind, value};
    ssize_t n = write(fd, &report, sizeof(report));
    (void)n;  // nothing left to do in a forked child if the pipe is gone
}

bool set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

}  // namespace

#endif

LaunchResult Launcher::launch_detached(const std::string& entry_path,
                                       const std::string& working_dir) {
    LaunchResult result;

    std::error_code ec;
    if (!fs::is_regular_file(entry_path, ec)) {
        result.message = "entry point not found: " + entry_path;
        spdlog::warn("launch: {}", result.message);
        return result;
    }

#ifdef _WIN32
    std::wstring app = fs::path(entry_path).wstring();
    std::wstring cmdline = L"\"" + app + L"\"";
    std::wstring cwd = fs::path(working_dir).wstring();

    STARTUPINFOW si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    ZeroMemory(&pi, sizeof(pi));

    if (!CreateProcessW(app.c_str(), cmdline.data(), nullptr, nullptr, FALSE,
                        DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP,
                        nullptr, cwd.empty() ? nullptr : cwd.c_str(), &si, &pi)) {
        result.message = "CreateProcess failed: " +
                         std::system_category().message(static_cast<int>(GetLastError()));
        spdlog::warn("launch {}: {}", entry_path, result.message);
        return result;
    }
    result.pid = static_cast<long>(pi.dwProcessId);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
#else
    const bool is_script = fs::path(entry_path).extension() == ".sh";
    if (!is_script) {
        fs::permissions(entry_path,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec) {
            spdlog::warn("launch: cannot mark {} executable: {}", entry_path, ec.message());
        }
    }

    // Everything the child needs is prepared before fork()
    std::string program = is_script ? "/bin/sh" : entry_path;
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    if (is_script) argv.push_back(entry_path.c_str());
    argv.push_back(nullptr);

    int fds[2];
    if (pipe(fds) != 0) {
        result.message = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (!set_cloexec(fds[0]) || !set_cloexec(fds[1])) {
        result.message = std::string("fcntl failed: ") + std::strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.message = std::string("fork failed: ") + std::strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return result;
    }

    if (pid == 0) {
        // Intermediate child: new session, fork the real child, exit.
        close(fds[0]);
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) {
            write_report(fds[1], 2, errno);
            _exit(1);
        }
        if (grandchild > 0) {
            write_report(fds[1], 1, static_cast<int>(grandchild));
            _exit(0);
        }

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            write_report(fds[1], 2, errno);
            _exit(127);
        }
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        execv(program.c_str(), const_cast<char* const*>(argv.data()));
        write_report(fds[1], 2, errno);
        _exit(127);
    }

    close(fds[1]);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    // EOF arrives once the grandchild has exec'd (close-on-exec) or died.
    int exec_errno = 0;
    ChildReport report;
    for (;;) {
        ssize_t n = read(fds[0], &report, sizeof(report));
        if (n < 0 && errno == EINTR) continue;
        if (n != static_cast<ssize_t>(sizeof(report))) break;
        if (report.kind == 1) result.pid = report.value;
        if (report.kind == 2) exec_errno = report.value;
    }
    close(fds[0]);

    if (exec_errno != 0) {
        result.pid = -1;
        result.message = "cannot start " + entry_path + ": " + std::strerror(exec_errno);
        spdlog::warn("launch: {}", result.message);
        return result;
    }
#endif

    result.success = true;
    result.message = "started " + fs::path(entry_path).filename().string();
    spdlog::info("launched {} (pid {})", entry_path, result.pid);
    return result;
}
