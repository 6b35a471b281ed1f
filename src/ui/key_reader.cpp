#include "ui/key_reader.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <memory>
#include <optional>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace {

#ifndef _WIN32

// ════════════════════════════════════════════════════════════════
// POSIX: termios
// ════════════════════════════════════════════════════════════════

// Settings saved by the active guard, restored from the signal hook too.
struct termios g_saved_mode;
std::atomic<bool> g_raw_active{false};

void restore_saved_mode() {
    if (g_raw_active.exchange(false)) {
        tcsetattr(STDIN_FILENO, TCSANOW, &g_saved_mode);
    }
}

void on_terminate_signal(int sig) {
    restore_saved_mode();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

/// Non-canonical, non-echo mode for one read. ISIG stays on so Ctrl+C still
/// delivers SIGINT.
class RawModeGuard {
public:
    RawModeGuard() {
        if (tcgetattr(STDIN_FILENO, &g_saved_mode) != 0) return;
        struct termios raw = g_saved_mode;
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0) {
            g_raw_active.store(true);
            active_ = true;
        }
    }

    ~RawModeGuard() {
        if (active_) restore_saved_mode();
    }

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    bool active_ = false;
};

/// 1 = byte read, 0 = end of input, -1 = error
int read_byte(char& c) {
    for (;;) {
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n == 1) return 1;
        if (n == 0) return 0;
        if (errno == EINTR) continue;
        return -1;
    }
}

bool byte_pending(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

class PosixKeyReader : public KeyReader {
public:
    PosixKeyReader() : is_tty_(isatty(STDIN_FILENO) == 1) {}

    std::optional<char> read_key() override {
        if (!is_tty_) return read_one();
        if (mute_) return read_one();
        RawModeGuard guard;
        return read_one();
    }

    void discard_pending() override {
        if (is_tty_ && tcflush(STDIN_FILENO, TCIFLUSH) != 0) {
            spdlog::warn("key reader: tcflush failed: {}", std::strerror(errno));
        }
    }

    void set_muted(bool muted) override {
        if (!is_tty_) return;
        if (muted && !mute_) {
            mute_ = std::make_unique<RawModeGuard>();
        } else if (!muted) {
            mute_.reset();
        }
    }

private:
    std::optional<char> read_one() {
        char c = 0;
        int r = read_byte(c);
        if (r <= 0) {
            if (r < 0) spdlog::warn("key reader: read failed, treating as end of input");
            return std::nullopt;
        }
        if (c != kEscapeKey) return c;

        // Lone Escape, or the start of an escape sequence
        if (!is_tty_ || !byte_pending(30)) return kEscapeKey;

        char next = 0;
        if (read_byte(next) <= 0) return kEscapeKey;

        if (next == 'O') {
            // SS3: exactly one final byte (F1-F4, keypad)
            char final_byte = 0;
            if (byte_pending(30) && read_byte(final_byte) <= 0) return std::nullopt;
            return kUnrecognizedKey;
        }
        if (next == '[') {
            // CSI: parameters until a final byte in 0x40..0x7E
            while (byte_pending(30)) {
                char b = 0;
                if (read_byte(b) <= 0) break;
                if (b >= 0x40 && b <= 0x7E) break;
            }
            return kUnrecognizedKey;
        }
        // Alt+key
        return kUnrecognizedKey;
    }

    bool is_tty_;
    std::unique_ptr<RawModeGuard> mute_;
};

#else

// ════════════════════════════════════════════════════════════════
// Windows: console input mode
// ════════════════════════════════════════════════════════════════

DWORD g_saved_mode = 0;
std::atomic<bool> g_raw_active{false};

void restore_saved_mode() {
    if (g_raw_active.exchange(false)) {
        SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), g_saved_mode);
    }
}

void on_terminate_signal(int sig) {
    restore_saved_mode();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

class ConsoleModeGuard {
public:
    explicit ConsoleModeGuard(HANDLE h) : handle_(h) {
        if (!GetConsoleMode(handle_, &g_saved_mode)) return;
        DWORD raw = g_saved_mode & ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT);
        if (SetConsoleMode(handle_, raw)) {
            g_raw_active.store(true);
            active_ = true;
        }
    }

    ~ConsoleModeGuard() {
        if (active_) restore_saved_mode();
    }

    ConsoleModeGuard(const ConsoleModeGuard&) = delete;
    ConsoleModeGuard& operator=(const ConsoleModeGuard&) = delete;

private:
    HANDLE handle_;
    bool active_ = false;
};

class ConsoleKeyReader : public KeyReader {
public:
    ConsoleKeyReader() : handle_(GetStdHandle(STD_INPUT_HANDLE)) {
        DWORD mode = 0;
        is_console_ = GetConsoleMode(handle_, &mode) != 0;
    }

    std::optional<char> read_key() override {
        if (!is_console_) {
            char c = 0;
            DWORD n = 0;
            if (!ReadFile(handle_, &c, 1, &n, nullptr) || n == 0) return std::nullopt;
            return c;
        }

        std::optional<ConsoleModeGuard> guard;
        if (!mute_) guard.emplace(handle_);
        for (;;) {
            INPUT_RECORD rec;
            DWORD n = 0;
            if (!ReadConsoleInputA(handle_, &rec, 1, &n) || n == 0) {
                spdlog::warn("key reader: console read failed, treating as end of input");
                return std::nullopt;
            }
            if (rec.EventType != KEY_EVENT || !rec.Event.KeyEvent.bKeyDown) continue;

            char c = rec.Event.KeyEvent.uChar.AsciiChar;
            if (c == 0) {
                // Modifier keys alone produce no character; skip them
                WORD vk = rec.Event.KeyEvent.wVirtualKeyCode;
                if (vk == VK_SHIFT || vk == VK_CONTROL || vk == VK_MENU) continue;
                return kUnrecognizedKey;
            }
            return c;
        }
    }

    void discard_pending() override {
        if (is_console_ && !FlushConsoleInputBuffer(handle_)) {
            spdlog::warn("key reader: FlushConsoleInputBuffer failed ({})", GetLastError());
        }
    }

    void set_muted(bool muted) override {
        if (!is_console_) return;
        if (muted && !mute_) {
            mute_ = std::make_unique<ConsoleModeGuard>(handle_);
        } else if (!muted) {
            mute_.reset();
        }
    }

private:
    HANDLE handle_;
    bool is_console_ = false;
    std::unique_ptr<ConsoleModeGuard> mute_;
};

#endif

}  // namespace

std::unique_ptr<KeyReader> make_terminal_key_reader() {
#ifdef _WIN32
    return std::make_unique<ConsoleKeyReader>();
#else
    return std::make_unique<PosixKeyReader>();
#endif
}

void install_terminal_signal_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, on_terminate_signal);
    std::signal(SIGTERM, on_terminate_signal);
#else
    struct sigaction sa;
    sa.sa_handler = on_terminate_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
#endif
}
