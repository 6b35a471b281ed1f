#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>

/// Source of single keystrokes. read_key() blocks until one key is available
/// and returns it case-preserved, without echo and without waiting for Enter.
/// nullopt means the input stream was closed.
class KeyReader {
public:
    virtual ~KeyReader() = default;
    virtual std::optional<char> read_key() = 0;

    /// Drop keystrokes typed before now, so they never answer a later prompt.
    virtual void discard_pending() {}

    /// While muted, typed keys are neither echoed nor line-buffered on screen.
    virtual void set_muted(bool muted) { (void)muted; }
};

/// Mutes the reader for a scope and discards whatever was typed meanwhile.
class MutedInput {
public:
    explicit MutedInput(KeyReader& keys) : keys_(keys) { keys_.set_muted(true); }
    ~MutedInput() {
        keys_.set_muted(false);
        keys_.discard_pending();
    }

    MutedInput(const MutedInput&) = delete;
    MutedInput& operator=(const MutedInput&) = delete;

private:
    KeyReader& keys_;
};

/// Replays a fixed key sequence, then reports end of input. Keys passed to
/// type_ahead() sit in front of the script as already-buffered input until
/// read or discarded.
class ScriptedKeyReader : public KeyReader {
public:
    explicit ScriptedKeyReader(const std::string& keys) : keys_(keys.begin(), keys.end()) {}

    std::optional<char> read_key() override {
        std::deque<char>& source = buffered_.empty() ? keys_ : buffered_;
        if (source.empty()) return std::nullopt;
        char c = source.front();
        source.pop_front();
        return c;
    }

    void discard_pending() override {
        buffered_.clear();
        ++discards_;
    }

    void set_muted(bool muted) override { muted_ = muted; }

    void type_ahead(const std::string& keys) { buffered_.insert(buffered_.end(), keys.begin(), keys.end()); }

    size_t remaining() const { return buffered_.size() + keys_.size(); }
    int discards() const { return discards_; }
    bool muted() const { return muted_; }

private:
    std::deque<char> keys_;
    std::deque<char> buffered_;
    int discards_ = 0;
    bool muted_ = false;
};

/// Key code reported for escape sequences the installer does not use
/// (arrows, function keys).
constexpr char kUnrecognizedKey = '\0';
constexpr char kEscapeKey = '\x1b';

/// Reader for the process's standard input. On a terminal, raw mode is
/// entered for the duration of each read and restored afterwards; piped
/// input is read byte by byte as is.
std::unique_ptr<KeyReader> make_terminal_key_reader();

/// Restore the terminal when SIGINT/SIGTERM/SIGHUP arrive mid-read, then
/// re-raise the signal with its default action.
void install_terminal_signal_handlers();
