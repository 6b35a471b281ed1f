#include <gtest/gtest.h>
#include "ui/key_reader.hpp"

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <termios.h>
#include <unistd.h>
#endif

TEST(ScriptedKeyReaderTest, ReplaysKeysThenEof) {
    ScriptedKeyReader reader("aB\x1b");
    EXPECT_EQ(reader.remaining(), 3u);
    EXPECT_EQ(reader.read_key(), 'a');
    EXPECT_EQ(reader.read_key(), 'B');
    EXPECT_EQ(reader.read_key(), kEscapeKey);
    EXPECT_EQ(reader.read_key(), std::nullopt);
    EXPECT_EQ(reader.read_key(), std::nullopt);
}

TEST(ScriptedKeyReaderTest, EmptyScriptIsImmediateEof) {
    ScriptedKeyReader reader("");
    EXPECT_FALSE(reader.read_key().has_value());
}

TEST(ScriptedKeyReaderTest, DiscardDropsOnlyTypeAhead) {
    ScriptedKeyReader reader("x");
    reader.type_ahead("uyy");
    EXPECT_EQ(reader.remaining(), 4u);
    reader.discard_pending();
    EXPECT_EQ(reader.discards(), 1);
    EXPECT_EQ(reader.read_key(), 'x');
    EXPECT_EQ(reader.read_key(), std::nullopt);
}

TEST(ScriptedKeyReaderTest, TypeAheadIsReadFirst) {
    ScriptedKeyReader reader("x");
    reader.type_ahead("u");
    EXPECT_EQ(reader.read_key(), 'u');
    EXPECT_EQ(reader.read_key(), 'x');
}

TEST(MutedInputTest, MutesForScopeThenDiscards) {
    ScriptedKeyReader reader("x");
    {
        MutedInput muted(reader);
        EXPECT_TRUE(reader.muted());
        reader.type_ahead("uyy");
    }
    EXPECT_FALSE(reader.muted());
    EXPECT_EQ(reader.discards(), 1);
    EXPECT_EQ(reader.read_key(), 'x');
}

#ifndef _WIN32

// Pipe bytes into stdin: the reader must not touch terminal modes and must
// deliver exactly one byte per call, case preserved.
class PipedStdinTest : public ::testing::Test {
protected:
    int saved_stdin = -1;

    void feed(const std::string& bytes) {
        int fds[2];
        ASSERT_EQ(pipe(fds), 0);
        ASSERT_EQ(write(fds[1], bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
        close(fds[1]);
        saved_stdin = dup(STDIN_FILENO);
        ASSERT_GE(saved_stdin, 0);
        ASSERT_GE(dup2(fds[0], STDIN_FILENO), 0);
        close(fds[0]);
    }

    void TearDown() override {
        if (saved_stdin >= 0) {
            dup2(saved_stdin, STDIN_FILENO);
            close(saved_stdin);
        }
    }
};

TEST_F(PipedStdinTest, ReadsSingleBytesThenEof) {
    feed("uYx");
    auto reader = make_terminal_key_reader();
    EXPECT_EQ(reader->read_key(), 'u');
    EXPECT_EQ(reader->read_key(), 'Y');
    EXPECT_EQ(reader->read_key(), 'x');
    EXPECT_EQ(reader->read_key(), std::nullopt);
}

TEST_F(PipedStdinTest, NewlineIsJustAnotherKey) {
    feed("y\n");
    auto reader = make_terminal_key_reader();
    EXPECT_EQ(reader->read_key(), 'y');
    EXPECT_EQ(reader->read_key(), '\n');
    EXPECT_EQ(reader->read_key(), std::nullopt);
}

TEST_F(PipedStdinTest, EscapeWithoutTerminal) {
    feed("\x1b");
    auto reader = make_terminal_key_reader();
    EXPECT_EQ(reader->read_key(), kEscapeKey);
    EXPECT_EQ(reader->read_key(), std::nullopt);
}

TEST_F(PipedStdinTest, DiscardKeepsPipedInput) {
    feed("uy");
    auto reader = make_terminal_key_reader();
    reader->set_muted(true);
    reader->set_muted(false);
    reader->discard_pending();
    EXPECT_EQ(reader->read_key(), 'u');
    EXPECT_EQ(reader->read_key(), 'y');
}

// A pseudo terminal on stdin: keys typed while muted must not survive
// discard_pending().
class PtyStdinTest : public ::testing::Test {
protected:
    int master = -1;
    int saved_stdin = -1;

    void SetUp() override {
        master = posix_openpt(O_RDWR | O_NOCTTY);
        if (master < 0 || grantpt(master) != 0 || unlockpt(master) != 0) {
            GTEST_SKIP() << "no pseudo terminal available";
        }
        int slave = open(ptsname(master), O_RDWR | O_NOCTTY);
        ASSERT_GE(slave, 0);
        saved_stdin = dup(STDIN_FILENO);
        ASSERT_GE(saved_stdin, 0);
        ASSERT_GE(dup2(slave, STDIN_FILENO), 0);
        close(slave);
    }

    void TearDown() override {
        if (saved_stdin >= 0) {
            dup2(saved_stdin, STDIN_FILENO);
            close(saved_stdin);
        }
        if (master >= 0) close(master);
    }

    void type(const std::string& keys) {
        ASSERT_EQ(write(master, keys.data(), keys.size()), static_cast<ssize_t>(keys.size()));
    }
};

TEST_F(PtyStdinTest, TypeAheadIsDiscarded) {
    auto reader = make_terminal_key_reader();
    reader->set_muted(true);
    type("uyy");

    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    ASSERT_EQ(poll(&pfd, 1, 2000), 1);

    // Muting turns echo off until it is lifted
    struct termios mode;
    ASSERT_EQ(tcgetattr(STDIN_FILENO, &mode), 0);
    EXPECT_EQ(mode.c_lflag & ECHO, 0u);

    reader->set_muted(false);
    reader->discard_pending();
    ASSERT_EQ(tcgetattr(STDIN_FILENO, &mode), 0);
    EXPECT_NE(mode.c_lflag & ECHO, 0u);

    type("x");
    EXPECT_EQ(reader->read_key(), 'x');
}

#endif
