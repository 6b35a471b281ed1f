#pragma once

#include "core/locator.hpp"

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -1 if no subcommand (caller should start the installer).
    static int run(int argc, char* argv[]);

    /// Same, with paths resolved against locator instead of the executable
    static int run(int argc, char* argv[], const PathLocator& locator);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status(const PathLocator& locator);
    static int cmd_config(int argc, char* argv[], const PathLocator& locator);
};
