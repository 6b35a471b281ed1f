#pragma once

#include <string>

struct LaunchResult {
    bool success = false;
    long pid = -1;
    std::string message;
};

class Launcher {
public:
    /// Start entry_path as a detached child with working_dir as its cwd and
    /// return without waiting for it. Shell scripts (.sh) run through /bin/sh;
    /// a missing executable bit is added first.
    static LaunchResult launch_detached(const std::string& entry_path,
                                        const std::string& working_dir);
};
