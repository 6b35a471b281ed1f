#pragma once

#include <memory>

class App {
public:
    App();
    ~App();

    /// Run the interactive installer; returns the process exit code.
    int run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
