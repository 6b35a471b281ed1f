#include "core/cli.hpp"
#include "ui/key_reader.hpp"
#include "app.hpp"

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);
    if (cli_result != -1) {
        // handled by CLI (help, version, status, config, or error)
        return cli_result;
    }

    // No subcommand → interactive installer
    install_terminal_signal_handlers();
    App app;
    return app.run();
}
