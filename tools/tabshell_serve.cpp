#include <csignal>
#include <cstdlib>

#include <tabshell/web/ShellServer.hpp>
#include <tabshell/web/ShellServerOptions.hpp>

namespace {
void handle_signal(int) {
    TS::Serve::RequestShellServerStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = TS::Serve::ParseShellServerArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        TS::Serve::PrintShellServerUsage();
        return EXIT_SUCCESS;
    }

    TS::Serve::ResetShellServerStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    return TS::Serve::RunShellServer(options);
}
