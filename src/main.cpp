#include <iostream>
#include <string>
#include "cli/bridge_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    panebridge"
              << theme::color::RESET << theme::color::DIM
              << "                  Console bridge to the tmux session" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    panebridge parse "
              << theme::color::RESET << theme::color::AMBER << "[file]"
              << theme::color::RESET << theme::color::DIM
              << "     Detect a prompt in a pane dump or the live pane" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    panebridge init-config"
              << theme::color::RESET << theme::color::DIM
              << "      Write ~/.panebridge/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    panebridge --version        Show version\n"
              << "    panebridge --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            BridgeCLI cli;
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "panebridge"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "parse") {
            BridgeCLI cli;
            return cli.run_parse(argc >= 3 ? argv[2] : "");
        } else if (cmd == "init-config") {
            BridgeCLI cli;
            return cli.run_init_config();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
