#include <iostream>
#include <vector>
#include <string>
#include "cli/parcp_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>

int main(int argc, char** argv) {
    try {
        ParcpCLI cli;

        if (argc == 1) {
            cli.print_usage();
            return EXIT_NOT_STARTED;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "--version") {
            cli.print_version();
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            cli.print_usage();
            return 0;
        } else if (cmd == "unpack") {
            if (args.size() != 2) {
                std::cout << theme::fail("Usage: parcp unpack <frame> <output>");
                return EXIT_NOT_STARTED;
            }
            return cli.run_unpack(args[0], args[1]);
        } else if (cmd == "inspect") {
            if (args.size() != 1) {
                std::cout << theme::fail("Usage: parcp inspect <frame>");
                return EXIT_NOT_STARTED;
            }
            return cli.run_inspect(args[0]);
        }

        std::vector<std::string> all(argv + 1, argv + argc);
        for (const auto& a : all) {
            if (a == "--help") { cli.print_usage(); return 0; }
            if (a == "--version") { cli.print_version(); return 0; }
        }

        auto opts = parse_copy_args(all);
        if (opts.is_err()) {
            std::cout << theme::fail(opts.error);
            std::cout << theme::step("Run 'parcp --help' for usage.");
            return EXIT_NOT_STARTED;
        }
        return cli.run_copy(opts.value);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_NOT_STARTED;
    }
}
