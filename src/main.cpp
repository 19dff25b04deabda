#include <iostream>
#include <vector>
#include <string>
#include "cli/depsweep_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"
#include "platform/terminal.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        auto parsed = parse_args(args);
        if (parsed.is_err()) {
            if (!platform::stdout_is_terminal()) theme::disable_colors();
            std::cout << theme::fail(parsed.error);
            std::cout << theme::step("Run 'depsweep --help' for usage.");
            return EXIT_FATAL;
        }

        CliOptions opts = parsed.value;
        if (!opts.color || !platform::stdout_is_terminal()) {
            theme::disable_colors();
        }

        if (opts.mode == CliOptions::VERSION) {
            std::cout << theme::color::BROWN << theme::color::BOLD << "depsweep"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << DEPSWEEP_VERSION << theme::color::RESET << "\n";
            return EXIT_OK;
        }
        if (opts.mode == CliOptions::HELP) {
            print_usage(std::cout);
            return EXIT_OK;
        }

        DepsweepCLI cli(opts, std::cout);
        return cli.run();
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_FATAL;
    }
}
