#include "callsheet/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        callsheet::startup_config cfg{};
        if (auto cli_result = callsheet::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        if (cfg.jobs_console) {
            callsheet::cli::run_jobs_console(cfg, std::cin, std::cout, std::cerr);
            return 0;
        }
        return callsheet::cli::run_once(cfg, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
