// ============================================================================
// main.cpp — Entry point for the wsclean tool
// ============================================================================

#include "wsclean/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        wsclean::Options opts = wsclean::parse_args(argc, argv);

        if (opts.help) {
            wsclean::print_usage(argv[0]);
            return 0;
        }

        return wsclean::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        wsclean::print_usage(argv[0]);
        return 1;
    }
}
