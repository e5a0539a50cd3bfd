#include "api_router.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "product_store.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    coop_catalog::Config cfg;
    try {
        cfg = coop_catalog::parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << coop_catalog::usage();
        return 1;
    }
    if (cfg.showHelp) {
        std::cout << coop_catalog::usage();
        return 0;
    }

    try {
        coop_catalog::ProductStore store;
        coop_catalog::ApiRouter    router(store, cfg.verbose);
        coop_catalog::HttpServer   server(router, cfg.address, cfg.port, cfg.verbose,
                                          cfg.idleTimeoutMs, cfg.threads);

        std::cout
            << "=== coop_catalog ===\n"
            << "Address:    " << cfg.address   << "\n"
            << "Port:       " << server.port() << "\n"
            << "Threads:    " << (cfg.threads == 0 ? std::string("auto")
                                                   : std::to_string(cfg.threads)) << "\n"
            << "Categories: " << coop_catalog::catalog::allowedCategories().size() << "\n"
            << "Verbose:    " << (cfg.verbose ? "yes" : "no") << "\n"
            << "====================\n" << std::flush;

        server.run();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
