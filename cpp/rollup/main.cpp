#include "rollup_service.hpp"
#include "../utils/logging/logger.hpp"

int main(int argc, char** argv) {
    rollup::RollupService service;
    if (!service.initialize(argc, argv)) {
        logging::cleanup_logging();
        return 1;
    }

    service.start();
    logging::cleanup_logging();
    return 0;
}
