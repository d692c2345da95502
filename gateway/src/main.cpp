#include "config.hpp"
#include "gateway_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <memory>

// Global pointer to the service to allow signal handler to access it
std::unique_ptr<GatewayService> service_ptr;

void signal_handler(int signum) {
    if (service_ptr) {
        service_ptr->stop();
    }
    (void)signum;
}

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        util::setup_logging(config.service_name, config.log_level);
        spdlog::info("Log level set to '{}'", config.log_level);

        config.validate();
        spdlog::info("Starting {}...", config.service_name);

        // 3. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Create and run the service
        service_ptr = std::make_unique<GatewayService>(config);
        service_ptr->run();
        service_ptr.reset();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Gateway has shut down gracefully.");
    return 0;
}
