#include "server/http_server.hpp"
#include "server/server_config.hpp"
#include "utils/logger.hpp"
#include <exception>
#include <string>

int main(int argc, char* argv[]) {
    parley::ServerConfig config = parley::ServerConfig::fromEnvironment();

    // Allow port override via command line argument
    if (argc > 1) {
        try {
            int port = std::stoi(argv[1]);
            if (port <= 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            config.port = static_cast<unsigned short>(port);
        } catch (const std::exception&) {
            parley::Logger::getInstance().error(std::string("Invalid port argument: ") + argv[1]);
            return 1;
        }
    }

    // Setup logging
    parley::Logger& logger = parley::Logger::getInstance();
    logger.setMinLevel(parley::Logger::levelFromString(config.log_level));
    if (!config.log_file.empty()) {
        logger.setLogFile(config.log_file);
    }
    logger.info("Starting Parley signaling server...");
    logger.info("Server will listen on " + config.address + ":" + std::to_string(config.port) +
                " with " + std::to_string(config.threads) + " thread(s)");

    // Create and start server
    parley::HttpServer server(config);
    if (!server.start()) {
        logger.error("Failed to start server");
        return 1;
    }

    logger.info("Server shut down");
    return 0;
}
