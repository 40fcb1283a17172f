#include "../../include/server/server_config.hpp"
#include "../../include/utils/logger.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace parley {

namespace {

std::string envString(const char* key, const std::string& fallback) {
    const char* value = std::getenv(key);
    if (value && *value) {
        return std::string(value);
    }
    return fallback;
}

long envNumber(const char* key, long fallback, long min_value, long max_value) {
    const char* value = std::getenv(key);
    if (!value || !*value) {
        return fallback;
    }
    try {
        long parsed = std::stol(value);
        if (parsed >= min_value && parsed <= max_value) {
            return parsed;
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    Logger::getInstance().warning(std::string("Ignoring invalid value for ") + key + ": " + value);
    return fallback;
}

std::string trim(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace

std::vector<IceServer> ServerConfig::defaultIceServers() {
    return {
        IceServer{"stun:stun.l.google.com:19302"},
        IceServer{"stun:stun1.l.google.com:19302"},
        IceServer{"stun:stun2.l.google.com:19302"}
    };
}

std::vector<IceServer> ServerConfig::parseIceServers(const std::string& list) {
    std::vector<IceServer> servers;
    std::istringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            servers.push_back(IceServer{item});
        }
    }
    return servers;
}

ServerConfig ServerConfig::fromEnvironment() {
    ServerConfig config;
    config.address = envString("PARLEY_SERVER_ADDRESS", config.address);
    config.port = static_cast<unsigned short>(envNumber("PARLEY_PORT", config.port, 1, 65535));
    config.threads = static_cast<int>(envNumber("PARLEY_THREADS", config.threads, 1, 256));
    config.log_file = envString("PARLEY_LOG_FILE", config.log_file);
    config.log_level = envString("PARLEY_LOG_LEVEL", config.log_level);
    config.cors_origin = envString("PARLEY_CORS_ORIGIN", config.cors_origin);
    config.offer_max_age = std::chrono::milliseconds(
        envNumber("PARLEY_OFFER_MAX_AGE_MS", static_cast<long>(config.offer_max_age.count()), 1, 86400000L));

    config.ice_servers = parseIceServers(envString("PARLEY_STUN_SERVERS", ""));
    if (config.ice_servers.empty()) {
        config.ice_servers = defaultIceServers();
    }
    return config;
}

} // namespace parley
