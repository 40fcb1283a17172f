#ifndef PARLEY_SERVER_CONFIG_HPP
#define PARLEY_SERVER_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>
#include "../signaling/peer_connection_tracker.hpp"

namespace parley {

struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 5001;
    int threads = 1;
    std::string log_file;
    std::string log_level = "info";
    std::string cors_origin = "http://localhost:3000";
    std::vector<IceServer> ice_servers;
    std::chrono::milliseconds offer_max_age{30000};

    // Unset or unparsable variables keep their defaults.
    static ServerConfig fromEnvironment();

    // "a, b,c" -> {"a","b","c"}; empty items are dropped.
    static std::vector<IceServer> parseIceServers(const std::string& list);
    static std::vector<IceServer> defaultIceServers();
};

} // namespace parley

#endif // PARLEY_SERVER_CONFIG_HPP
