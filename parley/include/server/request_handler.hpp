#ifndef PARLEY_REQUEST_HANDLER_HPP
#define PARLEY_REQUEST_HANDLER_HPP

#include <string>
#include <map>
#include <chrono>
#include "../rooms/connection_registry.hpp"
#include "../security/rate_limiter.hpp"
#include "../signaling/peer_connection_tracker.hpp"

namespace parley {

/**
 * Room administration API.
 *
 * handleRequest() returns either a bare JSON body (200 OK) or a complete
 * "HTTP/1.1 <code> <reason>\r\n..." response for every other status.
 * The caller's address is read from the X-Client-IP header.
 */
class RequestHandler {
public:
    RequestHandler(ConnectionRegistry& registry,
                   PeerConnectionTracker& tracker,
                   RateLimiter& api_limiter,
                   RateLimiter& room_limiter,
                   std::string cors_origin);

    std::string handleRequest(const std::string& method,
                              const std::string& path,
                              const std::map<std::string, std::string>& headers,
                              const std::string& body);

private:
    ConnectionRegistry& registry_;
    PeerConnectionTracker& tracker_;
    RateLimiter& api_limiter_;
    RateLimiter& room_limiter_;
    std::string cors_origin_;
    std::chrono::steady_clock::time_point started_at_;

    // Route handlers
    std::string handleGet(const std::string& path);
    std::string handlePost(const std::string& path, const std::string& body, const std::string& client_ip);
    std::string handleOptions();

    // API endpoints
    std::string handleCreateRoom(const std::string& body, const std::string& client_ip);
    std::string handleGetRoom(const std::string& room_id);
    std::string handleGetPeerRoom(const std::string& room_id);

    std::string statusResponse(int code, const std::string& reason, const std::string& body) const;
    std::string notFound(const std::string& message) const;
};

} // namespace parley

#endif // PARLEY_REQUEST_HANDLER_HPP
