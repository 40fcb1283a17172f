#include "../../include/server/request_handler.hpp"
#include "../../include/signaling/signaling_protocol.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace parley {

namespace {

const std::string kRoomsPrefix = "/api/rooms/";
const std::string kPeerRoomsPrefix = "/api/webrtc/rooms/";

// Thrown while validating a room creation body; answered with 400.
class BadRequest : public std::runtime_error {
public:
    explicit BadRequest(const std::string& message) : std::runtime_error(message) {}
};

bool isNull(const std::map<std::string, std::string>& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() || it->second == "null";
}

bool parseBool(const std::string& raw, const std::string& field) {
    if (raw == "true") return true;
    if (raw == "false") return false;
    throw BadRequest(field + " must be a boolean.");
}

bool isInteger(const std::string& raw) {
    if (raw.empty() || raw.size() > 9) {
        return false;
    }
    return std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string errorBody(const std::string& error) {
    return "{\"error\":\"" + JsonParser::escapeJson(error) + "\"}";
}

} // namespace

RequestHandler::RequestHandler(ConnectionRegistry& registry,
                               PeerConnectionTracker& tracker,
                               RateLimiter& api_limiter,
                               RateLimiter& room_limiter,
                               std::string cors_origin)
    : registry_(registry),
      tracker_(tracker),
      api_limiter_(api_limiter),
      room_limiter_(room_limiter),
      cors_origin_(std::move(cors_origin)),
      started_at_(std::chrono::steady_clock::now()) {}

std::string RequestHandler::handleRequest(const std::string& method,
                                          const std::string& path,
                                          const std::map<std::string, std::string>& headers,
                                          const std::string& body) {
    // Strip query string for routing
    std::string clean_path = path;
    size_t qpos = clean_path.find('?');
    if (qpos != std::string::npos) {
        clean_path = clean_path.substr(0, qpos);
    }
    if (clean_path.size() > 1 && clean_path.back() == '/') {
        clean_path.pop_back();
    }

    auto ip_it = headers.find("X-Client-IP");
    const std::string client_ip = ip_it != headers.end() ? ip_it->second : "unknown";

    if (method == "OPTIONS") {
        return handleOptions();
    }

    if (clean_path.rfind("/api/", 0) == 0) {
        std::string reason;
        if (!api_limiter_.allow(client_ip, reason)) {
            Logger::getInstance().warning("Rate limit exceeded for IP: " + client_ip);
            return statusResponse(429, "Too Many Requests",
                "{\"error\":\"Too many requests from this IP, please try again later.\",\"retryAfter\":\"15 minutes\"}");
        }
    }

    if (method == "GET") {
        return handleGet(clean_path);
    } else if (method == "POST") {
        return handlePost(clean_path, body, client_ip);
    }
    return notFound("Not found");
}

std::string RequestHandler::handleGet(const std::string& path) {
    if (path == "/") {
        std::ostringstream oss;
        oss << "{\"message\":\"Video Conference Signaling API\","
            << "\"status\":\"running\","
            << "\"timestamp\":\"" << SignalingProtocol::isoTimestampNow() << "\"}";
        return oss.str();
    } else if (path == "/health") {
        const double uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
        std::ostringstream oss;
        oss << "{\"status\":\"healthy\",\"uptime\":" << std::fixed << std::setprecision(3) << uptime << "}";
        return oss.str();
    } else if (path == "/api/stats") {
        return SignalingProtocol::registryStatsJson(registry_.stats());
    } else if (path == "/api/webrtc/stats") {
        return SignalingProtocol::trackerStatsJson(tracker_.stats());
    } else if (path == "/api/webrtc/ice-servers") {
        return "{\"iceServers\":" + SignalingProtocol::iceServersJson(tracker_.iceServers()) + "}";
    } else if (path.rfind(kPeerRoomsPrefix, 0) == 0 && path.size() > kPeerRoomsPrefix.size()) {
        return handleGetPeerRoom(path.substr(kPeerRoomsPrefix.size()));
    } else if (path.rfind(kRoomsPrefix, 0) == 0 && path.size() > kRoomsPrefix.size()) {
        return handleGetRoom(path.substr(kRoomsPrefix.size()));
    }
    return notFound("Not found");
}

std::string RequestHandler::handlePost(const std::string& path, const std::string& body, const std::string& client_ip) {
    if (path == "/api/rooms") {
        return handleCreateRoom(body, client_ip);
    }
    return notFound("Not found");
}

std::string RequestHandler::handleOptions() {
    std::ostringstream oss;
    oss << "HTTP/1.1 204 No Content\r\n"
        << "Access-Control-Allow-Origin: " << cors_origin_ << "\r\n"
        << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        << "Access-Control-Allow-Headers: Content-Type\r\n"
        << "Access-Control-Allow-Credentials: true\r\n"
        << "Access-Control-Max-Age: 86400\r\n"
        << "\r\n";
    return oss.str();
}

std::string RequestHandler::handleCreateRoom(const std::string& body, const std::string& client_ip) {
    std::string reason;
    if (!room_limiter_.allow(client_ip, reason)) {
        Logger::getInstance().warning("Room creation rate limit exceeded for IP: " + client_ip);
        return statusResponse(429, "Too Many Requests",
            "{\"error\":\"Too many rooms created from this IP, please try again later.\",\"retryAfter\":\"1 hour\"}");
    }

    std::optional<std::string> created_by;
    RoomOptions options;
    try {
        std::map<std::string, std::string> fields;
        if (body.find_first_not_of(" \t\r\n") != std::string::npos) {
            try {
                fields = JsonParser::parseRaw(body);
            } catch (const std::invalid_argument&) {
                throw BadRequest("Request body must be a JSON object.");
            }
        }

        if (!isNull(fields, "createdBy")) {
            const std::string& raw = fields["createdBy"];
            if (!JsonParser::isStringValue(raw)) {
                throw BadRequest("Invalid createdBy field. Must be a string with max 100 characters.");
            }
            std::string value = JsonParser::decodeString(raw);
            if (value.size() > 100) {
                throw BadRequest("Invalid createdBy field. Must be a string with max 100 characters.");
            }
            if (!value.empty()) {
                created_by = value;
            }
        }

        if (!isNull(fields, "settings")) {
            if (!JsonParser::isObjectValue(fields["settings"])) {
                throw BadRequest("Settings must be an object.");
            }
            auto settings = JsonParser::parseRaw(fields["settings"]);

            if (!isNull(settings, "maxUsers")) {
                const std::string& raw = settings["maxUsers"];
                if (!isInteger(raw) || std::stoi(raw) < 1 || std::stoi(raw) > 50) {
                    throw BadRequest("maxUsers must be a number between 1 and 50.");
                }
                options.max_participants = static_cast<size_t>(std::stoi(raw));
            }
            if (!isNull(settings, "password")) {
                const std::string& raw = settings["password"];
                if (!JsonParser::isStringValue(raw) || JsonParser::decodeString(raw).size() > 50) {
                    throw BadRequest("Password must be a string with max 50 characters.");
                }
                options.password = JsonParser::decodeString(raw);
            }
            if (!isNull(settings, "requirePassword")) {
                options.require_password = parseBool(settings["requirePassword"], "requirePassword");
            }
            if (!isNull(settings, "allowScreenShare")) {
                options.allow_screen_share = parseBool(settings["allowScreenShare"], "allowScreenShare");
            }
            if (!isNull(settings, "allowChat")) {
                options.allow_chat = parseBool(settings["allowChat"], "allowChat");
            }
        }
    } catch (const BadRequest& e) {
        Logger::getInstance().warning("Rejected room creation from " + client_ip + ": " + e.what());
        return statusResponse(400, "Bad Request", errorBody(e.what()));
    }

    Room room = registry_.createRoom(created_by, options);

    std::ostringstream oss;
    oss << "{\"roomId\":\"" << JsonParser::escapeJson(room.id()) << "\","
        << "\"message\":\"Room created successfully\","
        << "\"roomInfo\":" << SignalingProtocol::roomInfoJson(room, registry_.mediaStates())
        << "}";
    return oss.str();
}

std::string RequestHandler::handleGetRoom(const std::string& room_id) {
    auto room = registry_.getRoom(room_id);
    if (!room) {
        return notFound("Room not found");
    }
    return SignalingProtocol::roomInfoJson(*room, registry_.mediaStates());
}

std::string RequestHandler::handleGetPeerRoom(const std::string& room_id) {
    auto snapshot = tracker_.roomSnapshot(room_id);
    if (!snapshot) {
        return notFound("Room not found in WebRTC manager");
    }
    return SignalingProtocol::peerRoomSnapshotJson(*snapshot);
}

std::string RequestHandler::statusResponse(int code, const std::string& reason, const std::string& body) const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << reason << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Access-Control-Allow-Origin: " << cors_origin_ << "\r\n"
        << "\r\n"
        << body;
    return oss.str();
}

std::string RequestHandler::notFound(const std::string& message) const {
    return statusResponse(404, "Not Found", errorBody(message));
}

} // namespace parley
