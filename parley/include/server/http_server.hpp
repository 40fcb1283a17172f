#ifndef PARLEY_HTTP_SERVER_HPP
#define PARLEY_HTTP_SERVER_HPP

#include <string>
#include <memory>
#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include "../rooms/connection_registry.hpp"
#include "../rooms/media_state_table.hpp"
#include "../security/rate_limiter.hpp"
#include "../signaling/peer_connection_tracker.hpp"
#include "../signaling/signaling_dispatcher.hpp"
#include "periodic_task.hpp"
#include "request_handler.hpp"
#include "server_config.hpp"
#include "websocket_session.hpp"

namespace parley {

/**
 * Owns the io_context, the stores, the dispatcher and the periodic sweeps.
 * Serves the admin API over HTTP and the signaling protocol on /ws.
 */
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Blocks until stop() or SIGINT/SIGTERM.
    bool start();
    void stop();

private:
    ServerConfig config_;
    net::io_context ioc_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::atomic<bool> running_;

    MediaStateTable media_states_;
    ConnectionRegistry registry_;
    PeerConnectionTracker tracker_;
    RateLimiter api_limiter_;
    RateLimiter room_limiter_;
    RateLimiter event_limiter_;
    SignalingDispatcher dispatcher_;
    RequestHandler request_handler_;
    std::vector<std::shared_ptr<PeriodicTask>> tasks_;

    // session id -> live WebSocket session
    std::map<std::string, std::weak_ptr<WebSocketSession>> ws_sessions_;
    std::mutex ws_sessions_mutex_;

    void startScheduledTasks();
    void acceptConnections();
    void handleConnection(std::shared_ptr<tcp::socket> socket);
    void processRequest(std::shared_ptr<tcp::socket> socket,
                        http::request<http::string_body> req);
    void sendResponse(std::shared_ptr<tcp::socket> socket,
                      http::response<http::string_body> res);
    void handleWebSocketUpgrade(std::shared_ptr<tcp::socket> socket,
                                http::request<http::string_body> req);
    void registerWebSocketSession(std::shared_ptr<WebSocketSession> session);
    void unregisterWebSocketSession(const std::string& session_id);
    void sendToSession(const std::string& session_id, const std::string& message);
    void closeSession(const std::string& session_id);
};

} // namespace parley

#endif // PARLEY_HTTP_SERVER_HPP
