#include "../../include/server/http_server.hpp"
#include "../../include/utils/id_generator.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/utils/json_parser.hpp"
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <csignal>
#include <sstream>
#include <algorithm>

namespace {
constexpr auto kMaxRequestBodySize = 64ULL * 1024;

constexpr std::chrono::minutes kRoomSweepInterval{5};
constexpr std::chrono::seconds kOfferSweepInterval{60};
constexpr std::chrono::minutes kLimiterSweepInterval{5};
} // namespace

namespace parley {

HttpServer::HttpServer(const ServerConfig& config)
    : config_(config),
      running_(false),
      registry_(media_states_),
      tracker_(media_states_, config.ice_servers),
      api_limiter_(100, 15 * 60),
      room_limiter_(10, 60 * 60),
      event_limiter_(50, 60),
      dispatcher_(registry_, tracker_, event_limiter_),
      request_handler_(registry_, tracker_, api_limiter_, room_limiter_, config.cors_origin) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    std::vector<std::thread> workers;
    try {
        dispatcher_.setSender([this](const std::string& session_id, const std::string& message) {
            sendToSession(session_id, message);
        });
        dispatcher_.setCloser([this](const std::string& session_id) {
            closeSession(session_id);
        });

        // Create acceptor
        tcp::endpoint endpoint(net::ip::make_address(config_.address), config_.port);
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_, endpoint);

        running_ = true;
        Logger::getInstance().info("HTTP Server started on " + config_.address + ":" + std::to_string(config_.port));

        net::signal_set signals(ioc_, SIGINT, SIGTERM);
        signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            Logger::getInstance().info("Signal " + std::to_string(signal_number) + " received, shutting down");
            stop();
        });

        startScheduledTasks();
        acceptConnections();

        // Run IO context on the configured number of threads
        for (int i = 1; i < config_.threads; i++) {
            workers.emplace_back([this]() { ioc_.run(); });
        }
        ioc_.run();

        for (auto& worker : workers) {
            worker.join();
        }
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Server error: " + std::string(e.what()));
        stop();
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        return false;
    }
}

void HttpServer::stop() {
    if (running_.exchange(false)) {
        for (auto& task : tasks_) {
            task->stop();
        }
        ioc_.stop();
        Logger::getInstance().info("HTTP Server stopped");
    }
}

void HttpServer::startScheduledTasks() {
    const auto offer_max_age = config_.offer_max_age;

    tasks_.push_back(std::make_shared<PeriodicTask>(ioc_, "empty-room-sweep",
        std::chrono::duration_cast<std::chrono::milliseconds>(kRoomSweepInterval),
        [this]() {
            dispatcher_.sweepEmptyRooms();
        }));
    tasks_.push_back(std::make_shared<PeriodicTask>(ioc_, "expired-offer-sweep",
        std::chrono::duration_cast<std::chrono::milliseconds>(kOfferSweepInterval),
        [this, offer_max_age]() {
            size_t removed = dispatcher_.sweepExpiredOffers(offer_max_age);
            if (removed > 0) {
                Logger::getInstance().info("Removed " + std::to_string(removed) + " expired offers");
            }
        }));
    tasks_.push_back(std::make_shared<PeriodicTask>(ioc_, "rate-limit-sweep",
        std::chrono::duration_cast<std::chrono::milliseconds>(kLimiterSweepInterval),
        [this]() {
            size_t removed = api_limiter_.sweepExpired() + room_limiter_.sweepExpired() +
                             event_limiter_.sweepExpired();
            Logger::getInstance().debug("Rate limit sweep dropped " + std::to_string(removed) + " counters");
        }));

    for (auto& task : tasks_) {
        task->start();
    }
}

void HttpServer::acceptConnections() {
    if (!running_) return;

    // Each connection gets its own strand; WebSocket sessions rely on it.
    auto socket = std::make_shared<tcp::socket>(net::make_strand(ioc_));

    acceptor_->async_accept(*socket,
        [this, socket](beast::error_code ec) {
            if (!ec) {
                handleConnection(socket);
            } else if (ec != net::error::operation_aborted) {
                Logger::getInstance().error("Accept error: " + ec.message());
            }
            acceptConnections();
        });
}

void HttpServer::handleConnection(std::shared_ptr<tcp::socket> socket) {
    auto buffer = std::make_shared<beast::flat_buffer>();
    auto parser = std::make_shared<http::request_parser<http::string_body>>();
    parser->body_limit(kMaxRequestBodySize);

    http::async_read(*socket, *buffer, *parser,
        [this, socket, buffer, parser](beast::error_code ec, std::size_t) {
            if (!ec) {
                processRequest(socket, parser->release());
                return;
            }
            if (ec == http::error::body_limit) {
                Logger::getInstance().warning("Request body too large");
                http::response<http::string_body> res;
                res.result(http::status::payload_too_large);
                res.set(http::field::content_type, "application/json");
                res.set(http::field::access_control_allow_origin, config_.cors_origin);
                res.body() = JsonParser::createErrorResponse("Request body too large");
                res.prepare_payload();
                sendResponse(socket, res);
                return;
            }
            if (ec != http::error::end_of_stream) {
                Logger::getInstance().error("Read error: " + ec.message());
            }
        });
}

void HttpServer::processRequest(std::shared_ptr<tcp::socket> socket,
                                http::request<http::string_body> req) {
    auto applySecurityHeaders = [](http::response<http::string_body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Referrer-Policy", "strict-origin-when-cross-origin");
    };

    try {
    // Check for WebSocket upgrade request
    std::string path = std::string(req.target());
    if (path == "/ws" && websocket::is_upgrade(req)) {
        handleWebSocketUpgrade(socket, std::move(req));
        return;
    }

    std::string client_ip;
    beast::error_code endpoint_ec;
    auto remote = socket->remote_endpoint(endpoint_ec);
    if (!endpoint_ec) {
        client_ip = remote.address().to_string();
    }

    // Extract headers
    std::map<std::string, std::string> headers;
    for (const auto& header : req) {
        headers[std::string(header.name_string())] = std::string(header.value());
    }
    if (!client_ip.empty()) {
        headers["X-Client-IP"] = client_ip;
    }

    // Convert method to string
    std::string method = std::string(to_string(req.method()));
    std::string body = req.body();

    // Handle request
    std::string response_str = request_handler_.handleRequest(method, path, headers, body);

    // Parse response
    http::response<http::string_body> res;

    // Non-200 answers come back as a full HTTP response
    if (response_str.find("HTTP/1.1") == 0) {
        std::istringstream response_stream(response_str);
        std::string line;

        // Read status line (e.g. "HTTP/1.1 404 Not Found")
        std::getline(response_stream, line);
        int status_code = 200;
        std::istringstream status_stream(line);
        std::string http_version;
        status_stream >> http_version >> status_code;
        if (!status_stream || status_code < 100 || status_code > 599) {
            status_code = 500;
        }

        // Read headers
        while (std::getline(response_stream, line) && line != "\r" && !line.empty()) {
            size_t colon_pos = line.find(':');
            if (colon_pos != std::string::npos) {
                std::string key = line.substr(0, colon_pos);
                std::string value = line.substr(colon_pos + 1);
                // Trim whitespace
                value.erase(0, value.find_first_not_of(" \t\r\n"));
                value.erase(value.find_last_not_of(" \t\r\n") + 1);
                if (key != "Content-Length") {
                    res.set(key, value);
                }
            }
        }

        // Read body
        std::ostringstream body_stream;
        body_stream << response_stream.rdbuf();

        res.result(static_cast<http::status>(status_code));
        applySecurityHeaders(res);
        res.body() = body_stream.str();
        res.prepare_payload();

        sendResponse(socket, res);
        return;
    }

    // It's a JSON response, wrap it in HTTP
    res.result(http::status::ok);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, config_.cors_origin);
    res.set(http::field::access_control_allow_credentials, "true");
    applySecurityHeaders(res);

    res.body() = response_str;
    res.prepare_payload();

    sendResponse(socket, res);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unhandled exception in processRequest: " + std::string(e.what()));
        http::response<http::string_body> res;
        res.result(http::status::internal_server_error);
        res.set(http::field::content_type, "application/json");
        res.set(http::field::access_control_allow_origin, config_.cors_origin);
        res.body() = "{\"error\":\"Internal server error\"}";
        res.prepare_payload();
        applySecurityHeaders(res);
        sendResponse(socket, res);
    }
}

void HttpServer::sendResponse(std::shared_ptr<tcp::socket> socket,
                              http::response<http::string_body> res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    http::async_write(*socket, *sp,
        [socket, sp](beast::error_code ec, std::size_t) {
            if (ec) {
                Logger::getInstance().error("Write error: " + ec.message());
            }
            socket->shutdown(tcp::socket::shutdown_send, ec);
        });
}

void HttpServer::handleWebSocketUpgrade(std::shared_ptr<tcp::socket> socket,
                                        http::request<http::string_body> req) {
    std::string remote_address;
    beast::error_code endpoint_ec;
    auto remote = socket->remote_endpoint(endpoint_ec);
    if (!endpoint_ec) {
        remote_address = remote.address().to_string();
    }

    auto session = std::make_shared<WebSocketSession>(std::move(*socket), IdGenerator::generate(), remote_address);
    registerWebSocketSession(session);
    dispatcher_.handleConnect(session->id(), remote_address);

    session->run(std::move(req),
        [this](const std::string& session_id, const std::string& message) {
            dispatcher_.handleMessage(session_id, message);
        },
        [this](const std::string& session_id) {
            dispatcher_.handleDisconnect(session_id);
            unregisterWebSocketSession(session_id);
        });
}

void HttpServer::registerWebSocketSession(std::shared_ptr<WebSocketSession> session) {
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(ws_sessions_mutex_);
        ws_sessions_[session->id()] = session;
        total = ws_sessions_.size();
    }
    Logger::getInstance().info("WebSocket session registered: " + session->id() +
                               " (total connections: " + std::to_string(total) + ")");
}

void HttpServer::unregisterWebSocketSession(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(ws_sessions_mutex_);
        ws_sessions_.erase(session_id);
    }
    Logger::getInstance().info("WebSocket session unregistered: " + session_id);
}

void HttpServer::sendToSession(const std::string& session_id, const std::string& message) {
    std::shared_ptr<WebSocketSession> session;
    {
        std::lock_guard<std::mutex> lock(ws_sessions_mutex_);
        auto it = ws_sessions_.find(session_id);
        if (it == ws_sessions_.end()) {
            Logger::getInstance().warning("No WebSocket session found for " + session_id);
            return;
        }
        session = it->second.lock();
        if (!session) {
            Logger::getInstance().warning("WebSocket session expired: " + session_id);
            ws_sessions_.erase(it);
            return;
        }
    }
    session->send(message);
}

void HttpServer::closeSession(const std::string& session_id) {
    std::shared_ptr<WebSocketSession> session;
    {
        std::lock_guard<std::mutex> lock(ws_sessions_mutex_);
        auto it = ws_sessions_.find(session_id);
        if (it != ws_sessions_.end()) {
            session = it->second.lock();
        }
    }
    if (session) {
        session->close();
    }
}

} // namespace parley
