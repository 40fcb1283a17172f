#ifndef PARLEY_WEBSOCKET_SESSION_HPP
#define PARLEY_WEBSOCKET_SESSION_HPP

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace parley {

/**
 * One upgraded /ws connection.
 *
 * The socket must have been accepted on a strand; every handler of this
 * session runs on it. Frames are read one at a time and handed to the
 * message callback in arrival order. Outgoing frames are queued with a single
 * write in flight.
 */
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    using MessageHandler = std::function<void(const std::string& session_id, const std::string& message)>;
    using CloseHandler = std::function<void(const std::string& session_id)>;

    WebSocketSession(tcp::socket&& socket, std::string session_id, std::string remote_address);

    // Completes the handshake for req and starts reading.
    void run(http::request<http::string_body> req, MessageHandler on_message, CloseHandler on_close);

    // Thread-safe.
    void send(std::string message);
    // Thread-safe. Queued frames are flushed before the close frame.
    void close();

    const std::string& id() const { return session_id_; }

private:
    void onAccept(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes_transferred);
    void doClose();
    void notifyClosed();

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::string session_id_;
    std::string remote_address_;
    MessageHandler on_message_;
    CloseHandler on_close_;

    std::deque<std::shared_ptr<const std::string>> outbox_;
    bool write_in_progress_ = false;
    bool close_requested_ = false;
    bool close_started_ = false;
    bool closed_ = false;
};

} // namespace parley

#endif // PARLEY_WEBSOCKET_SESSION_HPP
