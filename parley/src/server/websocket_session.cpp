#include "../../include/server/websocket_session.hpp"
#include "../../include/utils/logger.hpp"

namespace parley {

namespace {
constexpr std::size_t kMaxFrameSize = 1024 * 1024;
} // namespace

WebSocketSession::WebSocketSession(tcp::socket&& socket, std::string session_id, std::string remote_address)
    : ws_(beast::tcp_stream(std::move(socket))),
      session_id_(std::move(session_id)),
      remote_address_(std::move(remote_address)) {}

void WebSocketSession::run(http::request<http::string_body> req, MessageHandler on_message, CloseHandler on_close) {
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "parley-signaling");
    }));
    ws_.read_message_max(kMaxFrameSize);

    ws_.async_accept(req, beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
}

void WebSocketSession::onAccept(beast::error_code ec) {
    if (ec) {
        Logger::getInstance().error("WebSocket accept error: " + ec.message());
        notifyClosed();
        return;
    }
    Logger::getInstance().info("WebSocket connection accepted: " + session_id_ + " from " + remote_address_);
    doRead();
}

void WebSocketSession::doRead() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::onRead, shared_from_this()));
}

void WebSocketSession::onRead(beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
        Logger::getInstance().info("WebSocket connection closed: " + session_id_);
        notifyClosed();
        return;
    }
    if (ec) {
        if (ec != net::error::operation_aborted) {
            Logger::getInstance().warning("WebSocket read error on " + session_id_ + ": " + ec.message());
        }
        notifyClosed();
        return;
    }

    std::string message = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    Logger::getInstance().debug("WebSocket message from " + session_id_ + ": " + message);
    if (on_message_) {
        on_message_(session_id_, message);
    }

    doRead();
}

void WebSocketSession::send(std::string message) {
    auto payload = std::make_shared<const std::string>(std::move(message));
    net::dispatch(ws_.get_executor(), [self = shared_from_this(), payload]() {
        if (self->closed_ || self->close_started_) {
            return;
        }
        self->outbox_.push_back(payload);
        if (!self->write_in_progress_) {
            self->doWrite();
        }
    });
}

void WebSocketSession::doWrite() {
    if (outbox_.empty()) {
        write_in_progress_ = false;
        if (close_requested_) {
            doClose();
        }
        return;
    }

    write_in_progress_ = true;
    ws_.text(true);
    ws_.async_write(net::buffer(*outbox_.front()),
                    beast::bind_front_handler(&WebSocketSession::onWrite, shared_from_this()));
}

void WebSocketSession::onWrite(beast::error_code ec, std::size_t) {
    if (ec) {
        Logger::getInstance().error("Error sending WebSocket message to " + session_id_ + ": " + ec.message());
        outbox_.clear();
        write_in_progress_ = false;
        return;
    }
    outbox_.pop_front();
    doWrite();
}

void WebSocketSession::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        self->close_requested_ = true;
        if (!self->write_in_progress_) {
            self->doClose();
        }
    });
}

void WebSocketSession::doClose() {
    if (close_started_ || closed_) {
        return;
    }
    close_started_ = true;
    ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            Logger::getInstance().warning("WebSocket close error on " + self->session_id_ + ": " + ec.message());
        }
    });
}

void WebSocketSession::notifyClosed() {
    if (closed_) {
        return;
    }
    closed_ = true;
    outbox_.clear();
    if (on_close_) {
        on_close_(session_id_);
    }
}

} // namespace parley
