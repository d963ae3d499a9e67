#include "stratmon/network/ws_broadcast_server.hpp"
#include "stratmon/core/logger.hpp"

#include <boost/asio/post.hpp>

namespace stratmon::network {

// ============================================================================
// WsBroadcastServer
// ============================================================================

WsBroadcastServer::WsBroadcastServer(net::io_context& ioc, unsigned short port)
    : ioc_(ioc)
    , acceptor_(net::make_strand(ioc))
    , port_(port)
{
}

WsBroadcastServer::~WsBroadcastServer() {
    stop();
}

bool WsBroadcastServer::start() {
    if (running_.exchange(true)) {
        return true;
    }

    beast::error_code ec;

    auto endpoint = tcp::endpoint(tcp::v4(), port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        Logger::error("[WS-Server] Failed to open acceptor: {}", ec.message());
        running_ = false;
        return false;
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);

    acceptor_.bind(endpoint, ec);
    if (ec) {
        Logger::error("[WS-Server] Failed to bind to port {}: {}", port_, ec.message());
        running_ = false;
        return false;
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        Logger::error("[WS-Server] Failed to listen: {}", ec.message());
        running_ = false;
        return false;
    }

    // Port 0 asks the OS for a free one
    port_ = acceptor_.local_endpoint(ec).port();

    Logger::info("[WS-Server] Broadcasting events on ws://localhost:{}", port_);
    do_accept();
    return true;
}

void WsBroadcastServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    beast::error_code ec;
    acceptor_.close(ec);

    std::set<std::shared_ptr<BroadcastSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& session : sessions) {
        session->close();
    }

    Logger::info("[WS-Server] Stopped");
}

void WsBroadcastServer::do_accept() {
    if (!running_) return;

    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&WsBroadcastServer::on_accept, shared_from_this()));
}

void WsBroadcastServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            Logger::warn("[WS-Server] Accept error: {}", ec.message());
        }
    } else {
        auto session = std::make_shared<BroadcastSession>(std::move(socket), shared_from_this());
        session->start();
    }

    do_accept();
}

void WsBroadcastServer::broadcast(std::string message) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& session : sessions_) {
        session->send(message);
    }
}

size_t WsBroadcastServer::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void WsBroadcastServer::join(std::shared_ptr<BroadcastSession> session) {
    if (greeting_) {
        for (auto& frame : greeting_()) {
            session->send(std::move(frame));
        }
    }

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.insert(session);
    Logger::info("[WS-Server] Client connected (total: {})", sessions_.size());
}

void WsBroadcastServer::leave(std::shared_ptr<BroadcastSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.erase(session) > 0) {
        Logger::info("[WS-Server] Client disconnected (total: {})", sessions_.size());
    }
}

// ============================================================================
// BroadcastSession
// ============================================================================

BroadcastSession::BroadcastSession(tcp::socket&& socket, std::shared_ptr<WsBroadcastServer> server)
    : ws_(std::move(socket))
    , server_(server)
{
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "stratmon");
        res.set(beast::http::field::access_control_allow_origin, "*");
    }));
}

void BroadcastSession::start() {
    ws_.async_accept(
        beast::bind_front_handler(&BroadcastSession::on_accept, shared_from_this()));
}

void BroadcastSession::on_accept(beast::error_code ec) {
    if (ec) {
        Logger::warn("[WS-Session] Handshake error: {}", ec.message());
        return;
    }

    if (auto server = server_.lock()) {
        server->join(shared_from_this());
    }

    do_read();
}

void BroadcastSession::do_read() {
    ws_.async_read(
        buffer_,
        beast::bind_front_handler(&BroadcastSession::on_read, shared_from_this()));
}

void BroadcastSession::on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        if (ec != websocket::error::closed) {
            Logger::debug("[WS-Session] Read error: {}", ec.message());
        }
        drop();
        return;
    }

    // Clients have nothing to say; discard and keep listening for close
    buffer_.consume(buffer_.size());
    do_read();
}

void BroadcastSession::send(std::string message) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(message));

    if (!writing_) {
        writing_ = true;
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            self->do_write();
        });
    }
}

void BroadcastSession::do_write() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.empty()) {
            writing_ = false;
            return;
        }
        current_message_ = std::move(queue_.front());
        queue_.pop_front();
    }

    ws_.text(true);
    ws_.async_write(
        net::buffer(current_message_),
        beast::bind_front_handler(&BroadcastSession::on_write, shared_from_this()));
}

void BroadcastSession::on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        drop();
        return;
    }

    do_write();
}

void BroadcastSession::drop() {
    if (auto server = server_.lock()) {
        server->leave(shared_from_this());
    }
}

void BroadcastSession::close() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->ws_.close(websocket::close_code::normal, ec);
    });
}

} // namespace stratmon::network
