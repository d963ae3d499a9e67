#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace stratmon::network {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class BroadcastSession;

/**
 * WebSocket server pushing engine events to dashboard clients
 *
 * - Every text frame goes to every connected client
 * - New clients first receive the greeting frames (current prices)
 * - Inbound frames are read only to detect disconnection
 */
class WsBroadcastServer : public std::enable_shared_from_this<WsBroadcastServer> {
public:
    using GreetingProvider = std::function<std::vector<std::string>()>;

    WsBroadcastServer(net::io_context& ioc, unsigned short port);
    ~WsBroadcastServer();

    // Start accepting connections; false if the port could not be bound
    bool start();
    void stop();

    // Broadcast message to all connected clients (thread-safe)
    void broadcast(std::string message);

    void set_greeting_provider(GreetingProvider provider) { greeting_ = std::move(provider); }

    size_t connection_count() const;
    unsigned short port() const noexcept { return port_; }
    bool is_running() const noexcept { return running_.load(); }

    // Session management (called by BroadcastSession)
    void join(std::shared_ptr<BroadcastSession> session);
    void leave(std::shared_ptr<BroadcastSession> session);

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_;
    std::atomic<bool> running_{false};
    GreetingProvider greeting_;

    mutable std::mutex sessions_mutex_;
    std::set<std::shared_ptr<BroadcastSession>> sessions_;
};

/**
 * One dashboard connection
 */
class BroadcastSession : public std::enable_shared_from_this<BroadcastSession> {
public:
    BroadcastSession(tcp::socket&& socket, std::shared_ptr<WsBroadcastServer> server);

    void start();
    void send(std::string message);
    void close();

private:
    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void drop();

    websocket::stream<beast::tcp_stream> ws_;
    std::weak_ptr<WsBroadcastServer> server_;
    beast::flat_buffer buffer_;

    std::mutex queue_mutex_;
    std::deque<std::string> queue_;
    std::string current_message_;  // Must outlive async_write
    bool writing_{false};
};

} // namespace stratmon::network
