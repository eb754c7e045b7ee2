#pragma once

#include "ViewerConnection.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

class ViewerRegistry;

/**
 * WebSocketViewer - One browser connected to the video socket
 *
 * Outbound messages go through a FIFO drained by a single in-flight write.
 * With a queue limit, the oldest queued video frame is dropped on overflow;
 * the frame being written and text messages are never dropped.
 */
class WebSocketViewer : public ViewerConnection,
                        public std::enable_shared_from_this<WebSocketViewer> {
public:
    using ClosedCallback = std::function<void(WebSocketViewer* viewer)>;

    WebSocketViewer(boost::asio::ip::tcp::socket socket, size_t queue_limit);

    // Perform the WebSocket handshake, then call on_open
    void run(std::function<void(const std::shared_ptr<WebSocketViewer>&)> on_open,
             ClosedCallback on_closed);

    ViewerState state() const override { return state_; }
    void sendBinary(const Frame& frame) override;
    void sendText(const std::string& text) override;
    void close() override;
    std::string remoteAddress() const override { return remote_address_; }

    size_t queuedMessages() const { return queue_.size(); }
    uint64_t getDroppedFrames() const { return dropped_frames_; }

private:
    struct Outbound {
        Frame frame;                                 // Binary message
        std::shared_ptr<const std::string> text;     // Text message
    };

    void enqueue(Outbound message);
    void dropOldestFrame();
    void doWrite();
    void doRead();
    void fail(const char* what, const boost::system::error_code& ec);
    void notifyClosed();

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer read_buffer_;
    std::string remote_address_;
    size_t queue_limit_;

    ViewerState state_;
    std::deque<Outbound> queue_;
    bool writing_;
    ClosedCallback on_closed_;

    uint64_t dropped_frames_ = 0;
};

/**
 * WebSocketServer - Accepts viewers and hands them to the registry
 */
class WebSocketServer {
public:
    WebSocketServer(boost::asio::io_context& io, ViewerRegistry& registry, uint16_t port,
                    size_t queue_limit);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    bool start();

    // Stop accepting new viewers
    void stop();

    bool isRunning() const { return acceptor_.is_open(); }

    // Bound port (useful when configured with 0)
    uint16_t port() const;

private:
    void doAccept();

    ViewerRegistry& registry_;
    uint16_t port_;
    size_t queue_limit_;
    boost::asio::ip::tcp::acceptor acceptor_;
};
