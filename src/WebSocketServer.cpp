#include "WebSocketServer.h"
#include "ViewerRegistry.h"
#include <boost/asio/buffer.hpp>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

WebSocketViewer::WebSocketViewer(tcp::socket socket, size_t queue_limit)
    : ws_(std::move(socket)),
      queue_limit_(queue_limit),
      state_(ViewerState::CLOSED),
      writing_(false) {
    boost::system::error_code ec;
    auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    remote_address_ = ec ? std::string("unknown") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void WebSocketViewer::run(std::function<void(const std::shared_ptr<WebSocketViewer>&)> on_open,
                          ClosedCallback on_closed) {
    on_closed_ = std::move(on_closed);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, "drone-relay");
    }));

    auto self = shared_from_this();
    ws_.async_accept([this, self, on_open](const boost::system::error_code& ec) {
        if (ec) {
            std::cerr << "[WebSocketServer] Handshake with " << remote_address_ << " failed: "
                      << ec.message() << std::endl;
            return;
        }
        state_ = ViewerState::OPEN;
        try {
            on_open(self);
        } catch (const std::exception& e) {
            std::cerr << "[WebSocketServer] Viewer open handler error: " << e.what() << std::endl;
        }
        doRead();
    });
}

void WebSocketViewer::sendBinary(const Frame& frame) {
    if (state_ != ViewerState::OPEN) {
        throw std::runtime_error("viewer is not open");
    }
    enqueue(Outbound{frame, nullptr});
}

void WebSocketViewer::sendText(const std::string& text) {
    if (state_ != ViewerState::OPEN) {
        throw std::runtime_error("viewer is not open");
    }
    enqueue(Outbound{nullptr, std::make_shared<const std::string>(text)});
}

void WebSocketViewer::enqueue(Outbound message) {
    bool is_frame = message.frame != nullptr;
    queue_.push_back(std::move(message));

    if (is_frame && queue_limit_ > 0) {
        size_t queued = queue_.size() - (writing_ ? 1 : 0);
        if (queued > queue_limit_) {
            dropOldestFrame();
        }
    }

    if (!writing_) {
        doWrite();
    }
}

void WebSocketViewer::dropOldestFrame() {
    // Index 0 is being written while writing_ is set
    for (size_t i = writing_ ? 1 : 0; i < queue_.size(); i++) {
        if (queue_[i].frame) {
            queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(i));
            dropped_frames_++;
            if (dropped_frames_ % 100 == 1) {
                std::cerr << "[WebSocketServer] Viewer " << remote_address_ << " too slow, "
                          << dropped_frames_ << " frame(s) dropped" << std::endl;
            }
            return;
        }
    }
}

void WebSocketViewer::doWrite() {
    if (queue_.empty() || state_ != ViewerState::OPEN) {
        writing_ = false;
        return;
    }

    writing_ = true;
    const Outbound& next = queue_.front();
    auto self = shared_from_this();
    auto handler = [this, self](const boost::system::error_code& ec, size_t /*bytes*/) {
        if (ec) {
            writing_ = false;
            fail("write", ec);
            return;
        }
        queue_.pop_front();
        doWrite();
    };

    if (next.frame) {
        ws_.binary(true);
        ws_.async_write(boost::asio::buffer(next.frame->data(), next.frame->size()), handler);
    } else {
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(next.text->data(), next.text->size()), handler);
    }
}

void WebSocketViewer::doRead() {
    auto self = shared_from_this();
    ws_.async_read(read_buffer_, [this, self](const boost::system::error_code& ec, size_t /*bytes*/) {
        if (ec) {
            if (ec == websocket::error::closed || state_ != ViewerState::OPEN) {
                state_ = ViewerState::CLOSED;
                queue_.clear();
                notifyClosed();
                return;
            }
            fail("read", ec);
            return;
        }
        // Viewers have nothing to say; incoming messages are discarded
        read_buffer_.consume(read_buffer_.size());
        doRead();
    });
}

void WebSocketViewer::close() {
    if (state_ != ViewerState::OPEN) {
        return;
    }
    state_ = ViewerState::CLOSING;

    // Keep only the message currently being written
    if (writing_ && !queue_.empty()) {
        queue_.erase(queue_.begin() + 1, queue_.end());
    } else {
        queue_.clear();
    }

    auto self = shared_from_this();
    ws_.async_close(websocket::close_code::going_away, [this, self](const boost::system::error_code& ec) {
        if (ec && ec != boost::asio::error::operation_aborted) {
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        }
        // The pending read completes with "closed" and finishes the teardown
    });
}

void WebSocketViewer::fail(const char* what, const boost::system::error_code& ec) {
    if (state_ == ViewerState::CLOSED) {
        return;
    }
    if (ec != boost::asio::error::operation_aborted) {
        std::cerr << "[WebSocketServer] Viewer " << remote_address_ << " " << what << " error: "
                  << ec.message() << std::endl;
    }
    state_ = ViewerState::CLOSED;
    queue_.clear();

    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
    notifyClosed();
}

void WebSocketViewer::notifyClosed() {
    if (!on_closed_) {
        return;
    }
    ClosedCallback callback = std::move(on_closed_);
    on_closed_ = nullptr;
    try {
        callback(this);
    } catch (const std::exception& e) {
        std::cerr << "[WebSocketServer] Viewer close handler error: " << e.what() << std::endl;
    }
}

WebSocketServer::WebSocketServer(boost::asio::io_context& io, ViewerRegistry& registry, uint16_t port,
                                 size_t queue_limit)
    : registry_(registry),
      port_(port),
      queue_limit_(queue_limit),
      acceptor_(io) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

bool WebSocketServer::start() {
    if (acceptor_.is_open()) {
        std::cerr << "[WebSocketServer] Already running" << std::endl;
        return false;
    }

    boost::system::error_code ec;
    tcp::endpoint endpoint(tcp::v4(), port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        std::cerr << "[WebSocketServer] Failed to listen on port " << port_ << ": " << ec.message() << std::endl;
        acceptor_.close(ec);
        return false;
    }

    std::cout << "[WebSocketServer] Started on port " << port() << std::endl;
    doAccept();
    return true;
}

void WebSocketServer::stop() {
    if (!acceptor_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
    std::cout << "[WebSocketServer] Stopped" << std::endl;
}

uint16_t WebSocketServer::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void WebSocketServer::doAccept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            std::cerr << "[WebSocketServer] Accept error: " << ec.message() << std::endl;
        } else {
            auto viewer = std::make_shared<WebSocketViewer>(std::move(socket), queue_limit_);
            viewer->run(
                [this](const std::shared_ptr<WebSocketViewer>& opened) {
                    registry_.registerViewer(opened);
                },
                [this](WebSocketViewer* closed) {
                    registry_.unregisterViewer(closed);
                });
        }
        doAccept();
    });
}
