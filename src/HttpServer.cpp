#include "HttpServer.h"
#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

using boost::asio::ip::tcp;

namespace {

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

// Content-Length of the header block, 0 if absent
size_t contentLength(const std::string& headers) {
    std::string lower = headers;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t cl_pos = lower.find("\r\ncontent-length:");
    if (cl_pos == std::string::npos) {
        return 0;
    }
    size_t cl_start = cl_pos + 17;  // strlen("\r\ncontent-length:")
    return static_cast<size_t>(std::strtoul(lower.c_str() + cl_start, nullptr, 10));
}

}  // namespace

HttpResponse HttpResponse::json(int status, const std::string& key, const std::string& value) {
    HttpResponse response;
    response.status = status;
    response.body = "{\"" + key + "\": \"" + HttpServer::jsonEscape(value) + "\"}";
    return response;
}

HttpResponse HttpResponse::error(int status, const std::string& message) {
    return json(status, "error", message);
}

/**
 * One accepted client: reads a single request, routes it, writes one response.
 */
class HttpServer::Connection : public std::enable_shared_from_this<HttpServer::Connection> {
public:
    Connection(HttpServer& server, tcp::socket socket)
        : server_(server),
          socket_(std::make_shared<tcp::socket>(std::move(socket))),
          timer_(server.io_) {
    }

    void start() {
        auto self = shared_from_this();
        timer_.expires_after(std::chrono::milliseconds(REQUEST_TIMEOUT_MS));
        timer_.async_wait([this, self](const boost::system::error_code& ec) {
            if (ec || responded_) {
                return;
            }
            boost::system::error_code ignored;
            socket_->close(ignored);
        });
        doRead();
    }

    void respond(const HttpResponse& response) {
        if (responded_) {
            return;
        }
        responded_ = true;
        timer_.cancel();

        auto self = shared_from_this();
        auto data = std::make_shared<std::string>(buildResponse(response));
        boost::asio::async_write(*socket_, boost::asio::buffer(*data),
            [this, self, data](const boost::system::error_code& /*ec*/, size_t /*bytes*/) {
                boost::system::error_code ignored;
                socket_->shutdown(tcp::socket::shutdown_both, ignored);
                socket_->close(ignored);
            });
    }

    // Hand the socket over to a long-lived event stream
    std::shared_ptr<tcp::socket> detach() {
        responded_ = true;
        timer_.cancel();
        return socket_;
    }

private:
    void doRead() {
        auto self = shared_from_this();
        socket_->async_read_some(boost::asio::buffer(buffer_),
            [this, self](const boost::system::error_code& ec, size_t bytes) {
                if (ec) {
                    return;
                }
                request_.append(buffer_.data(), bytes);

                if (request_.size() > MAX_REQUEST_SIZE) {
                    respond(HttpResponse::error(413, "Request too large"));
                    return;
                }

                size_t header_end = request_.find("\r\n\r\n");
                if (header_end == std::string::npos ||
                    request_.size() - (header_end + 4) < contentLength(request_.substr(0, header_end + 2))) {
                    doRead();
                    return;
                }
                timer_.cancel();

                std::string method, path, body;
                if (!parseRequest(request_, method, path, body)) {
                    respond(HttpResponse::error(400, "Bad request"));
                    return;
                }
                try {
                    server_.handleRequest(self, method, path, body);
                } catch (const std::exception& e) {
                    std::cerr << "[HttpServer] Error handling " << method << " " << path << ": " << e.what() << std::endl;
                    respond(HttpResponse::error(500, e.what()));
                }
            });
    }

    HttpServer& server_;
    std::shared_ptr<tcp::socket> socket_;
    boost::asio::steady_timer timer_;
    std::array<char, 4096> buffer_;
    std::string request_;
    bool responded_ = false;
};

HttpServer::HttpServer(boost::asio::io_context& io, uint16_t port)
    : io_(io),
      port_(port),
      acceptor_(io) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (acceptor_.is_open()) {
        std::cerr << "[HttpServer] Already running" << std::endl;
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
        std::cerr << "[HttpServer] Failed to bind to port " << port_ << ": " << ec.message() << std::endl;
        acceptor_.close(ec);
        return false;
    }

    std::cout << "[HttpServer] Started on port " << port() << std::endl;
    doAccept();
    return true;
}

void HttpServer::stop() {
    if (!acceptor_.is_open()) {
        return;
    }

    boost::system::error_code ec;
    acceptor_.close(ec);

    for (auto& subscriber : subscribers_) {
        subscriber->socket->close(ec);
    }
    subscribers_.clear();

    std::cout << "[HttpServer] Stopped" << std::endl;
}

uint16_t HttpServer::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? port_ : endpoint.port();
}

void HttpServer::doAccept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            std::cerr << "[HttpServer] Accept error: " << ec.message() << std::endl;
        } else {
            std::make_shared<Connection>(*this, std::move(socket))->start();
        }
        doAccept();
    });
}

bool HttpServer::parseRequest(const std::string& request, std::string& method, std::string& path, std::string& body) {
    // Parse first line
    std::istringstream stream(request);
    std::string line;

    if (!std::getline(stream, line)) {
        return false;
    }

    // Parse method and path
    std::istringstream first_line(line);
    std::string http_version;
    if (!(first_line >> method >> path >> http_version)) {
        return false;
    }
    if (path.empty() || path[0] != '/' || http_version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }

    // Find body (after empty line)
    size_t body_start = request.find("\r\n\r\n");
    if (body_start != std::string::npos) {
        body = request.substr(body_start + 4);
    }

    return true;
}

std::string HttpServer::buildResponse(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << statusText(response.status) << "\r\n";
    if (!response.body.empty()) {
        out << "Content-Type: " << response.content_type << "\r\n";
    }
    out << "Content-Length: " << response.body.length() << "\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    return out.str();
}

std::string HttpServer::urlDecode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            decoded.push_back(static_cast<char>(std::strtol(text.substr(i + 1, 2).c_str(), nullptr, 16)));
            i += 2;
        } else if (text[i] == '+') {
            decoded.push_back(' ');
        } else {
            decoded.push_back(text[i]);
        }
    }
    return decoded;
}

std::string HttpServer::jsonEscape(const std::string& text) {
    std::ostringstream out;
    for (char c : text) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

void HttpServer::handleRequest(const std::shared_ptr<Connection>& connection, const std::string& method,
                               const std::string& path, const std::string& /*body*/) {
    std::cout << "[HttpServer] " << method << " " << path << std::endl;

    Responder respond = [connection](const HttpResponse& response) { connection->respond(response); };

    if (method == "OPTIONS") {
        HttpResponse response;
        response.status = 204;
        respond(response);
        return;
    }

    // GET /drone/<command>; '?' belongs to read commands, so no query parsing here
    static const std::string DRONE_PREFIX = "/drone/";
    if (path.compare(0, DRONE_PREFIX.size(), DRONE_PREFIX) == 0) {
        if (method != "GET") {
            respond(HttpResponse::error(405, "Method not allowed"));
            return;
        }
        std::string command = urlDecode(path.substr(DRONE_PREFIX.size()));
        if (!command_callback_) {
            respond(HttpResponse::error(503, "Command relay not available"));
            return;
        }
        command_callback_(command, respond);
        return;
    }

    std::string route = path.substr(0, path.find('?'));

    if (method == "POST" && route == "/start-recording" && start_recording_callback_) {
        respond(start_recording_callback_());
        return;
    }

    if (method == "POST" && route == "/stop-recording" && stop_recording_callback_) {
        stop_recording_callback_(respond);
        return;
    }

    if (method == "POST" && route == "/capture-photo" && capture_photo_callback_) {
        respond(capture_photo_callback_());
        return;
    }

    if (method == "GET" && route == "/drone-state-stream") {
        subscribe(connection);
        return;
    }

    if (method == "GET" && route == "/health" && health_callback_) {
        respond(health_callback_());
        return;
    }

    // 404 for other paths
    respond(HttpResponse::error(404, "Not found"));
}

void HttpServer::subscribe(const std::shared_ptr<Connection>& connection) {
    auto subscriber = std::make_shared<Subscriber>();
    subscriber->socket = connection->detach();

    std::string initial = drone_state_callback_ ? drone_state_callback_() : std::string("{}");
    subscriber->queue.push_back(std::make_shared<std::string>(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Connection: keep-alive\r\n"
        "\r\n"
        "data: " + initial + "\n\n"));

    subscribers_.push_back(subscriber);
    std::cout << "[HttpServer] Event stream subscriber added (total: " << subscribers_.size() << ")" << std::endl;

    writeSubscriber(subscriber);
    watchSubscriber(subscriber);
}

void HttpServer::publishDroneState(const std::string& json) {
    if (subscribers_.empty()) {
        return;
    }
    auto event = std::make_shared<std::string>("data: " + json + "\n\n");

    for (auto& subscriber : subscribers_) {
        // Stale telemetry is worthless; keep the backlog short
        if (subscriber->queue.size() > 16) {
            subscriber->queue.erase(subscriber->queue.begin() + (subscriber->writing ? 1 : 0));
        }
        subscriber->queue.push_back(event);
        if (!subscriber->writing) {
            writeSubscriber(subscriber);
        }
    }
}

void HttpServer::writeSubscriber(const std::shared_ptr<Subscriber>& subscriber) {
    if (subscriber->queue.empty()) {
        subscriber->writing = false;
        return;
    }
    subscriber->writing = true;
    auto data = subscriber->queue.front();
    boost::asio::async_write(*subscriber->socket, boost::asio::buffer(*data),
        [this, subscriber, data](const boost::system::error_code& ec, size_t /*bytes*/) {
            if (ec) {
                dropSubscriber(subscriber);
                return;
            }
            subscriber->queue.pop_front();
            writeSubscriber(subscriber);
        });
}

void HttpServer::watchSubscriber(const std::shared_ptr<Subscriber>& subscriber) {
    // Subscribers never send anything; a completed read means they went away
    subscriber->socket->async_read_some(boost::asio::buffer(subscriber->discard),
        [this, subscriber](const boost::system::error_code& ec, size_t /*bytes*/) {
            if (ec) {
                dropSubscriber(subscriber);
                return;
            }
            watchSubscriber(subscriber);
        });
}

void HttpServer::dropSubscriber(const std::shared_ptr<Subscriber>& subscriber) {
    auto it = std::find(subscribers_.begin(), subscribers_.end(), subscriber);
    if (it == subscribers_.end()) {
        return;
    }
    subscribers_.erase(it);
    subscriber->writing = false;
    subscriber->queue.clear();

    boost::system::error_code ignored;
    subscriber->socket->close(ignored);
    std::cout << "[HttpServer] Event stream subscriber removed (total: " << subscribers_.size() << ")" << std::endl;
}
