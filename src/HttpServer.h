#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <string>

/**
 * Response handed back by a route handler
 */
struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    // {"<key>": "<value>"} with the given status
    static HttpResponse json(int status, const std::string& key, const std::string& value);
    static HttpResponse error(int status, const std::string& message);
};

/**
 * Small HTTP/1.1 server for the drone control surface.
 * Runs on the shared event loop; one request per connection.
 * - GET  /drone/<command>     - Send a command to the drone
 * - POST /start-recording     - Start recording the live stream
 * - POST /stop-recording      - Stop recording (replies once the file is finalized)
 * - POST /capture-photo       - Save the current snapshot as a photo
 * - GET  /drone-state-stream  - Server-Sent Events telemetry feed
 * - GET  /health              - Health status
 */
class HttpServer {
public:
    using Responder = std::function<void(const HttpResponse& response)>;
    using CommandCallback = std::function<void(const std::string& command, Responder respond)>;
    using AsyncCallback = std::function<void(Responder respond)>;
    using SyncCallback = std::function<HttpResponse()>;
    using DroneStateCallback = std::function<std::string()>;

    static constexpr size_t MAX_REQUEST_SIZE = 64 * 1024;
    static constexpr uint32_t REQUEST_TIMEOUT_MS = 5000;

    HttpServer(boost::asio::io_context& io, uint16_t port);
    ~HttpServer();

    // Prevent copying
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();

    // Stop accepting and drop event-stream subscribers
    void stop();

    bool isRunning() const { return acceptor_.is_open(); }
    uint16_t port() const;

    void setCommandCallback(CommandCallback callback) { command_callback_ = std::move(callback); }
    void setStartRecordingCallback(SyncCallback callback) { start_recording_callback_ = std::move(callback); }
    void setStopRecordingCallback(AsyncCallback callback) { stop_recording_callback_ = std::move(callback); }
    void setCapturePhotoCallback(SyncCallback callback) { capture_photo_callback_ = std::move(callback); }
    void setHealthCallback(SyncCallback callback) { health_callback_ = std::move(callback); }
    void setDroneStateCallback(DroneStateCallback callback) { drone_state_callback_ = std::move(callback); }

    // Push one telemetry update to every event-stream subscriber
    void publishDroneState(const std::string& json);
    size_t subscriberCount() const { return subscribers_.size(); }

    // Parse HTTP request and extract method, path and body
    static bool parseRequest(const std::string& request, std::string& method, std::string& path, std::string& body);
    static std::string buildResponse(const HttpResponse& response);
    static std::string urlDecode(const std::string& text);
    static std::string jsonEscape(const std::string& text);

private:
    class Connection;
    friend class Connection;

    struct Subscriber {
        std::shared_ptr<boost::asio::ip::tcp::socket> socket;
        std::deque<std::shared_ptr<std::string>> queue;
        bool writing = false;
        std::array<char, 256> discard;
    };
    using SubscriberList = std::list<std::shared_ptr<Subscriber>>;

    void doAccept();

    // Route one parsed request
    void handleRequest(const std::shared_ptr<Connection>& connection, const std::string& method,
                       const std::string& path, const std::string& body);

    void subscribe(const std::shared_ptr<Connection>& connection);
    void writeSubscriber(const std::shared_ptr<Subscriber>& subscriber);
    void watchSubscriber(const std::shared_ptr<Subscriber>& subscriber);
    void dropSubscriber(const std::shared_ptr<Subscriber>& subscriber);

    boost::asio::io_context& io_;
    uint16_t port_;
    boost::asio::ip::tcp::acceptor acceptor_;

    CommandCallback command_callback_;
    SyncCallback start_recording_callback_;
    AsyncCallback stop_recording_callback_;
    SyncCallback capture_photo_callback_;
    SyncCallback health_callback_;
    DroneStateCallback drone_state_callback_;

    SubscriberList subscribers_;
};
