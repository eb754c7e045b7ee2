#pragma once

#include "ChildProcess.h"
#include "CommandRelay.h"
#include "Config.h"
#include "HttpServer.h"
#include "MediaStorage.h"
#include "RecordingSink.h"
#include "RelayState.h"
#include "TranscoderSupervisor.h"
#include "ViewerRegistry.h"
#include "WebSocketServer.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <string>

/**
 * DroneRelay - Wires the relay together on one event loop
 *
 * transcoder stdout -> FrameChunker -> ViewerRegistry (broadcast)
 *                                   -> RecordingSink (tee)
 * HTTP routes -> CommandRelay -> drone; drone telemetry -> viewers + SSE
 */
class DroneRelay {
public:
    // Throws std::invalid_argument for unusable transcoder settings
    DroneRelay(boost::asio::io_context& io, const Config& config, ProcessLauncher& launcher);
    ~DroneRelay();

    DroneRelay(const DroneRelay&) = delete;
    DroneRelay& operator=(const DroneRelay&) = delete;

    // Create media directories (throws std::runtime_error), open sockets
    bool initialize();

    // Run the event loop until shutdown completes
    void run();

    // Graceful shutdown; completes asynchronously
    void stop();

    bool isRunning() const { return running_; }
    bool isShuttingDown() const { return shutting_down_; }

    // Stream control (streamon / streamoff side effects)
    bool startStream(std::string& message);
    void stopStream();

    // Route handlers
    void handleCommand(const std::string& command, HttpServer::Responder respond);
    HttpResponse startRecording();
    void stopRecording(HttpServer::Responder respond);
    HttpResponse capturePhoto();
    HttpResponse health() const;

    RelayState& state() { return state_; }
    ViewerRegistry& viewers() { return registry_; }
    TranscoderSupervisor& supervisor() { return *supervisor_; }
    RecordingSink& recorder() { return *recorder_; }
    CommandRelay& commands() { return *command_relay_; }
    HttpServer& httpServer() { return *http_server_; }
    WebSocketServer& webSocketServer() { return *ws_server_; }

private:
    void onFrame(const Frame& frame);
    void onLastViewerLeft();
    void continueShutdown();
    void finishShutdown(std::chrono::steady_clock::time_point deadline);
    void printStatistics() const;

    boost::asio::io_context& io_;
    const Config& config_;

    RelayState state_;
    MediaStorage storage_;
    ViewerRegistry registry_;

    std::unique_ptr<TranscoderSupervisor> supervisor_;
    std::unique_ptr<RecordingSink> recorder_;
    std::unique_ptr<CommandRelay> command_relay_;
    std::unique_ptr<HttpServer> http_server_;
    std::unique_ptr<WebSocketServer> ws_server_;

    boost::asio::steady_timer shutdown_timer_;
    bool running_ = false;
    bool shutting_down_ = false;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point shutdown_start_;
};
