#include "DroneRelay.h"
#include <boost/asio/post.hpp>
#include <iostream>
#include <sstream>

DroneRelay::DroneRelay(boost::asio::io_context& io, const Config& config, ProcessLauncher& launcher)
    : io_(io),
      config_(config),
      storage_(config.getMediaRoot()),
      registry_(state_),
      shutdown_timer_(io) {
    supervisor_ = std::make_unique<TranscoderSupervisor>(
        io, launcher, state_, TranscoderSettings::fromConfig(config, storage_.currentSnapshotPath()));
    recorder_ = std::make_unique<RecordingSink>(
        io, launcher, state_, storage_, RecordingSettings::fromConfig(config));
    command_relay_ = std::make_unique<CommandRelay>(
        io, state_, registry_, CommandRelaySettings::fromConfig(config));
    http_server_ = std::make_unique<HttpServer>(io, config.getHttpPort());
    ws_server_ = std::make_unique<WebSocketServer>(io, registry_, config.getWsPort(),
                                                   config.getViewerQueueLimit());

    supervisor_->setChunkCallback([this](const Frame& frame) { onFrame(frame); });
    supervisor_->setSessionEndedCallback([this](const std::string& /*reason*/) {
        // Recording cannot outlive its source
        recorder_->forceStop();
    });

    registry_.setEmptyCallback([this]() { onLastViewerLeft(); });

    command_relay_->setStreamHandlers(
        [this](std::string& message) { return startStream(message); },
        [this](std::string& message) {
            stopStream();
            message = "Stream stopped";
            return true;
        });
    command_relay_->setTelemetryCallback([this](const std::string& json) {
        http_server_->publishDroneState(json);
    });

    http_server_->setCommandCallback([this](const std::string& command, HttpServer::Responder respond) {
        handleCommand(command, std::move(respond));
    });
    http_server_->setStartRecordingCallback([this]() { return startRecording(); });
    http_server_->setStopRecordingCallback([this](HttpServer::Responder respond) {
        stopRecording(std::move(respond));
    });
    http_server_->setCapturePhotoCallback([this]() { return capturePhoto(); });
    http_server_->setHealthCallback([this]() { return health(); });
    http_server_->setDroneStateCallback([this]() { return command_relay_->droneStateMessage(); });
}

DroneRelay::~DroneRelay() {
    shutdown_timer_.cancel();
}

bool DroneRelay::initialize() {
    start_time_ = std::chrono::steady_clock::now();
    state_.resetTelemetry();

    // Fatal when it fails: nothing works without writable storage
    storage_.initialize();

    std::string error;
    if (!command_relay_->open(error)) {
        std::cerr << "[DroneRelay] Failed to open command channel: " << error << std::endl;
        return false;
    }
    if (!http_server_->start()) {
        std::cerr << "[DroneRelay] Failed to start HTTP server" << std::endl;
        return false;
    }
    if (!ws_server_->start()) {
        std::cerr << "[DroneRelay] Failed to start WebSocket server" << std::endl;
        return false;
    }

    running_ = true;
    std::cout << "[DroneRelay] Ready: HTTP on port " << http_server_->port()
              << ", viewers on port " << ws_server_->port() << std::endl;
    return true;
}

void DroneRelay::run() {
    io_.run();
}

void DroneRelay::onFrame(const Frame& frame) {
    registry_.broadcast(frame);
    recorder_->write(frame);
}

void DroneRelay::onLastViewerLeft() {
    if (shutting_down_ || !config_.isStopStreamWhenIdle()) {
        return;
    }

    // Deferred: this runs from inside a viewer removal
    boost::asio::post(io_, [this]() {
        if (shutting_down_ || !state_.viewers().empty() || !state_.stream().desired_active) {
            return;
        }
        std::cout << "[DroneRelay] Last viewer left, stopping stream" << std::endl;
        command_relay_->send("streamoff", nullptr);
        stopStream();
    });
}

bool DroneRelay::startStream(std::string& message) {
    const StreamSession& stream = state_.stream();
    if (stream.desired_active && (stream.process || stream.draining || supervisor_->isRestartPending())) {
        message = "Stream already active";
        return true;
    }
    return supervisor_->start(message);
}

void DroneRelay::stopStream() {
    recorder_->forceStop();
    supervisor_->stop();
}

void DroneRelay::handleCommand(const std::string& command, HttpServer::Responder respond) {
    if (!CommandRelay::isValidCommand(command)) {
        respond(HttpResponse::error(400, "Invalid command"));
        return;
    }
    if (shutting_down_) {
        respond(HttpResponse::error(503, "Shutting down"));
        return;
    }

    command_relay_->dispatch(command, [respond](bool ok, const std::string& message) {
        HttpResponse response;
        response.status = ok ? 200 : 500;
        response.content_type = "text/plain";
        response.body = message;
        respond(response);
    });
}

HttpResponse DroneRelay::startRecording() {
    RecordingResult result = recorder_->startRecording();
    switch (result.error) {
        case RecordingError::NONE:
            return HttpResponse::json(200, "fileName", result.file_name);
        case RecordingError::ALREADY_ACTIVE:
        case RecordingError::STREAM_NOT_ACTIVE:
            return HttpResponse::error(409, result.message);
        default:
            return HttpResponse::error(500, result.message);
    }
}

void DroneRelay::stopRecording(HttpServer::Responder respond) {
    recorder_->stopRecording([respond](const RecordingResult& result) {
        if (result.error == RecordingError::NOT_ACTIVE) {
            respond(HttpResponse::error(400, result.message));
            return;
        }
        HttpResponse response;
        response.body = "{\"fileName\": \"" + HttpServer::jsonEscape(result.file_name) +
                        "\", \"message\": \"" + HttpServer::jsonEscape(result.message) + "\"}";
        respond(response);
    });
}

HttpResponse DroneRelay::capturePhoto() {
    if (!state_.isStreamActive()) {
        return HttpResponse::error(409, "Stream not active");
    }

    int64_t timestamp = nowEpochMs();
    std::string file_name;
    std::string error;
    if (!storage_.capturePhoto(timestamp, file_name, error)) {
        return HttpResponse::error(500, error);
    }

    HttpResponse response;
    response.body = "{\"fileName\": \"" + HttpServer::jsonEscape(file_name) +
                    "\", \"timestamp\": " + std::to_string(timestamp) + "}";
    return response;
}

HttpResponse DroneRelay::health() const {
    const StreamSession& stream = state_.stream();
    const RecordingSession& recording = state_.recording();
    bool degraded = stream.desired_active && !state_.isStreamActive();

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count();

    std::ostringstream json;
    json << "{\"status\": \"" << (degraded ? "degraded" : "ok") << "\""
         << ", \"uptimeSeconds\": " << uptime
         << ", \"stream\": {"
         << "\"status\": \"" << toString(stream.status) << "\""
         << ", \"desired\": " << (stream.desired_active ? "true" : "false")
         << ", \"pid\": " << (stream.process ? std::to_string(stream.process->pid()) : std::string("null"))
         << ", \"launches\": " << stream.launches
         << ", \"restarts\": " << stream.restarts
         << ", \"framesEmitted\": " << supervisor_->chunker().getFramesEmitted()
         << ", \"lastError\": \"" << HttpServer::jsonEscape(stream.last_error) << "\""
         << "}"
         << ", \"recording\": {"
         << "\"active\": " << (recording.active ? "true" : "false")
         << ", \"fileName\": \"" << HttpServer::jsonEscape(recording.file_name) << "\""
         << ", \"framesWritten\": " << recorder_->getFramesWritten()
         << ", \"lastError\": \"" << HttpServer::jsonEscape(recording.last_error) << "\""
         << "}"
         << ", \"viewers\": " << state_.viewers().size()
         << ", \"subscribers\": " << http_server_->subscriberCount()
         << ", \"droneConnected\": " << (state_.isDroneConnected() ? "true" : "false")
         << ", \"lastCommand\": \"" << HttpServer::jsonEscape(state_.getLastCommand()) << "\""
         << ", \"telemetry\": " << state_.telemetry().toJson()
         << "}";

    HttpResponse response;
    response.status = degraded ? 503 : 200;
    response.body = json.str();
    return response;
}

void DroneRelay::stop() {
    if (shutting_down_) {
        return;
    }
    shutting_down_ = true;
    shutdown_start_ = std::chrono::steady_clock::now();

    std::cout << "[DroneRelay] ========================================" << std::endl;
    std::cout << "[DroneRelay] Beginning graceful shutdown..." << std::endl;
    std::cout << "[DroneRelay] ========================================" << std::endl;

    command_relay_->stopPolling();
    ws_server_->stop();
    http_server_->stop();
    registry_.closeAll();

    if (recorder_->isActive()) {
        std::cout << "[DroneRelay] Finalizing active recording..." << std::endl;
        recorder_->stopRecording([this](const RecordingResult& result) {
            std::cout << "[DroneRelay] Recording " << result.file_name << ": " << result.message << std::endl;
            continueShutdown();
        });
        return;
    }
    continueShutdown();
}

void DroneRelay::continueShutdown() {
    supervisor_->stop();

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(TranscoderSupervisor::STOP_KILL_TIMEOUT_MS + 500);

    std::string command = config_.getShutdownCommand();
    if (command.empty() || !command_relay_->isOpen()) {
        finishShutdown(deadline);
        return;
    }

    std::cout << "[DroneRelay] Sending '" << command << "' to drone" << std::endl;
    command_relay_->send(command, [this, deadline](bool ok, const std::string& error) {
        if (!ok) {
            std::cerr << "[DroneRelay] Shutdown command failed: " << error << std::endl;
        }
        finishShutdown(deadline);
    });
}

void DroneRelay::finishShutdown(std::chrono::steady_clock::time_point deadline) {
    // Give the transcoder its SIGTERM grace period before leaving the loop
    if ((supervisor_->isDraining() || recorder_->isFinalizing()) &&
        std::chrono::steady_clock::now() < deadline) {
        shutdown_timer_.expires_after(std::chrono::milliseconds(50));
        shutdown_timer_.async_wait([this, deadline](const boost::system::error_code& ec) {
            if (!ec) {
                finishShutdown(deadline);
            }
        });
        return;
    }

    command_relay_->close();
    running_ = false;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - shutdown_start_);
    printStatistics();
    std::cout << "[DroneRelay] Shutdown completed in " << elapsed.count() << " ms" << std::endl;

    io_.stop();
}

void DroneRelay::printStatistics() const {
    auto runtime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);
    const FrameChunker& chunker = supervisor_->chunker();

    std::cout << "[DroneRelay] Statistics:" << std::endl;
    std::cout << "  Runtime: " << runtime.count() << "s" << std::endl;
    std::cout << "  Transcoder launches: " << state_.stream().launches
              << " (restarts: " << state_.stream().restarts << ")" << std::endl;
    std::cout << "  Bytes from transcoder: " << chunker.getBytesReceived() << std::endl;
    std::cout << "  Frames emitted: " << chunker.getFramesEmitted()
              << " (misaligned: " << chunker.getMisalignedFrames() << ")" << std::endl;
    std::cout << "  Frames broadcast: " << registry_.getFramesBroadcast()
              << " (send failures: " << registry_.getSendFailures() << ")" << std::endl;
    std::cout << "  Commands sent: " << command_relay_->getCommandsSent()
              << ", responses: " << command_relay_->getResponsesReceived() << std::endl;
}
