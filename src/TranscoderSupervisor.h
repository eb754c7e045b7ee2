#pragma once

#include "ChildProcess.h"
#include "FrameChunker.h"
#include "RelayState.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

class Config;

/**
 * Transcoder launch and supervision parameters
 */
struct TranscoderSettings {
    std::string ffmpeg_path = "ffmpeg";
    uint16_t video_port = 11111;
    uint32_t udp_fifo_size = 50000000;
    std::string video_size = "640x480";
    uint32_t fps = 30;
    uint32_t bitrate_kbps = 1000;
    uint32_t maxrate_kbps = 1500;
    uint32_t bufsize_kbps = 4000;
    size_t packets_per_chunk = FrameChunker::DEFAULT_PACKETS_PER_CHUNK;

    // Second output: continuously overwritten still image
    bool snapshot_enabled = false;
    uint32_t snapshot_fps = 2;
    std::string snapshot_path;

    uint32_t restart_delay_ms = 1000;
    uint32_t max_restart_attempts = 0;  // 0 = unlimited
    bool debug_logging = false;

    static TranscoderSettings fromConfig(const Config& config, const std::string& snapshot_path);
};

enum class StderrLineKind {
    BENIGN,     // Known noise, dropped
    FAILURE,    // Logged and kept as last error
    INFO        // Anything else, logged at debug level
};

/**
 * TranscoderSupervisor - Owns the single live video transcoder
 *
 * Launches ffmpeg reading the drone's UDP video and writing MPEG-TS to
 * stdout, feeds that output through a FrameChunker, and restarts the process
 * after a fixed delay whenever it dies while streaming is desired.
 *
 * A terminated process is kept as "draining" until its exit is observed;
 * no new transcoder is launched before that, so two processes never compete
 * for the video port.
 */
class TranscoderSupervisor {
public:
    using ChunkCallback = std::function<void(const Frame& frame)>;
    using SessionEndedCallback = std::function<void(const std::string& reason)>;

    // Grace period between SIGTERM and SIGKILL for a stopped transcoder
    static constexpr uint32_t STOP_KILL_TIMEOUT_MS = 3000;

    // Throws std::invalid_argument for unusable settings
    TranscoderSupervisor(boost::asio::io_context& io, ProcessLauncher& launcher,
                         RelayState& state, const TranscoderSettings& settings);
    ~TranscoderSupervisor();

    TranscoderSupervisor(const TranscoderSupervisor&) = delete;
    TranscoderSupervisor& operator=(const TranscoderSupervisor&) = delete;

    // Mark streaming as desired and bring a transcoder up.
    // Returns false only when a launch attempted right now failed; the
    // restart path keeps retrying in that case.
    bool start(std::string& message);

    // Stop streaming. Idempotent.
    void stop();

    bool isRunning() const { return state_.isStreamActive(); }
    bool isDraining() const { return state_.stream().draining != nullptr; }
    bool isRestartPending() const { return restart_pending_; }

    void setChunkCallback(ChunkCallback callback) { chunk_callback_ = std::move(callback); }

    // Invoked when the restart cap is exhausted and the session is dropped
    void setSessionEndedCallback(SessionEndedCallback callback) { session_ended_callback_ = std::move(callback); }

    const FrameChunker& chunker() const { return chunker_; }
    uint32_t getConsecutiveFailures() const { return consecutive_failures_; }

    static StderrLineKind classifyStderrLine(const std::string& line);

    // Full argv (argv[0] = ffmpeg path). Throws std::invalid_argument.
    static std::vector<std::string> buildArguments(const TranscoderSettings& settings);

private:
    bool launch(std::string& error);
    void handleOutput(uint64_t generation, const uint8_t* data, size_t size);
    void handleStderrLine(uint64_t generation, const std::string& line);
    void handleExit(uint64_t generation, int exit_code, int signal);
    void handleLaunchFailure(const std::string& error);
    void scheduleRestart();
    void armKillTimer();
    void endSession(const std::string& reason);

    ProcessLauncher& launcher_;
    RelayState& state_;
    TranscoderSettings settings_;
    std::vector<std::string> arguments_;

    FrameChunker chunker_;
    ChunkCallback chunk_callback_;
    SessionEndedCallback session_ended_callback_;

    boost::asio::steady_timer restart_timer_;
    boost::asio::steady_timer kill_timer_;
    bool restart_pending_ = false;
    bool launch_after_drain_ = false;

    // Generation tags tell the owned process's events from a draining one's
    uint64_t generation_ = 0;
    uint64_t active_generation_ = 0;
    uint64_t draining_generation_ = 0;

    bool produced_output_ = false;
    uint32_t consecutive_failures_ = 0;
};
