#include "TranscoderSupervisor.h"
#include "Config.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isVideoSize(const std::string& size) {
    size_t x = size.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= size.size()) {
        return false;
    }
    for (size_t i = 0; i < size.size(); i++) {
        if (i != x && !std::isdigit(static_cast<unsigned char>(size[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

TranscoderSettings TranscoderSettings::fromConfig(const Config& config, const std::string& snapshot_path) {
    TranscoderSettings settings;
    settings.ffmpeg_path = config.getFfmpegPath();
    settings.video_port = config.getDroneVideoPort();
    settings.udp_fifo_size = config.getUdpFifoSize();
    settings.video_size = config.getVideoSize();
    settings.fps = config.getVideoFps();
    settings.bitrate_kbps = config.getVideoBitrateKbps();
    settings.maxrate_kbps = config.getVideoMaxrateKbps();
    settings.bufsize_kbps = config.getVideoBufsizeKbps();
    settings.packets_per_chunk = config.getPacketsPerChunk();
    settings.snapshot_enabled = config.isSnapshotEnabled();
    settings.snapshot_fps = config.getSnapshotFps();
    settings.snapshot_path = snapshot_path;
    settings.restart_delay_ms = config.getRestartDelayMs();
    settings.max_restart_attempts = config.getMaxRestartAttempts();
    settings.debug_logging = config.isDebugLogging();
    return settings;
}

TranscoderSupervisor::TranscoderSupervisor(boost::asio::io_context& io, ProcessLauncher& launcher,
                                           RelayState& state, const TranscoderSettings& settings)
    : launcher_(launcher),
      state_(state),
      settings_(settings),
      arguments_(buildArguments(settings)),
      chunker_(settings.packets_per_chunk),
      restart_timer_(io),
      kill_timer_(io) {
    chunker_.setFrameCallback([this](const Frame& frame) {
        if (chunk_callback_) {
            chunk_callback_(frame);
        }
    });
}

TranscoderSupervisor::~TranscoderSupervisor() {
    restart_timer_.cancel();
    kill_timer_.cancel();
}

std::vector<std::string> TranscoderSupervisor::buildArguments(const TranscoderSettings& settings) {
    if (settings.ffmpeg_path.empty()) {
        throw std::invalid_argument("transcoder path is empty");
    }
    if (settings.video_port == 0) {
        throw std::invalid_argument("video port must be non-zero");
    }
    if (settings.fps == 0 || settings.bitrate_kbps == 0) {
        throw std::invalid_argument("frame rate and bitrate must be positive");
    }
    if (settings.maxrate_kbps < settings.bitrate_kbps) {
        throw std::invalid_argument("maxrate must not be below bitrate");
    }
    if (!isVideoSize(settings.video_size)) {
        throw std::invalid_argument("invalid video size '" + settings.video_size + "' (expected WxH)");
    }
    if (settings.snapshot_enabled && (settings.snapshot_path.empty() || settings.snapshot_fps == 0)) {
        throw std::invalid_argument("snapshot output needs a path and a positive rate");
    }

    std::ostringstream input;
    input << "udp://0.0.0.0:" << settings.video_port
          << "?overrun_nonfatal=1&fifo_size=" << settings.udp_fifo_size;

    std::vector<std::string> args = {
        settings.ffmpeg_path,
        "-hide_banner",
        "-loglevel", "error",
        "-i", input.str(),
        // Live feed: MPEG-1 video in MPEG-TS, decodable by the browser player
        "-map", "0:v",
        "-c:v", "mpeg1video",
        "-b:v", std::to_string(settings.bitrate_kbps) + "k",
        "-maxrate", std::to_string(settings.maxrate_kbps) + "k",
        "-bufsize", std::to_string(settings.bufsize_kbps) + "k",
        "-an",
        "-f", "mpegts",
        "-s", settings.video_size,
        "-r", std::to_string(settings.fps),
        "-q:v", "5",
        "-tune", "zerolatency",
        "-preset", "ultrafast",
        "-pix_fmt", "yuv420p",
        "-flush_packets", "1",
        "pipe:1"
    };

    if (settings.snapshot_enabled) {
        std::vector<std::string> snapshot = {
            "-map", "0:v",
            "-vf", "fps=" + std::to_string(settings.snapshot_fps),
            "-q:v", "2",
            "-update", "1",
            "-y",
            settings.snapshot_path
        };
        args.insert(args.end(), snapshot.begin(), snapshot.end());
    }
    return args;
}

StderrLineKind TranscoderSupervisor::classifyStderrLine(const std::string& line) {
    static const char* const BENIGN[] = {
        "last message repeated",
        "non-monotonous dts",
        "non-monotonic dts",
        "max_analyze_duration",
        "pes packet size mismatch"
    };
    static const char* const FAILURE[] = {
        "error",
        "failed",
        "invalid",
        "could not",
        "cannot",
        "refused",
        "timed out",
        "timeout",
        "no such",
        "broken pipe"
    };

    std::string lower = toLower(line);
    for (const char* pattern : BENIGN) {
        if (lower.find(pattern) != std::string::npos) {
            return StderrLineKind::BENIGN;
        }
    }
    for (const char* pattern : FAILURE) {
        if (lower.find(pattern) != std::string::npos) {
            return StderrLineKind::FAILURE;
        }
    }
    return StderrLineKind::INFO;
}

bool TranscoderSupervisor::start(std::string& message) {
    StreamSession& stream = state_.stream();
    stream.desired_active = true;
    consecutive_failures_ = 0;

    if (stream.process) {
        // Supersede the running transcoder once its exit is observed
        std::cout << "[TranscoderSupervisor] Restarting transcoder (PID: " << stream.process->pid() << ")" << std::endl;
        stream.draining = stream.process;
        draining_generation_ = active_generation_;
        stream.process.reset();
        active_generation_ = 0;
        stream.status = SessionStatus::STARTING;
        chunker_.reset();
        launch_after_drain_ = true;
        stream.draining->terminate();
        armKillTimer();
        message = "Transcoder restarting";
        return true;
    }

    if (stream.draining) {
        std::cout << "[TranscoderSupervisor] Previous transcoder still exiting, launch deferred" << std::endl;
        stream.status = SessionStatus::STARTING;
        launch_after_drain_ = true;
        message = "Transcoder starting";
        return true;
    }

    if (restart_pending_) {
        restart_timer_.cancel();
        restart_pending_ = false;
    }

    std::string error;
    if (!launch(error)) {
        message = "Failed to start transcoder: " + error;
        return false;
    }
    message = "Transcoder started";
    return true;
}

void TranscoderSupervisor::stop() {
    StreamSession& stream = state_.stream();
    bool was_active = stream.desired_active || stream.process;

    stream.desired_active = false;
    launch_after_drain_ = false;
    if (restart_pending_) {
        restart_timer_.cancel();
        restart_pending_ = false;
    }

    if (stream.process) {
        stream.draining = stream.process;
        draining_generation_ = active_generation_;
        stream.process.reset();
        active_generation_ = 0;
        stream.draining->terminate();
        armKillTimer();
    }

    chunker_.reset();
    stream.status = SessionStatus::IDLE;

    if (was_active) {
        std::cout << "[TranscoderSupervisor] Stream stopped (" << chunker_.getFramesEmitted()
                  << " frames emitted in total)" << std::endl;
    }
}

bool TranscoderSupervisor::launch(std::string& error) {
    StreamSession& stream = state_.stream();
    uint64_t generation = ++generation_;

    ProcessSpec spec;
    spec.name = "Transcoder";
    spec.argv = arguments_;
    spec.pipe_stdin = false;
    spec.pipe_stdout = true;

    ProcessEvents events;
    events.on_stdout = [this, generation](const uint8_t* data, size_t size) {
        handleOutput(generation, data, size);
    };
    events.on_stderr_line = [this, generation](const std::string& line) {
        handleStderrLine(generation, line);
    };
    events.on_exit = [this, generation](int exit_code, int signal) {
        handleExit(generation, exit_code, signal);
    };

    std::cout << "[TranscoderSupervisor] Launching transcoder: listening on UDP port "
              << settings_.video_port << std::endl;

    auto process = launcher_.launch(spec, std::move(events), error);
    if (!process) {
        std::cerr << "[TranscoderSupervisor] Launch failed: " << error << std::endl;
        handleLaunchFailure(error);
        return false;
    }

    stream.process = process;
    stream.status = SessionStatus::ACTIVE;
    stream.started_at = std::chrono::system_clock::now();
    stream.launches++;
    active_generation_ = generation;
    produced_output_ = false;
    chunker_.reset();
    return true;
}

void TranscoderSupervisor::handleLaunchFailure(const std::string& error) {
    StreamSession& stream = state_.stream();
    stream.last_error = error;
    consecutive_failures_++;

    if (!stream.desired_active) {
        stream.status = SessionStatus::IDLE;
        return;
    }
    stream.status = SessionStatus::STARTING;

    if (settings_.max_restart_attempts > 0 && consecutive_failures_ > settings_.max_restart_attempts) {
        endSession("transcoder failed " + std::to_string(consecutive_failures_) + " consecutive times");
        return;
    }
    scheduleRestart();
}

void TranscoderSupervisor::handleOutput(uint64_t generation, const uint8_t* data, size_t size) {
    if (generation != active_generation_) {
        return;
    }
    if (!produced_output_) {
        produced_output_ = true;
        consecutive_failures_ = 0;
        std::cout << "[TranscoderSupervisor] Receiving video from transcoder" << std::endl;
    }
    chunker_.push(data, size);
}

void TranscoderSupervisor::handleStderrLine(uint64_t generation, const std::string& line) {
    switch (classifyStderrLine(line)) {
        case StderrLineKind::BENIGN:
            return;
        case StderrLineKind::FAILURE:
            std::cerr << "[TranscoderSupervisor] ffmpeg: " << line << std::endl;
            if (generation == active_generation_) {
                state_.stream().last_error = line;
            }
            return;
        case StderrLineKind::INFO:
            if (settings_.debug_logging) {
                std::cout << "[TranscoderSupervisor] ffmpeg: " << line << std::endl;
            }
            return;
    }
}

void TranscoderSupervisor::handleExit(uint64_t generation, int exit_code, int signal) {
    StreamSession& stream = state_.stream();

    if (generation == draining_generation_) {
        draining_generation_ = 0;
        stream.draining.reset();
        kill_timer_.cancel();

        if (launch_after_drain_ && stream.desired_active) {
            launch_after_drain_ = false;
            std::string error;
            launch(error);
        }
        return;
    }

    if (generation != active_generation_) {
        return;
    }

    // The owned transcoder died on its own
    stream.process.reset();
    active_generation_ = 0;
    chunker_.reset();
    consecutive_failures_++;

    std::ostringstream reason;
    if (signal != 0) {
        reason << "transcoder killed by signal " << signal;
    } else {
        reason << "transcoder exited with code " << exit_code;
    }
    if (exit_code != 0 || signal != 0 || stream.last_error.empty()) {
        stream.last_error = reason.str();
    }

    if (!stream.desired_active) {
        stream.status = SessionStatus::IDLE;
        return;
    }

    stream.status = SessionStatus::STARTING;
    std::cerr << "[TranscoderSupervisor] " << reason.str() << " while streaming" << std::endl;

    if (settings_.max_restart_attempts > 0 && consecutive_failures_ > settings_.max_restart_attempts) {
        endSession("transcoder failed " + std::to_string(consecutive_failures_) + " consecutive times");
        return;
    }
    scheduleRestart();
}

void TranscoderSupervisor::scheduleRestart() {
    std::cout << "[TranscoderSupervisor] Restarting in " << settings_.restart_delay_ms << " ms" << std::endl;

    restart_pending_ = true;
    restart_timer_.expires_after(std::chrono::milliseconds(settings_.restart_delay_ms));
    restart_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        restart_pending_ = false;

        StreamSession& stream = state_.stream();
        if (!stream.desired_active || stream.process) {
            return;
        }
        if (stream.draining) {
            launch_after_drain_ = true;
            return;
        }

        stream.restarts++;
        std::string error;
        launch(error);
    });
}

void TranscoderSupervisor::armKillTimer() {
    uint64_t generation = draining_generation_;
    kill_timer_.expires_after(std::chrono::milliseconds(STOP_KILL_TIMEOUT_MS));
    kill_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != draining_generation_ || !state_.stream().draining) {
            return;
        }
        std::cerr << "[TranscoderSupervisor] Transcoder did not exit after SIGTERM, killing" << std::endl;
        state_.stream().draining->kill();
    });
}

void TranscoderSupervisor::endSession(const std::string& reason) {
    StreamSession& stream = state_.stream();
    stream.desired_active = false;
    stream.status = SessionStatus::IDLE;
    stream.last_error = reason;

    std::cerr << "[TranscoderSupervisor] Giving up: " << reason << std::endl;

    if (session_ended_callback_) {
        try {
            session_ended_callback_(reason);
        } catch (const std::exception& e) {
            std::cerr << "[TranscoderSupervisor] Session ended callback error: " << e.what() << std::endl;
        }
    }
}
