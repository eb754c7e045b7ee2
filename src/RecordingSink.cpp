#include "RecordingSink.h"
#include "Config.h"
#include "TranscoderSupervisor.h"
#include <filesystem>
#include <iostream>

const char* toString(RecordingError error) {
    switch (error) {
        case RecordingError::NONE:
            return "none";
        case RecordingError::ALREADY_ACTIVE:
            return "already_active";
        case RecordingError::NOT_ACTIVE:
            return "not_active";
        case RecordingError::STREAM_NOT_ACTIVE:
            return "stream_not_active";
        case RecordingError::LAUNCH_FAILED:
            return "launch_failed";
        default:
            return "unknown";
    }
}

RecordingSettings RecordingSettings::fromConfig(const Config& config) {
    RecordingSettings settings;
    settings.ffmpeg_path = config.getFfmpegPath();
    settings.stop_timeout_ms = config.getRecordingStopTimeoutMs();
    settings.reencode = config.isRecordingReencode();
    settings.save_ts = config.isRecordingSaveTs();
    return settings;
}

RecordingSink::RecordingSink(boost::asio::io_context& io, ProcessLauncher& launcher, RelayState& state,
                             const MediaStorage& storage, const RecordingSettings& settings)
    : launcher_(launcher),
      state_(state),
      storage_(storage),
      settings_(settings),
      stop_timer_(io) {
}

RecordingSink::~RecordingSink() {
    stop_timer_.cancel();
    closeTsCopy();
}

std::vector<std::string> RecordingSink::buildArguments(const RecordingSettings& settings,
                                                       const std::string& output_path) {
    std::vector<std::string> args = {
        settings.ffmpeg_path,
        "-hide_banner",
        "-loglevel", "error",
        "-f", "mpegts",
        "-i", "pipe:0"
    };

    if (settings.reencode) {
        // Tolerates malformed input at the cost of CPU
        std::vector<std::string> encode = {
            "-c:v", "libx264",
            "-preset", "ultrafast",
            "-pix_fmt", "yuv420p"
        };
        args.insert(args.end(), encode.begin(), encode.end());
    } else {
        args.push_back("-c:v");
        args.push_back("copy");
    }

    std::vector<std::string> output = {
        "-an",
        "-movflags", "+faststart",
        "-n",
        output_path
    };
    args.insert(args.end(), output.begin(), output.end());
    return args;
}

RecordingResult RecordingSink::startRecording() {
    RecordingResult result;
    RecordingSession& recording = state_.recording();

    if (!state_.isStreamActive()) {
        result.error = RecordingError::STREAM_NOT_ACTIVE;
        result.message = "Stream not active";
        return result;
    }
    if (recording.active) {
        result.error = RecordingError::ALREADY_ACTIVE;
        result.message = "Recording already in progress";
        return result;
    }
    if (recording.finalizing) {
        result.error = RecordingError::ALREADY_ACTIVE;
        result.message = "Previous recording still finalizing";
        return result;
    }

    std::string file_name;
    std::string path = storage_.allocateRecordingPath(nowEpochMs(), file_name);
    uint64_t generation = ++generation_;

    ProcessSpec spec;
    spec.name = "Recorder";
    spec.argv = buildArguments(settings_, path);
    spec.pipe_stdin = true;
    spec.pipe_stdout = false;

    ProcessEvents events;
    events.on_stderr_line = [this, generation](const std::string& line) {
        handleStderrLine(generation, line);
    };
    events.on_input_error = [this, generation](const std::string& error) {
        handleInputError(generation, error);
    };
    events.on_exit = [this, generation](int exit_code, int signal) {
        handleExit(generation, exit_code, signal);
    };

    std::string error;
    auto process = launcher_.launch(spec, std::move(events), error);
    if (!process) {
        std::cerr << "[RecordingSink] Failed to start recorder: " << error << std::endl;
        recording.last_error = error;
        result.error = RecordingError::LAUNCH_FAILED;
        result.message = "Failed to start recording: " + error;
        return result;
    }

    recording.active = true;
    recording.process = process;
    recording.file_path = path;
    recording.file_name = file_name;
    recording.last_error.clear();
    recording.started_at = std::chrono::system_clock::now();
    active_generation_ = generation;
    last_file_name_ = file_name;
    frames_written_ = 0;
    frames_failed_ = 0;

    std::cout << "[RecordingSink] Recording started: " << path << std::endl;

    if (settings_.save_ts) {
        openTsCopy(path);
    }

    result.file_name = file_name;
    result.message = "Recording started";
    return result;
}

void RecordingSink::write(const Frame& frame) {
    RecordingSession& recording = state_.recording();
    if (!recording.active || !recording.process) {
        return;
    }

    if (ts_file_) {
        ts_file_->write(reinterpret_cast<const char*>(frame->data()),
                        static_cast<std::streamsize>(frame->size()));
        if (!*ts_file_) {
            std::cerr << "[RecordingSink] Write to " << last_ts_path_ << " failed, dropping TS copy" << std::endl;
            closeTsCopy();
        }
    }

    if (!recording.process->writeInput(frame)) {
        frames_failed_++;
        abandon("recorder input closed");
        return;
    }
    frames_written_++;
}

void RecordingSink::openTsCopy(const std::string& mp4_path) {
    std::string ts_path = std::filesystem::path(mp4_path).replace_extension(".ts").string();

    std::error_code ec;
    if (std::filesystem::exists(ts_path, ec)) {
        std::cerr << "[RecordingSink] " << ts_path << " already exists, not saving TS copy" << std::endl;
        return;
    }

    auto file = std::make_unique<std::ofstream>(ts_path, std::ios::binary | std::ios::trunc);
    if (!file->is_open()) {
        std::cerr << "[RecordingSink] Cannot open " << ts_path << ", not saving TS copy" << std::endl;
        return;
    }

    ts_file_ = std::move(file);
    last_ts_path_ = ts_path;
    std::cout << "[RecordingSink] Saving TS copy: " << ts_path << std::endl;
}

void RecordingSink::closeTsCopy() {
    if (!ts_file_) {
        return;
    }
    ts_file_->close();
    ts_file_.reset();
}

void RecordingSink::stopRecording(StopCallback callback) {
    RecordingSession& recording = state_.recording();
    if (!recording.active) {
        if (callback) {
            RecordingResult result;
            result.error = RecordingError::NOT_ACTIVE;
            result.message = "No active recording";
            callback(result);
        }
        return;
    }

    std::cout << "[RecordingSink] Stopping recording " << recording.file_name
              << " (" << frames_written_ << " frames written)" << std::endl;

    stopping_file_name_ = recording.file_name;
    stop_callback_ = std::move(callback);
    abandon("");
}

void RecordingSink::forceStop() {
    if (state_.isRecordingActive()) {
        stopRecording(nullptr);
    }
}

void RecordingSink::abandon(const std::string& reason) {
    RecordingSession& recording = state_.recording();

    if (!reason.empty()) {
        std::cerr << "[RecordingSink] Recording " << recording.file_name << " ended: " << reason << std::endl;
        recording.last_error = reason;
    }

    // Closing stdin lets the remuxer write the trailing container metadata
    if (recording.process && recording.process->isRunning()) {
        recording.finalizing = recording.process;
        finalizing_generation_ = active_generation_;
        recording.finalizing->closeInput();

        uint64_t generation = finalizing_generation_;
        stop_timer_.expires_after(std::chrono::milliseconds(settings_.stop_timeout_ms));
        stop_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
            if (ec || generation != finalizing_generation_ || !state_.recording().finalizing) {
                return;
            }
            std::cerr << "[RecordingSink] Recorder did not exit within " << settings_.stop_timeout_ms
                      << " ms, killing" << std::endl;
            state_.recording().finalizing->kill();
            completeStop("Recording force-stopped after timeout");
        });
    }

    recording.active = false;
    recording.process.reset();
    recording.file_path.clear();
    recording.file_name.clear();
    active_generation_ = 0;
    closeTsCopy();

    if (!recording.finalizing) {
        completeStop("Recording stopped");
    }
}

void RecordingSink::completeStop(const std::string& message) {
    if (!stop_callback_) {
        return;
    }

    StopCallback callback = std::move(stop_callback_);
    stop_callback_ = nullptr;

    RecordingResult result;
    result.file_name = stopping_file_name_;
    result.message = message;
    try {
        callback(result);
    } catch (const std::exception& e) {
        std::cerr << "[RecordingSink] Stop callback error: " << e.what() << std::endl;
    }
}

void RecordingSink::handleStderrLine(uint64_t generation, const std::string& line) {
    if (TranscoderSupervisor::classifyStderrLine(line) == StderrLineKind::BENIGN) {
        return;
    }
    std::cerr << "[RecordingSink] ffmpeg: " << line << std::endl;
    if (generation == active_generation_ || generation == finalizing_generation_) {
        state_.recording().last_error = line;
    }
}

void RecordingSink::handleInputError(uint64_t generation, const std::string& error) {
    if (generation != active_generation_) {
        return;
    }
    frames_failed_++;
    abandon("write to recorder failed: " + error);
}

void RecordingSink::handleExit(uint64_t generation, int exit_code, int signal) {
    RecordingSession& recording = state_.recording();

    if (generation == finalizing_generation_) {
        finalizing_generation_ = 0;
        recording.finalizing.reset();
        stop_timer_.cancel();

        if (exit_code == 0) {
            std::cout << "[RecordingSink] Recording saved: " << stopping_file_name_ << std::endl;
            completeStop("Recording saved");
        } else {
            completeStop("Recorder exited abnormally");
        }
        return;
    }

    if (generation != active_generation_) {
        return;
    }

    // Recorder died while frames were still being teed into it
    std::string reason = signal != 0
        ? "recorder killed by signal " + std::to_string(signal)
        : "recorder exited with code " + std::to_string(exit_code);
    std::cerr << "[RecordingSink] " << reason << " during " << recording.file_name << std::endl;

    recording.last_error = reason;
    recording.active = false;
    recording.process.reset();
    recording.file_path.clear();
    recording.file_name.clear();
    active_generation_ = 0;
    closeTsCopy();
}
