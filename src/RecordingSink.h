#pragma once

#include "ChildProcess.h"
#include "FrameChunker.h"
#include "MediaStorage.h"
#include "RelayState.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class Config;

enum class RecordingError {
    NONE,
    ALREADY_ACTIVE,
    NOT_ACTIVE,
    STREAM_NOT_ACTIVE,
    LAUNCH_FAILED
};

const char* toString(RecordingError error);

struct RecordingResult {
    RecordingError error = RecordingError::NONE;
    std::string file_name;
    std::string message;

    bool ok() const { return error == RecordingError::NONE; }
};

struct RecordingSettings {
    std::string ffmpeg_path = "ffmpeg";
    uint32_t stop_timeout_ms = 5000;
    bool reencode = false;     // libx264 instead of stream copy
    bool save_ts = false;      // also keep the raw frames as <stem>.ts

    static RecordingSettings fromConfig(const Config& config);
};

/**
 * RecordingSink - Tees the live frame stream into an MP4 file
 *
 * A second ffmpeg reads MPEG-TS frames on stdin and remuxes them into
 * <recordings>/video_<ms>.mp4 with fast-start metadata. With save_ts the
 * same frames are appended to video_<ms>.ts as well. Write failures end
 * the session quietly; they never reach the broadcast path.
 */
class RecordingSink {
public:
    using StopCallback = std::function<void(const RecordingResult& result)>;

    RecordingSink(boost::asio::io_context& io, ProcessLauncher& launcher, RelayState& state,
                  const MediaStorage& storage, const RecordingSettings& settings);
    ~RecordingSink();

    RecordingSink(const RecordingSink&) = delete;
    RecordingSink& operator=(const RecordingSink&) = delete;

    RecordingResult startRecording();

    // Tee one frame into the active recording, if any
    void write(const Frame& frame);

    // Close the recorder's input and report once it exited, or after the
    // stop timeout once it has been killed. NOT_ACTIVE is reported at once.
    void stopRecording(StopCallback callback);

    // Stop without anyone waiting for the result
    void forceStop();

    bool isActive() const { return state_.isRecordingActive(); }
    bool isFinalizing() const { return state_.recording().finalizing != nullptr; }
    const std::string& getLastFileName() const { return last_file_name_; }
    const std::string& getLastTsPath() const { return last_ts_path_; }
    bool isSavingTs() const { return ts_file_ != nullptr; }

    uint64_t getFramesWritten() const { return frames_written_; }
    uint64_t getFramesFailed() const { return frames_failed_; }

    static std::vector<std::string> buildArguments(const RecordingSettings& settings,
                                                   const std::string& output_path);

private:
    void handleStderrLine(uint64_t generation, const std::string& line);
    void handleInputError(uint64_t generation, const std::string& error);
    void handleExit(uint64_t generation, int exit_code, int signal);

    // Drop the active session after a failure, keeping the process as finalizing
    void abandon(const std::string& reason);
    void completeStop(const std::string& message);
    void openTsCopy(const std::string& mp4_path);
    void closeTsCopy();

    ProcessLauncher& launcher_;
    RelayState& state_;
    const MediaStorage& storage_;
    RecordingSettings settings_;

    boost::asio::steady_timer stop_timer_;
    StopCallback stop_callback_;
    std::string stopping_file_name_;

    uint64_t generation_ = 0;
    uint64_t active_generation_ = 0;
    uint64_t finalizing_generation_ = 0;

    std::string last_file_name_;
    std::unique_ptr<std::ofstream> ts_file_;
    std::string last_ts_path_;
    uint64_t frames_written_ = 0;
    uint64_t frames_failed_ = 0;
};
