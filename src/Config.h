#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>

class Config {
public:
    // Load configuration from YAML file
    // Environment variables override YAML values if set
    bool loadFromFile(const std::string& filename);

    // Apply environment variable overrides on top of the current values
    bool applyEnvironment();

    // Network endpoints
    uint16_t getHttpPort() const { return http_port_; }
    uint16_t getWsPort() const { return ws_port_; }
    std::string getDroneIp() const { return drone_ip_; }
    uint16_t getDroneCommandPort() const { return drone_command_port_; }
    uint16_t getLocalCommandPort() const { return local_command_port_; }
    uint16_t getDroneVideoPort() const { return drone_video_port_; }

    // Transcoder settings
    std::string getFfmpegPath() const { return ffmpeg_path_; }
    uint32_t getUdpFifoSize() const { return udp_fifo_size_; }
    std::string getVideoSize() const { return video_size_; }
    uint32_t getVideoFps() const { return video_fps_; }
    uint32_t getVideoBitrateKbps() const { return video_bitrate_kbps_; }
    uint32_t getVideoMaxrateKbps() const { return video_maxrate_kbps_; }
    uint32_t getVideoBufsizeKbps() const { return video_bufsize_kbps_; }
    uint32_t getPacketsPerChunk() const { return packets_per_chunk_; }
    uint32_t getRestartDelayMs() const { return restart_delay_ms_; }
    uint32_t getMaxRestartAttempts() const { return max_restart_attempts_; }
    bool isSnapshotEnabled() const { return snapshot_enabled_; }
    uint32_t getSnapshotFps() const { return snapshot_fps_; }

    // Media storage and recording
    std::string getMediaRoot() const { return media_root_; }
    uint32_t getRecordingStopTimeoutMs() const { return recording_stop_timeout_ms_; }
    bool isRecordingReencode() const { return recording_reencode_; }
    bool isRecordingSaveTs() const { return recording_save_ts_; }

    // Telemetry polling
    uint32_t getBatteryPollMs() const { return battery_poll_ms_; }
    uint32_t getTimePollMs() const { return time_poll_ms_; }
    uint32_t getSpeedPollMs() const { return speed_poll_ms_; }
    uint32_t getPollResponseTimeoutMs() const { return poll_response_timeout_ms_; }
    uint32_t getCommandAckTimeoutMs() const { return command_ack_timeout_ms_; }

    // Viewers and lifecycle
    uint32_t getViewerQueueLimit() const { return viewer_queue_limit_; }
    bool isStopStreamWhenIdle() const { return stop_stream_when_idle_; }
    std::string getShutdownCommand() const { return shutdown_command_; }
    std::string getLogLevel() const { return log_level_; }
    bool isDebugLogging() const { return log_level_ == "DEBUG"; }

    // Setters used by tests and embedding code
    void setHttpPort(uint16_t port) { http_port_ = port; }
    void setWsPort(uint16_t port) { ws_port_ = port; }
    void setDroneIp(const std::string& ip) { drone_ip_ = ip; }
    void setDroneCommandPort(uint16_t port) { drone_command_port_ = port; }
    void setMediaRoot(const std::string& root) { media_root_ = root; }
    void setRestartDelayMs(uint32_t ms) { restart_delay_ms_ = ms; }
    void setMaxRestartAttempts(uint32_t attempts) { max_restart_attempts_ = attempts; }
    void setRecordingStopTimeoutMs(uint32_t ms) { recording_stop_timeout_ms_ = ms; }
    void setCommandAckTimeoutMs(uint32_t ms) { command_ack_timeout_ms_ = ms; }
    void setStopStreamWhenIdle(bool enabled) { stop_stream_when_idle_ = enabled; }
    void setShutdownCommand(const std::string& command) { shutdown_command_ = command; }

    // Print configuration
    void print() const;

private:
    // Helpers to get environment variables with default values
    static uint32_t getEnvUint32(const char* name, uint32_t default_value);
    static std::string getEnvString(const char* name, const std::string& default_value);

    // Network settings
    uint16_t http_port_ = 3000;
    uint16_t ws_port_ = 3001;
    std::string drone_ip_ = "192.168.10.1";
    uint16_t drone_command_port_ = 8889;
    uint16_t local_command_port_ = 0;       // 0 = ephemeral
    uint16_t drone_video_port_ = 11111;

    // Transcoder settings
    std::string ffmpeg_path_ = "ffmpeg";
    uint32_t udp_fifo_size_ = 50000000;     // UDP_FIFO_SIZE: absorbs network jitter
    std::string video_size_ = "640x480";
    uint32_t video_fps_ = 30;
    uint32_t video_bitrate_kbps_ = 1000;
    uint32_t video_maxrate_kbps_ = 1500;
    uint32_t video_bufsize_kbps_ = 4000;
    uint32_t packets_per_chunk_ = 21;       // 21 * 188 = 3948 bytes per WebSocket message
    uint32_t restart_delay_ms_ = 1000;
    uint32_t max_restart_attempts_ = 0;     // 0 = unlimited
    bool snapshot_enabled_ = true;
    uint32_t snapshot_fps_ = 2;

    // Media storage and recording
    std::string media_root_ = "uploads";
    uint32_t recording_stop_timeout_ms_ = 5000;
    bool recording_reencode_ = false;
    bool recording_save_ts_ = false;

    // Telemetry polling (matches the drone's keep-alive window)
    uint32_t battery_poll_ms_ = 10000;
    uint32_t time_poll_ms_ = 5000;
    uint32_t speed_poll_ms_ = 2000;
    uint32_t poll_response_timeout_ms_ = 1000;
    uint32_t command_ack_timeout_ms_ = 1000;

    // Viewers and lifecycle
    uint32_t viewer_queue_limit_ = 0;       // 0 = unbounded
    bool stop_stream_when_idle_ = true;
    std::string shutdown_command_ = "emergency";
    std::string log_level_ = "INFO";
};
