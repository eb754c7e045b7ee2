#include "Config.h"
#include <yaml-cpp/yaml.h>
#include <iostream>
#include <fstream>
#include <limits>

// Helper to get environment variable as uint32_t with default value
uint32_t Config::getEnvUint32(const char* name, uint32_t default_value) {
    const char* env_value = std::getenv(name);
    if (env_value != nullptr && env_value[0] != '\0') {
        try {
            unsigned long val = std::stoul(env_value);
            return static_cast<uint32_t>(val);
        } catch (const std::exception& e) {
            std::cerr << "[Config] Warning: Invalid value for " << name
                      << " ('" << env_value << "'): " << e.what()
                      << " - using default " << default_value << std::endl;
        }
    }
    return default_value;
}

std::string Config::getEnvString(const char* name, const std::string& default_value) {
    const char* env_value = std::getenv(name);
    if (env_value != nullptr && env_value[0] != '\0') {
        return env_value;
    }
    return default_value;
}

// Ports are read as uint32 so out-of-range values are reported instead of wrapping
static bool toPort(const char* key, uint32_t value, uint16_t& port) {
    if (value > std::numeric_limits<uint16_t>::max()) {
        std::cerr << "[Config] Invalid port for " << key << ": " << value << std::endl;
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

bool Config::loadFromFile(const std::string& filename) {
    try {
        // Check if file exists
        std::ifstream infile(filename);
        if (!infile.good()) {
            std::cerr << "Configuration file not found: " << filename << std::endl;
            return false;
        }

        YAML::Node config = YAML::LoadFile(filename);

        // Network settings
        if (config["http_port"]) {
            if (!toPort("http_port", config["http_port"].as<uint32_t>(), http_port_)) return false;
        }
        if (config["ws_port"]) {
            if (!toPort("ws_port", config["ws_port"].as<uint32_t>(), ws_port_)) return false;
        }
        if (config["drone_ip"]) {
            drone_ip_ = config["drone_ip"].as<std::string>();
        }
        if (config["drone_command_port"]) {
            if (!toPort("drone_command_port", config["drone_command_port"].as<uint32_t>(),
                        drone_command_port_)) return false;
        }
        if (config["local_command_port"]) {
            if (!toPort("local_command_port", config["local_command_port"].as<uint32_t>(),
                        local_command_port_)) return false;
        }
        if (config["drone_video_port"]) {
            if (!toPort("drone_video_port", config["drone_video_port"].as<uint32_t>(),
                        drone_video_port_)) return false;
        }

        // Transcoder settings
        if (config["ffmpeg_path"]) {
            ffmpeg_path_ = config["ffmpeg_path"].as<std::string>();
        }
        if (config["udp_fifo_size"]) {
            udp_fifo_size_ = config["udp_fifo_size"].as<uint32_t>();
        }
        if (config["video_size"]) {
            video_size_ = config["video_size"].as<std::string>();
        }
        if (config["video_fps"]) {
            video_fps_ = config["video_fps"].as<uint32_t>();
        }
        if (config["video_bitrate_kbps"]) {
            video_bitrate_kbps_ = config["video_bitrate_kbps"].as<uint32_t>();
        }
        if (config["video_maxrate_kbps"]) {
            video_maxrate_kbps_ = config["video_maxrate_kbps"].as<uint32_t>();
        }
        if (config["video_bufsize_kbps"]) {
            video_bufsize_kbps_ = config["video_bufsize_kbps"].as<uint32_t>();
        }
        if (config["packets_per_chunk"]) {
            packets_per_chunk_ = config["packets_per_chunk"].as<uint32_t>();
        }
        if (config["restart_delay_ms"]) {
            restart_delay_ms_ = config["restart_delay_ms"].as<uint32_t>();
        }
        if (config["max_restart_attempts"]) {
            max_restart_attempts_ = config["max_restart_attempts"].as<uint32_t>();
        }
        if (config["snapshot_enabled"]) {
            snapshot_enabled_ = config["snapshot_enabled"].as<bool>();
        }
        if (config["snapshot_fps"]) {
            snapshot_fps_ = config["snapshot_fps"].as<uint32_t>();
        }

        // Media storage and recording
        if (config["media_root"]) {
            media_root_ = config["media_root"].as<std::string>();
        }
        if (config["recording_stop_timeout_ms"]) {
            recording_stop_timeout_ms_ = config["recording_stop_timeout_ms"].as<uint32_t>();
        }
        if (config["recording_reencode"]) {
            recording_reencode_ = config["recording_reencode"].as<bool>();
        }
        if (config["recording_save_ts"]) {
            recording_save_ts_ = config["recording_save_ts"].as<bool>();
        }

        // Telemetry polling
        if (config["battery_poll_ms"]) {
            battery_poll_ms_ = config["battery_poll_ms"].as<uint32_t>();
        }
        if (config["time_poll_ms"]) {
            time_poll_ms_ = config["time_poll_ms"].as<uint32_t>();
        }
        if (config["speed_poll_ms"]) {
            speed_poll_ms_ = config["speed_poll_ms"].as<uint32_t>();
        }
        if (config["poll_response_timeout_ms"]) {
            poll_response_timeout_ms_ = config["poll_response_timeout_ms"].as<uint32_t>();
        }
        if (config["command_ack_timeout_ms"]) {
            command_ack_timeout_ms_ = config["command_ack_timeout_ms"].as<uint32_t>();
        }

        // Viewers and lifecycle
        if (config["viewer_queue_limit"]) {
            viewer_queue_limit_ = config["viewer_queue_limit"].as<uint32_t>();
        }
        if (config["stop_stream_when_idle"]) {
            stop_stream_when_idle_ = config["stop_stream_when_idle"].as<bool>();
        }
        if (config["shutdown_command"]) {
            shutdown_command_ = config["shutdown_command"].as<std::string>();
        }
        if (config["log_level"]) {
            log_level_ = config["log_level"].as<std::string>();
        }

        // Environment variables override YAML values
        // Priority: env var > YAML > hardcoded default
        return applyEnvironment();

    } catch (const YAML::Exception& e) {
        std::cerr << "YAML parsing error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return false;
    }
}

bool Config::applyEnvironment() {
    if (!toPort("HTTP_PORT", getEnvUint32("HTTP_PORT", http_port_), http_port_)) return false;
    if (!toPort("WS_PORT", getEnvUint32("WS_PORT", ws_port_), ws_port_)) return false;
    if (!toPort("DRONE_COMMAND_PORT", getEnvUint32("DRONE_COMMAND_PORT", drone_command_port_),
                drone_command_port_)) return false;
    if (!toPort("LOCAL_COMMAND_PORT", getEnvUint32("LOCAL_COMMAND_PORT", local_command_port_),
                local_command_port_)) return false;
    if (!toPort("DRONE_VIDEO_PORT", getEnvUint32("DRONE_VIDEO_PORT", drone_video_port_),
                drone_video_port_)) return false;

    drone_ip_ = getEnvString("DRONE_IP", drone_ip_);
    ffmpeg_path_ = getEnvString("FFMPEG_PATH", ffmpeg_path_);
    media_root_ = getEnvString("MEDIA_ROOT", media_root_);
    log_level_ = getEnvString("LOG_LEVEL", log_level_);

    udp_fifo_size_ = getEnvUint32("UDP_FIFO_SIZE", udp_fifo_size_);
    packets_per_chunk_ = getEnvUint32("PACKETS_PER_CHUNK", packets_per_chunk_);
    restart_delay_ms_ = getEnvUint32("RESTART_DELAY_MS", restart_delay_ms_);
    max_restart_attempts_ = getEnvUint32("MAX_RESTART_ATTEMPTS", max_restart_attempts_);
    recording_stop_timeout_ms_ = getEnvUint32("RECORDING_STOP_TIMEOUT_MS", recording_stop_timeout_ms_);
    viewer_queue_limit_ = getEnvUint32("VIEWER_QUEUE_LIMIT", viewer_queue_limit_);
    return true;
}

void Config::print() const {
    std::cout << "=== Configuration ===" << std::endl;
    std::cout << "HTTP Port:         " << http_port_ << std::endl;
    std::cout << "WebSocket Port:    " << ws_port_ << std::endl;
    std::cout << "Log Level:         " << log_level_ << std::endl;
    std::cout << "--- Drone Settings ---" << std::endl;
    std::cout << "Drone Address:     " << drone_ip_ << ":" << drone_command_port_ << std::endl;
    std::cout << "Local Cmd Port:    " << local_command_port_
              << (local_command_port_ == 0 ? " (ephemeral)" : "") << std::endl;
    std::cout << "Video UDP Port:    " << drone_video_port_ << std::endl;
    std::cout << "--- Transcoder Settings ---" << std::endl;
    std::cout << "FFmpeg:                       " << ffmpeg_path_ << std::endl;
    std::cout << "UDP FIFO Size:                " << udp_fifo_size_ << " bytes" << std::endl;
    std::cout << "Output:                       " << video_size_ << " @ " << video_fps_ << " fps, "
              << video_bitrate_kbps_ << "k (max " << video_maxrate_kbps_ << "k, buf "
              << video_bufsize_kbps_ << "k)" << std::endl;
    std::cout << "Chunk Size:                   " << packets_per_chunk_ << " packets" << std::endl;
    std::cout << "Restart Delay:                " << restart_delay_ms_ << " ms" << std::endl;
    std::cout << "Max Restart Attempts:         "
              << (max_restart_attempts_ == 0 ? std::string("unlimited") : std::to_string(max_restart_attempts_))
              << std::endl;
    std::cout << "Snapshots:                    "
              << (snapshot_enabled_ ? std::to_string(snapshot_fps_) + " fps" : std::string("disabled"))
              << std::endl;
    std::cout << "--- Media Settings ---" << std::endl;
    std::cout << "Media Root:                   " << media_root_ << std::endl;
    std::cout << "Recording Stop Timeout:       " << recording_stop_timeout_ms_ << " ms" << std::endl;
    std::cout << "Recording Mode:               " << (recording_reencode_ ? "re-encode" : "remux") << std::endl;
    std::cout << "Raw TS Copy:                  " << (recording_save_ts_ ? "enabled" : "disabled") << std::endl;
    std::cout << "--- Telemetry Settings ---" << std::endl;
    std::cout << "Poll Intervals (bat/time/spd): " << battery_poll_ms_ << "/" << time_poll_ms_
              << "/" << speed_poll_ms_ << " ms" << std::endl;
    std::cout << "Poll Response Timeout:        " << poll_response_timeout_ms_ << " ms" << std::endl;
    std::cout << "Command Ack Timeout:          " << command_ack_timeout_ms_ << " ms" << std::endl;
    std::cout << "--- Viewer Settings ---" << std::endl;
    std::cout << "Viewer Queue Limit:           "
              << (viewer_queue_limit_ == 0 ? std::string("unbounded") : std::to_string(viewer_queue_limit_))
              << std::endl;
    std::cout << "Stop Stream When Idle:        " << (stop_stream_when_idle_ ? "yes" : "no") << std::endl;
    std::cout << "Shutdown Command:             "
              << (shutdown_command_.empty() ? std::string("(none)") : shutdown_command_) << std::endl;
    std::cout << "=====================" << std::endl;
}
