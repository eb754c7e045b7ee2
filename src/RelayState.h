#pragma once

#include "ChildProcess.h"
#include "ViewerConnection.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

// Explicit session status instead of "is there a process object" checks
enum class SessionStatus {
    IDLE,
    STARTING,   // Streaming desired, transcoder not (yet) running
    ACTIVE
};

const char* toString(SessionStatus status);

/**
 * Last known drone state. Every field stays unknown until first observed.
 */
struct TelemetrySnapshot {
    std::optional<int> battery;       // percent
    std::optional<int> speed;         // cm/s
    std::optional<int> flight_time;   // seconds
    std::optional<int64_t> last_update_ms;

    // {"battery":..,"speed":..,"time":..,"lastUpdate":..} with null for unknown
    std::string toJson() const;
};

struct StreamSession {
    SessionStatus status = SessionStatus::IDLE;
    bool desired_active = false;
    std::shared_ptr<ChildProcess> process;    // Owned transcoder
    std::shared_ptr<ChildProcess> draining;   // Terminated, exit not yet observed
    std::string last_error;
    std::chrono::system_clock::time_point started_at;
    uint64_t launches = 0;
    uint64_t restarts = 0;
};

struct RecordingSession {
    bool active = false;
    std::shared_ptr<ChildProcess> process;
    std::shared_ptr<ChildProcess> finalizing;   // Input closed, container being flushed
    std::string file_path;
    std::string file_name;
    std::string last_error;
    std::chrono::system_clock::time_point started_at;
};

struct ViewerEntry {
    uint64_t id = 0;
    std::shared_ptr<ViewerConnection> connection;
};

/**
 * RelayState - The single shared mutable record of the relay
 *
 * Holds the transcoder and recording process handles, the viewer set, the
 * last issued command and the latest telemetry. Mutated only from the event
 * loop; components are handed a reference instead of keeping private copies.
 */
class RelayState {
public:
    RelayState() = default;
    RelayState(const RelayState&) = delete;
    RelayState& operator=(const RelayState&) = delete;

    StreamSession& stream() { return stream_; }
    const StreamSession& stream() const { return stream_; }

    RecordingSession& recording() { return recording_; }
    const RecordingSession& recording() const { return recording_; }

    // A transcoder is owned and running
    bool isStreamActive() const { return stream_.status == SessionStatus::ACTIVE && stream_.process != nullptr; }
    bool isRecordingActive() const { return recording_.active; }

    // Viewer set, keyed by sequential identifier
    std::map<uint64_t, ViewerEntry>& viewers() { return viewers_; }
    const std::map<uint64_t, ViewerEntry>& viewers() const { return viewers_; }
    uint64_t nextViewerId() { return next_viewer_id_++; }

    // Drone command bookkeeping
    void setLastCommand(const std::string& command) { last_command_ = command; }
    const std::string& getLastCommand() const { return last_command_; }
    void setLastReadCommand(const std::string& command) { last_read_command_ = command; }
    const std::string& getLastReadCommand() const { return last_read_command_; }
    void setDroneConnected(bool connected) { drone_connected_ = connected; }
    bool isDroneConnected() const { return drone_connected_; }

    TelemetrySnapshot& telemetry() { return telemetry_; }
    const TelemetrySnapshot& telemetry() const { return telemetry_; }

    // Reset telemetry to "unknown"
    void resetTelemetry() { telemetry_ = TelemetrySnapshot{}; }

private:
    StreamSession stream_;
    RecordingSession recording_;
    std::map<uint64_t, ViewerEntry> viewers_;
    uint64_t next_viewer_id_ = 1;

    std::string last_command_;
    std::string last_read_command_;
    bool drone_connected_ = false;
    TelemetrySnapshot telemetry_;
};

// Milliseconds since the Unix epoch
int64_t nowEpochMs();
