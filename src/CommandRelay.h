#pragma once

#include "RelayState.h"
#include "TelemetryClassifier.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

class Config;
class ViewerRegistry;

struct CommandRelaySettings {
    std::string drone_ip = "192.168.10.1";
    uint16_t drone_port = 8889;
    uint16_t local_port = 0;
    uint32_t battery_poll_ms = 10000;
    uint32_t time_poll_ms = 5000;
    uint32_t speed_poll_ms = 2000;
    uint32_t poll_response_timeout_ms = 1000;
    uint32_t command_ack_timeout_ms = 1000;

    static CommandRelaySettings fromConfig(const Config& config);
};

enum class AckResult {
    OK,
    ERROR,
    TIMEOUT
};

/**
 * CommandRelay - Text command channel to the drone over UDP
 *
 * Sends commands as single datagrams, runs the telemetry poll loop and
 * classifies every inbound datagram. Read-commands, whether issued by the
 * poll loop or by a user, are strictly serialized: the next one goes out only
 * after the previous one was answered or timed out, and never while a command
 * awaits its "ok". User reads go ahead of queued polls.
 */
class CommandRelay {
public:
    static constexpr size_t MAX_COMMAND_LENGTH = 64;

    using SendCallback = std::function<void(bool ok, const std::string& error)>;
    using ReplyCallback = std::function<void(bool ok, const std::string& message)>;
    using AckCallback = std::function<void(AckResult result, const std::string& response)>;
    using StreamHandler = std::function<bool(std::string& message)>;
    using TelemetryCallback = std::function<void(const std::string& drone_state_json)>;

    CommandRelay(boost::asio::io_context& io, RelayState& state, ViewerRegistry& registry,
                 const CommandRelaySettings& settings);
    ~CommandRelay();

    CommandRelay(const CommandRelay&) = delete;
    CommandRelay& operator=(const CommandRelay&) = delete;

    // Bind the local socket and start receiving
    bool open(std::string& error);
    void close();
    bool isOpen() const { return socket_.is_open(); }
    uint16_t localPort() const;

    // Transmit one command datagram
    void send(const std::string& command, SendCallback callback);

    // Send a user command and apply its side effects (command/streamon/streamoff)
    void dispatch(const std::string& command, ReplyCallback callback);

    // Wait for the next "ok"/"error" from the drone. Returns the waiter id.
    uint64_t awaitAck(uint32_t timeout_ms, AckCallback callback);

    // Interpret one inbound datagram
    void handleResponse(const std::string& payload);

    // streamon starts the transcoder, streamoff stops it
    void setStreamHandlers(StreamHandler on_stream_on, StreamHandler on_stream_off);
    void setTelemetryCallback(TelemetryCallback callback) { telemetry_callback_ = std::move(callback); }

    void startPolling();
    void stopPolling();
    bool isPolling() const { return polling_; }
    // Read-command currently awaiting its value (poll or user read)
    const std::string& inFlightPoll() const { return in_flight_poll_; }
    size_t queuedPolls() const { return poll_queue_.size(); }
    size_t queuedUserReads() const { return user_reads_.size(); }

    // {"type":"droneState","value":{...},"timestamp":...}
    std::string droneStateMessage() const;

    static bool isValidCommand(const std::string& command);

    uint64_t getCommandsSent() const { return commands_sent_; }
    uint64_t getResponsesReceived() const { return responses_received_; }

private:
    struct UserRead {
        std::string command;
        ReplyCallback callback;
    };

    struct AckWaiter {
        uint64_t id;
        std::shared_ptr<boost::asio::steady_timer> timer;
        AckCallback callback;
    };

    void receiveNext();
    void resolveAck(AckResult result, const std::string& response);
    void cancelAck(uint64_t id);
    void applyTelemetry(const ClassifiedResponse& response);

    void schedulePoll(boost::asio::steady_timer& timer, uint32_t interval_ms, const std::string& command);
    void enqueuePoll(const std::string& command);
    void pumpPolls();
    void sendRead(const std::string& command, SendCallback callback);
    void finishPoll();
    void failUserReads(const std::string& reason);

    void dispatchStreamOff(ReplyCallback callback);

    boost::asio::io_context& io_;
    RelayState& state_;
    ViewerRegistry& registry_;
    CommandRelaySettings settings_;

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint drone_endpoint_;
    boost::asio::ip::udp::endpoint sender_endpoint_;
    std::array<char, 1518> receive_buffer_;

    StreamHandler on_stream_on_;
    StreamHandler on_stream_off_;
    TelemetryCallback telemetry_callback_;

    std::deque<AckWaiter> ack_waiters_;
    uint64_t next_ack_id_ = 1;

    bool polling_ = false;
    boost::asio::steady_timer battery_timer_;
    boost::asio::steady_timer time_timer_;
    boost::asio::steady_timer speed_timer_;
    boost::asio::steady_timer poll_timeout_timer_;
    std::deque<std::string> poll_queue_;
    std::deque<UserRead> user_reads_;
    std::string in_flight_poll_;
    uint64_t poll_seq_ = 0;

    uint64_t commands_sent_ = 0;
    uint64_t responses_received_ = 0;
};
