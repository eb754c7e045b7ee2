#include "CommandRelay.h"
#include "Config.h"
#include "ViewerRegistry.h"
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <iostream>
#include <sstream>

CommandRelaySettings CommandRelaySettings::fromConfig(const Config& config) {
    CommandRelaySettings settings;
    settings.drone_ip = config.getDroneIp();
    settings.drone_port = config.getDroneCommandPort();
    settings.local_port = config.getLocalCommandPort();
    settings.battery_poll_ms = config.getBatteryPollMs();
    settings.time_poll_ms = config.getTimePollMs();
    settings.speed_poll_ms = config.getSpeedPollMs();
    settings.poll_response_timeout_ms = config.getPollResponseTimeoutMs();
    settings.command_ack_timeout_ms = config.getCommandAckTimeoutMs();
    return settings;
}

CommandRelay::CommandRelay(boost::asio::io_context& io, RelayState& state, ViewerRegistry& registry,
                           const CommandRelaySettings& settings)
    : io_(io),
      state_(state),
      registry_(registry),
      settings_(settings),
      socket_(io),
      battery_timer_(io),
      time_timer_(io),
      speed_timer_(io),
      poll_timeout_timer_(io) {
}

CommandRelay::~CommandRelay() {
    polling_ = false;
    ack_waiters_.clear();
    boost::system::error_code ec;
    socket_.close(ec);
}

bool CommandRelay::open(std::string& error) {
    using boost::asio::ip::udp;

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(settings_.drone_ip, ec);
    if (ec) {
        error = "invalid drone address '" + settings_.drone_ip + "': " + ec.message();
        return false;
    }
    drone_endpoint_ = udp::endpoint(address, settings_.drone_port);

    socket_.open(udp::v4(), ec);
    if (!ec) {
        socket_.bind(udp::endpoint(udp::v4(), settings_.local_port), ec);
    }
    if (ec) {
        error = "failed to bind command socket: " + ec.message();
        socket_.close(ec);
        return false;
    }

    std::cout << "[CommandRelay] Command socket on UDP port " << localPort() << ", drone at "
              << settings_.drone_ip << ":" << settings_.drone_port << std::endl;
    receiveNext();
    return true;
}

void CommandRelay::close() {
    failUserReads("command socket closed");
    stopPolling();

    // Nobody will answer outstanding waits any more
    std::deque<AckWaiter> waiters;
    waiters.swap(ack_waiters_);
    for (auto& waiter : waiters) {
        waiter.timer->cancel();
        try {
            waiter.callback(AckResult::TIMEOUT, "");
        } catch (const std::exception& e) {
            std::cerr << "[CommandRelay] Ack callback error: " << e.what() << std::endl;
        }
    }

    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.close(ec);
        std::cout << "[CommandRelay] Command socket closed (" << commands_sent_ << " sent, "
                  << responses_received_ << " received)" << std::endl;
    }
}

uint16_t CommandRelay::localPort() const {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

bool CommandRelay::isValidCommand(const std::string& command) {
    if (command.empty() || command.size() > MAX_COMMAND_LENGTH) {
        return false;
    }
    if (command.front() == ' ' || command.back() == ' ') {
        return false;
    }
    return std::all_of(command.begin(), command.end(),
                       [](char c) { return c >= 0x20 && c <= 0x7e; });
}

void CommandRelay::send(const std::string& command, SendCallback callback) {
    if (!socket_.is_open()) {
        if (callback) {
            boost::asio::post(io_, [callback]() {
                try {
                    callback(false, "command socket not open");
                } catch (const std::exception& e) {
                    std::cerr << "[CommandRelay] Send callback error: " << e.what() << std::endl;
                }
            });
        }
        return;
    }

    state_.setLastCommand(command);
    if (TelemetryClassifier::isReadCommand(command)) {
        state_.setLastReadCommand(command);
    }

    auto payload = std::make_shared<std::string>(command);
    socket_.async_send_to(
        boost::asio::buffer(*payload), drone_endpoint_,
        [this, payload, callback](const boost::system::error_code& ec, size_t /*bytes*/) {
            if (ec) {
                std::cerr << "[CommandRelay] Failed to send '" << *payload << "': " << ec.message() << std::endl;
            } else {
                commands_sent_++;
            }
            if (!callback) {
                return;
            }
            try {
                callback(!ec, ec ? ec.message() : std::string());
            } catch (const std::exception& e) {
                std::cerr << "[CommandRelay] Send callback error: " << e.what() << std::endl;
            }
        });
}

void CommandRelay::setStreamHandlers(StreamHandler on_stream_on, StreamHandler on_stream_off) {
    on_stream_on_ = std::move(on_stream_on);
    on_stream_off_ = std::move(on_stream_off);
}

void CommandRelay::dispatch(const std::string& command, ReplyCallback callback) {
    if (!isValidCommand(command)) {
        callback(false, "Invalid command");
        return;
    }

    std::cout << "[CommandRelay] Command: " << command << std::endl;

    if (command == "command") {
        // Waiter first so a fast reply cannot slip past it
        uint64_t ack_id = awaitAck(settings_.command_ack_timeout_ms,
            [this, callback](AckResult result, const std::string& response) {
                if (result == AckResult::OK) {
                    std::cout << "[CommandRelay] Drone entered SDK mode" << std::endl;
                    state_.setDroneConnected(true);
                    startPolling();
                    callback(true, "ok");
                } else if (result == AckResult::ERROR) {
                    callback(false, "Drone rejected command: " + response);
                } else {
                    callback(false, "No acknowledgment from drone");
                }
            });
        send(command, [this, ack_id, callback](bool ok, const std::string& error) {
            if (!ok) {
                cancelAck(ack_id);
                callback(false, "Failed to send command: " + error);
            }
        });
        return;
    }

    if (command == "streamon") {
        send(command, [this, callback](bool ok, const std::string& error) {
            if (!ok) {
                callback(false, "Failed to send command: " + error);
                return;
            }
            std::string message = "Stream enabled";
            bool started = on_stream_on_ ? on_stream_on_(message) : true;
            callback(started, message);
        });
        return;
    }

    if (command == "streamoff") {
        dispatchStreamOff(std::move(callback));
        return;
    }

    if (TelemetryClassifier::isReadCommand(command)) {
        // Shares the single in-flight slot with the poll loop so its value is attributed to it
        user_reads_.push_back(UserRead{command, std::move(callback)});
        pumpPolls();
        return;
    }

    send(command, [command, callback](bool ok, const std::string& error) {
        callback(ok, ok ? "Command sent: " + command : "Failed to send command: " + error);
    });
}

void CommandRelay::dispatchStreamOff(ReplyCallback callback) {
    uint64_t ack_id = awaitAck(settings_.command_ack_timeout_ms,
        [this, callback](AckResult result, const std::string& /*response*/) {
            std::string message;
            if (on_stream_off_) {
                on_stream_off_(message);
            }
            callback(true, result == AckResult::OK ? "Stream stopped (acknowledged)"
                                                   : "Stream stopped (no acknowledgment)");
        });

    send("streamoff", [this, ack_id, callback](bool ok, const std::string& error) {
        if (ok) {
            return;
        }
        cancelAck(ack_id);
        std::string message;
        if (on_stream_off_) {
            on_stream_off_(message);
        }
        callback(false, "Failed to send streamoff: " + error + " (stream stopped locally)");
    });
}

uint64_t CommandRelay::awaitAck(uint32_t timeout_ms, AckCallback callback) {
    uint64_t id = next_ack_id_++;
    auto timer = std::make_shared<boost::asio::steady_timer>(io_);
    timer->expires_after(std::chrono::milliseconds(timeout_ms));
    ack_waiters_.push_back(AckWaiter{id, timer, std::move(callback)});

    timer->async_wait([this, id](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        auto it = std::find_if(ack_waiters_.begin(), ack_waiters_.end(),
                               [id](const AckWaiter& waiter) { return waiter.id == id; });
        if (it == ack_waiters_.end()) {
            return;
        }
        AckCallback expired = std::move(it->callback);
        ack_waiters_.erase(it);
        std::cerr << "[CommandRelay] No acknowledgment from drone" << std::endl;
        try {
            expired(AckResult::TIMEOUT, "");
        } catch (const std::exception& e) {
            std::cerr << "[CommandRelay] Ack callback error: " << e.what() << std::endl;
        }
        pumpPolls();
    });
    return id;
}

void CommandRelay::cancelAck(uint64_t id) {
    auto it = std::find_if(ack_waiters_.begin(), ack_waiters_.end(),
                           [id](const AckWaiter& waiter) { return waiter.id == id; });
    if (it != ack_waiters_.end()) {
        it->timer->cancel();
        ack_waiters_.erase(it);
        pumpPolls();
    }
}

void CommandRelay::resolveAck(AckResult result, const std::string& response) {
    if (ack_waiters_.empty()) {
        // Reads are never answered with "ok"; a stray one belongs to some other command
        if (result == AckResult::ERROR && !in_flight_poll_.empty()) {
            finishPoll();
        }
        return;
    }

    AckWaiter waiter = std::move(ack_waiters_.front());
    ack_waiters_.pop_front();
    waiter.timer->cancel();

    try {
        waiter.callback(result, response);
    } catch (const std::exception& e) {
        std::cerr << "[CommandRelay] Ack callback error: " << e.what() << std::endl;
    }
    pumpPolls();
}

void CommandRelay::receiveNext() {
    socket_.async_receive_from(
        boost::asio::buffer(receive_buffer_), sender_endpoint_,
        [this](const boost::system::error_code& ec, size_t bytes) {
            if (ec == boost::asio::error::operation_aborted || !socket_.is_open()) {
                return;
            }
            if (ec) {
                // ICMP port unreachable shows up here while the drone is away
                std::cerr << "[CommandRelay] Receive error: " << ec.message() << std::endl;
                receiveNext();
                return;
            }
            try {
                handleResponse(std::string(receive_buffer_.data(), bytes));
            } catch (const std::exception& e) {
                std::cerr << "[CommandRelay] Response handling error: " << e.what() << std::endl;
            }
            receiveNext();
        });
}

void CommandRelay::handleResponse(const std::string& payload) {
    responses_received_++;

    const std::string& correlated = in_flight_poll_.empty() ? state_.getLastReadCommand() : in_flight_poll_;
    ClassifiedResponse response = TelemetryClassifier::classify(payload, correlated);

    switch (response.kind) {
        case ResponseKind::ACK_OK:
            resolveAck(AckResult::OK, response.text);
            break;
        case ResponseKind::ACK_ERROR:
            std::cerr << "[CommandRelay] Drone error: " << response.text << std::endl;
            resolveAck(AckResult::ERROR, response.text);
            break;
        case ResponseKind::TELEMETRY:
            applyTelemetry(response);
            break;
        case ResponseKind::UNKNOWN:
            std::cout << "[CommandRelay] Unclassified response: " << response.text << std::endl;
            break;
    }
}

void CommandRelay::applyTelemetry(const ClassifiedResponse& response) {
    TelemetrySnapshot& telemetry = state_.telemetry();
    switch (response.field) {
        case TelemetryField::BATTERY:
            telemetry.battery = response.value;
            break;
        case TelemetryField::SPEED:
            telemetry.speed = response.value;
            break;
        case TelemetryField::FLIGHT_TIME:
            telemetry.flight_time = response.value;
            break;
        case TelemetryField::NONE:
            return;
    }
    telemetry.last_update_ms = nowEpochMs();
    state_.setDroneConnected(true);

    if (!in_flight_poll_.empty()) {
        finishPoll();
    }

    std::string message = droneStateMessage();
    registry_.broadcastText(message);

    if (telemetry_callback_) {
        try {
            telemetry_callback_(message);
        } catch (const std::exception& e) {
            std::cerr << "[CommandRelay] Telemetry callback error: " << e.what() << std::endl;
        }
    }
}

std::string CommandRelay::droneStateMessage() const {
    std::ostringstream json;
    json << "{\"type\": \"droneState\", \"value\": " << state_.telemetry().toJson()
         << ", \"timestamp\": " << nowEpochMs() << "}";
    return json.str();
}

void CommandRelay::startPolling() {
    if (polling_) {
        return;
    }
    polling_ = true;
    std::cout << "[CommandRelay] Telemetry polling started (battery " << settings_.battery_poll_ms
              << " ms, time " << settings_.time_poll_ms << " ms, speed " << settings_.speed_poll_ms
              << " ms)" << std::endl;

    enqueuePoll("battery?");
    enqueuePoll("time?");
    enqueuePoll("speed?");
    pumpPolls();

    schedulePoll(battery_timer_, settings_.battery_poll_ms, "battery?");
    schedulePoll(time_timer_, settings_.time_poll_ms, "time?");
    schedulePoll(speed_timer_, settings_.speed_poll_ms, "speed?");
}

void CommandRelay::stopPolling() {
    if (!polling_) {
        return;
    }
    polling_ = false;
    battery_timer_.cancel();
    time_timer_.cancel();
    speed_timer_.cancel();
    poll_timeout_timer_.cancel();
    poll_queue_.clear();
    in_flight_poll_.clear();
    poll_seq_++;
    std::cout << "[CommandRelay] Telemetry polling stopped" << std::endl;
    pumpPolls();
}

void CommandRelay::schedulePoll(boost::asio::steady_timer& timer, uint32_t interval_ms,
                                const std::string& command) {
    timer.expires_after(std::chrono::milliseconds(interval_ms));
    timer.async_wait([this, &timer, interval_ms, command](const boost::system::error_code& ec) {
        if (ec || !polling_) {
            return;
        }
        enqueuePoll(command);
        pumpPolls();
        schedulePoll(timer, interval_ms, command);
    });
}

void CommandRelay::enqueuePoll(const std::string& command) {
    if (command == in_flight_poll_ ||
        std::find(poll_queue_.begin(), poll_queue_.end(), command) != poll_queue_.end()) {
        return;
    }
    poll_queue_.push_back(command);
}

void CommandRelay::pumpPolls() {
    if (!in_flight_poll_.empty() || !ack_waiters_.empty() || !socket_.is_open()) {
        return;
    }

    if (!user_reads_.empty()) {
        UserRead read = std::move(user_reads_.front());
        user_reads_.pop_front();
        std::string command = read.command;
        ReplyCallback callback = std::move(read.callback);
        sendRead(command, [command, callback](bool ok, const std::string& error) {
            callback(ok, ok ? "Command sent: " + command : "Failed to send command: " + error);
        });
        return;
    }

    if (!polling_ || poll_queue_.empty()) {
        return;
    }

    std::string command = poll_queue_.front();
    poll_queue_.pop_front();
    sendRead(command, nullptr);
}

void CommandRelay::sendRead(const std::string& command, SendCallback callback) {
    in_flight_poll_ = command;
    uint64_t seq = ++poll_seq_;

    send(command, [this, seq, callback](bool ok, const std::string& error) {
        if (!ok && seq == poll_seq_ && !in_flight_poll_.empty()) {
            finishPoll();
        }
        if (callback) {
            callback(ok, error);
        }
    });

    poll_timeout_timer_.expires_after(std::chrono::milliseconds(settings_.poll_response_timeout_ms));
    poll_timeout_timer_.async_wait([this, seq](const boost::system::error_code& ec) {
        if (ec || seq != poll_seq_ || in_flight_poll_.empty()) {
            return;
        }
        std::cerr << "[CommandRelay] No response to " << in_flight_poll_ << std::endl;
        finishPoll();
    });
}

void CommandRelay::failUserReads(const std::string& reason) {
    std::deque<UserRead> reads;
    reads.swap(user_reads_);
    for (auto& read : reads) {
        try {
            read.callback(false, "Failed to send command: " + reason);
        } catch (const std::exception& e) {
            std::cerr << "[CommandRelay] Reply callback error: " << e.what() << std::endl;
        }
    }
}

void CommandRelay::finishPoll() {
    in_flight_poll_.clear();
    poll_timeout_timer_.cancel();
    pumpPolls();
}
