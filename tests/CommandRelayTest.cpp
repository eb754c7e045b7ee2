/**
 * CommandRelay tests
 *
 * Runs the relay against a fake drone bound on the loopback interface.
 * Covers command transmission and bookkeeping, the SDK-mode handshake that
 * starts telemetry polling, acknowledgement timeouts, streamon/streamoff side
 * effects, command validation, telemetry application and broadcast, and the
 * strictly serialized poll loop.
 */

#include "CommandRelay.h"
#include "RelayState.h"
#include "TestSupport.h"
#include "ViewerRegistry.h"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <algorithm>
#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using boost::asio::ip::udp;

class CommandRelayTest : public ::testing::Test {
protected:
    struct Reply {
        bool ok;
        std::string message;
    };

    void SetUp() override {
        drone_.open(udp::v4());
        drone_.bind(udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

        settings_.drone_ip = "127.0.0.1";
        settings_.drone_port = drone_.local_endpoint().port();
        settings_.command_ack_timeout_ms = 100;
        settings_.poll_response_timeout_ms = 100;
        settings_.battery_poll_ms = 60000;
        settings_.time_poll_ms = 60000;
        settings_.speed_poll_ms = 60000;

        registry_ = std::make_unique<ViewerRegistry>(state_);
        relay_ = std::make_unique<CommandRelay>(io_, state_, *registry_, settings_);
        relay_->setTelemetryCallback([this](const std::string& json) { published_.push_back(json); });

        std::string error;
        ASSERT_TRUE(relay_->open(error)) << error;
        receiveAtDrone();
    }

    void TearDown() override {
        relay_.reset();
        boost::system::error_code ec;
        drone_.close(ec);
    }

    void receiveAtDrone() {
        drone_.async_receive_from(
            boost::asio::buffer(drone_buffer_), drone_peer_,
            [this](const boost::system::error_code& ec, size_t bytes) {
                if (ec) {
                    return;
                }
                std::string command(drone_buffer_.data(), bytes);
                drone_received_.push_back(command);
                if (responder_) {
                    std::string answer = responder_(command);
                    if (!answer.empty()) {
                        boost::system::error_code send_ec;
                        drone_.send_to(boost::asio::buffer(answer), drone_peer_, 0, send_ec);
                    }
                }
                receiveAtDrone();
            });
    }

    bool droneReceived(const std::string& command) const {
        return std::find(drone_received_.begin(), drone_received_.end(), command) != drone_received_.end();
    }

    CommandRelay::ReplyCallback capture() {
        return [this](bool ok, const std::string& message) { reply_ = Reply{ok, message}; };
    }

    boost::asio::io_context io_;
    udp::socket drone_{io_};
    udp::endpoint drone_peer_;
    std::array<char, 1518> drone_buffer_;
    std::vector<std::string> drone_received_;
    std::function<std::string(const std::string&)> responder_;

    RelayState state_;
    CommandRelaySettings settings_;
    std::unique_ptr<ViewerRegistry> registry_;
    std::unique_ptr<CommandRelay> relay_;

    std::optional<Reply> reply_;
    std::vector<std::string> published_;
};

// =============================================================================
// Transmission
// =============================================================================

TEST_F(CommandRelayTest, SendDeliversDatagramAndRecordsCommand) {
    std::optional<bool> sent;
    relay_->send("battery?", [&sent](bool ok, const std::string&) { sent = ok; });

    EXPECT_EQ(state_.getLastCommand(), "battery?");
    EXPECT_EQ(state_.getLastReadCommand(), "battery?");

    ASSERT_TRUE(runUntil(io_, [this]() { return drone_received_.size() == 1u; }));
    EXPECT_EQ(drone_received_[0], "battery?");
    ASSERT_TRUE(runUntil(io_, [&sent]() { return sent.has_value(); }));
    EXPECT_TRUE(*sent);
    EXPECT_EQ(relay_->getCommandsSent(), 1u);
}

TEST_F(CommandRelayTest, NonReadCommandKeepsLastReadCommand) {
    relay_->send("battery?", nullptr);
    relay_->send("takeoff", nullptr);

    EXPECT_EQ(state_.getLastCommand(), "takeoff");
    EXPECT_EQ(state_.getLastReadCommand(), "battery?");
}

TEST_F(CommandRelayTest, OtherCommandsReplyWithConfirmation) {
    relay_->dispatch("takeoff", capture());

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_TRUE(reply_->ok);
    EXPECT_EQ(reply_->message, "Command sent: takeoff");
    EXPECT_TRUE(runUntil(io_, [this]() { return droneReceived("takeoff"); }));
}

TEST_F(CommandRelayTest, InvalidCommandsAreRejected) {
    relay_->dispatch("", capture());
    ASSERT_TRUE(reply_.has_value());
    EXPECT_FALSE(reply_->ok);
    EXPECT_EQ(reply_->message, "Invalid command");

    EXPECT_FALSE(CommandRelay::isValidCommand(" takeoff"));
    EXPECT_FALSE(CommandRelay::isValidCommand("takeoff\n"));
    EXPECT_FALSE(CommandRelay::isValidCommand(std::string(65, 'a')));
    EXPECT_TRUE(CommandRelay::isValidCommand(std::string(64, 'a')));
    EXPECT_TRUE(CommandRelay::isValidCommand("rc 0 0 10 0"));
    EXPECT_TRUE(CommandRelay::isValidCommand("battery?"));
}

TEST_F(CommandRelayTest, SendAfterCloseFails) {
    relay_->close();
    EXPECT_FALSE(relay_->isOpen());

    std::optional<Reply> result;
    relay_->send("battery?", [&result](bool ok, const std::string& error) { result = Reply{ok, error}; });

    ASSERT_TRUE(runUntil(io_, [&result]() { return result.has_value(); }));
    EXPECT_FALSE(result->ok);
    EXPECT_EQ(result->message, "command socket not open");
}

// =============================================================================
// Handshake and stream commands
// =============================================================================

TEST_F(CommandRelayTest, AcknowledgedCommandStartsPolling) {
    responder_ = [](const std::string& command) {
        return command == "command" ? std::string("ok") : std::string();
    };

    relay_->dispatch("command", capture());

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_TRUE(reply_->ok);
    EXPECT_EQ(reply_->message, "ok");
    EXPECT_TRUE(state_.isDroneConnected());
    EXPECT_TRUE(relay_->isPolling());

    EXPECT_TRUE(runUntil(io_, [this]() { return droneReceived("battery?"); }));
}

TEST_F(CommandRelayTest, UnacknowledgedCommandTimesOut) {
    relay_->dispatch("command", capture());

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_FALSE(reply_->ok);
    EXPECT_EQ(reply_->message, "No acknowledgment from drone");
    EXPECT_FALSE(relay_->isPolling());
    EXPECT_FALSE(state_.isDroneConnected());
}

TEST_F(CommandRelayTest, RejectedCommandReportsDroneError) {
    responder_ = [](const std::string&) { return std::string("error"); };

    relay_->dispatch("command", capture());

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_FALSE(reply_->ok);
    EXPECT_NE(reply_->message.find("rejected"), std::string::npos);
}

TEST_F(CommandRelayTest, StreamOnStartsStream) {
    bool started = false;
    relay_->setStreamHandlers(
        [&started](std::string& message) {
            started = true;
            message = "Transcoder started";
            return true;
        },
        [](std::string&) { return true; });

    relay_->dispatch("streamon", capture());

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_TRUE(started);
    EXPECT_TRUE(reply_->ok);
    EXPECT_EQ(reply_->message, "Transcoder started");
}

TEST_F(CommandRelayTest, StreamOffWaitsForAcknowledgement) {
    bool stopped = false;
    relay_->setStreamHandlers(
        [](std::string&) { return true; },
        [&stopped](std::string&) {
            stopped = true;
            return true;
        });
    responder_ = [](const std::string& command) {
        return command == "streamoff" ? std::string("ok") : std::string();
    };

    relay_->dispatch("streamoff", capture());
    EXPECT_FALSE(stopped);

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_TRUE(stopped);
    EXPECT_TRUE(reply_->ok);
    EXPECT_EQ(reply_->message, "Stream stopped (acknowledged)");
}

TEST_F(CommandRelayTest, StreamOffStopsEvenWithoutAcknowledgement) {
    bool stopped = false;
    relay_->setStreamHandlers(
        [](std::string&) { return true; },
        [&stopped](std::string&) {
            stopped = true;
            return true;
        });

    relay_->dispatch("streamoff", capture());

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_TRUE(stopped);
    EXPECT_TRUE(reply_->ok);
    EXPECT_EQ(reply_->message, "Stream stopped (no acknowledgment)");
}

TEST_F(CommandRelayTest, CloseResolvesPendingAcknowledgements) {
    std::optional<AckResult> result;
    relay_->awaitAck(5000, [&result](AckResult r, const std::string&) { result = r; });

    relay_->close();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, AckResult::TIMEOUT);
}

// =============================================================================
// Telemetry
// =============================================================================

TEST_F(CommandRelayTest, TelemetryUpdatesSnapshotAndReachesViewers) {
    auto viewer = std::make_shared<FakeViewer>();
    registry_->registerViewer(viewer);

    relay_->send("battery?", nullptr);
    relay_->handleResponse("87");

    ASSERT_TRUE(state_.telemetry().battery.has_value());
    EXPECT_EQ(*state_.telemetry().battery, 87);
    EXPECT_TRUE(state_.telemetry().last_update_ms.has_value());
    EXPECT_TRUE(state_.isDroneConnected());

    ASSERT_EQ(viewer->texts.size(), 1u);
    EXPECT_NE(viewer->texts[0].find("\"type\": \"droneState\""), std::string::npos);
    EXPECT_NE(viewer->texts[0].find("\"battery\": 87"), std::string::npos);
    ASSERT_EQ(published_.size(), 1u);
    EXPECT_EQ(published_[0], viewer->texts[0]);
}

TEST_F(CommandRelayTest, UnknownFieldsStayNull) {
    std::string message = relay_->droneStateMessage();
    EXPECT_NE(message.find("\"battery\": null"), std::string::npos);
    EXPECT_NE(message.find("\"speed\": null"), std::string::npos);
    EXPECT_NE(message.find("\"time\": null"), std::string::npos);
}

TEST_F(CommandRelayTest, UnclassifiedResponseChangesNothing) {
    relay_->handleResponse("hello");

    EXPECT_FALSE(state_.telemetry().battery.has_value());
    EXPECT_TRUE(published_.empty());
    EXPECT_EQ(relay_->getResponsesReceived(), 1u);
}

TEST_F(CommandRelayTest, PollsAreStrictlySerialized) {
    relay_->startPolling();
    EXPECT_EQ(relay_->inFlightPoll(), "battery?");
    EXPECT_EQ(relay_->queuedPolls(), 2u);

    relay_->handleResponse("87");
    EXPECT_EQ(relay_->inFlightPoll(), "time?");
    EXPECT_EQ(*state_.telemetry().battery, 87);

    relay_->handleResponse("12s");
    EXPECT_EQ(relay_->inFlightPoll(), "speed?");
    EXPECT_EQ(*state_.telemetry().flight_time, 12);

    relay_->handleResponse("30");
    EXPECT_TRUE(relay_->inFlightPoll().empty());
    EXPECT_EQ(*state_.telemetry().speed, 30);
    EXPECT_EQ(relay_->queuedPolls(), 0u);
}

TEST_F(CommandRelayTest, UnitSuffixWinsOverInFlightQuery) {
    relay_->startPolling();
    ASSERT_EQ(relay_->inFlightPoll(), "battery?");

    relay_->handleResponse("15s");

    EXPECT_FALSE(state_.telemetry().battery.has_value());
    ASSERT_TRUE(state_.telemetry().flight_time.has_value());
    EXPECT_EQ(*state_.telemetry().flight_time, 15);
}

TEST_F(CommandRelayTest, UnansweredPollTimesOutAndMovesOn) {
    relay_->startPolling();
    ASSERT_EQ(relay_->inFlightPoll(), "battery?");

    EXPECT_TRUE(runUntil(io_, [this]() { return relay_->inFlightPoll() == "time?"; }));
}

TEST_F(CommandRelayTest, PollsWaitWhileAcknowledgementPending) {
    std::optional<AckResult> result;
    relay_->awaitAck(5000, [&result](AckResult r, const std::string&) { result = r; });

    relay_->startPolling();
    EXPECT_TRUE(relay_->inFlightPoll().empty());
    EXPECT_EQ(relay_->queuedPolls(), 3u);

    relay_->handleResponse("ok");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, AckResult::OK);
    EXPECT_EQ(relay_->inFlightPoll(), "battery?");
}

TEST_F(CommandRelayTest, StopPollingClearsQueue) {
    relay_->startPolling();
    relay_->stopPolling();

    EXPECT_FALSE(relay_->isPolling());
    EXPECT_TRUE(relay_->inFlightPoll().empty());
    EXPECT_EQ(relay_->queuedPolls(), 0u);
}

TEST_F(CommandRelayTest, OkForAnotherCommandKeepsPollInFlight) {
    relay_->startPolling();
    ASSERT_EQ(relay_->inFlightPoll(), "battery?");

    relay_->dispatch("takeoff", capture());
    relay_->handleResponse("ok");
    EXPECT_EQ(relay_->inFlightPoll(), "battery?");

    relay_->handleResponse("87");
    ASSERT_TRUE(state_.telemetry().battery.has_value());
    EXPECT_EQ(*state_.telemetry().battery, 87);
    EXPECT_FALSE(state_.telemetry().flight_time.has_value());
    EXPECT_EQ(relay_->inFlightPoll(), "time?");
}

TEST_F(CommandRelayTest, ErrorAnswerEndsInFlightPoll) {
    relay_->startPolling();
    ASSERT_EQ(relay_->inFlightPoll(), "battery?");

    relay_->handleResponse("error");
    EXPECT_EQ(relay_->inFlightPoll(), "time?");
    EXPECT_FALSE(state_.telemetry().battery.has_value());
}

TEST_F(CommandRelayTest, UserReadWaitsForInFlightPoll) {
    relay_->startPolling();
    relay_->handleResponse("87");
    relay_->handleResponse("12s");
    ASSERT_EQ(relay_->inFlightPoll(), "speed?");

    relay_->dispatch("battery?", capture());
    EXPECT_EQ(relay_->inFlightPoll(), "speed?");
    EXPECT_EQ(relay_->queuedUserReads(), 1u);

    relay_->handleResponse("30");
    EXPECT_EQ(*state_.telemetry().speed, 30);
    EXPECT_EQ(relay_->inFlightPoll(), "battery?");
    EXPECT_EQ(relay_->queuedUserReads(), 0u);

    relay_->handleResponse("55");
    EXPECT_EQ(*state_.telemetry().battery, 55);
    EXPECT_EQ(*state_.telemetry().speed, 30);

    ASSERT_TRUE(runUntil(io_, [this]() { return reply_.has_value(); }));
    EXPECT_TRUE(reply_->ok);
    EXPECT_EQ(reply_->message, "Command sent: battery?");
}

TEST_F(CommandRelayTest, UserReadGoesOutAtOnceWhenIdle) {
    relay_->dispatch("battery?", capture());
    EXPECT_EQ(relay_->inFlightPoll(), "battery?");

    ASSERT_TRUE(runUntil(io_, [this]() { return droneReceived("battery?"); }));
    relay_->handleResponse("64");
    EXPECT_EQ(*state_.telemetry().battery, 64);
    EXPECT_TRUE(relay_->inFlightPoll().empty());
}

TEST_F(CommandRelayTest, CloseFailsQueuedUserReads) {
    relay_->startPolling();
    relay_->dispatch("battery?", capture());
    ASSERT_EQ(relay_->queuedUserReads(), 1u);

    relay_->close();
    ASSERT_TRUE(reply_.has_value());
    EXPECT_FALSE(reply_->ok);
    EXPECT_EQ(relay_->queuedUserReads(), 0u);
}
