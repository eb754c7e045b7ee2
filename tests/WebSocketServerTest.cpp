/**
 * WebSocketServer tests
 *
 * Connects real WebSocket clients over loopback to cover viewer
 * registration on handshake, binary frame and text telemetry delivery,
 * unregistration when the client disconnects, and server-side close.
 */

#include "RelayState.h"
#include "TestSupport.h"
#include "ViewerRegistry.h"
#include "WebSocketServer.h"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

class WebSocketServerTest : public ::testing::Test {
protected:
    using Client = websocket::stream<beast::tcp_stream>;

    void SetUp() override {
        registry_ = std::make_unique<ViewerRegistry>(state_);
        server_ = std::make_unique<WebSocketServer>(io_, *registry_, 0, 0);
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        server_->stop();
        registry_->closeAll();
        runFor(io_, std::chrono::milliseconds(20));
    }

    std::unique_ptr<Client> connect() {
        auto client = std::make_unique<Client>(io_);
        beast::get_lowest_layer(*client).connect(
            tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server_->port()));

        bool handshaken = false;
        client->async_handshake("127.0.0.1", "/", [&handshaken](const beast::error_code& ec) {
            handshaken = !ec;
        });
        size_t expected = registry_->size() + 1;
        EXPECT_TRUE(runUntil(io_, [&]() { return handshaken && registry_->size() == expected; }));
        return client;
    }

    // Read one message; returns false on error or timeout
    bool readMessage(Client& client, beast::flat_buffer& buffer) {
        bool done = false;
        bool ok = false;
        client.async_read(buffer, [&](const beast::error_code& ec, size_t) {
            done = true;
            ok = !ec;
        });
        runUntil(io_, [&done]() { return done; });
        return ok;
    }

    boost::asio::io_context io_;
    RelayState state_;
    std::unique_ptr<ViewerRegistry> registry_;
    std::unique_ptr<WebSocketServer> server_;
};

TEST_F(WebSocketServerTest, HandshakeRegistersViewer) {
    auto client = connect();
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_EQ(registry_->openCount(), 1u);
}

TEST_F(WebSocketServerTest, BroadcastFrameArrivesAsBinaryMessage) {
    auto client = connect();

    auto frame = std::make_shared<const std::vector<uint8_t>>(makeTsPackets(21));
    registry_->broadcast(frame);

    beast::flat_buffer buffer;
    ASSERT_TRUE(readMessage(*client, buffer));
    EXPECT_TRUE(client->got_binary());
    ASSERT_EQ(buffer.size(), 3948u);
    EXPECT_EQ(static_cast<const uint8_t*>(buffer.data().data())[0], 0x47);
}

TEST_F(WebSocketServerTest, TelemetryArrivesAsTextMessage) {
    auto client = connect();

    registry_->broadcastText("{\"type\": \"droneState\"}");

    beast::flat_buffer buffer;
    ASSERT_TRUE(readMessage(*client, buffer));
    EXPECT_TRUE(client->got_text());
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), "{\"type\": \"droneState\"}");
}

TEST_F(WebSocketServerTest, FramesKeepOrderPerViewer) {
    auto client = connect();

    for (uint8_t i = 0; i < 5; i++) {
        auto frame = std::make_shared<const std::vector<uint8_t>>(makeTsPackets(21, i));
        registry_->broadcast(frame);
    }

    for (uint8_t i = 0; i < 5; i++) {
        beast::flat_buffer buffer;
        ASSERT_TRUE(readMessage(*client, buffer));
        EXPECT_EQ(static_cast<const uint8_t*>(buffer.data().data())[1], i);
    }
}

TEST_F(WebSocketServerTest, ClientCloseUnregistersViewer) {
    auto client = connect();

    bool closed = false;
    client->async_close(websocket::close_code::normal, [&closed](const beast::error_code&) { closed = true; });

    EXPECT_TRUE(runUntil(io_, [&]() { return closed && registry_->size() == 0u; }));
}

TEST_F(WebSocketServerTest, CloseAllEndsClientConnections) {
    auto client = connect();

    registry_->closeAll();

    beast::flat_buffer buffer;
    EXPECT_FALSE(readMessage(*client, buffer));
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(WebSocketServerTest, StopRejectsNewViewers) {
    server_->stop();
    EXPECT_FALSE(server_->isRunning());
}
