#pragma once

#include "RelayState.h"
#include "ViewerConnection.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

/**
 * ViewerRegistry - Tracks connected viewers and fans frames out to them
 *
 * The viewer set lives in RelayState. A viewer whose send throws is removed
 * on the spot; delivery to the remaining viewers continues.
 */
class ViewerRegistry {
public:
    // Invoked after a removal leaves the set empty
    using EmptyCallback = std::function<void()>;

    explicit ViewerRegistry(RelayState& state);

    // Returns the sequential identifier assigned to the viewer
    uint64_t registerViewer(const std::shared_ptr<ViewerConnection>& connection);

    // No-op for unknown or already removed connections
    void unregisterViewer(const ViewerConnection* connection);

    // Send a video frame to every open viewer
    void broadcast(const Frame& frame);

    // Send a text message (telemetry) to every open viewer
    void broadcastText(const std::string& text);

    // Close and forget every viewer
    void closeAll();

    size_t openCount() const;
    size_t size() const { return state_.viewers().size(); }

    void setEmptyCallback(EmptyCallback callback) { empty_callback_ = std::move(callback); }

    // Statistics
    uint64_t getFramesBroadcast() const { return frames_broadcast_; }
    uint64_t getSendFailures() const { return send_failures_; }

private:
    template <typename SendFn>
    void deliver(SendFn&& send);

    RelayState& state_;
    EmptyCallback empty_callback_;

    uint64_t frames_broadcast_ = 0;
    uint64_t send_failures_ = 0;
};
