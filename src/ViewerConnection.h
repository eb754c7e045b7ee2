#pragma once

#include "FrameChunker.h"
#include <string>

enum class ViewerState {
    OPEN,
    CLOSING,
    CLOSED
};

/**
 * A single connected real-time consumer (a WebSocket in production).
 * sendBinary()/sendText() throw std::runtime_error when the viewer can no
 * longer accept messages.
 */
class ViewerConnection {
public:
    virtual ~ViewerConnection() = default;

    virtual ViewerState state() const = 0;
    virtual void sendBinary(const Frame& frame) = 0;
    virtual void sendText(const std::string& text) = 0;
    virtual void close() = 0;
    virtual std::string remoteAddress() const = 0;
};
