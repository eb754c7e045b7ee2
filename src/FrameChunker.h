#pragma once

#include <tsduck.h>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

// Immutable, shareable chunk of transport stream bytes
using Frame = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * FrameChunker - Repackages the transcoder's raw stdout into fixed-size frames
 *
 * Every emitted frame is exactly packets_per_chunk whole 188-byte TS packets.
 * Bytes that do not yet make a whole frame are retained and combined with the
 * next block. Purely push-driven: no timers, no I/O.
 *
 * If the frame callback throws, the accumulation buffer is reset and the
 * error is absorbed.
 */
class FrameChunker {
public:
    using FrameCallback = std::function<void(const Frame& frame)>;

    static constexpr size_t DEFAULT_PACKETS_PER_CHUNK = 21;  // 21 * 188 = 3948 bytes
    static constexpr size_t MAX_CHUNK_SIZE = 64 * 1024;

    explicit FrameChunker(size_t packets_per_chunk = DEFAULT_PACKETS_PER_CHUNK);

    void setFrameCallback(FrameCallback callback) { callback_ = std::move(callback); }

    // Append a block of transcoder output, emitting every complete frame
    void push(const uint8_t* data, size_t size);

    // Drop any buffered partial data
    void reset();

    size_t chunkSize() const { return chunk_size_; }
    size_t buffered() const { return buffer_.size(); }
    const std::vector<uint8_t>& remainder() const { return buffer_; }

    // Statistics
    uint64_t getFramesEmitted() const { return frames_emitted_; }
    uint64_t getBytesReceived() const { return bytes_received_; }
    uint64_t getResets() const { return resets_; }
    uint64_t getMisalignedFrames() const { return misaligned_frames_; }

private:
    size_t chunk_size_;
    std::vector<uint8_t> buffer_;
    FrameCallback callback_;

    uint64_t frames_emitted_ = 0;
    uint64_t bytes_received_ = 0;
    uint64_t resets_ = 0;
    uint64_t misaligned_frames_ = 0;
};
