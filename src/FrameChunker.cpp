#include "FrameChunker.h"
#include <iostream>
#include <stdexcept>
#include <string>

FrameChunker::FrameChunker(size_t packets_per_chunk)
    : chunk_size_(packets_per_chunk * ts::PKT_SIZE) {
    if (packets_per_chunk == 0) {
        throw std::invalid_argument("packets_per_chunk must be at least 1");
    }
    if (chunk_size_ > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk size " + std::to_string(chunk_size_) +
                                    " exceeds " + std::to_string(MAX_CHUNK_SIZE) + " bytes");
    }
    buffer_.reserve(chunk_size_ * 2);
}

void FrameChunker::push(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }

    bytes_received_ += size;
    buffer_.insert(buffer_.end(), data, data + size);

    size_t consumed = 0;
    while (buffer_.size() - consumed >= chunk_size_) {
        const uint8_t* start = buffer_.data() + consumed;

        // A chunk that does not open on a sync byte means the transcoder output
        // lost alignment; it is still delivered, the decoder resyncs on its own
        if (start[0] != ts::SYNC_BYTE) {
            if (misaligned_frames_ % 100 == 0) {
                std::cerr << "[FrameChunker] Warning: frame does not start with sync byte (0x"
                          << std::hex << static_cast<int>(start[0]) << std::dec << "), "
                          << misaligned_frames_ + 1 << " misaligned so far" << std::endl;
            }
            misaligned_frames_++;
        }

        auto frame = std::make_shared<const std::vector<uint8_t>>(start, start + chunk_size_);
        consumed += chunk_size_;
        frames_emitted_++;

        if (!callback_) {
            continue;
        }

        try {
            callback_(frame);
        } catch (const std::exception& e) {
            std::cerr << "[FrameChunker] Error processing video chunk: " << e.what()
                      << " - resetting stream buffer" << std::endl;
            reset();
            return;
        }
    }

    if (consumed > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
    }
}

void FrameChunker::reset() {
    if (!buffer_.empty()) {
        resets_++;
    }
    buffer_.clear();
}
