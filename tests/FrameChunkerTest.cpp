/**
 * FrameChunker tests
 *
 * Covers fixed-size frame emission, carry-over of partial data across
 * blocks, byte-exact reassembly for arbitrary block sizes, recovery when the
 * frame callback throws, and constructor validation.
 */

#include "FrameChunker.h"
#include "TestSupport.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

class FrameChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        chunker_ = std::make_unique<FrameChunker>(21);
        chunker_->setFrameCallback([this](const Frame& frame) { frames_.push_back(frame); });
    }

    std::vector<uint8_t> collected() const {
        std::vector<uint8_t> bytes;
        for (const auto& frame : frames_) {
            bytes.insert(bytes.end(), frame->begin(), frame->end());
        }
        return bytes;
    }

    std::unique_ptr<FrameChunker> chunker_;
    std::vector<Frame> frames_;
};

TEST_F(FrameChunkerTest, ChunkSizeIsWholePackets) {
    EXPECT_EQ(chunker_->chunkSize(), 21u * 188u);
    EXPECT_EQ(chunker_->chunkSize(), 3948u);
}

TEST_F(FrameChunkerTest, EmitsOneFramePerFullChunk) {
    auto data = makeTsPackets(42);
    chunker_->push(data.data(), data.size());

    ASSERT_EQ(frames_.size(), 2u);
    EXPECT_EQ(frames_[0]->size(), 3948u);
    EXPECT_EQ(frames_[1]->size(), 3948u);
    EXPECT_EQ(chunker_->buffered(), 0u);
    EXPECT_EQ(chunker_->getFramesEmitted(), 2u);
}

TEST_F(FrameChunkerTest, HoldsPartialDataUntilComplete) {
    auto data = makeTsPackets(21);
    chunker_->push(data.data(), data.size());
    EXPECT_EQ(frames_.size(), 1u);

    chunker_->push(data.data(), 100);
    EXPECT_EQ(frames_.size(), 1u);
    EXPECT_EQ(chunker_->buffered(), 100u);
}

TEST_F(FrameChunkerTest, ExampleFromTwoBlocks) {
    // 5000 bytes then 3000 bytes: two frames, 104 bytes left over
    std::vector<uint8_t> first(5000, 0x47);
    std::vector<uint8_t> second(3000, 0x47);

    chunker_->push(first.data(), first.size());
    EXPECT_EQ(frames_.size(), 1u);
    EXPECT_EQ(chunker_->buffered(), 5000u - 3948u);

    chunker_->push(second.data(), second.size());
    EXPECT_EQ(frames_.size(), 2u);
    EXPECT_EQ(chunker_->buffered(), 104u);
}

TEST_F(FrameChunkerTest, ReassemblyIsByteExactForAnyBlockSizes) {
    std::vector<uint8_t> input(3948 * 7 + 517);
    for (size_t i = 0; i < input.size(); i++) {
        input[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }

    const size_t sizes[] = {1, 187, 188, 189, 3947, 3948, 3949, 5000, 13};
    size_t offset = 0;
    size_t pick = 0;
    while (offset < input.size()) {
        size_t size = std::min(sizes[pick++ % (sizeof(sizes) / sizeof(sizes[0]))], input.size() - offset);
        chunker_->push(input.data() + offset, size);
        offset += size;
    }

    ASSERT_EQ(frames_.size(), 7u);
    std::vector<uint8_t> output = collected();
    output.insert(output.end(), chunker_->remainder().begin(), chunker_->remainder().end());
    EXPECT_EQ(output, input);
    EXPECT_EQ(chunker_->buffered(), 517u);
    EXPECT_EQ(chunker_->getBytesReceived(), input.size());
}

TEST_F(FrameChunkerTest, EmptyPushIsIgnored) {
    chunker_->push(nullptr, 0);
    std::vector<uint8_t> none;
    chunker_->push(none.data(), 0);
    EXPECT_TRUE(frames_.empty());
    EXPECT_EQ(chunker_->getBytesReceived(), 0u);
}

TEST_F(FrameChunkerTest, CountsMisalignedFramesButStillDelivers) {
    std::vector<uint8_t> data(3948, 0x00);
    chunker_->push(data.data(), data.size());

    EXPECT_EQ(frames_.size(), 1u);
    EXPECT_EQ(chunker_->getMisalignedFrames(), 1u);
}

TEST_F(FrameChunkerTest, ThrowingCallbackResetsBufferAndIsAbsorbed) {
    int calls = 0;
    chunker_->setFrameCallback([&calls](const Frame&) {
        calls++;
        throw std::runtime_error("consumer failed");
    });

    auto data = makeTsPackets(50);
    EXPECT_NO_THROW(chunker_->push(data.data(), data.size()));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(chunker_->buffered(), 0u);
    EXPECT_EQ(chunker_->getResets(), 1u);

    // Keeps working afterwards
    chunker_->setFrameCallback([this](const Frame& frame) { frames_.push_back(frame); });
    chunker_->push(data.data(), 3948);
    EXPECT_EQ(frames_.size(), 1u);
}

TEST_F(FrameChunkerTest, ResetDropsPartialData) {
    auto data = makeTsPackets(3);
    chunker_->push(data.data(), data.size());
    EXPECT_EQ(chunker_->buffered(), 3u * 188u);

    chunker_->reset();
    EXPECT_EQ(chunker_->buffered(), 0u);

    auto full = makeTsPackets(21);
    chunker_->push(full.data(), full.size());
    ASSERT_EQ(frames_.size(), 1u);
    EXPECT_EQ((*frames_[0])[0], ts::SYNC_BYTE);
}

TEST(FrameChunkerConstruction, RejectsZeroPackets) {
    EXPECT_THROW(FrameChunker(0), std::invalid_argument);
}

TEST(FrameChunkerConstruction, RejectsOversizedChunks) {
    EXPECT_THROW(FrameChunker(400), std::invalid_argument);
    EXPECT_NO_THROW(FrameChunker(348));
}

TEST(FrameChunkerConstruction, CustomPacketCount) {
    FrameChunker chunker(7);
    EXPECT_EQ(chunker.chunkSize(), 7u * 188u);
}
