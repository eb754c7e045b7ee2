/**
 * RecordingSink tests
 *
 * Covers recording preconditions (live stream required, one session at a
 * time), recorder arguments, frame tee-ing, graceful stop that replies once
 * the recorder exits, forced stop after the timeout, quiet self-healing
 * when the recorder stops accepting input, and the optional raw TS copy.
 */

#include "MediaStorage.h"
#include "RecordingSink.h"
#include "RelayState.h"
#include "TestSupport.h"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

class RecordingSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_unique<MediaStorage>(temp_.path());
        storage_->initialize();
        settings_.stop_timeout_ms = 30;
        sink_ = std::make_unique<RecordingSink>(io_, launcher_, state_, *storage_, settings_);
        frame_ = std::make_shared<const std::vector<uint8_t>>(makeTsPackets(21));
    }

    // Pretend the transcoder is up
    void activateStream() {
        ProcessSpec spec;
        spec.name = "Transcoder";
        state_.stream().process = std::make_shared<FakeChildProcess>(1, spec, ProcessEvents{});
        state_.stream().status = SessionStatus::ACTIVE;
        state_.stream().desired_active = true;
    }

    std::shared_ptr<FakeChildProcess> recorder() const { return launcher_.lastNamed("Recorder"); }

    TempDir temp_;
    boost::asio::io_context io_;
    FakeProcessLauncher launcher_;
    RelayState state_;
    RecordingSettings settings_;
    std::unique_ptr<MediaStorage> storage_;
    std::unique_ptr<RecordingSink> sink_;
    Frame frame_;
};

TEST_F(RecordingSinkTest, RequiresActiveStream) {
    RecordingResult result = sink_->startRecording();

    EXPECT_EQ(result.error, RecordingError::STREAM_NOT_ACTIVE);
    EXPECT_EQ(result.message, "Stream not active");
    EXPECT_TRUE(launcher_.launched.empty());
    EXPECT_FALSE(sink_->isActive());
}

TEST_F(RecordingSinkTest, StartLaunchesRecorderWithFastStartMp4) {
    activateStream();
    RecordingResult result = sink_->startRecording();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.file_name.rfind("video_", 0), 0u);
    EXPECT_NE(result.file_name.find(".mp4"), std::string::npos);
    EXPECT_TRUE(sink_->isActive());
    EXPECT_EQ(state_.recording().file_name, result.file_name);

    auto process = recorder();
    ASSERT_TRUE(process);
    EXPECT_TRUE(process->spec.pipe_stdin);
    const auto& args = process->spec.argv;
    EXPECT_NE(std::find(args.begin(), args.end(), "+faststart"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "copy"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "pipe:0"), args.end());
    EXPECT_EQ(args.back(), storage_->recordingsDir() + "/" + result.file_name);
}

TEST_F(RecordingSinkTest, SecondStartIsRejected) {
    activateStream();
    ASSERT_TRUE(sink_->startRecording().ok());

    RecordingResult second = sink_->startRecording();
    EXPECT_EQ(second.error, RecordingError::ALREADY_ACTIVE);
    EXPECT_EQ(second.message, "Recording already in progress");
    EXPECT_EQ(launcher_.launched.size(), 1u);
}

TEST_F(RecordingSinkTest, LaunchFailureIsReported) {
    activateStream();
    launcher_.fail_launches = true;

    RecordingResult result = sink_->startRecording();
    EXPECT_EQ(result.error, RecordingError::LAUNCH_FAILED);
    EXPECT_FALSE(sink_->isActive());
}

TEST_F(RecordingSinkTest, FramesAreTeedIntoRecorder) {
    activateStream();
    ASSERT_TRUE(sink_->startRecording().ok());

    for (int i = 0; i < 10; i++) {
        sink_->write(frame_);
    }

    EXPECT_EQ(recorder()->written.size(), 10u);
    EXPECT_EQ(sink_->getFramesWritten(), 10u);
}

TEST_F(RecordingSinkTest, WriteWithoutRecordingIsNoop) {
    EXPECT_NO_THROW(sink_->write(frame_));
    EXPECT_EQ(sink_->getFramesWritten(), 0u);
}

TEST_F(RecordingSinkTest, StopRepliesOnceRecorderExits) {
    activateStream();
    RecordingResult started = sink_->startRecording();
    ASSERT_TRUE(started.ok());
    auto process = recorder();

    for (int i = 0; i < 10; i++) {
        sink_->write(frame_);
        EXPECT_EQ(state_.recording().file_name, started.file_name);
    }
    EXPECT_EQ(process->written.size(), 10u);

    std::optional<RecordingResult> stopped;
    sink_->stopRecording([&stopped](const RecordingResult& result) { stopped = result; });

    EXPECT_TRUE(process->input_closed);
    EXPECT_FALSE(sink_->isActive());
    EXPECT_TRUE(sink_->isFinalizing());
    EXPECT_FALSE(stopped.has_value());
    EXPECT_EQ(sink_->getLastFileName(), started.file_name);

    // Closed input takes no more frames
    sink_->write(frame_);
    EXPECT_EQ(process->written.size(), 10u);

    process->exit(0);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_TRUE(stopped->ok());
    EXPECT_EQ(stopped->file_name, started.file_name);
    EXPECT_EQ(stopped->message, "Recording saved");
    EXPECT_FALSE(sink_->isFinalizing());
    EXPECT_EQ(sink_->getLastFileName(), started.file_name);
}

TEST_F(RecordingSinkTest, StopWithoutRecordingReportsNotActive) {
    std::optional<RecordingResult> stopped;
    sink_->stopRecording([&stopped](const RecordingResult& result) { stopped = result; });

    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->error, RecordingError::NOT_ACTIVE);
    EXPECT_EQ(stopped->message, "No active recording");
}

TEST_F(RecordingSinkTest, StartWhileFinalizingIsRejected) {
    activateStream();
    ASSERT_TRUE(sink_->startRecording().ok());
    sink_->stopRecording(nullptr);

    RecordingResult result = sink_->startRecording();
    EXPECT_EQ(result.error, RecordingError::ALREADY_ACTIVE);
    EXPECT_EQ(result.message, "Previous recording still finalizing");
}

TEST_F(RecordingSinkTest, StuckRecorderIsKilledAfterTimeout) {
    activateStream();
    ASSERT_TRUE(sink_->startRecording().ok());
    auto process = recorder();

    std::optional<RecordingResult> stopped;
    sink_->stopRecording([&stopped](const RecordingResult& result) { stopped = result; });

    ASSERT_TRUE(runUntil(io_, [&stopped]() { return stopped.has_value(); }));
    EXPECT_EQ(process->kill_calls, 1);
    EXPECT_EQ(stopped->message, "Recording force-stopped after timeout");

    // The late exit must not produce a second reply
    process->exit(0, 9);
    EXPECT_EQ(stopped->message, "Recording force-stopped after timeout");
}

TEST_F(RecordingSinkTest, WriteFailureEndsSessionQuietly) {
    activateStream();
    ASSERT_TRUE(sink_->startRecording().ok());
    auto process = recorder();
    process->fail_writes = true;

    EXPECT_NO_THROW(sink_->write(frame_));
    EXPECT_FALSE(sink_->isActive());
    EXPECT_EQ(sink_->getFramesFailed(), 1u);
    EXPECT_EQ(state_.recording().last_error, "recorder input closed");

    // Further frames are simply not recorded
    EXPECT_NO_THROW(sink_->write(frame_));
    EXPECT_EQ(sink_->getFramesFailed(), 1u);
}

TEST_F(RecordingSinkTest, InputErrorEndsSession) {
    activateStream();
    ASSERT_TRUE(sink_->startRecording().ok());

    recorder()->emitInputError("Broken pipe");
    EXPECT_FALSE(sink_->isActive());
    EXPECT_NE(state_.recording().last_error.find("Broken pipe"), std::string::npos);
}

TEST_F(RecordingSinkTest, UnexpectedRecorderExitClearsSession) {
    activateStream();
    ASSERT_TRUE(sink_->startRecording().ok());

    recorder()->exit(1);
    EXPECT_FALSE(sink_->isActive());
    EXPECT_FALSE(sink_->isFinalizing());
    EXPECT_EQ(state_.recording().last_error, "recorder exited with code 1");

    std::optional<RecordingResult> stopped;
    sink_->stopRecording([&stopped](const RecordingResult& result) { stopped = result; });
    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->error, RecordingError::NOT_ACTIVE);
}

TEST_F(RecordingSinkTest, ForceStopWithoutRecordingIsHarmless) {
    EXPECT_NO_THROW(sink_->forceStop());
    EXPECT_FALSE(sink_->isActive());
}

TEST(RecordingArgumentsTest, ReencodeUsesLibx264) {
    RecordingSettings settings;
    settings.reencode = true;
    auto args = RecordingSink::buildArguments(settings, "/tmp/out.mp4");

    EXPECT_NE(std::find(args.begin(), args.end(), "libx264"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "copy"), args.end());
    EXPECT_EQ(args.back(), "/tmp/out.mp4");
    EXPECT_NE(std::find(args.begin(), args.end(), "-n"), args.end());
}

// =============================================================================
// Raw TS copy
// =============================================================================

class RecordingSinkTsCopyTest : public RecordingSinkTest {
protected:
    void SetUp() override {
        RecordingSinkTest::SetUp();
        settings_.save_ts = true;
        sink_ = std::make_unique<RecordingSink>(io_, launcher_, state_, *storage_, settings_);
    }

    static size_t fileSize(const std::string& path) {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : static_cast<size_t>(size);
    }
};

TEST_F(RecordingSinkTsCopyTest, FramesAreSavedBesideMp4) {
    activateStream();
    RecordingResult started = sink_->startRecording();
    ASSERT_TRUE(started.ok());
    ASSERT_TRUE(sink_->isSavingTs());

    std::string ts_path = sink_->getLastTsPath();
    EXPECT_EQ(std::filesystem::path(ts_path).stem().string(),
              std::filesystem::path(started.file_name).stem().string());
    EXPECT_EQ(std::filesystem::path(ts_path).extension().string(), ".ts");

    for (int i = 0; i < 3; i++) {
        sink_->write(frame_);
    }
    sink_->stopRecording(nullptr);
    EXPECT_FALSE(sink_->isSavingTs());

    EXPECT_EQ(fileSize(ts_path), 3u * frame_->size());
    std::ifstream in(ts_path, std::ios::binary);
    EXPECT_EQ(in.get(), 0x47);
}

TEST_F(RecordingSinkTsCopyTest, DisabledByDefault) {
    RecordingSettings defaults;
    EXPECT_FALSE(defaults.save_ts);
}
