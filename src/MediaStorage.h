#pragma once

#include <cstdint>
#include <string>

/**
 * MediaStorage - Layout of the media directory
 *
 *   <root>/snapshots/current.jpg       continuously overwritten by the transcoder
 *   <root>/snapshots/photo_<ms>.jpg    one per captured photo
 *   <root>/recordings/video_<ms>.mp4   one per recording session
 *
 * Generated file names are never reused; an existing file is never overwritten.
 */
class MediaStorage {
public:
    static constexpr const char* SNAPSHOT_FILE = "current.jpg";

    explicit MediaStorage(const std::string& root);

    // Create the directory tree. Throws std::runtime_error on failure.
    void initialize();

    const std::string& rootDir() const { return root_; }
    std::string snapshotsDir() const;
    std::string recordingsDir() const;
    std::string currentSnapshotPath() const;

    // Pick a fresh recording file. Returns the full path, file_name gets the base name.
    std::string allocateRecordingPath(int64_t epoch_ms, std::string& file_name) const;

    // Copy the current snapshot to a new photo file
    bool capturePhoto(int64_t epoch_ms, std::string& file_name, std::string& error) const;

private:
    std::string uniquePath(const std::string& dir, const std::string& stem, int64_t epoch_ms,
                           const std::string& extension, std::string& file_name) const;

    std::string root_;
};
