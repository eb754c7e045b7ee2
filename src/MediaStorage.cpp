#include "MediaStorage.h"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

MediaStorage::MediaStorage(const std::string& root)
    : root_(root.empty() ? std::string(".") : root) {
}

void MediaStorage::initialize() {
    for (const std::string& dir : {root_, snapshotsDir(), recordingsDir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("cannot create directory " + dir + ": " + ec.message());
        }
        if (!fs::is_directory(dir, ec)) {
            throw std::runtime_error(dir + " exists but is not a directory");
        }
    }
    std::cout << "[MediaStorage] Media directory ready: " << root_ << std::endl;
}

std::string MediaStorage::snapshotsDir() const {
    return (fs::path(root_) / "snapshots").string();
}

std::string MediaStorage::recordingsDir() const {
    return (fs::path(root_) / "recordings").string();
}

std::string MediaStorage::currentSnapshotPath() const {
    return (fs::path(snapshotsDir()) / SNAPSHOT_FILE).string();
}

std::string MediaStorage::uniquePath(const std::string& dir, const std::string& stem, int64_t epoch_ms,
                                     const std::string& extension, std::string& file_name) const {
    std::string base = stem + "_" + std::to_string(epoch_ms);
    file_name = base + extension;

    std::error_code ec;
    for (int suffix = 1; fs::exists(fs::path(dir) / file_name, ec); suffix++) {
        file_name = base + "_" + std::to_string(suffix) + extension;
    }
    return (fs::path(dir) / file_name).string();
}

std::string MediaStorage::allocateRecordingPath(int64_t epoch_ms, std::string& file_name) const {
    return uniquePath(recordingsDir(), "video", epoch_ms, ".mp4", file_name);
}

bool MediaStorage::capturePhoto(int64_t epoch_ms, std::string& file_name, std::string& error) const {
    std::error_code ec;
    std::string source = currentSnapshotPath();
    if (!fs::exists(source, ec) || fs::file_size(source, ec) == 0) {
        error = "No snapshot available yet";
        return false;
    }

    std::string target = uniquePath(snapshotsDir(), "photo", epoch_ms, ".jpg", file_name);
    if (!fs::copy_file(source, target, fs::copy_options::none, ec)) {
        error = "Failed to copy snapshot: " + ec.message();
        return false;
    }

    std::cout << "[MediaStorage] Photo captured: " << file_name << std::endl;
    return true;
}
