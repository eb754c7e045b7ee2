#pragma once

#include "FrameChunker.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * Description of an external process to launch.
 * argv[0] is resolved through PATH.
 */
struct ProcessSpec {
    std::string name;                 // Log tag, e.g. "Transcoder"
    std::vector<std::string> argv;
    bool pipe_stdin = false;          // Frames written through writeInput()
    bool pipe_stdout = false;         // Delivered through on_stdout
};

/**
 * Process event callbacks. Always invoked from the event loop, never from
 * inside launch(), terminate() or kill().
 */
struct ProcessEvents {
    std::function<void(const uint8_t* data, size_t size)> on_stdout;
    std::function<void(const std::string& line)> on_stderr_line;
    std::function<void(const std::string& error)> on_input_error;
    std::function<void(int exit_code, int signal)> on_exit;
};

class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual int pid() const = 0;
    virtual bool isRunning() const = 0;

    // Queue a frame for the child's stdin
    // Returns false if stdin is closed or was never piped
    virtual bool writeInput(const Frame& frame) = 0;

    // Signal end-of-input once queued frames are flushed
    virtual void closeInput() = 0;

    // SIGTERM
    virtual void terminate() = 0;

    // SIGKILL
    virtual void kill() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Returns nullptr and fills error if the process could not be started
    virtual std::shared_ptr<ChildProcess> launch(const ProcessSpec& spec,
                                                 ProcessEvents events,
                                                 std::string& error) = 0;
};
