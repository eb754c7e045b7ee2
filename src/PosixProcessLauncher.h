#pragma once

#include "ChildProcess.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <sys/types.h>
#include <array>
#include <deque>
#include <map>
#include <memory>
#include <string>

class PosixProcessLauncher;

/**
 * PosixChildProcess - fork/exec'd child with asynchronous pipe I/O
 *
 * stdout is read in blocks, stderr is split into lines, stdin is written
 * through a FIFO of frames so a slow reader never blocks the event loop.
 */
class PosixChildProcess : public ChildProcess,
                          public std::enable_shared_from_this<PosixChildProcess> {
public:
    PosixChildProcess(boost::asio::io_context& io, const std::string& name, pid_t pid,
                      ProcessEvents events);
    ~PosixChildProcess() override;

    int pid() const override { return pid_; }
    bool isRunning() const override { return running_; }
    bool writeInput(const Frame& frame) override;
    void closeInput() override;
    void terminate() override;
    void kill() override;

    size_t pendingInputFrames() const { return input_queue_.size(); }

private:
    friend class PosixProcessLauncher;

    void attachPipes(int stdin_fd, int stdout_fd, int stderr_fd);
    void readStdout();
    void readStderr();
    void writeNext();
    void closeInputNow();
    void handleStderrData(size_t bytes);

    // Called by the launcher once waitpid() reaped the child
    void markExited(int exit_code, int signal);

    std::string name_;
    pid_t pid_;
    bool running_;
    ProcessEvents events_;

    boost::asio::posix::stream_descriptor stdin_;
    boost::asio::posix::stream_descriptor stdout_;
    boost::asio::posix::stream_descriptor stderr_;

    std::array<uint8_t, 65536> stdout_buffer_;
    std::array<char, 4096> stderr_buffer_;
    std::string stderr_line_buffer_;

    std::deque<Frame> input_queue_;
    bool writing_;
    bool input_closing_;
};

/**
 * PosixProcessLauncher - Spawns children with fork/execvp and reaps them
 * through a SIGCHLD signal set on the event loop.
 */
class PosixProcessLauncher : public ProcessLauncher {
public:
    explicit PosixProcessLauncher(boost::asio::io_context& io);
    ~PosixProcessLauncher() override;

    PosixProcessLauncher(const PosixProcessLauncher&) = delete;
    PosixProcessLauncher& operator=(const PosixProcessLauncher&) = delete;

    std::shared_ptr<ChildProcess> launch(const ProcessSpec& spec, ProcessEvents events,
                                         std::string& error) override;

    // Number of launched children not yet reaped
    size_t liveChildren() const { return children_.size(); }

private:
    void waitForChildSignal();
    void reapChildren();

    boost::asio::io_context& io_;
    boost::asio::signal_set sigchld_;
    std::map<pid_t, std::weak_ptr<PosixChildProcess>> children_;
};
