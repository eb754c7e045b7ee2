#include "PosixProcessLauncher.h"
#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <algorithm>
#include <iostream>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <errno.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void closePipe(int (&fds)[2]) {
    closeFd(fds[0]);
    closeFd(fds[1]);
}

}  // namespace

PosixChildProcess::PosixChildProcess(boost::asio::io_context& io, const std::string& name,
                                     pid_t pid, ProcessEvents events)
    : name_(name),
      pid_(pid),
      running_(true),
      events_(std::move(events)),
      stdin_(io),
      stdout_(io),
      stderr_(io),
      writing_(false),
      input_closing_(false) {
}

PosixChildProcess::~PosixChildProcess() {
    boost::system::error_code ec;
    stdin_.close(ec);
    stdout_.close(ec);
    stderr_.close(ec);
}

void PosixChildProcess::attachPipes(int stdin_fd, int stdout_fd, int stderr_fd) {
    if (stdin_fd >= 0) {
        stdin_.assign(stdin_fd);
    }
    if (stdout_fd >= 0) {
        stdout_.assign(stdout_fd);
        readStdout();
    }
    if (stderr_fd >= 0) {
        stderr_.assign(stderr_fd);
        readStderr();
    }
}

void PosixChildProcess::readStdout() {
    auto self = shared_from_this();
    stdout_.async_read_some(
        boost::asio::buffer(stdout_buffer_),
        [this, self](const boost::system::error_code& ec, size_t bytes) {
            if (ec || !running_) {
                return;
            }
            if (events_.on_stdout) {
                try {
                    events_.on_stdout(stdout_buffer_.data(), bytes);
                } catch (const std::exception& e) {
                    std::cerr << "[" << name_ << "] stdout handler error: " << e.what() << std::endl;
                }
            }
            readStdout();
        });
}

void PosixChildProcess::readStderr() {
    auto self = shared_from_this();
    stderr_.async_read_some(
        boost::asio::buffer(stderr_buffer_),
        [this, self](const boost::system::error_code& ec, size_t bytes) {
            // After exit the remaining bytes are drained by markExited()
            if (ec || !running_) {
                return;
            }
            handleStderrData(bytes);
            readStderr();
        });
}

void PosixChildProcess::handleStderrData(size_t bytes) {
    stderr_line_buffer_.append(stderr_buffer_.data(), bytes);

    // Process complete lines
    size_t pos;
    while ((pos = stderr_line_buffer_.find('\n')) != std::string::npos) {
        std::string line = stderr_line_buffer_.substr(0, pos);
        stderr_line_buffer_.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || !events_.on_stderr_line) {
            continue;
        }
        try {
            events_.on_stderr_line(line);
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] stderr handler error: " << e.what() << std::endl;
        }
    }
}

bool PosixChildProcess::writeInput(const Frame& frame) {
    if (!frame || !running_ || input_closing_ || !stdin_.is_open()) {
        return false;
    }

    input_queue_.push_back(frame);
    if (!writing_) {
        writeNext();
    }
    return true;
}

void PosixChildProcess::writeNext() {
    if (input_queue_.empty()) {
        writing_ = false;
        if (input_closing_) {
            closeInputNow();
        }
        return;
    }

    writing_ = true;
    auto self = shared_from_this();
    const Frame& frame = input_queue_.front();
    boost::asio::async_write(
        stdin_, boost::asio::buffer(frame->data(), frame->size()),
        [this, self](const boost::system::error_code& ec, size_t /*bytes*/) {
            if (ec) {
                writing_ = false;
                input_queue_.clear();
                closeInputNow();
                if (ec != boost::asio::error::operation_aborted && events_.on_input_error) {
                    try {
                        events_.on_input_error(ec.message());
                    } catch (const std::exception& e) {
                        std::cerr << "[" << name_ << "] input error handler error: " << e.what() << std::endl;
                    }
                }
                return;
            }
            input_queue_.pop_front();
            writeNext();
        });
}

void PosixChildProcess::closeInput() {
    input_closing_ = true;
    if (!writing_) {
        closeInputNow();
    }
}

void PosixChildProcess::closeInputNow() {
    input_closing_ = true;
    if (stdin_.is_open()) {
        boost::system::error_code ec;
        stdin_.close(ec);
    }
}

void PosixChildProcess::terminate() {
    if (running_) {
        std::cout << "[" << name_ << "] Sending SIGTERM (PID: " << pid_ << ")" << std::endl;
        ::kill(pid_, SIGTERM);
    }
}

void PosixChildProcess::kill() {
    if (running_) {
        std::cout << "[" << name_ << "] Sending SIGKILL (PID: " << pid_ << ")" << std::endl;
        ::kill(pid_, SIGKILL);
    }
}

void PosixChildProcess::markExited(int exit_code, int signal) {
    running_ = false;

    // Pick up diagnostics the child wrote just before exiting
    if (stderr_.is_open()) {
        boost::system::error_code ec;
        stderr_.non_blocking(true, ec);
        std::array<char, 4096> drain;
        while (!ec) {
            size_t bytes = stderr_.read_some(boost::asio::buffer(drain), ec);
            if (ec || bytes == 0) {
                break;
            }
            std::copy(drain.begin(), drain.begin() + bytes, stderr_buffer_.begin());
            handleStderrData(bytes);
        }
        if (!stderr_line_buffer_.empty() && events_.on_stderr_line) {
            std::string tail;
            tail.swap(stderr_line_buffer_);
            try {
                events_.on_stderr_line(tail);
            } catch (const std::exception& e) {
                std::cerr << "[" << name_ << "] stderr handler error: " << e.what() << std::endl;
            }
        }
    }

    boost::system::error_code ignored;
    input_queue_.clear();
    closeInputNow();
    stdout_.close(ignored);
    stderr_.close(ignored);

    if (events_.on_exit) {
        try {
            events_.on_exit(exit_code, signal);
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] exit handler error: " << e.what() << std::endl;
        }
    }
}

PosixProcessLauncher::PosixProcessLauncher(boost::asio::io_context& io)
    : io_(io),
      sigchld_(io, SIGCHLD) {
    waitForChildSignal();
}

PosixProcessLauncher::~PosixProcessLauncher() {
    boost::system::error_code ec;
    sigchld_.cancel(ec);
}

std::shared_ptr<ChildProcess> PosixProcessLauncher::launch(const ProcessSpec& spec,
                                                           ProcessEvents events,
                                                           std::string& error) {
    if (spec.argv.empty()) {
        error = "empty argument list";
        return nullptr;
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    // Create pipes for stdin, stdout and stderr
    if ((spec.pipe_stdin && pipe2(stdin_pipe, O_CLOEXEC) < 0) ||
        (spec.pipe_stdout && pipe2(stdout_pipe, O_CLOEXEC) < 0) ||
        pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        error = std::string("failed to create pipe: ") + strerror(errno);
        closePipe(stdin_pipe);
        closePipe(stdout_pipe);
        closePipe(stderr_pipe);
        return nullptr;
    }

    int devnull = -1;
    if (!spec.pipe_stdin || !spec.pipe_stdout) {
        devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    }

    // Build argv before forking; the child must not allocate
    std::vector<char*> args;
    args.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) {
        max_fd = 1024;
    }

    pid_t pid = fork();

    if (pid < 0) {
        error = std::string("failed to fork: ") + strerror(errno);
        closePipe(stdin_pipe);
        closePipe(stdout_pipe);
        closePipe(stderr_pipe);
        closeFd(devnull);
        return nullptr;
    }

    if (pid == 0) {
        // Child process
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);

        dup2(spec.pipe_stdin ? stdin_pipe[0] : devnull, STDIN_FILENO);
        dup2(spec.pipe_stdout ? stdout_pipe[1] : devnull, STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        // Asio sockets are not close-on-exec; keep listeners and viewer sockets out of the child
        for (long fd = STDERR_FILENO + 1; fd < max_fd; fd++) {
            ::close(static_cast<int>(fd));
        }

        execvp(args[0], args.data());

        // If we get here, exec failed
        const char* prefix = "exec failed: ";
        const char* reason = strerror(errno);
        ssize_t ignored = write(STDERR_FILENO, prefix, strlen(prefix));
        ignored = write(STDERR_FILENO, reason, strlen(reason));
        ignored = write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(127);
    }

    // Parent process: close the child's ends of the pipes
    closeFd(stdin_pipe[0]);
    closeFd(stdout_pipe[1]);
    closeFd(stderr_pipe[1]);
    closeFd(devnull);

    auto process = std::make_shared<PosixChildProcess>(io_, spec.name, pid, std::move(events));
    process->attachPipes(stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]);
    children_[pid] = process;

    std::cout << "[" << spec.name << "] Process started (PID: " << pid << ")" << std::endl;
    return process;
}

void PosixProcessLauncher::waitForChildSignal() {
    sigchld_.async_wait([this](const boost::system::error_code& ec, int /*signal*/) {
        if (ec) {
            return;
        }
        reapChildren();
        waitForChildSignal();
    });
}

void PosixProcessLauncher::reapChildren() {
    struct Reaped {
        pid_t pid;
        int exit_code;
        int signal;
        std::shared_ptr<PosixChildProcess> process;
    };
    std::vector<Reaped> reaped;

    // Only our own children are reaped, never unrelated ones
    for (auto it = children_.begin(); it != children_.end();) {
        int status = 0;
        pid_t result = waitpid(it->first, &status, WNOHANG);
        if (result == it->first || (result < 0 && errno == ECHILD)) {
            Reaped entry{it->first, -1, 0, it->second.lock()};
            if (result == it->first) {
                if (WIFEXITED(status)) {
                    entry.exit_code = WEXITSTATUS(status);
                } else if (WIFSIGNALED(status)) {
                    entry.signal = WTERMSIG(status);
                }
            }
            reaped.push_back(std::move(entry));
            it = children_.erase(it);
        } else {
            ++it;
        }
    }

    // Dispatch after the map is settled; exit handlers may launch again
    for (auto& entry : reaped) {
        if (entry.signal != 0) {
            std::cout << "[Process] PID " << entry.pid << " killed with signal " << entry.signal << std::endl;
        } else {
            std::cout << "[Process] PID " << entry.pid << " exited with code " << entry.exit_code << std::endl;
        }
        if (entry.process) {
            entry.process->markExited(entry.exit_code, entry.signal);
        }
    }
}
