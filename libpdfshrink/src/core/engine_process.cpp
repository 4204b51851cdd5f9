#include "../../include/engine_process.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace pdfshrink {

namespace {

constexpr std::size_t kReadChunk = 4096;

// posix_spawn_file_actions_t with scope-bound destruction
struct SpawnActions {
    posix_spawn_file_actions_t value{};
    SpawnActions() { posix_spawn_file_actions_init(&value); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&value); }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;
};

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::string_view engine_state_name(const EngineState state) noexcept {
    switch (state) {
        case EngineState::Starting:  return "Starting";
        case EngineState::Running:   return "Running";
        case EngineState::Succeeded: return "Succeeded";
        case EngineState::Failed:    return "Failed";
        case EngineState::NotFound:  return "NotFound";
    }
    return "";
}

void EngineProcess::Fd::reset(const int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

EngineProcess::EngineProcess(std::string program, std::vector<std::string> args)
    : program_(std::move(program)), args_(std::move(args)) {}

EngineProcess::~EngineProcess() {
    if (pid_ > 0) {
        Logger::log(LogLevel::Warning, "Killing unfinished engine process " + std::to_string(pid_), "engine");
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

void EngineProcess::fail_to_start(const int err) {
    if (err == ENOENT || err == ENOTDIR) {
        state_ = EngineState::NotFound;
        Logger::log(LogLevel::Error, "Engine executable not found: " + program_, "engine");
        throw ShrinkError(ErrorKind::EngineNotFound,
                          "Ghostscript (" + program_ + ") executable not found. "
                          "Please make sure Ghostscript is installed on your system.");
    }
    state_ = EngineState::Failed;
    Logger::log(LogLevel::Error, "Cannot start " + program_ + ": " + std::strerror(err), "engine");
    throw ShrinkError(ErrorKind::EngineStartFailure,
                      "Failed to start Ghostscript process: " + std::string(std::strerror(err)));
}

void EngineProcess::start() {
    if (state_ != EngineState::Starting) {
        throw std::logic_error("EngineProcess::start called more than once");
    }

    std::array<int, 2> out_pipe{};
    std::array<int, 2> err_pipe{};
    if (::pipe2(out_pipe.data(), O_CLOEXEC) != 0) {
        fail_to_start(errno);
    }
    Fd out_read(out_pipe[0]);
    Fd out_write(out_pipe[1]);
    if (::pipe2(err_pipe.data(), O_CLOEXEC) != 0) {
        fail_to_start(errno);
    }
    Fd err_read(err_pipe[0]);
    Fd err_write(err_pipe[1]);

    SpawnActions actions;
    if (const int err = posix_spawn_file_actions_addopen(&actions.value, STDIN_FILENO, "/dev/null", O_RDONLY, 0)) {
        fail_to_start(err);
    }
    if (const int err = posix_spawn_file_actions_adddup2(&actions.value, out_write.get(), STDOUT_FILENO)) {
        fail_to_start(err);
    }
    if (const int err = posix_spawn_file_actions_adddup2(&actions.value, err_write.get(), STDERR_FILENO)) {
        fail_to_start(err);
    }

    std::vector<char*> argv;
    argv.reserve(args_.size() + 2);
    argv.push_back(program_.data());
    for (auto& arg : args_) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, program_.c_str(), &actions.value, nullptr, argv.data(), environ);

    // the child holds its own copies of the write ends
    out_write.reset();
    err_write.reset();

    if (rc != 0) {
        fail_to_start(rc);
    }

    pid_ = pid;
    stdout_ = std::move(out_read);
    stderr_ = std::move(err_read);
    state_ = EngineState::Running;
    Logger::log(LogLevel::Debug, "Started " + program_ + " (pid " + std::to_string(pid_) + ")", "engine");
}

int EngineProcess::wait(const OutputHandler& on_output) {
    if (state_ != EngineState::Running) {
        throw std::logic_error("EngineProcess::wait called on a process that is not running");
    }

    std::array<char, kReadChunk> buffer{};

    while (stdout_.valid() || stderr_.valid()) {
        std::array<pollfd, 2> fds{};
        std::array<OutputStream, 2> streams{};
        nfds_t count = 0;
        if (stdout_.valid()) {
            fds[count] = {stdout_.get(), POLLIN, 0};
            streams[count++] = OutputStream::Stdout;
        }
        if (stderr_.valid()) {
            fds[count] = {stderr_.get(), POLLIN, 0};
            streams[count++] = OutputStream::Stderr;
        }

        if (::poll(fds.data(), count, -1) < 0) {
            if (errno == EINTR) continue;
            Logger::log(LogLevel::Error, std::string("poll failed: ") + std::strerror(errno), "engine");
            stdout_.reset();
            stderr_.reset();
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            Fd& fd = streams[i] == OutputStream::Stdout ? stdout_ : stderr_;
            const ssize_t got = ::read(fd.get(), buffer.data(), buffer.size());
            if (got > 0) {
                const std::string_view chunk(buffer.data(), static_cast<std::size_t>(got));
                if (streams[i] == OutputStream::Stderr) {
                    stderr_text_.append(chunk);
                }
                if (on_output) {
                    on_output(streams[i], chunk);
                }
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                fd.reset();
            }
        }
    }

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            const int err = errno;
            pid_ = -1;
            state_ = EngineState::Failed;
            Logger::log(LogLevel::Error, std::string("waitpid failed: ") + std::strerror(err), "engine");
            throw EngineFailureError(-1, stderr_text_);
        }
    }
    pid_ = -1;

    const int exit_code = decode_status(status);
    state_ = exit_code == 0 ? EngineState::Succeeded : EngineState::Failed;
    Logger::log(LogLevel::Debug, program_ + " exited with code " + std::to_string(exit_code), "engine");
    return exit_code;
}

} // namespace pdfshrink
