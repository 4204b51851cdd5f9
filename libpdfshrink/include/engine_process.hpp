/**
 * @file engine_process.hpp
 * @brief Runs the external document engine as a child process.
 */

#ifndef PDFSHRINK_ENGINE_PROCESS_HPP
#define PDFSHRINK_ENGINE_PROCESS_HPP

#include <functional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace pdfshrink {

/**
 * @brief Lifecycle of one engine run.
 *
 * Starting -> Running -> Succeeded | Failed, or Starting -> NotFound
 * (executable not on PATH) / Failed (any other spawn error).
 */
enum class EngineState {
    Starting,
    Running,
    Succeeded,
    Failed,
    NotFound
};

std::string_view engine_state_name(EngineState state) noexcept;

enum class OutputStream {
    Stdout,
    Stderr
};

/**
 * @brief One child process with captured stdout and stderr.
 *
 * The program is resolved through PATH (unless it contains a '/') and
 * receives its arguments as a discrete vector; no shell is involved, so
 * paths with spaces or shell metacharacters are passed through untouched.
 * The child's stdin is /dev/null.
 *
 * If the object is destroyed while the child is still running (e.g. an
 * output handler threw), the child is killed and reaped.
 */
class EngineProcess {
public:
    using OutputHandler = std::function<void(OutputStream, std::string_view)>;

    /**
     * @param program Executable name or path (argv[0]).
     * @param args Arguments following argv[0].
     */
    EngineProcess(std::string program, std::vector<std::string> args);
    ~EngineProcess();

    EngineProcess(const EngineProcess&) = delete;
    EngineProcess& operator=(const EngineProcess&) = delete;

    /**
     * @brief Spawn the child.
     * @throws ShrinkError EngineNotFound if the executable cannot be found,
     * EngineStartFailure for any other spawn error.
     */
    void start();

    /**
     * @brief Drain both output streams until EOF, then reap the child.
     *
     * Each chunk is passed to @p on_output as it arrives (may be empty).
     * Standard error is retained regardless and available through
     * stderr_text().
     *
     * @return Exit status, or 128 + signal number if the child was killed.
     */
    int wait(const OutputHandler& on_output);

    [[nodiscard]] EngineState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_text_; }
    [[nodiscard]] const std::string& program() const noexcept { return program_; }
    [[nodiscard]] const std::vector<std::string>& args() const noexcept { return args_; }

private:
    /// Owning file descriptor.
    class Fd {
    public:
        Fd() = default;
        explicit Fd(const int fd) : fd_(fd) {}
        ~Fd() { reset(); }
        Fd(Fd&& other) noexcept : fd_(other.release()) {}
        Fd& operator=(Fd&& other) noexcept {
            if (this != &other) reset(other.release());
            return *this;
        }
        Fd(const Fd&) = delete;
        Fd& operator=(const Fd&) = delete;

        [[nodiscard]] int get() const noexcept { return fd_; }
        [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
        int release() noexcept { const int fd = fd_; fd_ = -1; return fd; }
        void reset(int fd = -1) noexcept;

    private:
        int fd_ = -1;
    };

    [[noreturn]] void fail_to_start(int err);

    std::string program_;
    std::vector<std::string> args_;
    EngineState state_ = EngineState::Starting;
    pid_t pid_ = -1;
    Fd stdout_;
    Fd stderr_;
    std::string stderr_text_;
};

} // namespace pdfshrink

#endif // PDFSHRINK_ENGINE_PROCESS_HPP
