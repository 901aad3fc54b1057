// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace workhooks
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    bool process_group = false;
    int exit_code = -1;
    int term_signal = 0; // non-zero when the child died from a signal
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int error_number = errno)
{
    return std::strerror(error_number);
}

static void set_fd_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
        throw std::runtime_error("fcntl F_GETFL failed: " + get_errno_message());
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw std::runtime_error("fcntl F_SETFL failed: " + get_errno_message());
}

// Both ends close-on-exec; dup2() onto 0/1/2 in the child clears the flag there.
static bool make_pipe(int fds[2])
{
    if (pipe(fds) != 0)
        return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

static void close_pipe(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

// Child side: report errno to the parent through the status pipe and exit
[[noreturn]] static void child_fail(int status_fd)
{
    int error_number = errno;
    ssize_t ignored = ::write(status_fd, &error_number, sizeof(error_number));
    (void)ignored;
    _exit(127);
}

static void record_status(ProcessHandle& handle, int status)
{
    if (WIFEXITED(status))
    {
        handle.exit_code = WEXITSTATUS(status);
        handle.term_signal = 0;
    }
    else if (WIFSIGNALED(status))
    {
        handle.term_signal = WTERMSIG(status);
        handle.exit_code = 128 + handle.term_signal;
    }
    else
    {
        handle.exit_code = -1;
    }
    handle.running = false;
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // No data available (non-blocking)
        throw std::runtime_error("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

int ReadPipe::native_handle() const
{
    return handle_ ? handle_->fd : -1;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    // SIGPIPE is blocked for this thread during the write; a reader that went away shows up as
    // EPIPE and the pending signal is consumed before the old mask comes back
    sigset_t pipe_set;
    sigset_t old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    sigset_t pending;
    sigpending(&pending);
    const bool already_pending = sigismember(&pending, SIGPIPE) == 1;
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    ssize_t bytes_written;
    do
    {
        bytes_written = ::write(handle_->fd, data, size);
    } while (bytes_written < 0 && errno == EINTR);
    const int write_errno = errno;

    if (bytes_written < 0 && write_errno == EPIPE && !already_pending)
    {
        const struct timespec no_wait = {0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &no_wait) < 0 && errno == EINTR)
        {
        }
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);

    if (bytes_written < 0)
    {
        if (write_errno == EAGAIN || write_errno == EWOULDBLOCK)
            return 0;
        if (write_errno == EPIPE)
            throw std::runtime_error("Broken pipe (process closed stdin)");
        throw std::runtime_error("Write failed: " + get_errno_message(write_errno));
    }

    return static_cast<size_t>(bytes_written);
}

void WritePipe::set_nonblocking()
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");
    set_fd_nonblocking(handle_->fd);
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    // Never leave a child (or its group) behind
    if (handle_ && handle_->pid > 0 && handle_->running)
    {
        send_signal(SIGKILL);
        int status;
        while (waitpid(handle_->pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        handle_->running = false;
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto cleanup = [&]()
    {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
    };

    if (options.redirect_stdin && !make_pipe(stdin_pipe))
    {
        cleanup();
        throw std::runtime_error("Failed to create stdin pipe: " + get_errno_message());
    }
    if (options.redirect_stdout && !make_pipe(stdout_pipe))
    {
        cleanup();
        throw std::runtime_error("Failed to create stdout pipe: " + get_errno_message());
    }
    if (options.redirect_stderr && !make_pipe(stderr_pipe))
    {
        cleanup();
        throw std::runtime_error("Failed to create stderr pipe: " + get_errno_message());
    }
    if (!make_pipe(status_pipe))
    {
        cleanup();
        throw std::runtime_error("Failed to create status pipe: " + get_errno_message());
    }

    // Build argv before forking
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int error_number = errno;
        cleanup();
        throw std::runtime_error("Failed to fork process: " + get_errno_message(error_number));
    }

    if (pid == 0)
    {
        // Child process
        ::close(status_pipe[0]);

        if (options.new_process_group)
            setpgid(0, 0);

        // The parent may ignore SIGPIPE; hooks get the default disposition
        signal(SIGPIPE, SIG_DFL);

        if (options.redirect_stdin && dup2(stdin_pipe[0], STDIN_FILENO) < 0)
            child_fail(status_pipe[1]);
        if (options.redirect_stdout && dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
            child_fail(status_pipe[1]);
        if (options.redirect_stderr && dup2(stderr_pipe[1], STDERR_FILENO) < 0)
            child_fail(status_pipe[1]);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail(status_pipe[1]);

        if (!options.inherit_environment)
        {
#if defined(__linux__)
            clearenv();
#else
            if (environ)
                environ[0] = nullptr;
#endif
        }
        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        execvp(executable.c_str(), argv.data());

        // If execvp returns, it failed
        child_fail(status_pipe[1]);
    }

    // Parent process
    if (options.new_process_group)
        setpgid(pid, pid); // Also done by the child; whichever runs first wins

    ::close(status_pipe[1]);
    status_pipe[1] = -1;

    // Blocks until exec succeeds (EOF via close-on-exec) or the child reports errno
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_pipe(status_pipe);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        cleanup();
        throw SpawnError("Failed to execute '" + executable + "': " +
                             get_errno_message(child_errno),
                         child_errno);
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]);
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->process_group = options.new_process_group;
    handle_->exit_code = -1;
    handle_->term_signal = 0;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        record_status(*handle_, status);
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        record_status(*handle_, status);
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::send_signal(int sig)
{
    if (!handle_ || handle_->pid <= 0 || !handle_->running)
        return;

    // Negative pid addresses the whole group (grandchildren included)
    if (handle_->process_group && ::kill(-handle_->pid, sig) == 0)
        return;
    ::kill(handle_->pid, sig);
}

void Process::terminate()
{
    send_signal(SIGTERM);
}

void Process::kill()
{
    send_signal(SIGKILL);
}

bool Process::signaled() const
{
    return handle_ && handle_->term_signal != 0;
}

int Process::term_signal() const
{
    return handle_ ? handle_->term_signal : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::vector<bool> poll_readable(const std::vector<ReadPipe*>& pipes, int timeout_ms)
{
    std::vector<pollfd> fds;
    fds.reserve(pipes.size());
    for (ReadPipe* pipe : pipes)
    {
        pollfd entry{};
        entry.fd = (pipe && pipe->is_open()) ? pipe->native_handle() : -1; // -1 is ignored
        entry.events = POLLIN;
        fds.push_back(entry);
    }

    std::vector<bool> ready(pipes.size(), false);
    int result = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return ready;
        throw std::runtime_error("poll failed: " + get_errno_message());
    }

    for (size_t i = 0; i < fds.size(); ++i)
        ready[i] = fds[i].fd >= 0 && (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0;
    return ready;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& candidate)
    {
        std::error_code ec;
        return fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0;
    };

    // Absolute path: check it directly
    fs::path exe_path(name);
    if (exe_path.is_absolute())
        return is_executable(exe_path) ? std::optional<std::string>(name) : std::nullopt;

    // Contains a path separator: relative to the current directory
    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    // Split PATH by colon
    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace workhooks
