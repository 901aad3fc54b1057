#ifndef WORKHOOKS_SUBPROCESS_PROCESS_HPP
#define WORKHOOKS_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace workhooks
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// exec() of the child failed (missing binary, permission denied, bad interpreter)
class SpawnError : public std::runtime_error
{
  public:
    SpawnError(const std::string& message, int error_number)
        : std::runtime_error(message), error_number_(error_number)
    {
    }

    int error_number() const
    {
        return error_number_;
    }

  private:
    int error_number_;
};

// Pipe for reading from subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes, returns actual bytes read
    // Returns 0 on EOF (or no data when non-blocking), throws on error
    size_t read(char* buffer, size_t size);

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

    int native_handle() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Pipe for writing to subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // No copy, move only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Write data to pipe. Returns 0 when non-blocking and the pipe is full.
    size_t write(const char* data, size_t size);

    // Switch to O_NONBLOCK so a child that never reads stdin cannot stall us
    void set_nonblocking();

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Process configuration
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true; // false: child starts from an empty environment
    bool new_process_group = false;  // child leads its own group; signals reach the group
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws SpawnError when exec fails in the child.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Get pipes (only valid if redirected)
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    // Process control
    std::optional<int> try_wait(); // Non-blocking wait, returns exit code if done
    int wait();                    // Blocking wait, returns exit code (128+N for signal N)
    void terminate();              // SIGTERM (to the group when new_process_group)
    void kill();                   // SIGKILL (to the group when new_process_group)

    // Exit details, valid once try_wait()/wait() reported completion
    bool signaled() const;
    int term_signal() const;

  private:
    void send_signal(int sig);

    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Wait until any of the open pipes is readable (or at EOF). Returns one flag per pipe.
std::vector<bool> poll_readable(const std::vector<ReadPipe*>& pipes, int timeout_ms);

// Helper function to find executable in PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace workhooks

#endif // WORKHOOKS_SUBPROCESS_PROCESS_HPP
