#ifndef WORKHOOKS_ERRORS_HPP
#define WORKHOOKS_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace workhooks
{

// Base exception
class WorkhooksError : public std::runtime_error
{
  public:
    explicit WorkhooksError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed or unreadable hook configuration. Disables hook execution for the run.
class ConfigurationError : public WorkhooksError
{
  public:
    explicit ConfigurationError(const std::string& message) : WorkhooksError(message) {}

    ConfigurationError(const std::string& message, std::vector<std::string> errors)
        : WorkhooksError(format(message, errors)), errors_(std::move(errors))
    {
    }

    const std::vector<std::string>& errors() const
    {
        return errors_;
    }

  private:
    static std::string format(const std::string& message, const std::vector<std::string>& errors)
    {
        std::string full = message;
        if (!errors.empty())
            full += ":";
        for (const auto& error : errors)
            full += "\n  - " + error;
        return full;
    }

    std::vector<std::string> errors_;
};

// Path traversal, escaping working directory or other disallowed action
class SecurityViolationError : public WorkhooksError
{
  public:
    explicit SecurityViolationError(const std::string& message) : WorkhooksError(message) {}
};

// Audit log could not be written or read
class AuditError : public WorkhooksError
{
  public:
    explicit AuditError(const std::string& message) : WorkhooksError(message) {}
};

// Work-item store failure (e.g. git command failed)
class StoreError : public WorkhooksError
{
  public:
    StoreError(const std::string& message, int exit_code)
        : WorkhooksError(message), exit_code_(exit_code)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// Document could not be parsed as a work item. Never escapes the snapshot parser.
class SnapshotParseError : public WorkhooksError
{
  public:
    explicit SnapshotParseError(const std::string& message) : WorkhooksError(message) {}
};

} // namespace workhooks

#endif // WORKHOOKS_ERRORS_HPP
