#pragma once

#include "../src/internal/subprocess/process.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>
#include <workhooks/logging.hpp>
#include <workhooks/options.hpp>

namespace workhooks::test
{

namespace fs = std::filesystem;

inline bool is_git_available()
{
    return workhooks::subprocess::find_executable("git").has_value();
}

/// Blocking read of a child's pipe until EOF
inline std::string read_to_end(workhooks::subprocess::ReadPipe& pipe)
{
    std::string data;
    char buffer[4096];
    while (size_t n = pipe.read(buffer, sizeof(buffer)))
        data.append(buffer, n);
    return data;
}

/// Unique scratch directory, removed on destruction
class TempDir
{
  public:
    TempDir()
    {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("workhooks_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
        path_ = fs::canonical(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const
    {
        return path_;
    }

  private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Fixture with a project root holding .workhooks/hooks.yaml and .workhooks/hooks/
class ProjectTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        options_.project_root = temp_.path();
        fs::create_directories(hooks_dir());
    }

    fs::path root() const
    {
        return temp_.path();
    }

    fs::path hooks_dir() const
    {
        return options_.resolve(options_.hooks_dir);
    }

    fs::path hooks_config() const
    {
        return options_.resolve(options_.hooks_config);
    }

    fs::path audit_path() const
    {
        return options_.resolve(options_.audit_log);
    }

    void write_config(const std::string& yaml)
    {
        write_file(hooks_config(), yaml);
    }

    /// Executable shell script in the hooks directory
    fs::path write_script(const std::string& name, const std::string& body)
    {
        fs::path path = hooks_dir() / name;
        write_file(path, "#!/bin/sh\n" + body);
        fs::permissions(path,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                        fs::perm_options::replace);
        return path;
    }

    TempDir temp_;
    Options options_;
};

/// Builds the markdown document of one work item
class TaskDocument
{
  public:
    TaskDocument(std::string id, std::string title) : id_(std::move(id)), title_(std::move(title))
    {
    }

    TaskDocument& status(std::string value)
    {
        status_ = std::move(value);
        return *this;
    }

    TaskDocument& priority(std::string value)
    {
        priority_ = std::move(value);
        return *this;
    }

    TaskDocument& label(std::string value)
    {
        labels_.push_back(std::move(value));
        return *this;
    }

    TaskDocument& criterion(std::string text, bool checked = false)
    {
        criteria_.emplace_back(std::move(text), checked);
        return *this;
    }

    /// "backlog/tasks/<id> - <title>.md"
    std::string path(const std::string& dir = "backlog/tasks") const
    {
        return dir + "/" + id_ + " - " + title_ + ".md";
    }

    std::string content() const
    {
        std::string doc = "---\nid: " + id_ + "\ntitle: " + title_ + "\n";
        if (!status_.empty())
            doc += "status: " + status_ + "\n";
        if (!priority_.empty())
            doc += "priority: " + priority_ + "\n";
        if (!labels_.empty())
        {
            doc += "labels:\n";
            for (const auto& label : labels_)
                doc += "  - " + label + "\n";
        }
        doc += "---\n\n## Description\n\n" + title_ + "\n";
        if (!criteria_.empty())
        {
            doc += "\n## Acceptance Criteria\n<!-- AC:BEGIN -->\n";
            int index = 1;
            for (const auto& [text, checked] : criteria_)
                doc += std::string("- [") + (checked ? "x" : " ") + "] #" +
                       std::to_string(index++) + " " + text + "\n";
            doc += "<!-- AC:END -->\n";
        }
        return doc;
    }

  private:
    std::string id_;
    std::string title_;
    std::string status_ = "To Do";
    std::string priority_;
    std::vector<std::string> labels_;
    std::vector<std::pair<std::string, bool>> criteria_;
};

/// Routes the library logger into a ring buffer for the lifetime of the object
class LogCapture
{
  public:
    LogCapture() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256))
    {
        auto logger = std::make_shared<spdlog::logger>(log::LOGGER_NAME, sink_);
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("%l %v");
        previous_ = log::logger();
        log::set_logger(logger);
    }

    ~LogCapture()
    {
        log::set_logger(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::string> lines() const
    {
        return sink_->last_formatted();
    }

    bool contains(const std::string& needle) const
    {
        for (const auto& line : lines())
            if (line.find(needle) != std::string::npos)
                return true;
        return false;
    }

  private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> previous_;
};

} // namespace workhooks::test

#define SKIP_WITHOUT_GIT()                                                                         \
    do                                                                                             \
    {                                                                                              \
        if (!workhooks::test::is_git_available())                                                  \
        {                                                                                          \
            GTEST_SKIP() << "git executable not found in PATH";                                    \
        }                                                                                          \
    } while (0)
