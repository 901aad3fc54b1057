#include "internal/subprocess/process.hpp"

#include <workhooks/errors.hpp>
#include <workhooks/logging.hpp>
#include <workhooks/store.hpp>

namespace workhooks
{

// ============================================================================
// MemoryStore
// ============================================================================

void MemoryStore::set_revision(const std::string& revision, std::vector<Document> documents,
                               const std::string& timestamp)
{
    revisions_[revision] = Revision{std::move(documents), timestamp};
}

void MemoryStore::put(const std::string& revision, const std::string& path,
                      const std::string& content)
{
    auto& documents = revisions_[revision].documents;
    for (auto& doc : documents)
    {
        if (doc.path == path)
        {
            doc.content = content;
            return;
        }
    }
    documents.push_back({path, content});
}

std::optional<std::string> MemoryStore::resolve(const std::string& revision)
{
    if (revisions_.count(revision) == 0)
        return std::nullopt;
    return revision;
}

std::vector<Document> MemoryStore::list_documents(const std::string& revision)
{
    auto it = revisions_.find(revision);
    return it == revisions_.end() ? std::vector<Document>{} : it->second.documents;
}

std::optional<std::string> MemoryStore::revision_timestamp(const std::string& revision)
{
    auto it = revisions_.find(revision);
    if (it == revisions_.end() || it->second.timestamp.empty())
        return std::nullopt;
    return it->second.timestamp;
}

// ============================================================================
// GitStore
// ============================================================================

GitStore::GitStore(std::filesystem::path repo_root, std::string tracked_dir, std::string git)
    : repo_root_(std::move(repo_root)), tracked_dir_(std::move(tracked_dir))
{
    auto found = subprocess::find_executable(git);
    if (!found)
        throw StoreError("git executable not found: " + git, 127);
    git_ = *found;

    while (!tracked_dir_.empty() && tracked_dir_.back() == '/')
        tracked_dir_.pop_back();
}

GitStore::GitResult GitStore::run_git(const std::vector<std::string>& args) const
{
    std::vector<std::string> full_args = {"-C", repo_root_.string()};
    full_args.insert(full_args.end(), args.begin(), args.end());

    subprocess::ProcessOptions options;
    options.redirect_stdin = false;
    options.redirect_stdout = true;
    options.redirect_stderr = true;
    options.environment["GIT_TERMINAL_PROMPT"] = "0";

    subprocess::Process process;
    try
    {
        process.spawn(git_, full_args, options);
    }
    catch (const std::runtime_error& e)
    {
        throw StoreError(std::string("failed to run git: ") + e.what(), 127);
    }

    // Drain both pipes together so a chatty stderr cannot stall stdout
    GitResult result;
    auto& out = process.stdout_pipe();
    auto& err = process.stderr_pipe();
    char buffer[8192];
    while (out.is_open() || err.is_open())
    {
        auto ready = subprocess::poll_readable({&out, &err}, 100);
        if (ready[0])
        {
            size_t n = out.read(buffer, sizeof(buffer));
            if (n == 0)
                out.close();
            else
                result.out.append(buffer, n);
        }
        if (ready[1])
        {
            size_t n = err.read(buffer, sizeof(buffer));
            if (n == 0)
                err.close();
            else
                result.err.append(buffer, n);
        }
    }

    result.exit_code = process.wait();
    return result;
}

std::string GitStore::git_or_throw(const std::vector<std::string>& args) const
{
    GitResult result = run_git(args);
    if (result.exit_code != 0)
    {
        std::string command = "git";
        for (const auto& arg : args)
            command += " " + arg;
        throw StoreError(command + " failed (exit " + std::to_string(result.exit_code) +
                             "): " + result.err,
                         result.exit_code);
    }
    return result.out;
}

std::optional<std::string> GitStore::resolve(const std::string& revision)
{
    GitResult result = run_git({"rev-parse", "--verify", "--quiet", revision + "^{commit}"});
    if (result.exit_code != 0)
        return std::nullopt;

    std::string sha = result.out;
    while (!sha.empty() && (sha.back() == '\n' || sha.back() == '\r'))
        sha.pop_back();
    return sha;
}

std::vector<Document> GitStore::list_documents(const std::string& revision)
{
    auto sha = resolve(revision);
    if (!sha)
    {
        log::logger()->debug("Revision '{}' does not exist, treating it as empty", revision);
        return {};
    }

    std::vector<std::string> args = {"ls-tree", "-r", "-z", "--name-only", *sha};
    if (!tracked_dir_.empty())
    {
        args.push_back("--");
        args.push_back(tracked_dir_);
    }
    std::string listing = git_or_throw(args);

    std::vector<Document> documents;
    size_t start = 0;
    while (start < listing.size())
    {
        size_t end = listing.find('\0', start);
        if (end == std::string::npos)
            end = listing.size();
        std::string path = listing.substr(start, end - start);
        start = end + 1;

        if (path.size() < 3 || path.compare(path.size() - 3, 3, ".md") != 0)
            continue;
        documents.push_back({path, git_or_throw({"show", *sha + ":" + path})});
    }

    log::logger()->debug("Read {} document(s) at {}", documents.size(), revision);
    return documents;
}

std::optional<std::string> GitStore::revision_timestamp(const std::string& revision)
{
    auto sha = resolve(revision);
    if (!sha)
        return std::nullopt;

    std::string output = git_or_throw({"log", "-1", "--format=%cI", *sha});
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r'))
        output.pop_back();
    if (output.empty())
        return std::nullopt;

    // Normalize to UTC with a 'Z' suffix
    auto parsed = parse_timestamp(output);
    return parsed ? format_timestamp(*parsed) : output;
}

} // namespace workhooks
