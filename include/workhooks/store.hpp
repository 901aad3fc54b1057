#ifndef WORKHOOKS_STORE_HPP
#define WORKHOOKS_STORE_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <workhooks/snapshot.hpp>

namespace workhooks
{

/// Versioned source of work-item documents
class WorkItemStore
{
  public:
    virtual ~WorkItemStore() = default;

    /// Canonical id of a revision, or std::nullopt when it does not exist
    virtual std::optional<std::string> resolve(const std::string& revision) = 0;

    /// Tracked documents at a revision (empty for an unknown revision)
    virtual std::vector<Document> list_documents(const std::string& revision) = 0;

    /// ISO 8601 time of the revision, when the store knows it
    virtual std::optional<std::string> revision_timestamp(const std::string& revision) = 0;
};

/// Store backed by in-memory revisions
class MemoryStore : public WorkItemStore
{
  public:
    void set_revision(const std::string& revision, std::vector<Document> documents,
                      const std::string& timestamp = "");

    void put(const std::string& revision, const std::string& path, const std::string& content);

    std::optional<std::string> resolve(const std::string& revision) override;
    std::vector<Document> list_documents(const std::string& revision) override;
    std::optional<std::string> revision_timestamp(const std::string& revision) override;

  private:
    struct Revision
    {
        std::vector<Document> documents;
        std::string timestamp;
    };
    std::map<std::string, Revision> revisions_;
};

/**
 * Reads documents of a git repository through the git command line.
 *
 * Only blobs below tracked_dir ending in ".md" are returned. Git runs
 * through the subprocess layer; a failing git command throws StoreError
 * carrying git's exit code and stderr.
 */
class GitStore : public WorkItemStore
{
  public:
    /// Throws StoreError when no git executable can be found
    GitStore(std::filesystem::path repo_root, std::string tracked_dir, std::string git = "git");

    std::optional<std::string> resolve(const std::string& revision) override;
    std::vector<Document> list_documents(const std::string& revision) override;
    std::optional<std::string> revision_timestamp(const std::string& revision) override;

  private:
    struct GitResult
    {
        int exit_code = 0;
        std::string out;
        std::string err;
    };

    GitResult run_git(const std::vector<std::string>& args) const;
    std::string git_or_throw(const std::vector<std::string>& args) const;

    std::filesystem::path repo_root_;
    std::string tracked_dir_;
    std::string git_;
};

} // namespace workhooks

#endif // WORKHOOKS_STORE_HPP
