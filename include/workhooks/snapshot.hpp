#ifndef WORKHOOKS_SNAPSHOT_HPP
#define WORKHOOKS_SNAPSHOT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <workhooks/types.hpp>

namespace workhooks
{

/// One document of a revision as handed over by a WorkItemStore
struct Document
{
    std::string path; // store-relative, e.g. "backlog/tasks/task-1 - Title.md"
    std::string content;
};

struct SnapshotOptions
{
    std::string id_prefix = "task";
};

/// Result of parsing all documents of one revision
struct SnapshotSetResult
{
    SnapshotSet snapshots;
    std::size_t skipped = 0;    // not a work item, or malformed
    std::size_t duplicates = 0; // second claim on an id already taken
};

/// True when id matches exactly "<prefix>-<digits>[.<digits>]"
bool is_valid_item_id(const std::string& id, const std::string& prefix = "task");

/// Extract the item id from a document file name ("task-12 - Title.md" -> "task-12")
std::optional<std::string> item_id_from_path(const std::string& path,
                                             const std::string& prefix = "task");

/**
 * Parse one document into a Snapshot.
 *
 * Returns std::nullopt when the document is not a tracked work item: the file
 * name does not follow the id grammar, the front matter is missing or not valid
 * YAML, the status is missing, or the front matter id disagrees with the file
 * name. The reason is logged at debug level. Never throws for content problems.
 */
std::optional<Snapshot> parse_snapshot(const std::string& path, const std::string& content,
                                       const SnapshotOptions& options = {});

/// Parse a whole revision. On duplicate ids the lexicographically smaller path wins.
SnapshotSetResult parse_snapshot_set(const std::vector<Document>& documents,
                                     const SnapshotOptions& options = {});

} // namespace workhooks

#endif // WORKHOOKS_SNAPSHOT_HPP
