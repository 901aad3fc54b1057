#include <workhooks/change_detector.hpp>
#include <workhooks/logging.hpp>

namespace workhooks
{

namespace
{

Delta make_delta(DeltaKind kind, const Snapshot& after)
{
    Delta delta;
    delta.kind = kind;
    delta.id = after.id;
    delta.title = after.title;
    delta.status = after.status;
    delta.priority = after.priority;
    delta.labels.assign(after.labels.begin(), after.labels.end());
    delta.path = after.path;
    delta.checked_after = after.checked_count();
    delta.checked_before = delta.checked_after;
    delta.total_after = after.total_count();
    return delta;
}

} // namespace

ChangeSet detect_changes(const SnapshotSet& before, const SnapshotSet& after,
                         const DetectorOptions& options)
{
    auto logger = log::logger();
    ChangeSet result;

    for (const auto& [id, current] : after)
    {
        auto previous_it = before.find(id);
        if (previous_it == before.end())
        {
            logger->debug("{}: created (status '{}')", id, current.status);
            Delta delta = make_delta(DeltaKind::Created, current);
            delta.to = current.status;
            delta.checked_before = 0;
            result.deltas.push_back(std::move(delta));
            continue;
        }

        const Snapshot& previous = previous_it->second;

        if (previous.status != current.status)
        {
            logger->debug("{}: status '{}' -> '{}'", id, previous.status, current.status);
            Delta delta = make_delta(DeltaKind::StatusChanged, current);
            delta.from = previous.status;
            delta.to = current.status;
            delta.completed = current.status == options.terminal_status;
            delta.checked_before = previous.checked_count();
            result.deltas.push_back(std::move(delta));
        }

        int checked_before = previous.checked_count();
        int checked_after = current.checked_count();
        if (checked_after != checked_before)
        {
            logger->debug("{}: acceptance criteria checked {} -> {}", id, checked_before,
                          checked_after);
            Delta delta = make_delta(
                checked_after > checked_before ? DeltaKind::AcChecked : DeltaKind::AcUnchecked,
                current);
            delta.checked_before = checked_before;
            delta.checked_delta = checked_after - checked_before;
            result.deltas.push_back(std::move(delta));
        }
    }

    for (const auto& [id, previous] : before)
    {
        if (after.find(id) == after.end())
            logger->debug("{}: removed in the newer revision, no event", id);
    }

    if (result.deltas.empty())
    {
        result.no_changes = true;
        result.reason = (before.empty() && after.empty())
                            ? "no tracked work items in either revision"
                            : "no field-level differences";
        logger->info("No changes detected: {}", result.reason);
    }

    return result;
}

} // namespace workhooks
