#ifndef WORKHOOKS_CHANGE_DETECTOR_HPP
#define WORKHOOKS_CHANGE_DETECTOR_HPP

#include <string>
#include <vector>
#include <workhooks/types.hpp>

namespace workhooks
{

struct DetectorOptions
{
    std::string terminal_status = "Done";
};

/// Deltas between two revisions. An empty result is a successful no-op, not a failure.
struct ChangeSet
{
    std::vector<Delta> deltas;
    bool no_changes = false;
    std::string reason; // set when no_changes

    bool empty() const
    {
        return deltas.empty();
    }
};

/**
 * Compare two snapshot sets keyed by id.
 *
 * Deltas come out in ascending natural id order and, within one id, in the
 * order created, status_changed, AC delta. Items only present in `before`
 * are deleted items and yield nothing.
 */
ChangeSet detect_changes(const SnapshotSet& before, const SnapshotSet& after,
                         const DetectorOptions& options = {});

} // namespace workhooks

#endif // WORKHOOKS_CHANGE_DETECTOR_HPP
