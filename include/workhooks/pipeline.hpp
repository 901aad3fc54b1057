#ifndef WORKHOOKS_PIPELINE_HPP
#define WORKHOOKS_PIPELINE_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <workhooks/audit.hpp>
#include <workhooks/change_detector.hpp>
#include <workhooks/dispatcher.hpp>
#include <workhooks/event_emitter.hpp>
#include <workhooks/executor.hpp>
#include <workhooks/hook_registry.hpp>
#include <workhooks/metrics.hpp>
#include <workhooks/options.hpp>
#include <workhooks/snapshot.hpp>
#include <workhooks/store.hpp>

namespace workhooks
{

struct PipelineOptions
{
    SnapshotOptions snapshot;
    DetectorOptions detector;
    std::string domain = "task";
    std::string project_root;
    std::string source = "git";
    bool dry_run = false;

    static PipelineOptions from(const Options& options);
};

struct PipelineResult
{
    std::string before_revision;
    std::string after_revision;

    std::size_t before_snapshots = 0;
    std::size_t after_snapshots = 0;
    std::size_t skipped_documents = 0;
    std::size_t duplicate_ids = 0;

    std::vector<Delta> deltas;
    std::vector<Event> events;
    std::vector<std::string> already_processed; // event ids found in the audit log
    std::vector<DispatchResult> dispatches;

    bool no_changes = false;
    std::string reason;

    bool blocked = false;
    std::string blocking_reason;

    bool succeeded() const
    {
        return !blocked;
    }
};

/**
 * Revision pair -> snapshots -> deltas -> events -> dispatch.
 *
 * Event ids are derived from the revision pair, so running the same pair
 * again finds every event in the audit log and dispatches nothing.
 */
class Pipeline
{
  public:
    Pipeline(WorkItemStore& store, const HookRegistry& registry, HookRunner& runner,
             AuditSink& audit, MetricsAggregator* metrics = nullptr,
             PipelineOptions options = {});

    PipelineResult run(const std::string& before, const std::string& after);

  private:
    WorkItemStore& store_;
    const HookRegistry& registry_;
    HookRunner& runner_;
    AuditSink& audit_;
    MetricsAggregator* metrics_;
    PipelineOptions options_;
};

} // namespace workhooks

#endif // WORKHOOKS_PIPELINE_HPP
