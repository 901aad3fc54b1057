#include <workhooks/errors.hpp>
#include <workhooks/logging.hpp>
#include <workhooks/pipeline.hpp>

namespace workhooks
{

PipelineOptions PipelineOptions::from(const Options& options)
{
    PipelineOptions result;
    result.snapshot.id_prefix = options.id_prefix;
    result.detector.terminal_status = options.terminal_status;
    result.domain = options.event_domain;
    result.project_root = options.project_root.string();
    return result;
}

Pipeline::Pipeline(WorkItemStore& store, const HookRegistry& registry, HookRunner& runner,
                   AuditSink& audit, MetricsAggregator* metrics, PipelineOptions options)
    : store_(store), registry_(registry), runner_(runner), audit_(audit), metrics_(metrics),
      options_(std::move(options))
{
}

PipelineResult Pipeline::run(const std::string& before, const std::string& after)
{
    auto logger = log::logger();

    PipelineResult result;
    result.before_revision = before;
    result.after_revision = after;

    // A missing "before" is the empty set (first commit); a missing "after" is an error
    auto after_id = store_.resolve(after);
    if (!after_id)
        throw StoreError("Unknown revision: " + after, 128);
    auto before_id = store_.resolve(before);

    SnapshotSetResult before_set = parse_snapshot_set(store_.list_documents(before),
                                                      options_.snapshot);
    SnapshotSetResult after_set = parse_snapshot_set(store_.list_documents(after),
                                                     options_.snapshot);
    result.before_snapshots = before_set.snapshots.size();
    result.after_snapshots = after_set.snapshots.size();
    result.skipped_documents = before_set.skipped + after_set.skipped;
    result.duplicate_ids = before_set.duplicates + after_set.duplicates;
    logger->debug("Parsed {} -> {} work item(s) ({} skipped)", result.before_snapshots,
                  result.after_snapshots, result.skipped_documents);

    ChangeSet changes =
        detect_changes(before_set.snapshots, after_set.snapshots, options_.detector);
    result.deltas = changes.deltas;
    if (changes.empty())
    {
        result.no_changes = true;
        result.reason = changes.reason;
        return result;
    }

    EmitterOptions emitter_options;
    emitter_options.domain = options_.domain;
    emitter_options.project_root = options_.project_root;
    // Ids hash the resolved revisions so "HEAD~1..HEAD" differs from commit to commit
    emitter_options.before_revision = before_id ? *before_id : std::string();
    emitter_options.after_revision = *after_id;
    emitter_options.source = options_.source;
    if (auto when = store_.revision_timestamp(after))
    {
        auto parsed = parse_timestamp(*when);
        emitter_options.timestamp = parsed ? format_timestamp(*parsed) : std::string();
    }
    result.events = EventEmitter(emitter_options).emit(changes);

    std::vector<Event> pending;
    for (const auto& event : result.events)
    {
        if (audit_.contains_event(event.event_id))
        {
            logger->info("Event {} ({}) already processed, skipping", event.event_id,
                         event.event_type);
            result.already_processed.push_back(event.event_id);
            continue;
        }
        pending.push_back(event);
    }

    DispatchOptions dispatch_options;
    dispatch_options.dry_run = options_.dry_run;
    Dispatcher dispatcher(registry_, runner_, audit_, metrics_, dispatch_options);
    result.dispatches = dispatcher.dispatch_all(pending);

    for (const auto& dispatch : result.dispatches)
    {
        if (dispatch.blocked)
        {
            result.blocked = true;
            result.blocking_reason = dispatch.blocking_reason;
            break;
        }
    }

    logger->info("{} event(s) from {}..{}: {} dispatched, {} already processed{}",
                 result.events.size(), before, after, result.dispatches.size(),
                 result.already_processed.size(), result.blocked ? ", blocked" : "");
    return result;
}

} // namespace workhooks
