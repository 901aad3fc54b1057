#ifndef WORKHOOKS_EVENT_EMITTER_HPP
#define WORKHOOKS_EVENT_EMITTER_HPP

#include <string>
#include <vector>
#include <workhooks/change_detector.hpp>
#include <workhooks/types.hpp>

namespace workhooks
{

struct EmitterOptions
{
    std::string domain = "task";
    std::string project_root;
    std::string before_revision;
    std::string after_revision;
    std::string source = "git";
    std::string timestamp; // ISO 8601; empty means "now" at emit time
};

/// Maps deltas to canonical events.
///
/// Ids of detected events are derived from (before, after, item id, event
/// type), so emitting the same revision pair twice yields identical events.
class EventEmitter
{
  public:
    explicit EventEmitter(EmitterOptions options = {});

    std::vector<Event> emit(const ChangeSet& changes) const;
    std::vector<Event> emit(const Delta& delta) const;

    /// Manually triggered event with a random id and the current time.
    /// Throws std::invalid_argument when event_type is not "<domain>.<action>".
    Event make_event(const std::string& event_type, json context = json::object()) const;

    const EmitterOptions& options() const
    {
        return options_;
    }

  private:
    Event build(const std::string& action, const Delta& delta) const;
    json base_metadata() const;

    EmitterOptions options_;
};

/// "evt_" + 26 upper-case hex characters from a digest of the given parts
std::string derive_event_id(const std::vector<std::string>& parts);

/// "evt_" + 26 random upper-case hex characters
std::string generate_event_id();

/// Dot-delimited lower-case segments, at least two: "task.completed"
bool is_valid_event_type(const std::string& event_type);

} // namespace workhooks

#endif // WORKHOOKS_EVENT_EMITTER_HPP
