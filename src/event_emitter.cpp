#include "internal/sha256.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <workhooks/event_emitter.hpp>
#include <workhooks/version.hpp>

namespace workhooks
{

namespace
{

constexpr size_t EVENT_ID_HEX_CHARS = 26;

std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::string derive_event_id(const std::vector<std::string>& parts)
{
    // Unit separator keeps ("ab","c") and ("a","bc") apart
    std::string material;
    for (const auto& part : parts)
    {
        material += part;
        material += '\x1f';
    }
    return "evt_" + upper(internal::sha256_hex(material).substr(0, EVENT_ID_HEX_CHARS));
}

std::string generate_event_id()
{
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << "evt_";
    for (size_t i = 0; i < EVENT_ID_HEX_CHARS; ++i)
        oss << std::hex << std::uppercase << dis(gen);
    return oss.str();
}

bool is_valid_event_type(const std::string& event_type)
{
    static const std::regex pattern(R"(^[a-z][a-z0-9_]*(\.[a-z0-9_]+)+$)");
    return std::regex_match(event_type, pattern);
}

EventEmitter::EventEmitter(EmitterOptions options) : options_(std::move(options)) {}

json EventEmitter::base_metadata() const
{
    json metadata = {{"tool", TOOL_NAME}, {"tool_version", version_string()},
                     {"source", options_.source}};
    if (!options_.before_revision.empty() || !options_.after_revision.empty())
        metadata["revisions"] = {{"before", options_.before_revision},
                                 {"after", options_.after_revision}};
    return metadata;
}

Event EventEmitter::build(const std::string& action, const Delta& delta) const
{
    Event event;
    event.schema_version = EVENT_SCHEMA_VERSION;
    event.event_type = options_.domain + "." + action;
    event.event_id = derive_event_id(
        {options_.before_revision, options_.after_revision, delta.id, event.event_type});
    event.timestamp = options_.timestamp.empty() ? now_timestamp() : options_.timestamp;
    event.project_root = options_.project_root;

    event.context = {{"task_id", delta.id},     {"task_title", delta.title},
                     {"status", delta.status},  {"priority", delta.priority},
                     {"labels", delta.labels},  {"path", delta.path}};
    event.metadata = base_metadata();
    return event;
}

std::vector<Event> EventEmitter::emit(const Delta& delta) const
{
    std::vector<Event> events;

    switch (delta.kind)
    {
    case DeltaKind::Created:
    {
        Event event = build(EventType::Created, delta);
        event.context["ac_checked"] = delta.checked_after;
        event.context["ac_total"] = delta.total_after;
        events.push_back(std::move(event));
        break;
    }
    case DeltaKind::StatusChanged:
    {
        Event event = build(EventType::StatusChanged, delta);
        event.context["status_from"] = delta.from.value_or("");
        event.context["status_to"] = delta.to.value_or("");
        event.context["ac_checked"] = delta.checked_after;
        event.context["ac_total"] = delta.total_after;
        events.push_back(event);

        if (delta.completed)
        {
            Event completed = build(EventType::Completed, delta);
            completed.context = event.context;
            events.push_back(std::move(completed));
        }
        break;
    }
    case DeltaKind::AcChecked:
    case DeltaKind::AcUnchecked:
    {
        Event event = build(delta.kind == DeltaKind::AcChecked ? EventType::AcChecked
                                                               : EventType::AcUnchecked,
                            delta);
        event.context["ac_checked"] = delta.checked_after;
        event.context["ac_total"] = delta.total_after;
        event.context["ac_checked_before"] = delta.checked_before;
        event.context["checked_delta"] = delta.checked_delta;
        events.push_back(std::move(event));
        break;
    }
    }

    return events;
}

std::vector<Event> EventEmitter::emit(const ChangeSet& changes) const
{
    std::vector<Event> events;
    for (const auto& delta : changes.deltas)
    {
        auto emitted = emit(delta);
        events.insert(events.end(), std::make_move_iterator(emitted.begin()),
                      std::make_move_iterator(emitted.end()));
    }
    return events;
}

Event EventEmitter::make_event(const std::string& event_type, json context) const
{
    if (!is_valid_event_type(event_type))
        throw std::invalid_argument("Invalid event type '" + event_type +
                                    "' (expected <domain>.<action>)");
    if (!context.is_object())
        throw std::invalid_argument("Event context must be a JSON object");

    Event event;
    event.schema_version = EVENT_SCHEMA_VERSION;
    event.event_type = event_type;
    event.event_id = generate_event_id();
    event.timestamp = now_timestamp();
    event.project_root = options_.project_root;
    event.context = std::move(context);
    event.metadata = base_metadata();
    event.metadata["source"] = "manual";
    return event;
}

} // namespace workhooks
