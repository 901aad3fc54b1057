#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <workhooks/types.hpp>

namespace workhooks
{

int Snapshot::checked_count() const
{
    return static_cast<int>(std::count_if(acceptance_items.begin(), acceptance_items.end(),
                                          [](const AcceptanceItem& item) { return item.checked; }));
}

// ============================================================================
// ItemIdLess
// ============================================================================

namespace
{

struct IdKey
{
    std::string prefix;
    bool numbered = false;
    std::string major; // digits without leading zeros
    bool has_minor = false;
    std::string minor;
};

std::string strip_zeros(const std::string& digits)
{
    size_t pos = digits.find_first_not_of('0');
    return pos == std::string::npos ? "0" : digits.substr(pos);
}

bool all_digits(const std::string& s)
{
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

IdKey split_id(const std::string& id)
{
    IdKey key;
    size_t dash = id.rfind('-');
    if (dash == std::string::npos)
    {
        key.prefix = id;
        return key;
    }

    std::string number = id.substr(dash + 1);
    std::string major = number;
    std::string minor;
    size_t dot = number.find('.');
    if (dot != std::string::npos)
    {
        major = number.substr(0, dot);
        minor = number.substr(dot + 1);
    }

    if (!all_digits(major) || (dot != std::string::npos && !all_digits(minor)))
    {
        key.prefix = id;
        return key;
    }

    key.prefix = id.substr(0, dash);
    key.numbered = true;
    key.major = strip_zeros(major);
    key.has_minor = dot != std::string::npos;
    key.minor = key.has_minor ? strip_zeros(minor) : "";
    return key;
}

// -1, 0, 1 comparison of non-negative decimal strings without leading zeros
int compare_numbers(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return a.size() < b.size() ? -1 : 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

bool ItemIdLess::operator()(const std::string& a, const std::string& b) const
{
    IdKey ka = split_id(a);
    IdKey kb = split_id(b);

    if (ka.prefix != kb.prefix)
        return ka.prefix < kb.prefix;
    if (ka.numbered != kb.numbered)
        return !ka.numbered;
    if (ka.numbered)
    {
        int c = compare_numbers(ka.major, kb.major);
        if (c != 0)
            return c < 0;
        if (ka.has_minor != kb.has_minor)
            return !ka.has_minor;
        c = compare_numbers(ka.minor, kb.minor);
        if (c != 0)
            return c < 0;
    }
    // Same numeric value, different spelling ("task-01" vs "task-1")
    return a < b;
}

// ============================================================================
// Enum conversions
// ============================================================================

std::string to_string(DeltaKind kind)
{
    switch (kind)
    {
    case DeltaKind::Created:
        return "created";
    case DeltaKind::StatusChanged:
        return "status_changed";
    case DeltaKind::AcChecked:
        return "ac_checked";
    case DeltaKind::AcUnchecked:
        return "ac_unchecked";
    }
    return "unknown";
}

std::string to_string(FailMode mode)
{
    return mode == FailMode::Stop ? "stop" : "continue";
}

std::optional<FailMode> fail_mode_from_string(const std::string& value)
{
    if (value == "continue")
        return FailMode::Continue;
    if (value == "stop")
        return FailMode::Stop;
    return std::nullopt;
}

std::string to_string(ExecutionStatus status)
{
    switch (status)
    {
    case ExecutionStatus::Success:
        return "success";
    case ExecutionStatus::Failed:
        return "failed";
    case ExecutionStatus::Timeout:
        return "timeout";
    case ExecutionStatus::Error:
        return "error";
    }
    return "error";
}

std::optional<ExecutionStatus> execution_status_from_string(const std::string& value)
{
    if (value == "success")
        return ExecutionStatus::Success;
    if (value == "failed")
        return ExecutionStatus::Failed;
    if (value == "timeout")
        return ExecutionStatus::Timeout;
    if (value == "error")
        return ExecutionStatus::Error;
    return std::nullopt;
}

// ============================================================================
// Event
// ============================================================================

json Event::to_json() const
{
    json j = {{"schema_version", schema_version},
              {"event_type", event_type},
              {"event_id", event_id},
              {"timestamp", timestamp},
              {"project_root", project_root}};
    if (!context.empty())
        j["context"] = context;
    if (!metadata.empty())
        j["metadata"] = metadata;
    return j;
}

Event Event::from_json(const json& j)
{
    Event event;
    event.schema_version = j.value("schema_version", std::string(""));
    event.event_type = j.at("event_type").get<std::string>();
    event.event_id = j.value("event_id", std::string(""));
    event.timestamp = j.value("timestamp", std::string(""));
    event.project_root = j.value("project_root", std::string(""));
    if (j.contains("context") && j["context"].is_object())
        event.context = j["context"];
    if (j.contains("metadata") && j["metadata"].is_object())
        event.metadata = j["metadata"];
    return event;
}

// ============================================================================
// HookDefinition
// ============================================================================

std::string HookDefinition::action_type() const
{
    if (script.has_value())
        return "script";
    if (command.has_value())
        return "command";
    return "none";
}

std::string HookDefinition::action() const
{
    if (script.has_value())
        return *script;
    if (command.has_value())
        return *command;
    return "";
}

// ============================================================================
// Time helpers
// ============================================================================

std::string format_timestamp(Timestamp tp)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0)
    {
        millis += 1000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0')
        << millis << "Z";
    return oss.str();
}

std::string now_timestamp()
{
    return format_timestamp(Clock::now());
}

std::optional<Timestamp> parse_timestamp(const std::string& value)
{
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6)
        return std::nullopt;

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    long millis = 0;
    if (pos < value.size() && value[pos] == '.')
    {
        ++pos;
        int digits = 0;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])))
        {
            if (digits < 3)
                millis = millis * 10 + (value[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (int i = digits; i < 3; ++i)
            millis *= 10;
    }

    long offset_seconds = 0;
    if (pos < value.size())
    {
        char sign = value[pos];
        if (sign == 'Z' || sign == 'z')
        {
            ++pos;
        }
        else if (sign == '+' || sign == '-')
        {
            int hours = 0;
            int minutes = 0;
            if (std::sscanf(value.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2)
                return std::nullopt;
            offset_seconds = (hours * 3600L + minutes * 60L) * (sign == '-' ? -1 : 1);
            pos += 6;
        }
        else
        {
            return std::nullopt;
        }
    }
    if (pos != value.size())
        return std::nullopt;

    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1))
        return std::nullopt;

    return Clock::from_time_t(seconds - offset_seconds) + std::chrono::milliseconds(millis);
}

} // namespace workhooks
