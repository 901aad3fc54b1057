#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <workhooks/errors.hpp>
#include <workhooks/logging.hpp>
#include <workhooks/snapshot.hpp>
#include <yaml-cpp/yaml.h>

namespace workhooks
{

namespace
{

const std::string AC_BEGIN = "<!-- AC:BEGIN -->";
const std::string AC_END = "<!-- AC:END -->";

std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_digits(const std::string& s)
{
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> split_lines(const std::string& content)
{
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string base_name(const std::string& path)
{
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Title part of "task-12 - Title.md", empty when absent
std::string title_from_path(const std::string& path)
{
    std::string name = base_name(path);
    size_t sep = name.find(" - ");
    if (sep == std::string::npos || name.size() < 3)
        return "";
    return name.substr(sep + 3, name.size() - 3 - (sep + 3));
}

std::string scalar_or_empty(const YAML::Node& node)
{
    if (!node || node.IsNull())
        return "";
    if (!node.IsScalar())
        throw SnapshotParseError("expected a scalar value");
    return node.as<std::string>();
}

struct FrontMatter
{
    YAML::Node root;
    std::vector<std::string> body;
};

FrontMatter split_front_matter(const std::string& content)
{
    std::vector<std::string> lines = split_lines(content);

    // Tolerate a UTF-8 byte order mark
    if (!lines.empty() && lines.front().rfind("\xEF\xBB\xBF", 0) == 0)
        lines.front().erase(0, 3);

    if (lines.empty() || trim(lines.front()) != "---")
        throw SnapshotParseError("missing front matter");

    auto close = std::find_if(lines.begin() + 1, lines.end(),
                              [](const std::string& l) { return trim(l) == "---"; });
    if (close == lines.end())
        throw SnapshotParseError("unterminated front matter");

    std::string yaml_text;
    for (auto it = lines.begin() + 1; it != close; ++it)
        yaml_text += *it + "\n";

    FrontMatter result;
    try
    {
        result.root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        throw SnapshotParseError(std::string("invalid YAML front matter: ") + e.what());
    }
    if (!result.root.IsMap())
        throw SnapshotParseError("front matter is not a mapping");

    result.body.assign(close + 1, lines.end());
    return result;
}

std::vector<AcceptanceItem> parse_acceptance_items(const std::vector<std::string>& body)
{
    static const std::regex checkbox(R"(^\s*-\s+\[([ xX])\]\s+(?:#(\d+)\s+)?(.*)$)");

    bool has_markers = std::any_of(body.begin(), body.end(), [](const std::string& l)
                                   { return l.find(AC_BEGIN) != std::string::npos; });

    std::vector<AcceptanceItem> items;
    bool inside = !has_markers;
    for (const auto& line : body)
    {
        if (has_markers)
        {
            if (line.find(AC_BEGIN) != std::string::npos)
            {
                inside = true;
                continue;
            }
            if (line.find(AC_END) != std::string::npos)
            {
                inside = false;
                continue;
            }
        }
        if (!inside)
            continue;

        std::smatch match;
        if (!std::regex_match(line, match, checkbox))
            continue;

        AcceptanceItem item;
        item.checked = match[1].str() != " ";
        item.index = static_cast<int>(items.size()) + 1;
        if (match[2].matched)
        {
            const std::string digits = match[2].str();
            auto parsed = std::from_chars(digits.data(), digits.data() + digits.size(),
                                          item.index);
            if (parsed.ec != std::errc())
                throw SnapshotParseError("acceptance criterion index out of range: #" + digits);
        }
        item.text = trim(match[3].str());
        items.push_back(std::move(item));
    }
    return items;
}

Snapshot parse_or_throw(const std::string& path, const std::string& content,
                        const SnapshotOptions& options)
{
    auto id = item_id_from_path(path, options.id_prefix);
    if (!id)
        throw SnapshotParseError("file name is not a work item id");

    FrontMatter front = split_front_matter(content);
    const YAML::Node& root = front.root;

    Snapshot snapshot;
    snapshot.id = *id;
    snapshot.path = path;

    try
    {
        if (root["id"])
        {
            std::string declared = trim(scalar_or_empty(root["id"]));
            if (declared != *id)
                throw SnapshotParseError("front matter id '" + declared +
                                         "' does not match file name id '" + *id + "'");
        }

        snapshot.status = trim(scalar_or_empty(root["status"]));
        if (snapshot.status.empty())
            throw SnapshotParseError("missing status");

        snapshot.title = trim(scalar_or_empty(root["title"]));
        if (snapshot.title.empty())
            snapshot.title = title_from_path(path);
        if (snapshot.title.empty())
            snapshot.title = *id;

        snapshot.priority = trim(scalar_or_empty(root["priority"]));

        const YAML::Node labels = root["labels"];
        if (labels && labels.IsSequence())
        {
            for (const auto& label : labels)
            {
                std::string value = trim(scalar_or_empty(label));
                if (!value.empty())
                    snapshot.labels.insert(value);
            }
        }
        else if (labels && labels.IsScalar())
        {
            std::string value = trim(labels.as<std::string>());
            if (!value.empty())
                snapshot.labels.insert(value);
        }
    }
    catch (const YAML::Exception& e)
    {
        throw SnapshotParseError(std::string("invalid front matter value: ") + e.what());
    }

    snapshot.acceptance_items = parse_acceptance_items(front.body);
    return snapshot;
}

} // namespace

bool is_valid_item_id(const std::string& id, const std::string& prefix)
{
    const std::string lead = prefix + "-";
    if (prefix.empty() || id.size() <= lead.size() || id.compare(0, lead.size(), lead) != 0)
        return false;

    std::string number = id.substr(lead.size());
    size_t dot = number.find('.');
    if (dot == std::string::npos)
        return is_digits(number);
    return is_digits(number.substr(0, dot)) && is_digits(number.substr(dot + 1));
}

std::optional<std::string> item_id_from_path(const std::string& path, const std::string& prefix)
{
    std::string name = base_name(path);
    const std::string ext = ".md";
    if (name.size() <= ext.size() || name.compare(name.size() - ext.size(), ext.size(), ext) != 0)
        return std::nullopt;
    name.erase(name.size() - ext.size());

    std::string id = name;
    size_t sep = name.find(" - ");
    if (sep != std::string::npos)
    {
        if (sep + 3 >= name.size())
            return std::nullopt; // " - " with no title
        id = name.substr(0, sep);
    }

    if (!is_valid_item_id(id, prefix))
        return std::nullopt;
    return id;
}

std::optional<Snapshot> parse_snapshot(const std::string& path, const std::string& content,
                                       const SnapshotOptions& options)
{
    try
    {
        return parse_or_throw(path, content, options);
    }
    catch (const SnapshotParseError& e)
    {
        log::logger()->debug("Skipping '{}': {}", path, e.what());
        return std::nullopt;
    }
}

SnapshotSetResult parse_snapshot_set(const std::vector<Document>& documents,
                                     const SnapshotOptions& options)
{
    std::vector<const Document*> ordered;
    ordered.reserve(documents.size());
    for (const auto& doc : documents)
        ordered.push_back(&doc);
    std::sort(ordered.begin(), ordered.end(),
              [](const Document* a, const Document* b) { return a->path < b->path; });

    SnapshotSetResult result;
    for (const Document* doc : ordered)
    {
        auto snapshot = parse_snapshot(doc->path, doc->content, options);
        if (!snapshot)
        {
            ++result.skipped;
            continue;
        }

        auto existing = result.snapshots.find(snapshot->id);
        if (existing != result.snapshots.end())
        {
            log::logger()->warn("Duplicate work item id '{}': keeping '{}', skipping '{}'",
                                snapshot->id, existing->second.path, doc->path);
            ++result.duplicates;
            continue;
        }

        std::string id = snapshot->id;
        result.snapshots.emplace(std::move(id), std::move(*snapshot));
    }
    return result;
}

} // namespace workhooks
