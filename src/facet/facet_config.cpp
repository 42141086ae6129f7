#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <system_error>
#include <trellis/error.hpp>
#include <trellis/facet_config.hpp>
#include <trellis/labeller.hpp>
#include <trellis/logger.hpp>

namespace trellis
{

namespace
{

constexpr int CONFIG_VERSION = 1;

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

const char* strip_side_name(StripSide side)
{
    switch (side)
    {
        case StripSide::Top:
            return "top";
        case StripSide::Left:
            return "left";
        case StripSide::Right:
            return "right";
    }
    return "right";
}

std::optional<StripSide> strip_side_from(const std::string& name)
{
    if (name == "right")
        return StripSide::Right;
    if (name == "left")
        return StripSide::Left;
    return std::nullopt;
}

// Position just past the ':' following "key", or npos.
size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return pos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return pos;
    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    return pos;
}

std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return std::nullopt;

    std::string out;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            return out;
        if (c == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            out += e == 'n' ? '\n' : e == 't' ? '\t' : e;
            continue;
        }
        out += c;
    }
    return std::nullopt;
}

bool read_json_bool(const std::string& json, const std::string& key, bool def)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return def;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return def;
}

// Absent or null -> nullopt; `ok` turns false on anything else unparsable.
std::optional<float> read_json_number(const std::string& json, const std::string& key, bool& ok)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos || json.compare(pos, 4, "null") == 0)
        return std::nullopt;

    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    float       v     = std::strtof(begin, &end);
    if (end == begin)
    {
        ok = false;
        return std::nullopt;
    }
    return v;
}

}   // namespace

FacetOptions FacetConfig::to_options() const
{
    FacetOptions options;
    options.margins  = margins;
    options.scales   = scales;
    options.space    = space;
    options.labeller = labeller_by_name(labeller);
    options.as_table = as_table;
    return options;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string FacetConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";
    os << "  \"margins\": " << (margins ? "true" : "false") << ",\n";
    os << "  \"scales\": \"" << to_string(scales) << "\",\n";
    os << "  \"space\": \"" << to_string(space) << "\",\n";
    os << "  \"labeller\": \"" << escape_json(labeller) << "\",\n";
    os << "  \"as_table\": " << (as_table ? "true" : "false") << ",\n";
    os << "  \"theme\": {\n";
    os << "    \"panel_margin\": " << theme.panel_margin << ",\n";
    os << "    \"aspect_ratio\": ";
    if (theme.aspect_ratio)
        os << *theme.aspect_ratio;
    else
        os << "null";
    os << ",\n";
    os << "    \"row_strip\": \"" << strip_side_name(theme.row_strip) << "\"\n";
    os << "  }\n";
    os << "}\n";
    return os.str();
}

bool FacetConfig::deserialize(const std::string& json)
{
    if (json.empty() || json.find('{') == std::string::npos)
        return false;

    bool ok      = true;
    auto version = read_json_number(json, "version", ok);
    if (!ok || (version && *version > static_cast<float>(CONFIG_VERSION)))
        return false;

    FacetConfig next;
    next.margins  = read_json_bool(json, "margins", next.margins);
    next.as_table = read_json_bool(json, "as_table", next.as_table);

    try
    {
        if (auto s = read_json_string(json, "scales"))
            next.scales = parse_scale_mode(*s);
        if (auto s = read_json_string(json, "space"))
            next.space = parse_space_mode(*s);
        if (auto s = read_json_string(json, "labeller"))
        {
            labeller_by_name(*s);
            next.labeller = *s;
        }
    }
    catch (const ConfigurationError& e)
    {
        TRELLIS_LOG_WARN("config", "rejecting facet config: {}", e.what());
        return false;
    }

    if (auto margin = read_json_number(json, "panel_margin", ok))
        next.theme.panel_margin = *margin;
    next.theme.aspect_ratio = read_json_number(json, "aspect_ratio", ok);
    if (!ok)
        return false;

    if (auto side = read_json_string(json, "row_strip"))
    {
        auto parsed = strip_side_from(*side);
        if (!parsed)
        {
            TRELLIS_LOG_WARN("config", "rejecting facet config: bad row_strip \"{}\"", *side);
            return false;
        }
        next.theme.row_strip = *parsed;
    }

    *this = std::move(next);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool FacetConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            TRELLIS_LOG_WARN("config", "cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        TRELLIS_LOG_WARN("config", "cannot write facet config {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool FacetConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TRELLIS_LOG_WARN("config", "cannot read facet config {}", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string FacetConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "facet.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "trellis";
    return (dir / "facet.json").string();
}

}   // namespace trellis
