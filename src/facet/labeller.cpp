#include <trellis/error.hpp>
#include <trellis/labeller.hpp>

namespace trellis
{

namespace labellers
{

Labeller value()
{
    return [](const std::string&, const Value& v) { return v.to_string(); };
}

Labeller both()
{
    return [](const std::string& variable, const Value& v)
    { return variable + ": " + v.to_string(); };
}

}   // namespace labellers

const std::vector<std::string>& labeller_names()
{
    static const std::vector<std::string> names = {"label_value", "label_both"};
    return names;
}

Labeller labeller_by_name(std::string_view name)
{
    if (name == "label_value")
        return labellers::value();
    if (name == "label_both")
        return labellers::both();

    std::string allowed;
    for (const auto& n : labeller_names())
    {
        if (!allowed.empty())
            allowed += ", ";
        allowed += "\"" + n + "\"";
    }
    throw ConfigurationError("labeller must be one of " + allowed + " (got \"" + std::string(name)
                             + "\")");
}

}   // namespace trellis
