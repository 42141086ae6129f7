#pragma once

#include <string>
#include <trellis/facet_spec.hpp>
#include <trellis/theme.hpp>

namespace trellis
{

// Persistent facet settings: the user options (with the labeller stored by
// name) plus the facet theme, saved as JSON.
struct FacetConfig
{
    bool        margins  = false;
    ScaleMode   scales   = ScaleMode::Fixed;
    SpaceMode   space    = SpaceMode::Fixed;
    std::string labeller = "label_value";
    bool        as_table = true;
    FacetTheme  theme;

    // Throws ConfigurationError for an unknown labeller name.
    FacetOptions to_options() const;

    std::string serialize() const;

    // Returns false on malformed input, unknown enum values or a newer
    // format version; the config is left untouched in that case.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/trellis/facet.json
    static std::string default_path();
};

}   // namespace trellis
