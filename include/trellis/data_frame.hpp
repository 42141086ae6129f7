#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <trellis/value.hpp>
#include <unordered_map>
#include <vector>

namespace trellis
{

// Column-oriented table of Values. Each plot layer carries its own frame;
// a frame need not contain every facet variable.
class DataFrame
{
   public:
    DataFrame() = default;

    // Adds or replaces a column. Throws std::invalid_argument if the length
    // disagrees with the existing columns.
    DataFrame& add_column(const std::string& name, std::vector<Value> values);

    // Declares the level order of a column (factor order). Observed values
    // missing from the declaration sort after the declared ones.
    DataFrame& set_levels(const std::string& name, std::vector<Value> levels);

    bool has_column(const std::string& name) const;

    // Throws std::out_of_range for an unknown column.
    const std::vector<Value>& column(const std::string& name) const;

    const std::vector<Value>* levels(const std::string& name) const;

    const Value& at(size_t row, const std::string& name) const;

    size_t                          rows() const { return rows_; }
    const std::vector<std::string>& column_names() const { return names_; }
    bool                            empty() const { return names_.empty(); }

   private:
    size_t                                              rows_ = 0;
    std::vector<std::string>                            names_;
    std::unordered_map<std::string, std::vector<Value>> columns_;
    std::unordered_map<std::string, std::vector<Value>> levels_;
};

}   // namespace trellis
