#include <stdexcept>
#include <trellis/data_frame.hpp>

namespace trellis
{

DataFrame& DataFrame::add_column(const std::string& name, std::vector<Value> values)
{
    const bool replacing = columns_.count(name) > 0;
    const bool sole      = replacing && names_.size() == 1;

    if (!names_.empty() && !sole && values.size() != rows_)
    {
        throw std::invalid_argument("column '" + name + "' has " + std::to_string(values.size())
                                    + " values, expected " + std::to_string(rows_));
    }

    rows_ = values.size();
    if (!replacing)
        names_.push_back(name);
    columns_[name] = std::move(values);
    return *this;
}

DataFrame& DataFrame::set_levels(const std::string& name, std::vector<Value> levels)
{
    levels_[name] = std::move(levels);
    return *this;
}

bool DataFrame::has_column(const std::string& name) const
{
    return columns_.count(name) > 0;
}

const std::vector<Value>& DataFrame::column(const std::string& name) const
{
    auto it = columns_.find(name);
    if (it == columns_.end())
        throw std::out_of_range("no column named '" + name + "'");
    return it->second;
}

const std::vector<Value>* DataFrame::levels(const std::string& name) const
{
    auto it = levels_.find(name);
    return it == levels_.end() ? nullptr : &it->second;
}

const Value& DataFrame::at(size_t row, const std::string& name) const
{
    return column(name).at(row);
}

}   // namespace trellis
