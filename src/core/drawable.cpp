#include <trellis/drawable.hpp>

namespace trellis
{

void DrawableGroup::add(std::unique_ptr<Drawable> child)
{
    if (child)
        children_.push_back(std::move(child));
}

}   // namespace trellis
