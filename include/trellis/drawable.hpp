#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace trellis
{

// ─── Size units ─────────────────────────────────────────────────────────────

enum class UnitKind
{
    Relative,   // Share of the space left after absolute tracks are placed
    Absolute,   // Points
};

struct SizeUnit
{
    float    value = 0.0f;
    UnitKind kind  = UnitKind::Relative;

    static SizeUnit relative(float v) { return {v, UnitKind::Relative}; }
    static SizeUnit absolute(float v) { return {v, UnitKind::Absolute}; }

    bool is_relative() const { return kind == UnitKind::Relative; }
    bool is_absolute() const { return kind == UnitKind::Absolute; }

    bool operator==(const SizeUnit&) const = default;
};

using SizeVector = std::vector<SizeUnit>;

struct Size2D
{
    float width  = 0.0f;
    float height = 0.0f;
};

// ─── Drawables ──────────────────────────────────────────────────────────────

// Opaque node of the graphics tree. The drawing-primitive library provides
// the concrete leaves (rectangles, text, axis guides); this library only
// arranges them.
class Drawable
{
   public:
    virtual ~Drawable() = default;

    virtual std::string_view kind() const = 0;
};

// Zero-size placeholder filling grid cells that have nothing to draw.
class NullDrawable final : public Drawable
{
   public:
    std::string_view kind() const override { return "null"; }
};

// Ordered stack of children drawn back to front.
class DrawableGroup : public Drawable
{
   public:
    explicit DrawableGroup(std::string name) : name_(std::move(name)) {}

    std::string_view kind() const override { return "group"; }

    // Null children are skipped.
    void add(std::unique_ptr<Drawable> child);

    const std::string&                            name() const { return name_; }
    const std::vector<std::unique_ptr<Drawable>>& children() const { return children_; }
    size_t                                        size() const { return children_.size(); }

   private:
    std::string                            name_;
    std::vector<std::unique_ptr<Drawable>> children_;
};

// Per-panel content from the geometry pipeline: one layer per geometric
// layer, each holding one slot per panel (index = panel id - 1). A null slot
// means the layer draws nothing in that panel.
using ContentLayer  = std::vector<std::unique_ptr<Drawable>>;
using ContentLayers = std::vector<ContentLayer>;

}   // namespace trellis
