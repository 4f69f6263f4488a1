#pragma once

#include <optional>
#include <psgraph/color.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace psgraph
{

class DocumentSink;

enum class Shape
{
    Dot,
    Cross,
    Square,
    Plus,
    Diamond,
    Circle
};

std::string_view shape_name(Shape shape);

// Attributes a SequenceGenerator can cycle through.
enum class Choice
{
    Red,
    Green,
    Blue,
    Yellow,   // red and green together
    Mauve,    // red and blue together
    Cyan,     // green and blue together
    Gray,
    Shape,
    Width,
    Dashes,
    Size
};

std::string_view choice_name(Choice choice);

using Dashes = std::vector<double>;

// One row of automatically chosen drawing parameters.
struct StyleRecord
{
    double red   = 0.0;
    double green = 0.0;
    double blue  = 0.0;
    double gray  = 0.0;
    Shape  shape = Shape::Dot;
    double width = 0.5;
    Dashes dashes;
    double size = 5.0;
};

// ─── SequenceGenerator ──────────────────────────────────────────────────────

// Hands out successive StyleRecords so that styles created from the same
// sequence differ. The requested choices act as the digits of an odometer,
// least significant first; after the last permutation it wraps to the first.
// Not thread safe; share one between threads only under the caller's lock.
class SequenceGenerator
{
   public:
    // Style settings as (name, PostScript value) pairs, in write order.
    using Settings = std::vector<std::pair<std::string, std::string>>;

    SequenceGenerator();

    // Replace the value list of a numeric choice. Throws ConfigurationError
    // for Shape and Dashes, which have their own overloads, or an empty list.
    void setup(Choice choice, std::vector<double> values);
    void setup(std::vector<Shape> shapes);
    void setup(std::vector<Dashes> dashes);

    size_t value_count(Choice choice) const;

    // Restarts at the first permutation when called for the first time, after
    // reset() or setup(), or with different choices; otherwise advances.
    // An empty list means shape, dashes, size and width.
    StyleRecord next(const std::vector<Choice>& choices);
    void        reset() { initialized_ = false; }

    const std::vector<Choice>& choices() const { return choices_; }

    int new_style_id() { return ++style_id_; }
    int style_id() const { return style_id_; }

    // Settings of the style written last, or null before the first write.
    const Settings* previous_settings() const;
    void            register_settings(Settings settings);

   private:
    StyleRecord current_row() const;
    void        restart(const std::vector<Choice>& choices);
    void        advance();

    std::vector<double> red_;
    std::vector<double> green_;
    std::vector<double> blue_;
    std::vector<double> yellow_;
    std::vector<double> mauve_;
    std::vector<double> cyan_;
    std::vector<double> gray_;
    std::vector<Shape>  shape_;
    std::vector<double> width_;
    std::vector<Dashes> dashes_;
    std::vector<double> size_;

    bool                    initialized_ = false;
    std::vector<Choice>     choices_;
    std::vector<size_t>     count_;
    int                     style_id_ = 0;
    std::optional<Settings> previous_;
};

// ─── Style ──────────────────────────────────────────────────────────────────

// Outline colour that is either given or derived later from the background.
class OuterColor
{
   public:
    // Complement of the background, resolved by resolve().
    OuterColor() = default;
    OuterColor(const Color& color) : deferred_(false), color_(color) {}

    bool deferred() const { return deferred_; }

    // The resolved colour; black while still deferred.
    const Color& color() const { return color_; }

    void resolve(const Color& background, bool same);

   private:
    bool  deferred_ = true;
    Color color_    = colors::black;
};

struct LineStyleOptions
{
    std::optional<double>     width;
    std::optional<Dashes>     dashes;
    std::optional<OuterColor> outer_color;
    std::optional<double>     outer_width;   // 2 x width
    std::optional<Dashes>     outer_dashes;
    std::optional<Color>      color;
    std::optional<Color>      inner_color;
    std::optional<double>     inner_width;
    std::optional<Dashes>     inner_dashes;
};

struct BarStyleOptions
{
    std::optional<double>     width;
    std::optional<OuterColor> outer_color;
    std::optional<double>     outer_width;   // 2 x width
    std::optional<Color>      color;
    std::optional<Color>      inner_color;
    std::optional<double>     inner_width;
};

struct PointStyleOptions
{
    std::optional<double>     width;
    std::optional<double>     size;
    std::optional<Shape>      shape;
    std::optional<OuterColor> outer_color;
    std::optional<double>     outer_width;   // 2 x width
    std::optional<Color>      color;
    std::optional<Color>      inner_color;
    std::optional<double>     inner_width;
};

struct StyleOptions
{
    bool                auto_none = false;   // skip cycling, use the default row
    std::vector<Choice> auto_choices;
    SequenceGenerator*  sequence     = nullptr;
    bool                changes_only = true;
    bool                same         = false;   // outlines take the background itself
    bool                use_color    = true;

    std::optional<LineStyleOptions>  line;
    std::optional<BarStyleOptions>   bar;
    std::optional<PointStyleOptions> point;
};

struct LineStyle
{
    OuterColor outer_color;
    double     outer_width = 0.0;
    Dashes     outer_dashes;
    Color      inner_color;
    double     inner_width = 0.0;
    Dashes     inner_dashes;
};

struct BarStyle
{
    OuterColor outer_color;
    double     outer_width = 0.0;
    Color      inner_color;
    double     inner_width = 0.0;
};

struct PointStyle
{
    double     size  = 0.0;
    Shape      shape = Shape::Dot;
    OuterColor outer_color;
    double     outer_width = 0.0;
    Color      inner_color;
    double     inner_width = 0.0;
};

// Drawing parameters for lines, bars and points, written into gstyledict.
class Style
{
   public:
    // Throws ResourceError when cycling is wanted but no sequence is given.
    explicit Style(const StyleOptions& options);

    int                id() const { return id_; }
    const StyleRecord& record() const { return record_; }
    bool               same() const { return same_; }
    bool               use_color() const { return use_color_; }
    bool               changes_only() const { return changes_only_; }

    const std::optional<LineStyle>&  line() const { return line_; }
    const std::optional<BarStyle>&   bar() const { return bar_; }
    const std::optional<PointStyle>& point() const { return point_; }

    // Fixes every deferred outline colour: the background itself when `same`,
    // otherwise its complement.
    void resolve_background(const Color& background);
    void resolve_background(const Color& background, bool same);

    SequenceGenerator::Settings settings() const;

    // Writes the settings, skipping values unchanged since the sequence's
    // previous write when changes_only is set.
    void write(DocumentSink& sink);

   private:
    SequenceGenerator*        seq_ = nullptr;
    int                       id_  = 0;
    StyleRecord               record_;
    bool                      changes_only_ = true;
    bool                      same_         = false;
    bool                      use_color_    = true;
    std::optional<LineStyle>  line_;
    std::optional<BarStyle>   bar_;
    std::optional<PointStyle> point_;
};

}   // namespace psgraph
