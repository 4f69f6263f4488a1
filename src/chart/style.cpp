#include <psgraph/document.hpp>
#include <psgraph/number_format.hpp>
#include <psgraph/style.hpp>
#include <string>

#include "core/fail.hpp"
#include "io/ps_procedures.hpp"
#include "io/ps_writer.hpp"

namespace psgraph
{

std::string_view shape_name(Shape shape)
{
    switch (shape)
    {
        case Shape::Dot:
            return "dot";
        case Shape::Cross:
            return "cross";
        case Shape::Square:
            return "square";
        case Shape::Plus:
            return "plus";
        case Shape::Diamond:
            return "diamond";
        case Shape::Circle:
            return "circle";
    }
    return "dot";
}

std::string_view choice_name(Choice choice)
{
    switch (choice)
    {
        case Choice::Red:
            return "red";
        case Choice::Green:
            return "green";
        case Choice::Blue:
            return "blue";
        case Choice::Yellow:
            return "yellow";
        case Choice::Mauve:
            return "mauve";
        case Choice::Cyan:
            return "cyan";
        case Choice::Gray:
            return "gray";
        case Choice::Shape:
            return "shape";
        case Choice::Width:
            return "width";
        case Choice::Dashes:
            return "dashes";
        case Choice::Size:
            return "size";
    }
    return "unknown";
}

// ─── SequenceGenerator ──────────────────────────────────────────────────────

SequenceGenerator::SequenceGenerator()
    : red_{0.5, 1.0, 0.0},
      green_{0.0, 0.5, 0.25, 0.75, 1.0},
      blue_{0.0, 1.0, 0.5},
      yellow_{0.9, 0.2, 0.5},
      mauve_{0.9, 0.2, 0.5},
      cyan_{0.9, 0.2, 0.5},
      gray_{0.6, 0.0, 0.45, 0.15, 0.75, 0.3, 0.9},
      shape_{Shape::Dot, Shape::Cross, Shape::Square, Shape::Plus, Shape::Diamond, Shape::Circle},
      width_{1.0, 0.5, 4.0, 2.0},
      dashes_{{}, {3.0, 3.0}, {9.0, 9.0}, {10.0, 5.0, 3.0, 5.0}},
      size_{5.0, 3.0, 7.0}
{
}

void SequenceGenerator::setup(Choice choice, std::vector<double> values)
{
    if (values.empty())
        fail("style", "sequence: values for " + std::string(choice_name(choice)) + " must not be empty");

    switch (choice)
    {
        case Choice::Red:
            red_ = std::move(values);
            break;
        case Choice::Green:
            green_ = std::move(values);
            break;
        case Choice::Blue:
            blue_ = std::move(values);
            break;
        case Choice::Yellow:
            yellow_ = std::move(values);
            break;
        case Choice::Mauve:
            mauve_ = std::move(values);
            break;
        case Choice::Cyan:
            cyan_ = std::move(values);
            break;
        case Choice::Gray:
            gray_ = std::move(values);
            break;
        case Choice::Width:
            width_ = std::move(values);
            break;
        case Choice::Size:
            size_ = std::move(values);
            break;
        case Choice::Shape:
        case Choice::Dashes:
            fail("style", "sequence: " + std::string(choice_name(choice)) + " values are not numbers");
    }
    initialized_ = false;
}

void SequenceGenerator::setup(std::vector<Shape> shapes)
{
    if (shapes.empty())
        fail("style", "sequence: values for shape must not be empty");
    shape_       = std::move(shapes);
    initialized_ = false;
}

void SequenceGenerator::setup(std::vector<Dashes> dashes)
{
    if (dashes.empty())
        fail("style", "sequence: values for dashes must not be empty");
    dashes_      = std::move(dashes);
    initialized_ = false;
}

size_t SequenceGenerator::value_count(Choice choice) const
{
    switch (choice)
    {
        case Choice::Red:
            return red_.size();
        case Choice::Green:
            return green_.size();
        case Choice::Blue:
            return blue_.size();
        case Choice::Yellow:
            return yellow_.size();
        case Choice::Mauve:
            return mauve_.size();
        case Choice::Cyan:
            return cyan_.size();
        case Choice::Gray:
            return gray_.size();
        case Choice::Shape:
            return shape_.size();
        case Choice::Width:
            return width_.size();
        case Choice::Dashes:
            return dashes_.size();
        case Choice::Size:
            return size_.size();
    }
    return 0;
}

StyleRecord SequenceGenerator::next(const std::vector<Choice>& choices)
{
    const std::vector<Choice> defaults = {Choice::Shape, Choice::Dashes, Choice::Size,
                                          Choice::Width};
    const auto&               wanted   = choices.empty() ? defaults : choices;

    if (initialized_ && wanted == choices_)
        advance();
    else
        restart(wanted);
    return current_row();
}

void SequenceGenerator::restart(const std::vector<Choice>& choices)
{
    choices_ = choices;
    count_.assign(choices_.size(), 0);
    initialized_ = true;
}

void SequenceGenerator::advance()
{
    for (size_t i = 0; i < count_.size(); ++i)
    {
        if (count_[i] + 1 < value_count(choices_[i]))
        {
            ++count_[i];
            return;
        }
        count_[i] = 0;
    }
    // Every digit wrapped: back at the first permutation
}

StyleRecord SequenceGenerator::current_row() const
{
    StyleRecord r;
    for (size_t i = 0; i < choices_.size(); ++i)
    {
        size_t n = count_[i];
        switch (choices_[i])
        {
            case Choice::Red:
                r.red = red_[n];
                break;
            case Choice::Green:
                r.green = green_[n];
                break;
            case Choice::Blue:
                r.blue = blue_[n];
                break;
            case Choice::Yellow:
                r.red   = yellow_[n];
                r.green = yellow_[n];
                break;
            case Choice::Mauve:
                r.red  = mauve_[n];
                r.blue = mauve_[n];
                break;
            case Choice::Cyan:
                r.green = cyan_[n];
                r.blue  = cyan_[n];
                break;
            case Choice::Gray:
                r.red   = gray_[n] * 0.3;
                r.green = gray_[n] * 0.59;
                r.blue  = gray_[n] * 0.11;
                r.gray  = gray_[n];
                break;
            case Choice::Shape:
                r.shape = shape_[n];
                break;
            case Choice::Width:
                r.width = width_[n];
                break;
            case Choice::Dashes:
                r.dashes = dashes_[n];
                break;
            case Choice::Size:
                r.size = size_[n];
                break;
        }
    }
    return r;
}

const SequenceGenerator::Settings* SequenceGenerator::previous_settings() const
{
    return previous_ ? &*previous_ : nullptr;
}

void SequenceGenerator::register_settings(Settings settings)
{
    previous_ = std::move(settings);
}

// ─── Style ──────────────────────────────────────────────────────────────────

void OuterColor::resolve(const Color& background, bool same)
{
    if (!deferred_)
        return;
    color_    = same ? background : complement(background);
    deferred_ = false;
}

Style::Style(const StyleOptions& options)
    : changes_only_(options.changes_only), same_(options.same), use_color_(options.use_color)
{
    if (!options.auto_none)
    {
        if (options.sequence == nullptr)
            fail<ResourceError>("style", "style: automatic styles need a sequence generator");
        seq_    = options.sequence;
        record_ = seq_->next(options.auto_choices);
        id_     = seq_->new_style_id();
    }

    const StyleRecord& d     = record_;
    Color              color = use_color_ ? rgb(d.red, d.green, d.blue) : gray(d.gray);

    if (options.line)
    {
        const auto& li = *options.line;
        double      w  = li.width.value_or(d.width);
        Dashes      ds = li.dashes.value_or(d.dashes);
        LineStyle   s;
        s.outer_color  = li.outer_color.value_or(OuterColor());
        s.outer_width  = li.outer_width.value_or(2.0 * w);
        s.outer_dashes = li.outer_dashes.value_or(ds);
        s.inner_color  = li.inner_color.value_or(li.color.value_or(color));
        s.inner_width  = li.inner_width.value_or(w);
        s.inner_dashes = li.inner_dashes.value_or(ds);
        line_          = s;
    }

    if (options.bar)
    {
        const auto& bl = *options.bar;
        double      w  = bl.width.value_or(d.width);
        BarStyle    s;
        s.outer_color = bl.outer_color.value_or(OuterColor());
        s.outer_width = bl.outer_width.value_or(2.0 * w);
        s.inner_color = bl.inner_color.value_or(bl.color.value_or(color));
        s.inner_width = bl.inner_width.value_or(w);
        bar_          = s;
    }

    if (options.point)
    {
        const auto& pp = *options.point;
        double      w  = pp.width.value_or(d.width);
        PointStyle  s;
        s.size        = pp.size.value_or(d.size);
        s.shape       = pp.shape.value_or(d.shape);
        s.outer_color = pp.outer_color.value_or(OuterColor());
        s.outer_width = pp.outer_width.value_or(2.0 * w);
        s.inner_color = pp.inner_color.value_or(pp.color.value_or(color));
        s.inner_width = pp.inner_width.value_or(w);
        point_        = s;
    }
}

void Style::resolve_background(const Color& background)
{
    resolve_background(background, same_);
}

void Style::resolve_background(const Color& background, bool same)
{
    if (line_)
        line_->outer_color.resolve(background, same);
    if (bar_)
        bar_->outer_color.resolve(background, same);
    if (point_)
        point_->outer_color.resolve(background, same);
}

namespace
{

std::string dash_array(const Dashes& d)
{
    ps::Writer w;
    w.numbers(d);
    return w.str();
}

// Deferred outlines still unresolved when written are drawn against white
std::string outline(const OuterColor& c)
{
    if (!c.deferred())
        return ps::color(c.color());
    OuterColor resolved = c;
    resolved.resolve(colors::white, false);
    return ps::color(resolved.color());
}

}   // anonymous namespace

SequenceGenerator::Settings Style::settings() const
{
    SequenceGenerator::Settings s;
    if (line_)
    {
        s.emplace_back("locolor", outline(line_->outer_color));
        s.emplace_back("lowidth", format_number(line_->outer_width));
        s.emplace_back("lostyle", dash_array(line_->outer_dashes));
        s.emplace_back("licolor", ps::color(line_->inner_color));
        s.emplace_back("liwidth", format_number(line_->inner_width));
        s.emplace_back("listyle", dash_array(line_->inner_dashes));
    }
    if (point_)
    {
        s.emplace_back("ppshape", "/make_" + std::string(shape_name(point_->shape)) + " cvx");
        s.emplace_back("ppsize", format_number(point_->size));
        s.emplace_back("powidth", format_number(point_->outer_width));
        s.emplace_back("pocolor", outline(point_->outer_color));
        s.emplace_back("picolor", ps::color(point_->inner_color));
        s.emplace_back("piwidth", format_number(point_->inner_width));
    }
    if (bar_)
    {
        s.emplace_back("bocolor", outline(bar_->outer_color));
        s.emplace_back("bowidth", format_number(bar_->outer_width));
        s.emplace_back("bicolor", ps::color(bar_->inner_color));
        s.emplace_back("biwidth", format_number(bar_->inner_width));
    }
    return s;
}

void Style::write(DocumentSink& sink)
{
    sink.add_function(std::string(ps::kGraphStyleName), std::string(ps::graph_style_procedures()));

    SequenceGenerator::Settings current  = settings();
    const auto*                 previous = seq_ ? seq_->previous_settings() : nullptr;

    ps::Writer w;
    w.begin("gstyledict");
    for (const auto& [key, value] : current)
    {
        if (changes_only_ && previous != nullptr)
        {
            bool unchanged = false;
            for (const auto& [pkey, pvalue] : *previous)
            {
                if (pkey == key)
                {
                    unchanged = (pvalue == value);
                    break;
                }
            }
            if (unchanged)
                continue;
        }
        w.def(key, value);
    }
    w.end();
    sink.add_to_page(w.str());

    if (seq_)
        seq_->register_settings(std::move(current));
}

}   // namespace psgraph
