#pragma once

#include <xdot_model/draw_surface.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace xdotview_test {

// DrawSurface that records every call instead of drawing.
class RecordingSurface : public xdot_model::DrawSurface {
public:
    enum class Op { MoveTo, LineTo, CurveTo, ClosePath, Fill, Stroke, Clip, Text };

    struct Record {
        Op op;
        std::vector<xdot_model::Point> points;
        xdot_model::Color color;
        double line_width = 0.0;
        std::vector<double> dash;
        std::string text;
        std::string font;
        double font_size = 0.0;
    };

    // Returned by measure_text for every string.
    xdot_model::TextExtent text_extent{0.0, 0.0};

    std::vector<Record> records;

    void move_to(xdot_model::Point p) override { push(Op::MoveTo, {p}); }
    void line_to(xdot_model::Point p) override { push(Op::LineTo, {p}); }
    void curve_to(xdot_model::Point c1, xdot_model::Point c2, xdot_model::Point end) override {
        push(Op::CurveTo, {c1, c2, end});
    }
    void close_path() override { push(Op::ClosePath, {}); }

    void fill(const xdot_model::Color& color) override {
        Record& r = push(Op::Fill, {});
        r.color = color;
    }
    void stroke(const xdot_model::Color& color, double line_width, const std::vector<double>& dash) override {
        Record& r = push(Op::Stroke, {});
        r.color = color;
        r.line_width = line_width;
        r.dash = dash;
    }

    void clip_rect(xdot_model::Point min, xdot_model::Point max) override { push(Op::Clip, {min, max}); }

    xdot_model::TextExtent measure_text(const std::string&, const std::string&, double) override {
        return text_extent;
    }
    void draw_text(xdot_model::Point origin, const std::string& text, const std::string& font_family,
        double font_size, const xdot_model::Color& color) override
    {
        Record& r = push(Op::Text, {origin});
        r.text = text;
        r.font = font_family;
        r.font_size = font_size;
        r.color = color;
    }

    std::vector<Op> ops() const {
        std::vector<Op> out;
        for (const auto& r : records)
            out.push_back(r.op);
        return out;
    }

    std::size_t count(Op op) const {
        std::size_t n = 0;
        for (const auto& r : records)
            if (r.op == op) ++n;
        return n;
    }

    // Fill and stroke records, in order.
    std::vector<Record> paints() const {
        std::vector<Record> out;
        for (const auto& r : records)
            if (r.op == Op::Fill || r.op == Op::Stroke) out.push_back(r);
        return out;
    }

private:
    Record& push(Op op, std::vector<xdot_model::Point> points) {
        Record r;
        r.op = op;
        r.points = std::move(points);
        records.push_back(std::move(r));
        return records.back();
    }
};

} // namespace xdotview_test
