#include "svg_document.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace spinlogo {

namespace {

// Coordinates are written so that they read back as the same double
std::ostringstream make_stream() {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10);
    return ss;
}

// Presentation values (pixels, stroke widths, opacity) keep the stream default
std::string style_number(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

// Extent from lo that reaches hi once added back to lo in floating point
double covering_span(double lo, double hi) {
    double span = hi - lo;
    while (lo + span < hi) {
        span = std::nextafter(span, std::numeric_limits<double>::infinity());
    }
    return span;
}

}  // namespace

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

SvgDocument SvgDocument::from_layers(std::vector<PathLayer> layers,
                                     const ExportOptions& options) {
    SvgDocument doc;
    doc.layers_ = std::move(layers);
    doc.options_ = options;

    bool any = false;
    Vec2 min_pt(std::numeric_limits<double>::max(), std::numeric_limits<double>::max());
    Vec2 max_pt(std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest());
    for (const auto& layer : doc.layers_) {
        for (const auto& p : layer.points) {
            min_pt.x = std::min(min_pt.x, p.x);
            min_pt.y = std::min(min_pt.y, p.y);
            max_pt.x = std::max(max_pt.x, p.x);
            max_pt.y = std::max(max_pt.y, p.y);
            any = true;
        }
    }
    if (!any) {
        throw EmptyGeometryError("cannot export: " + std::to_string(doc.layers_.size()) +
                                 " layer(s) contain no points");
    }

    doc.min_ = min_pt;
    doc.max_ = max_pt;
    doc.view_box_.x = min_pt.x - options.padding;
    doc.view_box_.y = min_pt.y - options.padding;
    doc.view_box_.width = covering_span(doc.view_box_.x, max_pt.x + options.padding);
    doc.view_box_.height = covering_span(doc.view_box_.y, max_pt.y + options.padding);
    return doc;
}

Vec2 SvgDocument::label_position() const {
    return Vec2(view_box_.x, view_box_.y) + options_.label_offset;
}

std::string SvgDocument::path_data(const Curve& points) {
    if (points.empty()) {
        return "";
    }
    auto ss = make_stream();
    ss << "M " << points[0].x << "," << points[0].y;
    for (size_t i = 1; i < points.size(); ++i) {
        ss << " L " << points[i].x << "," << points[i].y;
    }
    return ss.str();
}

std::string SvgDocument::to_svg() const {
    auto ss = make_stream();

    ss << "<?xml version=\"1.0\" encoding=\"utf-8\" ?>\n";
    ss << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\""
       << " width=\"" << style_number(pixel_width()) << "px\""
       << " height=\"" << style_number(pixel_height()) << "px\""
       << " viewBox=\"" << view_box_.x << " " << view_box_.y << " "
       << view_box_.width << " " << view_box_.height << "\">\n";

    ss << "  <rect x=\"" << view_box_.x << "\" y=\"" << view_box_.y << "\""
       << " width=\"" << view_box_.width << "\" height=\"" << view_box_.height << "\""
       << " fill=\"" << xml_escape(options_.background) << "\" />\n";

    for (const auto& layer : layers_) {
        if (layer.points.empty()) {
            continue;
        }
        ss << "  <path d=\"" << path_data(layer.points) << "\""
           << " stroke=\"" << xml_escape(layer.stroke) << "\""
           << " stroke-width=\"" << style_number(layer.stroke_width) << "\""
           << " fill=\"none\"";
        if (layer.opacity) {
            ss << " opacity=\"" << style_number(*layer.opacity) << "\"";
        }
        ss << " />\n";
    }

    Vec2 pos = label_position();
    ss << "  <text x=\"" << pos.x << "\" y=\"" << pos.y << "\""
       << " font-size=\"" << style_number(options_.label_font_size) << "\""
       << " fill=\"" << xml_escape(options_.label_fill) << "\">"
       << xml_escape(options_.label) << "</text>\n";

    ss << "</svg>\n";
    return ss.str();
}

void SvgDocument::save(const std::string& path) const {
    auto log = logging::get_logger();

    std::ofstream file(path);
    if (!file) {
        throw IOFailure("Cannot write to file: " + path);
    }
    file << to_svg();
    file.flush();
    if (!file) {
        throw IOFailure("Write failed for file: " + path);
    }

    log->debug("SvgDocument: wrote {} paths to {} ({} x {} px)",
               layers_.size(), path, pixel_width(), pixel_height());
}

}  // namespace spinlogo
