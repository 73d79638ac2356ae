#ifndef SPINLOGO_SERIALIZATION_SVG_DOCUMENT_HPP
#define SPINLOGO_SERIALIZATION_SVG_DOCUMENT_HPP

#include <geometry/curve.hpp>
#include <optional>
#include <string>
#include <vector>

namespace spinlogo {

// One stroked polyline in the exported document
struct PathLayer {
    Curve points;
    std::string stroke = "black";
    double stroke_width = 0.01;
    std::optional<double> opacity;     // Attribute omitted when empty
};

struct ExportOptions {
    double padding = 0.2;              // Added on every side of the bounds
    double pixels_per_unit = 300.0;

    std::string background = "white";

    std::string label = "spinlogo";   // Always rendered
    Vec2 label_offset{0.05, 0.15};     // From the padded top-left corner
    double label_font_size = 0.1;
    std::string label_fill = "gray";
};

struct ViewBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool contains(const Vec2& p) const {
        return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
    }
};

// Stroke-only vector document: background, one open path per layer in the
// order received, one metadata label. No filled regions.
class SvgDocument {
public:
    // Throws EmptyGeometryError if no layer holds a point
    static SvgDocument from_layers(std::vector<PathLayer> layers,
                                   const ExportOptions& options = ExportOptions{});

    const std::vector<PathLayer>& layers() const { return layers_; }
    const ExportOptions& options() const { return options_; }

    // Raw bounds over every point of every layer
    const Vec2& min_point() const { return min_; }
    const Vec2& max_point() const { return max_; }

    // Padded bounds in logical units
    const ViewBox& view_box() const { return view_box_; }

    double pixel_width() const { return view_box_.width * options_.pixels_per_unit; }
    double pixel_height() const { return view_box_.height * options_.pixels_per_unit; }

    // Where the label baseline starts
    Vec2 label_position() const;

    // "M x0,y0 L x1,y1 ..." without a closing command; empty for no points
    static std::string path_data(const Curve& points);

    // Render the SVG text
    std::string to_svg() const;

    // Write to_svg() to path. Throws IOFailure; a failed write may leave a
    // partial file behind.
    void save(const std::string& path) const;

private:
    std::vector<PathLayer> layers_;
    ExportOptions options_;
    Vec2 min_;
    Vec2 max_;
    ViewBox view_box_;
};

// Escape &, <, >, " and ' for XML text and attributes
std::string xml_escape(const std::string& text);

}  // namespace spinlogo

#endif // SPINLOGO_SERIALIZATION_SVG_DOCUMENT_HPP
