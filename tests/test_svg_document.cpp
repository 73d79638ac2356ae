#include <gtest/gtest.h>
#include <serialization/svg_document.hpp>
#include <session/logo_session.hpp>
#include <common/errors.hpp>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace spinlogo;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::vector<PathLayer> two_layers() {
    PathLayer a;
    a.points = {{0.0, 0.0}, {1.0, 2.0}};
    a.stroke = "blue";
    a.opacity = 0.6;

    PathLayer b;
    b.points = {{-0.5, 0.5}, {0.5, 0.5}};
    b.stroke = "red";
    b.stroke_width = 0.015;
    return {a, b};
}

// Every x,y pair written into the d attributes of the rendered paths
std::vector<Vec2> rendered_points(const std::string& svg) {
    std::vector<Vec2> points;
    const std::string key = "<path d=\"";
    for (size_t pos = svg.find(key); pos != std::string::npos;
         pos = svg.find(key, pos + key.size())) {
        size_t start = pos + key.size();
        std::string data = svg.substr(start, svg.find('"', start) - start);
        std::replace(data.begin(), data.end(), ',', ' ');
        std::istringstream in(data);
        std::string command;
        double x = 0.0;
        double y = 0.0;
        while (in >> command >> x >> y) {
            points.emplace_back(x, y);
        }
    }
    return points;
}

ViewBox rendered_view_box(const std::string& svg) {
    const std::string key = "viewBox=\"";
    size_t start = svg.find(key) + key.size();
    std::istringstream in(svg.substr(start, svg.find('"', start) - start));
    ViewBox vb;
    in >> vb.x >> vb.y >> vb.width >> vb.height;
    return vb;
}

}  // namespace

// ============================================
// Layout
// ============================================

TEST(SvgDocumentTest, EmptyLayersThrow) {
    EXPECT_THROW(SvgDocument::from_layers({}), EmptyGeometryError);

    PathLayer empty;
    EXPECT_THROW(SvgDocument::from_layers({empty, empty}), EmptyGeometryError);
}

TEST(SvgDocumentTest, PaddedViewBox) {
    SvgDocument doc = SvgDocument::from_layers(two_layers());

    EXPECT_EQ(doc.min_point(), Vec2(-0.5, 0.0));
    EXPECT_EQ(doc.max_point(), Vec2(1.0, 2.0));

    const ViewBox& vb = doc.view_box();
    EXPECT_NEAR(vb.x, -0.7, 1e-12);
    EXPECT_NEAR(vb.y, -0.2, 1e-12);
    EXPECT_NEAR(vb.width, 1.5 + 0.4, 1e-12);
    EXPECT_NEAR(vb.height, 2.0 + 0.4, 1e-12);

    EXPECT_NEAR(doc.pixel_width(), 1.9 * 300.0, 1e-9);
    EXPECT_NEAR(doc.pixel_height(), 2.4 * 300.0, 1e-9);
}

TEST(SvgDocumentTest, ViewBoxContainsEveryPoint) {
    SvgDocument doc = SvgDocument::from_layers(two_layers());
    for (const auto& layer : doc.layers()) {
        for (const auto& p : layer.points) {
            EXPECT_TRUE(doc.view_box().contains(p));
        }
    }
}

TEST(SvgDocumentTest, CustomPaddingAndScale) {
    ExportOptions options;
    options.padding = 0.0;
    options.pixels_per_unit = 100.0;
    SvgDocument doc = SvgDocument::from_layers(two_layers(), options);

    EXPECT_NEAR(doc.view_box().width, 1.5, 1e-12);
    EXPECT_NEAR(doc.pixel_height(), 200.0, 1e-9);
}

TEST(SvgDocumentTest, LabelPosition) {
    SvgDocument doc = SvgDocument::from_layers(two_layers());
    Vec2 pos = doc.label_position();
    EXPECT_NEAR(pos.x, -0.7 + 0.05, 1e-12);
    EXPECT_NEAR(pos.y, -0.2 + 0.15, 1e-12);
}

// ============================================
// Rendering
// ============================================

TEST(SvgDocumentTest, PathDataIsOpen) {
    EXPECT_EQ(SvgDocument::path_data({{0.0, 0.0}, {1.0, 2.0}, {0.5, -0.25}}),
              "M 0,0 L 1,2 L 0.5,-0.25");
    EXPECT_EQ(SvgDocument::path_data({}), "");
}

TEST(SvgDocumentTest, OnePathPerLayerInOrder) {
    SvgDocument doc = SvgDocument::from_layers(two_layers());
    std::string svg = doc.to_svg();

    EXPECT_EQ(count_occurrences(svg, "<path "), 2u);
    EXPECT_EQ(count_occurrences(svg, "fill=\"none\""), 2u);
    EXPECT_LT(svg.find("stroke=\"blue\""), svg.find("stroke=\"red\""));
    EXPECT_EQ(svg.find(" Z"), std::string::npos);

    // Opacity only where the layer sets it
    EXPECT_EQ(count_occurrences(svg, "opacity="), 1u);
    EXPECT_NE(svg.find("opacity=\"0.6\""), std::string::npos);
}

TEST(SvgDocumentTest, HeaderAndBackground) {
    ExportOptions options;
    options.padding = 0.25;
    SvgDocument doc = SvgDocument::from_layers(two_layers(), options);
    std::string svg = doc.to_svg();

    EXPECT_NE(svg.find("viewBox=\"-0.75 -0.25 2 2.5\""), std::string::npos);
    EXPECT_NE(svg.find("width=\"600px\""), std::string::npos);
    EXPECT_NE(svg.find("height=\"750px\""), std::string::npos);
    EXPECT_NE(svg.find("fill=\"white\""), std::string::npos);
    EXPECT_NE(svg.find("</svg>"), std::string::npos);
}

TEST(SvgDocumentTest, LabelIsEscaped) {
    ExportOptions options;
    options.label = "Logo <3 & more";
    SvgDocument doc = SvgDocument::from_layers(two_layers(), options);
    std::string svg = doc.to_svg();

    EXPECT_NE(svg.find(">Logo &lt;3 &amp; more</text>"), std::string::npos);
    EXPECT_NE(svg.find("font-size=\"0.1\""), std::string::npos);
    EXPECT_NE(svg.find("fill=\"gray\""), std::string::npos);
}

TEST(SvgDocumentTest, LabelAlwaysRendered) {
    SvgDocument doc = SvgDocument::from_layers(two_layers());
    std::string svg = doc.to_svg();
    EXPECT_EQ(count_occurrences(svg, "<text "), 1u);
    EXPECT_NE(svg.find(">spinlogo</text>"), std::string::npos);

    ExportOptions options;
    options.label.clear();
    svg = SvgDocument::from_layers(two_layers(), options).to_svg();
    EXPECT_EQ(count_occurrences(svg, "<text "), 1u);
}

TEST(SvgDocumentTest, CoordinatesReadBackExactly) {
    PathLayer layer;
    layer.points = {{0.1, 1.0 / 3.0}, {-2.0 / 7.0, 0.7}, {1e-17, -0.30000000000000004}};
    SvgDocument doc = SvgDocument::from_layers({layer});

    std::vector<Vec2> points = rendered_points(doc.to_svg());
    ASSERT_EQ(points.size(), layer.points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_EQ(points[i], layer.points[i]);
    }
}

TEST(SvgDocumentTest, RenderedEmblemStaysInsideRenderedViewBox) {
    LogoSession session(EmblemGeometry::build(), AirfoilParams{}, OverlayParams{0.0, 3});
    ExportOptions options;
    options.padding = 0.0;
    SvgDocument doc = session.to_document(options);
    std::string svg = doc.to_svg();

    size_t expected = 0;
    for (const auto& layer : doc.layers()) {
        expected += layer.points.size();
    }
    std::vector<Vec2> points = rendered_points(svg);
    ASSERT_EQ(points.size(), expected);

    ViewBox vb = rendered_view_box(svg);
    EXPECT_EQ(vb.x, doc.view_box().x);
    EXPECT_EQ(vb.width, doc.view_box().width);
    for (const auto& p : points) {
        EXPECT_TRUE(vb.contains(p)) << "(" << p.x << ", " << p.y << ")";
    }
}

TEST(SvgDocumentTest, XmlEscape) {
    EXPECT_EQ(xml_escape("a\"b'c"), "a&quot;b&apos;c");
    EXPECT_EQ(xml_escape("plain"), "plain");
}

// ============================================
// Files
// ============================================

TEST(SvgDocumentTest, SaveWritesDocument) {
    SvgDocument doc = SvgDocument::from_layers(two_layers());
    std::string path = ::testing::TempDir() + "spinlogo_svg_document_test.svg";
    doc.save(path);

    std::ifstream file(path);
    ASSERT_TRUE(file.good());
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_EQ(contents.str(), doc.to_svg());
    std::remove(path.c_str());
}

TEST(SvgDocumentTest, SaveToMissingDirectoryThrows) {
    SvgDocument doc = SvgDocument::from_layers(two_layers());
    EXPECT_THROW(doc.save("/nonexistent-spinlogo-dir/out.svg"), IOFailure);
}
