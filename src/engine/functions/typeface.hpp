#pragma once

#include <nlohmann/json.hpp>
#include "pch.hpp"

using json = nlohmann::json;

using Contour = std::vector<vec2>;

struct Shape {
    Contour outline;
    std::vector<Contour> holes;
};

enum class PathOp {
    MOVE,
    LINE,
    QUAD,
    CUBIC,
};

// Outline command in font units; `to` is the end point, c1/c2 the controls.
struct PathCommand {
    PathOp op;
    vec2 to;
    vec2 c1;
    vec2 c2;
};

struct TypefaceGlyph {
    real advance = 0.0f;
    std::vector<PathCommand> outline;
};

// Typeface in the JSON layout produced by facetype.js: glyph outlines as
// "m/l/q/b" command strings in font units, advances in `ha`.
class Typeface {
  private:
    std::unordered_map<char32_t, TypefaceGlyph> glyphs;
    std::string family;
    real resolution = 1000.0f;
    real lineHeight = 0.0f;

    void appendGlyphShapes(const TypefaceGlyph &glyph, real scale, vec2 offset,
                           int curveSegments, std::vector<Shape> &shapes) const;

  public:
    Typeface() = default;

    static Typeface load(const std::string &path);
    static Typeface parse(const json &data);

    // Lays out `text` starting at the origin, one line per '\n'.
    std::vector<Shape> generateShapes(const std::string &text, real size,
                                      int curveSegments) const;

    bool hasGlyph(char32_t codepoint) const { return glyphs.count(codepoint) > 0; }
    size_t glyphCount() const { return glyphs.size(); }
    const std::string &getFamily() const { return family; }
    real getResolution() const { return resolution; }
    real getLineHeight() const { return lineHeight; }
};

namespace ShapeUtils {
    // Positive for counter-clockwise contours (y up).
    real area(const Contour &contour);
    bool isClockWise(const Contour &contour);
    bool containsPoint(const Contour &contour, const vec2 &point);
    std::vector<char32_t> decodeUtf8(const std::string &text);
} // namespace ShapeUtils
