#include "engine/functions/typeface.hpp"

namespace ShapeUtils {

    real area(const Contour &contour) {
        real sum = 0.0f;
        size_t n = contour.size();
        for (size_t p = n - 1, q = 0; q < n; p = q++)
            sum += contour[p].x * contour[q].y - contour[q].x * contour[p].y;
        return sum * 0.5f;
    }

    bool isClockWise(const Contour &contour) { return area(contour) < 0.0f; }

    bool containsPoint(const Contour &contour, const vec2 &point) {
        bool inside = false;
        size_t n = contour.size();
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const vec2 &a = contour[i];
            const vec2 &b = contour[j];
            if ((a.y > point.y) != (b.y > point.y) &&
                point.x < (b.x - a.x) * (point.y - a.y) / (b.y - a.y) + a.x)
                inside = !inside;
        }
        return inside;
    }

    std::vector<char32_t> decodeUtf8(const std::string &text) {
        std::vector<char32_t> result;
        result.reserve(text.size());
        for (size_t i = 0; i < text.size();) {
            unsigned char lead = static_cast<unsigned char>(text[i]);
            size_t length = 1;
            char32_t codepoint = lead;
            if (lead >= 0xF0) {
                length = 4;
                codepoint = lead & 0x07;
            } else if (lead >= 0xE0) {
                length = 3;
                codepoint = lead & 0x0F;
            } else if (lead >= 0xC0) {
                length = 2;
                codepoint = lead & 0x1F;
            } else if (lead >= 0x80) {
                // stray continuation byte
                result.push_back(U'\uFFFD');
                ++i;
                continue;
            }
            if (i + length > text.size()) {
                result.push_back(U'\uFFFD');
                break;
            }
            for (size_t k = 1; k < length; ++k)
                codepoint = (codepoint << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
            result.push_back(codepoint);
            i += length;
        }
        return result;
    }

} // namespace ShapeUtils

namespace {

    real readNumber(std::istringstream &stream, const std::string &glyphName) {
        std::string token;
        if (!(stream >> token))
            throw std::runtime_error("Truncated outline in glyph '" + glyphName + "'");
        try {
            return std::stof(token);
        } catch (const std::exception &) {
            throw std::runtime_error("Bad number '" + token + "' in glyph '" + glyphName + "'");
        }
    }

    std::vector<PathCommand> parseOutline(const std::string &outline, const std::string &glyphName) {
        std::vector<PathCommand> commands;
        std::istringstream stream(outline);
        std::string op;
        while (stream >> op) {
            PathCommand command{};
            if (op == "m" || op == "l") {
                command.op = op == "m" ? PathOp::MOVE : PathOp::LINE;
                command.to.x = readNumber(stream, glyphName);
                command.to.y = readNumber(stream, glyphName);
            } else if (op == "q") {
                command.op = PathOp::QUAD;
                command.to.x = readNumber(stream, glyphName);
                command.to.y = readNumber(stream, glyphName);
                command.c1.x = readNumber(stream, glyphName);
                command.c1.y = readNumber(stream, glyphName);
            } else if (op == "b") {
                command.op = PathOp::CUBIC;
                command.to.x = readNumber(stream, glyphName);
                command.to.y = readNumber(stream, glyphName);
                command.c1.x = readNumber(stream, glyphName);
                command.c1.y = readNumber(stream, glyphName);
                command.c2.x = readNumber(stream, glyphName);
                command.c2.y = readNumber(stream, glyphName);
            } else {
                continue;
            }
            commands.push_back(command);
        }
        return commands;
    }

    void appendPoint(Contour &contour, const vec2 &point) {
        if (contour.empty() || contour.back() != point)
            contour.push_back(point);
    }

    void closeContour(Contour &contour, std::vector<Contour> &contours) {
        if (contour.size() > 1 && contour.front() == contour.back())
            contour.pop_back();
        if (contour.size() >= 3)
            contours.push_back(std::move(contour));
        contour.clear();
    }

} // namespace

Typeface Typeface::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Failed to open typeface: " + path);
    json data;
    try {
        file >> data;
    } catch (const json::exception &e) {
        throw std::runtime_error("Failed to parse typeface " + path + ": " + e.what());
    }
    return parse(data);
}

Typeface Typeface::parse(const json &data) {
    if (!data.is_object() || !data.contains("glyphs") || !data["glyphs"].is_object())
        throw std::runtime_error("Typeface has no glyph table");

    Typeface typeface;
    try {
        typeface.family = data.value("familyName", std::string("unknown"));
        typeface.resolution = data.value("resolution", 1000.0f);
        if (typeface.resolution <= 0.0f)
            throw std::runtime_error("Typeface resolution must be positive");

        real yMin = 0.0f, yMax = typeface.resolution;
        if (data.contains("boundingBox")) {
            yMin = data["boundingBox"].value("yMin", 0.0f);
            yMax = data["boundingBox"].value("yMax", typeface.resolution);
        }
        typeface.lineHeight = yMax - yMin + data.value("underlineThickness", 0.0f);

        for (auto &[key, value] : data["glyphs"].items()) {
            std::vector<char32_t> codepoints = ShapeUtils::decodeUtf8(key);
            if (codepoints.size() != 1)
                continue;
            TypefaceGlyph &glyph = typeface.glyphs[codepoints.front()];
            glyph.advance = value.value("ha", 0.0f);
            if (value.contains("o") && value["o"].is_string())
                glyph.outline = parseOutline(value["o"].get<std::string>(), key);
        }
    } catch (const json::exception &e) {
        throw std::runtime_error(std::string("Malformed typeface: ") + e.what());
    }
    return typeface;
}

std::vector<Shape> Typeface::generateShapes(const std::string &text, real size,
                                            int curveSegments) const {
    std::vector<Shape> shapes;
    real scale = size / resolution;
    vec2 offset(0.0f);
    curveSegments = std::max(curveSegments, 1);

    for (char32_t codepoint : ShapeUtils::decodeUtf8(text)) {
        if (codepoint == U'\n') {
            offset.x = 0.0f;
            offset.y -= lineHeight * scale;
            continue;
        }
        auto it = glyphs.find(codepoint);
        if (it == glyphs.end()) {
            std::cerr << "[WARN] " << "Character U+" << std::hex << static_cast<uint32_t>(codepoint)
                      << std::dec << " does not exist in font family " << family << "\n";
            it = glyphs.find(U'?');
            if (it == glyphs.end())
                continue;
        }
        appendGlyphShapes(it->second, scale, offset, curveSegments, shapes);
        offset.x += it->second.advance * scale;
    }
    return shapes;
}

void Typeface::appendGlyphShapes(const TypefaceGlyph &glyph, real scale, vec2 offset,
                                 int curveSegments, std::vector<Shape> &shapes) const {
    std::vector<Contour> contours;
    Contour contour;
    vec2 cursor(0.0f);

    for (const PathCommand &command : glyph.outline) {
        vec2 to = command.to * scale + offset;
        switch (command.op) {
        case PathOp::MOVE:
            closeContour(contour, contours);
            appendPoint(contour, to);
            break;
        case PathOp::LINE:
            appendPoint(contour, to);
            break;
        case PathOp::QUAD: {
            vec2 c1 = command.c1 * scale + offset;
            for (int d = 1; d <= curveSegments; ++d) {
                real t = static_cast<real>(d) / curveSegments;
                real k = 1.0f - t;
                appendPoint(contour, k * k * cursor + 2.0f * k * t * c1 + t * t * to);
            }
            break;
        }
        case PathOp::CUBIC: {
            vec2 c1 = command.c1 * scale + offset;
            vec2 c2 = command.c2 * scale + offset;
            for (int d = 1; d <= curveSegments; ++d) {
                real t = static_cast<real>(d) / curveSegments;
                real k = 1.0f - t;
                appendPoint(contour, k * k * k * cursor + 3.0f * k * k * t * c1 +
                                         3.0f * k * t * t * c2 + t * t * t * to);
            }
            break;
        }
        }
        cursor = to;
    }
    closeContour(contour, contours);
    if (contours.empty())
        return;

    // The largest contour is always a solid; its winding tells solids from holes.
    auto largest = std::max_element(contours.begin(), contours.end(),
                                    [](const Contour &a, const Contour &b) {
                                        return std::abs(ShapeUtils::area(a)) <
                                               std::abs(ShapeUtils::area(b));
                                    });
    bool solidClockWise = ShapeUtils::isClockWise(*largest);

    size_t first = shapes.size();
    std::vector<const Contour *> holes;
    for (Contour &candidate : contours) {
        if (ShapeUtils::isClockWise(candidate) == solidClockWise)
            shapes.push_back(Shape{std::move(candidate), {}});
        else
            holes.push_back(&candidate);
    }
    for (const Contour *hole : holes) {
        Shape *owner = &shapes[first];
        for (size_t i = first; i < shapes.size(); ++i) {
            if (ShapeUtils::containsPoint(shapes[i].outline, hole->front())) {
                owner = &shapes[i];
                break;
            }
        }
        owner->holes.push_back(*hole);
    }
}
