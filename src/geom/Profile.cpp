#include "ifc-core/geom/Profile.hpp"
#include "ifc-core/geom/Triangulation.hpp"
#include <algorithm>
#include <cmath>

namespace ifccore::geom {

namespace {

constexpr double kPi = 3.14159265358979323846;

void dropClosingPoint(std::vector<Vector2>& loop) {
    while (loop.size() > 1 && loop.front() == loop.back()) {
        loop.pop_back();
    }
}

} // anonymous namespace

size_t calculateCircleSegments(double radius) {
    if (!(radius > 0.0)) {
        return 8;
    }
    double segments = std::ceil(std::sqrt(radius) * 8.0);
    return static_cast<size_t>(std::clamp(segments, 8.0, 32.0));
}

std::vector<Vector2> circlePoints(const Vector2& center, double radius, size_t segments) {
    std::vector<Vector2> points;
    points.reserve(segments);
    for (size_t i = 0; i < segments; ++i) {
        double angle = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(segments);
        points.emplace_back(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
    }
    return points;
}

Profile2D Profile2D::rectangle(double width, double height) {
    Profile2D profile;
    profile.type = ProfileType::Rectangle;
    double hw = width / 2.0;
    double hh = height / 2.0;
    profile.outer = {
        Vector2(-hw, -hh),
        Vector2(hw, -hh),
        Vector2(hw, hh),
        Vector2(-hw, hh)
    };
    return profile;
}

Profile2D Profile2D::circle(double radius, size_t segments) {
    Profile2D profile;
    profile.type = ProfileType::Circle;
    if (segments == 0) {
        segments = calculateCircleSegments(radius);
    }
    profile.outer = circlePoints(Vector2(), radius, segments);
    return profile;
}

Profile2D Profile2D::polygon(std::vector<Vector2> points) {
    Profile2D profile;
    profile.type = ProfileType::Arbitrary;
    profile.outer = std::move(points);
    return profile;
}

void Profile2D::applyPlacement(const Vector2& origin, const Vector2& xAxis) {
    double len = xAxis.length();
    Vector2 x = len > 1e-12 ? xAxis * (1.0 / len) : Vector2(1, 0);
    Vector2 y(-x.y, x.x);
    auto place = [&](Vector2& p) {
        p = origin + x * p.x + y * p.y;
    };
    for (auto& p : outer) {
        place(p);
    }
    for (auto& hole : holes) {
        for (auto& p : hole) {
            place(p);
        }
    }
}

Profile2D Profile2D::normalized() const {
    Profile2D result;
    result.type = type;
    result.outer = outer;
    dropClosingPoint(result.outer);
    if (signedArea(result.outer) < 0.0) {
        std::reverse(result.outer.begin(), result.outer.end());
    }
    for (const auto& hole : holes) {
        std::vector<Vector2> h = hole;
        dropClosingPoint(h);
        if (h.size() < 3) {
            continue;
        }
        if (signedArea(h) > 0.0) {
            std::reverse(h.begin(), h.end());
        }
        result.holes.push_back(std::move(h));
    }
    return result;
}

double Profile2D::area() const {
    double total = std::abs(signedArea(outer));
    for (const auto& hole : holes) {
        total -= std::abs(signedArea(hole));
    }
    return total;
}

Result<ProfileTriangulation> Profile2D::triangulate() const {
    auto indices = triangulatePolygonWithHoles(outer, holes);
    if (!indices) {
        return Result<ProfileTriangulation>::from(indices);
    }
    ProfileTriangulation result;
    result.points = outer;
    for (const auto& hole : holes) {
        result.points.insert(result.points.end(), hole.begin(), hole.end());
    }
    result.indices = std::move(indices.value);
    return Result<ProfileTriangulation>::ok(std::move(result));
}

VoidInfo VoidInfo::through(std::vector<Vector2> contour, double depth) {
    VoidInfo info;
    info.contour = std::move(contour);
    info.depthStart = 0.0;
    info.depthEnd = depth;
    info.isThrough = true;
    return info;
}

VoidInfo VoidInfo::partial(std::vector<Vector2> contour, double start, double end) {
    VoidInfo info;
    info.contour = std::move(contour);
    info.depthStart = start;
    info.depthEnd = end;
    info.isThrough = false;
    return info;
}

} // namespace ifccore::geom
