#include "ifc-core/geom/Processors.hpp"
#include "EntityGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace ifccore::geom {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct Frame {
    Vector3 tangent;
    Vector3 u;
    Vector3 v;
};

/**
 * @brief Rotation-minimizing frames along a polyline
 *
 * Interior tangents bisect the adjacent segments; each frame is the
 * previous one rotated onto the new tangent.
 */
std::vector<Frame> parallelTransportFrames(const std::vector<Vector3>& points) {
    size_t n = points.size();
    std::vector<Frame> frames(n);
    for (size_t i = 0; i < n; ++i) {
        Vector3 prev = i > 0 ? (points[i] - points[i - 1]).normalized() : Vector3();
        Vector3 next = i + 1 < n ? (points[i + 1] - points[i]).normalized() : Vector3();
        Vector3 t = (prev + next).normalized();
        if (t.length() < 0.5) {
            t = next.length() > 0.5 ? next : prev;
        }
        frames[i].tangent = t;
    }

    Vector3 t0 = frames[0].tangent;
    Vector3 reference = std::abs(t0.x) < 0.9 ? Vector3(1, 0, 0) : Vector3(0, 1, 0);
    frames[0].u = (t0 % reference).normalized();
    frames[0].v = t0 % frames[0].u;

    for (size_t i = 1; i < n; ++i) {
        const Vector3& a = frames[i - 1].tangent;
        const Vector3& b = frames[i].tangent;
        Vector3 u = frames[i - 1].u;
        Vector3 axis = a % b;
        double s = axis.length();
        if (s > 1e-12) {
            u = Matrix3::rotation(axis, std::atan2(s, a * b)) * u;
        }
        u = (u - b * (u * b)).normalized();
        frames[i].u = u;
        frames[i].v = b % u;
    }
    return frames;
}

std::vector<Vector3> removeRepeatedPoints(const std::vector<Vector3>& points) {
    std::vector<Vector3> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        if (result.empty() || (p - result.back()).length() > 1e-9) {
            result.push_back(p);
        }
    }
    return result;
}

} // anonymous namespace

SweptDiskSolidProcessor::SweptDiskSolidProcessor(size_t segments)
    : segments(std::max<size_t>(segments, 3)) {}

Result<Mesh> SweptDiskSolidProcessor::process(const step::DecodedEntity& entity,
                                              const step::EntityResolver& resolver) const {
    // (Directrix, Radius, InnerRadius, StartParam, EndParam)
    auto directrixRef = entity.getRef(0);
    if (!directrixRef) {
        return Result<Mesh>::invalidAttribute(0, "Missing Directrix").withEntity(entity.id);
    }
    auto radius = detail::readPositive(entity, 1, "Radius", ErrorCode::Geometry);
    if (!radius) {
        return Result<Mesh>::from(radius).withEntity(entity.id);
    }
    double innerRadius = entity.getFloat(2).value_or(0.0);
    if (innerRadius < 0.0 || innerRadius >= radius.value) {
        auto r = Result<Mesh>::error(ErrorCode::Geometry,
            "InnerRadius must be in [0, Radius), got " + std::to_string(innerRadius));
        r.entityId = entity.id;
        r.attributeIndex = 2;
        return r;
    }

    auto curve = detail::readCurvePoints(*directrixRef, resolver);
    if (!curve) {
        return Result<Mesh>::from(curve).withEntity(entity.id);
    }
    std::vector<Vector3> points = removeRepeatedPoints(curve.value);
    if (points.size() < 2) {
        auto r = Result<Mesh>::error(ErrorCode::Geometry, "Directrix needs at least 2 distinct points");
        r.entityId = entity.id;
        return r;
    }

    std::vector<Frame> frames = parallelTransportFrames(points);
    const size_t n = segments;

    Mesh mesh;
    mesh.reserve(points.size() * n * 2 + n * 4, points.size() * n * 4 + n * 4);

    // Rings of vertices with radial normals; the inner surface faces the axis
    auto addTube = [&](double r, bool inward) {
        auto base = static_cast<uint32_t>(mesh.getVertexCount());
        for (size_t i = 0; i < points.size(); ++i) {
            for (size_t j = 0; j < n; ++j) {
                double angle = 2.0 * kPi * static_cast<double>(j) / static_cast<double>(n);
                Vector3 radial = frames[i].u * std::cos(angle) + frames[i].v * std::sin(angle);
                mesh.addVertex(points[i] + radial * r, inward ? -radial : radial);
            }
        }
        for (size_t i = 0; i + 1 < points.size(); ++i) {
            for (size_t j = 0; j < n; ++j) {
                size_t jn = (j + 1) % n;
                uint32_t a = base + static_cast<uint32_t>(i * n + j);
                uint32_t b = base + static_cast<uint32_t>(i * n + jn);
                uint32_t c = base + static_cast<uint32_t>((i + 1) * n + jn);
                uint32_t d = base + static_cast<uint32_t>((i + 1) * n + j);
                if (inward) {
                    mesh.addTriangle(a, c, b);
                    mesh.addTriangle(a, d, c);
                } else {
                    mesh.addTriangle(a, b, c);
                    mesh.addTriangle(a, c, d);
                }
            }
        }
    };

    auto ringPoint = [&](size_t i, size_t j, double r) {
        double angle = 2.0 * kPi * static_cast<double>(j % n) / static_cast<double>(n);
        return points[i] + (frames[i].u * std::cos(angle) + frames[i].v * std::sin(angle)) * r;
    };

    addTube(radius.value, false);

    size_t last = points.size() - 1;
    if (innerRadius > 0.0) {
        addTube(innerRadius, true);
        for (size_t j = 0; j < n; ++j) {
            // Start annulus faces -tangent, end annulus faces +tangent
            mesh.addFlatQuad(ringPoint(0, j, radius.value), ringPoint(0, j, innerRadius),
                             ringPoint(0, j + 1, innerRadius), ringPoint(0, j + 1, radius.value));
            mesh.addFlatQuad(ringPoint(last, j, radius.value), ringPoint(last, j + 1, radius.value),
                             ringPoint(last, j + 1, innerRadius), ringPoint(last, j, innerRadius));
        }
    } else {
        const Vector3& s = points.front();
        const Vector3& e = points.back();
        for (size_t j = 0; j < n; ++j) {
            mesh.addFlatTriangle(s, ringPoint(0, j + 1, radius.value), ringPoint(0, j, radius.value));
            mesh.addFlatTriangle(e, ringPoint(last, j, radius.value), ringPoint(last, j + 1, radius.value));
        }
    }
    return Result<Mesh>::ok(std::move(mesh));
}

} // namespace ifccore::geom
