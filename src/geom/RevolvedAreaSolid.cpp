#include "ifc-core/geom/Processors.hpp"
#include "ifc-core/geom/Profile.hpp"
#include "EntityGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace ifccore::geom {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

struct AxisLine {
    Vector3 location;
    Vector3 direction;
};

Result<AxisLine> readAxis1Placement(const step::DecodedEntity& axis, const step::EntityResolver& resolver) {
    // (Location, Axis)
    AxisLine line;
    line.direction = Vector3(0, 0, 1);
    if (axis.typeName != "IFCAXIS1PLACEMENT") {
        auto r = Result<AxisLine>::error(ErrorCode::InvalidAttribute,
            "Expected IFCAXIS1PLACEMENT, found " + axis.typeName);
        r.entityId = axis.id;
        return r;
    }
    if (auto locationRef = axis.getRef(0)) {
        auto location = detail::readCartesianPoint(*locationRef, resolver);
        if (!location) {
            return Result<AxisLine>::from(location).withEntity(axis.id);
        }
        line.location = location.value;
    }
    if (auto directionRef = axis.getRef(1)) {
        auto direction = detail::readDirection(*directionRef, resolver);
        if (!direction) {
            return Result<AxisLine>::from(direction).withEntity(axis.id);
        }
        line.direction = direction.value;
    }
    return Result<AxisLine>::ok(line);
}

} // anonymous namespace

RevolvedAreaSolidProcessor::RevolvedAreaSolidProcessor(size_t fullCircleSegments)
    : fullCircleSegments(std::max<size_t>(fullCircleSegments, 3)) {}

Result<Mesh> RevolvedAreaSolidProcessor::process(const step::DecodedEntity& entity,
                                                 const step::EntityResolver& resolver) const {
    // (SweptArea, Position, Axis, Angle)
    auto profileEntity = resolver.resolveAttribute(entity, 0);
    if (!profileEntity) {
        return Result<Mesh>::from(profileEntity).withEntity(entity.id);
    }
    auto profile = profileFromEntity(*profileEntity.value, resolver);
    if (!profile) {
        return Result<Mesh>::from(profile).withEntity(entity.id);
    }
    Profile2D section = profile.value.normalized();
    if (section.outer.size() < 3) {
        auto r = Result<Mesh>::error(ErrorCode::Profile, "Revolved profile has fewer than 3 points");
        r.entityId = entity.id;
        return r;
    }

    auto axisEntity = resolver.resolveAttribute(entity, 2);
    if (!axisEntity) {
        return Result<Mesh>::from(axisEntity).withEntity(entity.id);
    }
    auto axis = readAxis1Placement(*axisEntity.value, resolver);
    if (!axis) {
        return Result<Mesh>::from(axis).withEntity(entity.id);
    }

    auto angleValue = entity.getFloat(3);
    if (!angleValue) {
        return Result<Mesh>::invalidAttribute(3, "Missing Angle").withEntity(entity.id);
    }
    double angle = std::clamp(*angleValue, -kTwoPi, kTwoPi);
    if (std::abs(angle) < 1e-9) {
        auto r = Result<Mesh>::error(ErrorCode::Geometry, "Revolution angle is zero");
        r.entityId = entity.id;
        return r;
    }

    bool fullCircle = std::abs(angle) >= kTwoPi * 0.995;
    size_t segments = fullCircle
        ? fullCircleSegments
        : std::max<size_t>(4, static_cast<size_t>(
              std::ceil(std::abs(angle) / kTwoPi * static_cast<double>(fullCircleSegments))));

    // Rotations for each ring; the last ring of a full circle is the first
    std::vector<Matrix3> rings;
    rings.reserve(segments + 1);
    for (size_t i = 0; i <= segments; ++i) {
        double theta = (fullCircle && i == segments)
            ? 0.0
            : angle * static_cast<double>(i) / static_cast<double>(segments);
        rings.push_back(Matrix3::rotation(axis.value.direction, theta));
    }
    auto place = [&](const Vector2& p, size_t ring) {
        Vector3 local = Vector3(p.x, p.y, 0.0) - axis.value.location;
        return axis.value.location + rings[ring] * local;
    };

    Mesh mesh;
    auto sweepLoop = [&](const std::vector<Vector2>& loop) {
        size_t n = loop.size();
        for (size_t i = 0; i < segments; ++i) {
            for (size_t j = 0; j < n; ++j) {
                const Vector2& a = loop[j];
                const Vector2& b = loop[(j + 1) % n];
                mesh.addFlatQuad(place(a, i), place(b, i), place(b, i + 1), place(a, i + 1));
            }
        }
    };
    sweepLoop(section.outer);
    for (const auto& hole : section.holes) {
        sweepLoop(hole);
    }

    if (!fullCircle) {
        auto tri = section.triangulate();
        if (!tri) {
            return Result<Mesh>::from(tri).withEntity(entity.id);
        }
        const auto& pts = tri.value.points;
        const auto& idx = tri.value.indices;
        for (size_t k = 0; k + 2 < idx.size(); k += 3) {
            mesh.addFlatTriangle(place(pts[idx[k]], 0), place(pts[idx[k + 2]], 0), place(pts[idx[k + 1]], 0));
            mesh.addFlatTriangle(place(pts[idx[k]], segments), place(pts[idx[k + 1]], segments),
                                 place(pts[idx[k + 2]], segments));
        }
    }

    // Axis side and rotation sense decide the orientation
    if (mesh.getSignedVolume() < 0.0) {
        mesh.flipWinding();
    }

    if (auto positionRef = entity.getRef(1)) {
        auto position = resolver.get(*positionRef);
        if (!position) {
            return Result<Mesh>::from(position).withEntity(entity.id);
        }
        auto placement = detail::readAxisPlacement(*position.value, resolver);
        if (!placement) {
            return Result<Mesh>::from(placement).withEntity(entity.id);
        }
        mesh.transform(placement.value);
    }
    return Result<Mesh>::ok(std::move(mesh));
}

} // namespace ifccore::geom
