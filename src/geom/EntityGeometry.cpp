#include "EntityGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace ifccore::geom::detail {

namespace {

constexpr int kMaxPlacementDepth = 64;
constexpr int kMaxCurveDepth = 16;
constexpr size_t kArcSegmentsPerCircle = 24;
constexpr double kPi = 3.14159265358979323846;

template<typename T>
Result<T> unexpectedType(const step::DecodedEntity& entity, const char* expected) {
    auto r = Result<T>::error(ErrorCode::InvalidAttribute,
        "Expected " + std::string(expected) + ", found " + entity.typeName +
        " #" + std::to_string(entity.id));
    r.entityId = entity.id;
    return r;
}

/**
 * @brief Unit vector perpendicular to `v`
 */
Vector3 anyPerpendicular(const Vector3& v) {
    Vector3 reference = std::abs(v.x) < 0.9 ? Vector3(1, 0, 0) : Vector3(0, 1, 0);
    return (v % reference).normalized();
}

/**
 * @brief Right-handed basis from a z axis and an approximate x axis
 */
Matrix3 basisFromAxes(const Vector3& zAxis, const Vector3& xHint) {
    Vector3 z = zAxis.normalized();
    Vector3 x = (xHint - z * (xHint * z)).normalized();
    if (x.length() < 0.5) {
        x = anyPerpendicular(z);
    }
    Vector3 y = z % x;
    return Matrix3::fromColumns(x, y, z);
}

Result<Vector3> optionalDirection(const step::DecodedEntity& entity, size_t index,
                                  const Vector3& fallback, const step::EntityResolver& resolver) {
    auto ref = entity.getRef(index);
    if (!ref) {
        return Result<Vector3>::ok(fallback);
    }
    return readDirection(*ref, resolver);
}

Result<std::vector<Vector3>> readIndexedPolyCurve(const step::DecodedEntity& curve,
                                                  const step::EntityResolver& resolver) {
    // (Points, Segments, SelfIntersect)
    auto listEntity = resolver.resolveAttribute(curve, 0);
    if (!listEntity) {
        return Result<std::vector<Vector3>>::from(listEntity).withEntity(curve.id);
    }
    auto coords = readPointList(*listEntity.value);
    if (!coords) {
        return coords;
    }

    const auto* segments = curve.getList(1);
    if (!segments) {
        return coords;
    }

    const auto& pts = coords.value;
    std::vector<Vector3> result;
    auto pointAt = [&](int64_t oneBased, Vector3& out) {
        if (oneBased < 1 || static_cast<size_t>(oneBased) > pts.size()) {
            return false;
        }
        out = pts[static_cast<size_t>(oneBased - 1)];
        return true;
    };
    auto append = [&](const Vector3& p) {
        if (result.empty() || result.back() != p) {
            result.push_back(p);
        }
    };

    for (const auto& segment : *segments) {
        const step::TypedValue* typed = segment.asTypedValue();
        if (!typed || typed->args.empty() || !typed->args.front().asList()) {
            return Result<std::vector<Vector3>>::invalidAttribute(1,
                "Malformed segment " + segment.toString()).withEntity(curve.id);
        }
        std::vector<Vector3> segmentPoints;
        for (const auto& index : *typed->args.front().asList()) {
            Vector3 p;
            auto value = index.asInteger();
            if (!value || !pointAt(*value, p)) {
                return Result<std::vector<Vector3>>::invalidAttribute(1,
                    "Segment index out of range in " + segment.toString()).withEntity(curve.id);
            }
            segmentPoints.push_back(p);
        }

        if (typed->name == "IFCARCINDEX" && segmentPoints.size() == 3) {
            for (const auto& p : arcThroughPoints(segmentPoints[0], segmentPoints[1], segmentPoints[2])) {
                append(p);
            }
        } else {
            for (const auto& p : segmentPoints) {
                append(p);
            }
        }
    }
    return Result<std::vector<Vector3>>::ok(std::move(result));
}

Result<std::vector<Vector3>> readCurvePointsImpl(EntityId curveId, const step::EntityResolver& resolver,
                                                 int depth) {
    if (depth > kMaxCurveDepth) {
        auto r = Result<std::vector<Vector3>>::error(ErrorCode::Geometry, "Curve nesting too deep");
        r.entityId = curveId;
        return r;
    }
    auto curve = resolver.get(curveId);
    if (!curve) {
        return Result<std::vector<Vector3>>::from(curve);
    }
    const auto& entity = *curve.value;

    if (entity.typeName == "IFCPOLYLINE") {
        std::vector<Vector3> points;
        for (EntityId pointId : entity.getRefs(0)) {
            auto point = readCartesianPoint(pointId, resolver);
            if (!point) {
                return Result<std::vector<Vector3>>::from(point).withEntity(entity.id);
            }
            points.push_back(point.value);
        }
        return Result<std::vector<Vector3>>::ok(std::move(points));
    }

    if (entity.typeName == "IFCINDEXEDPOLYCURVE") {
        return readIndexedPolyCurve(entity, resolver);
    }

    if (entity.typeName == "IFCCOMPOSITECURVE") {
        // (Segments, SelfIntersect); segment = (Transition, SameSense, ParentCurve)
        std::vector<Vector3> points;
        for (EntityId segmentId : entity.getRefs(0)) {
            auto segment = resolver.get(segmentId);
            if (!segment) {
                return Result<std::vector<Vector3>>::from(segment).withEntity(entity.id);
            }
            auto parent = segment.value->getRef(2);
            if (!parent) {
                return Result<std::vector<Vector3>>::invalidAttribute(2,
                    "Composite curve segment without parent curve").withEntity(segmentId);
            }
            auto parentPoints = readCurvePointsImpl(*parent, resolver, depth + 1);
            if (!parentPoints) {
                return parentPoints;
            }
            std::vector<Vector3> part = std::move(parentPoints.value);
            if (segment.value->getBool(1) == false) {
                std::reverse(part.begin(), part.end());
            }
            for (const auto& p : part) {
                if (points.empty() || points.back() != p) {
                    points.push_back(p);
                }
            }
        }
        return Result<std::vector<Vector3>>::ok(std::move(points));
    }

    if (entity.typeName == "IFCCIRCLE") {
        // (Position, Radius)
        auto radius = readPositive(entity, 1, "circle radius", ErrorCode::Geometry);
        if (!radius) {
            return Result<std::vector<Vector3>>::from(radius);
        }
        Transform placement;
        if (auto placementRef = entity.getRef(0)) {
            auto placementEntity = resolver.get(*placementRef);
            if (!placementEntity) {
                return Result<std::vector<Vector3>>::from(placementEntity).withEntity(entity.id);
            }
            auto t = readAxisPlacement(*placementEntity.value, resolver);
            if (!t) {
                return Result<std::vector<Vector3>>::from(t);
            }
            placement = t.value;
        }
        std::vector<Vector3> points;
        for (size_t i = 0; i < kArcSegmentsPerCircle; ++i) {
            double angle = 2.0 * kPi * static_cast<double>(i) / kArcSegmentsPerCircle;
            Vector3 local(radius.value * std::cos(angle), radius.value * std::sin(angle), 0.0);
            points.push_back(placement.applyToPoint(local));
        }
        return Result<std::vector<Vector3>>::ok(std::move(points));
    }

    auto r = Result<std::vector<Vector3>>::error(ErrorCode::UnsupportedType,
        "Unsupported curve type " + entity.typeName);
    r.entityId = entity.id;
    return r;
}

Result<Transform> readPlacementImpl(EntityId id, const step::EntityResolver& resolver, int depth) {
    if (depth > kMaxPlacementDepth) {
        auto r = Result<Transform>::error(ErrorCode::Geometry, "Placement chain too deep");
        r.entityId = id;
        return r;
    }
    auto placement = resolver.get(id);
    if (!placement) {
        return Result<Transform>::from(placement);
    }
    const auto& entity = *placement.value;

    if (entity.typeName == "IFCLOCALPLACEMENT") {
        // (PlacementRelTo, RelativePlacement)
        Transform parent;
        if (auto relTo = entity.getRef(0)) {
            auto parentResult = readPlacementImpl(*relTo, resolver, depth + 1);
            if (!parentResult) {
                return parentResult;
            }
            parent = parentResult.value;
        }
        auto relative = resolver.resolveAttribute(entity, 1);
        if (!relative) {
            return Result<Transform>::from(relative).withEntity(entity.id);
        }
        auto local = readAxisPlacement(*relative.value, resolver);
        if (!local) {
            return local;
        }
        return Result<Transform>::ok(parent * local.value);
    }

    if (entity.typeName == "IFCAXIS2PLACEMENT3D" || entity.typeName == "IFCAXIS2PLACEMENT2D") {
        return readAxisPlacement(entity, resolver);
    }

    auto r = Result<Transform>::error(ErrorCode::UnsupportedType,
        "Unsupported placement type " + entity.typeName);
    r.entityId = entity.id;
    return r;
}

} // anonymous namespace

Result<Vector3> readCartesianPoint(EntityId id, const step::EntityResolver& resolver) {
    auto point = resolver.get(id);
    if (!point) {
        return Result<Vector3>::from(point);
    }
    const auto& entity = *point.value;
    if (entity.typeName != "IFCCARTESIANPOINT") {
        return unexpectedType<Vector3>(entity, "IFCCARTESIANPOINT");
    }
    const auto* coords = entity.getList(0);
    if (!coords || coords->size() < 2 || coords->size() > 3) {
        return Result<Vector3>::invalidAttribute(0, "Coordinates must have 2 or 3 values")
            .withEntity(entity.id);
    }
    double values[3] = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < coords->size(); ++i) {
        auto v = (*coords)[i].asFloat();
        if (!v) {
            return Result<Vector3>::invalidAttribute(0, "Non-numeric coordinate")
                .withEntity(entity.id);
        }
        values[i] = *v;
    }
    return Result<Vector3>::ok(Vector3(values[0], values[1], values[2]));
}

Result<Vector3> readDirection(EntityId id, const step::EntityResolver& resolver) {
    auto direction = resolver.get(id);
    if (!direction) {
        return Result<Vector3>::from(direction);
    }
    const auto& entity = *direction.value;
    if (entity.typeName != "IFCDIRECTION") {
        return unexpectedType<Vector3>(entity, "IFCDIRECTION");
    }
    const auto* ratios = entity.getList(0);
    if (!ratios || ratios->size() < 2 || ratios->size() > 3) {
        return Result<Vector3>::invalidAttribute(0, "Direction must have 2 or 3 ratios")
            .withEntity(entity.id);
    }
    double values[3] = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < ratios->size(); ++i) {
        auto v = (*ratios)[i].asFloat();
        if (!v) {
            return Result<Vector3>::invalidAttribute(0, "Non-numeric direction ratio")
                .withEntity(entity.id);
        }
        values[i] = *v;
    }
    Vector3 d = Vector3(values[0], values[1], values[2]).normalized();
    if (d.length() < 0.5) {
        auto r = Result<Vector3>::error(ErrorCode::Geometry, "Zero-length direction");
        r.entityId = entity.id;
        return r;
    }
    return Result<Vector3>::ok(d);
}

Result<Transform> readAxisPlacement(const step::DecodedEntity& placement,
                                    const step::EntityResolver& resolver) {
    Vector3 location;
    if (auto locationRef = placement.getRef(0)) {
        auto point = readCartesianPoint(*locationRef, resolver);
        if (!point) {
            return Result<Transform>::from(point).withEntity(placement.id);
        }
        location = point.value;
    }

    if (placement.typeName == "IFCAXIS2PLACEMENT3D") {
        // (Location, Axis, RefDirection)
        auto axis = optionalDirection(placement, 1, Vector3(0, 0, 1), resolver);
        if (!axis) {
            return Result<Transform>::from(axis).withEntity(placement.id);
        }
        auto refDirection = optionalDirection(placement, 2, Vector3(1, 0, 0), resolver);
        if (!refDirection) {
            return Result<Transform>::from(refDirection).withEntity(placement.id);
        }
        return Result<Transform>::ok(Transform(basisFromAxes(axis.value, refDirection.value), location));
    }

    if (placement.typeName == "IFCAXIS2PLACEMENT2D") {
        // (Location, RefDirection)
        auto refDirection = optionalDirection(placement, 1, Vector3(1, 0, 0), resolver);
        if (!refDirection) {
            return Result<Transform>::from(refDirection).withEntity(placement.id);
        }
        return Result<Transform>::ok(Transform(basisFromAxes(Vector3(0, 0, 1), refDirection.value), location));
    }

    return unexpectedType<Transform>(placement, "IFCAXIS2PLACEMENT3D");
}

Result<Transform> readPlacement(EntityId id, const step::EntityResolver& resolver) {
    return readPlacementImpl(id, resolver, 0);
}

Result<Transform> readTransformationOperator(const step::DecodedEntity& op,
                                             const step::EntityResolver& resolver) {
    const std::string& type = op.typeName;
    bool is3D = type == "IFCCARTESIANTRANSFORMATIONOPERATOR3D" ||
                type == "IFCCARTESIANTRANSFORMATIONOPERATOR3DNONUNIFORM";
    bool is2D = type == "IFCCARTESIANTRANSFORMATIONOPERATOR2D" ||
                type == "IFCCARTESIANTRANSFORMATIONOPERATOR2DNONUNIFORM";
    if (!is3D && !is2D) {
        return unexpectedType<Transform>(op, "IFCCARTESIANTRANSFORMATIONOPERATOR3D");
    }

    // (Axis1, Axis2, LocalOrigin, Scale [, Axis3] [, Scale2, Scale3])
    auto axis1 = optionalDirection(op, 0, Vector3(1, 0, 0), resolver);
    if (!axis1) {
        return Result<Transform>::from(axis1).withEntity(op.id);
    }
    Vector3 zAxis(0, 0, 1);
    if (is3D) {
        auto axis3 = optionalDirection(op, 4, Vector3(0, 0, 1), resolver);
        if (!axis3) {
            return Result<Transform>::from(axis3).withEntity(op.id);
        }
        zAxis = axis3.value;
    }

    Vector3 origin;
    auto originRef = op.getRef(2);
    if (!originRef) {
        return Result<Transform>::invalidAttribute(2, "Missing LocalOrigin").withEntity(op.id);
    }
    auto originPoint = readCartesianPoint(*originRef, resolver);
    if (!originPoint) {
        return Result<Transform>::from(originPoint).withEntity(op.id);
    }
    origin = originPoint.value;

    double scale = op.getFloat(3).value_or(1.0);
    double scaleY = scale;
    double scaleZ = scale;
    if (type == "IFCCARTESIANTRANSFORMATIONOPERATOR3DNONUNIFORM") {
        scaleY = op.getFloat(5).value_or(scale);
        scaleZ = op.getFloat(6).value_or(scale);
    } else if (type == "IFCCARTESIANTRANSFORMATIONOPERATOR2DNONUNIFORM") {
        scaleY = op.getFloat(4).value_or(scale);
    }

    Matrix3 basis = basisFromAxes(zAxis, axis1.value);
    Vector3 x(basis.m[0][0], basis.m[1][0], basis.m[2][0]);
    Vector3 y(basis.m[0][1], basis.m[1][1], basis.m[2][1]);
    Vector3 z(basis.m[0][2], basis.m[1][2], basis.m[2][2]);
    return Result<Transform>::ok(Transform(
        Matrix3::fromColumns(x * scale, y * scaleY, z * scaleZ), origin));
}

Result<std::vector<Vector3>> readCurvePoints(EntityId curveId, const step::EntityResolver& resolver) {
    return readCurvePointsImpl(curveId, resolver, 0);
}

Result<std::vector<Vector3>> readPointList(const step::DecodedEntity& list) {
    if (list.typeName != "IFCCARTESIANPOINTLIST3D" && list.typeName != "IFCCARTESIANPOINTLIST2D") {
        return unexpectedType<std::vector<Vector3>>(list, "IFCCARTESIANPOINTLIST3D");
    }
    const auto* rows = list.getList(0);
    if (!rows) {
        return Result<std::vector<Vector3>>::invalidAttribute(0, "Missing CoordList").withEntity(list.id);
    }
    std::vector<Vector3> points;
    points.reserve(rows->size());
    for (const auto& row : *rows) {
        const auto* coords = row.asList();
        if (!coords || coords->size() < 2 || coords->size() > 3) {
            return Result<std::vector<Vector3>>::invalidAttribute(0,
                "Coordinate tuple must have 2 or 3 values").withEntity(list.id);
        }
        double values[3] = {0.0, 0.0, 0.0};
        for (size_t i = 0; i < coords->size(); ++i) {
            auto v = (*coords)[i].asFloat();
            if (!v) {
                return Result<std::vector<Vector3>>::invalidAttribute(0,
                    "Non-numeric coordinate").withEntity(list.id);
            }
            values[i] = *v;
        }
        points.emplace_back(values[0], values[1], values[2]);
    }
    return Result<std::vector<Vector3>>::ok(std::move(points));
}

std::vector<Vector3> arcThroughPoints(const Vector3& a, const Vector3& b, const Vector3& c) {
    Vector3 ab = b - a;
    Vector3 ac = c - a;
    Vector3 n = ab % ac;
    double n2 = n * n;
    if (n2 < 1e-20) {
        return {a, b, c};
    }

    Vector3 center = a + ((n % ab) * (ac * ac) + (ac % n) * (ab * ab)) * (1.0 / (2.0 * n2));
    double radius = (a - center).length();
    Vector3 u = (a - center).normalized();
    Vector3 w = n.normalized();
    Vector3 v = w % u;

    Vector3 dc = c - center;
    double sweep = std::atan2(dc * v, dc * u);
    if (sweep <= 0.0) {
        sweep += 2.0 * kPi;
    }

    size_t segments = static_cast<size_t>(std::ceil(sweep / (2.0 * kPi) * kArcSegmentsPerCircle));
    if (segments < 2) {
        segments = 2;
    }

    std::vector<Vector3> points;
    points.reserve(segments + 1);
    for (size_t i = 0; i <= segments; ++i) {
        double angle = sweep * static_cast<double>(i) / static_cast<double>(segments);
        points.push_back(center + (u * std::cos(angle) + v * std::sin(angle)) * radius);
    }
    points.front() = a;
    points.back() = c;
    return points;
}

Result<double> readPositive(const step::DecodedEntity& entity, size_t index, const char* what,
                            const char* code) {
    auto value = entity.getFloat(index);
    if (!value) {
        return Result<double>::invalidAttribute(index,
            std::string("Missing ") + what + " on " + entity.typeName).withEntity(entity.id);
    }
    if (!(*value > 0.0)) {
        auto r = Result<double>::error(code,
            std::string(what) + " must be positive, got " + std::to_string(*value));
        r.entityId = entity.id;
        r.attributeIndex = index;
        return r;
    }
    return Result<double>::ok(*value);
}

} // namespace ifccore::geom::detail
