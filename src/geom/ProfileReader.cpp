#include "ifc-core/geom/Profile.hpp"
#include "EntityGeometry.hpp"
#include <algorithm>
#include <string>

namespace ifccore::geom {

namespace {

constexpr int kMaxDerivedDepth = 8;

Result<Profile2D> profileError(const step::DecodedEntity& entity, const std::string& message) {
    auto r = Result<Profile2D>::error(ErrorCode::Profile,
        entity.typeName + " #" + std::to_string(entity.id) + ": " + message);
    r.entityId = entity.id;
    return r;
}

/**
 * @brief Closed curve as a 2D loop without its repeated closing point
 */
Result<std::vector<Vector2>> readClosedCurve(EntityId curveId, const step::EntityResolver& resolver) {
    auto points = detail::readCurvePoints(curveId, resolver);
    if (!points) {
        return Result<std::vector<Vector2>>::from(points);
    }
    std::vector<Vector2> loop;
    loop.reserve(points.value.size());
    for (const auto& p : points.value) {
        loop.emplace_back(p.x, p.y);
    }
    while (loop.size() > 1 && loop.front() == loop.back()) {
        loop.pop_back();
    }
    if (loop.size() < 3) {
        auto r = Result<std::vector<Vector2>>::error(ErrorCode::Profile,
            "Closed curve needs at least 3 distinct points");
        r.entityId = curveId;
        return r;
    }
    return Result<std::vector<Vector2>>::ok(std::move(loop));
}

/**
 * @brief Apply IfcParameterizedProfileDef.Position, if present
 */
Result<Profile2D> placeProfile(Profile2D profile, const step::DecodedEntity& entity,
                               const step::EntityResolver& resolver) {
    auto positionRef = entity.getRef(2);
    if (!positionRef) {
        return Result<Profile2D>::ok(std::move(profile));
    }
    auto position = resolver.get(*positionRef);
    if (!position) {
        return Result<Profile2D>::from(position).withEntity(entity.id);
    }
    auto placement = detail::readAxisPlacement(*position.value, resolver);
    if (!placement) {
        return Result<Profile2D>::from(placement).withEntity(entity.id);
    }
    const Transform& t = placement.value;
    profile.applyPlacement(Vector2(t.translation.x, t.translation.y),
                           Vector2(t.linear.m[0][0], t.linear.m[1][0]));
    return Result<Profile2D>::ok(std::move(profile));
}

Result<Profile2D> readProfile(const step::DecodedEntity& entity, const step::EntityResolver& resolver,
                              int depth);

Result<Profile2D> readParameterized(const step::DecodedEntity& entity, const step::EntityResolver& resolver) {
    const std::string& type = entity.typeName;
    Profile2D profile;

    if (type == "IFCRECTANGLEPROFILEDEF" || type == "IFCROUNDEDRECTANGLEPROFILEDEF") {
        // (ProfileType, ProfileName, Position, XDim, YDim)
        auto x = detail::readPositive(entity, 3, "XDim");
        if (!x) return Result<Profile2D>::from(x);
        auto y = detail::readPositive(entity, 4, "YDim");
        if (!y) return Result<Profile2D>::from(y);
        profile = Profile2D::rectangle(x.value, y.value);
    } else if (type == "IFCRECTANGLEHOLLOWPROFILEDEF") {
        // (..., XDim, YDim, WallThickness, InnerFilletRadius, OuterFilletRadius)
        auto x = detail::readPositive(entity, 3, "XDim");
        if (!x) return Result<Profile2D>::from(x);
        auto y = detail::readPositive(entity, 4, "YDim");
        if (!y) return Result<Profile2D>::from(y);
        auto t = detail::readPositive(entity, 5, "WallThickness");
        if (!t) return Result<Profile2D>::from(t);
        if (2.0 * t.value >= x.value || 2.0 * t.value >= y.value) {
            return profileError(entity, "wall thickness leaves no opening");
        }
        profile = Profile2D::rectangle(x.value, y.value);
        Profile2D inner = Profile2D::rectangle(x.value - 2.0 * t.value, y.value - 2.0 * t.value);
        profile.addHole(inner.outer);
    } else if (type == "IFCCIRCLEPROFILEDEF") {
        // (ProfileType, ProfileName, Position, Radius)
        auto r = detail::readPositive(entity, 3, "Radius");
        if (!r) return Result<Profile2D>::from(r);
        profile = Profile2D::circle(r.value);
    } else if (type == "IFCCIRCLEHOLLOWPROFILEDEF") {
        // (..., Radius, WallThickness)
        auto r = detail::readPositive(entity, 3, "Radius");
        if (!r) return Result<Profile2D>::from(r);
        auto t = detail::readPositive(entity, 4, "WallThickness");
        if (!t) return Result<Profile2D>::from(t);
        if (t.value >= r.value) {
            return profileError(entity, "wall thickness must be less than the radius");
        }
        size_t segments = calculateCircleSegments(r.value);
        profile = Profile2D::circle(r.value, segments);
        profile.addHole(circlePoints(Vector2(), r.value - t.value, segments));
    } else if (type == "IFCELLIPSEPROFILEDEF") {
        // (..., SemiAxis1, SemiAxis2)
        auto a = detail::readPositive(entity, 3, "SemiAxis1");
        if (!a) return Result<Profile2D>::from(a);
        auto b = detail::readPositive(entity, 4, "SemiAxis2");
        if (!b) return Result<Profile2D>::from(b);
        size_t segments = calculateCircleSegments(std::max(a.value, b.value));
        profile = Profile2D::circle(1.0, segments);
        for (auto& p : profile.outer) {
            p = Vector2(p.x * a.value, p.y * b.value);
        }
        profile.type = ProfileType::Arbitrary;
    } else if (type == "IFCISHAPEPROFILEDEF") {
        // (..., OverallWidth, OverallDepth, WebThickness, FlangeThickness, FilletRadius)
        auto b = detail::readPositive(entity, 3, "OverallWidth");
        if (!b) return Result<Profile2D>::from(b);
        auto h = detail::readPositive(entity, 4, "OverallDepth");
        if (!h) return Result<Profile2D>::from(h);
        auto tw = detail::readPositive(entity, 5, "WebThickness");
        if (!tw) return Result<Profile2D>::from(tw);
        auto tf = detail::readPositive(entity, 6, "FlangeThickness");
        if (!tf) return Result<Profile2D>::from(tf);
        if (tw.value >= b.value || 2.0 * tf.value >= h.value) {
            return profileError(entity, "web or flange thickness exceeds the section");
        }
        double hb = b.value / 2.0, hh = h.value / 2.0, hw = tw.value / 2.0, f = tf.value;
        profile = Profile2D::polygon({
            Vector2(-hb, -hh), Vector2(hb, -hh), Vector2(hb, -hh + f), Vector2(hw, -hh + f),
            Vector2(hw, hh - f), Vector2(hb, hh - f), Vector2(hb, hh), Vector2(-hb, hh),
            Vector2(-hb, hh - f), Vector2(-hw, hh - f), Vector2(-hw, -hh + f), Vector2(-hb, -hh + f)
        });
    } else if (type == "IFCLSHAPEPROFILEDEF") {
        // (..., Depth, Width, Thickness, FilletRadius, EdgeRadius, LegSlope)
        auto d = detail::readPositive(entity, 3, "Depth");
        if (!d) return Result<Profile2D>::from(d);
        double w = entity.getFloat(4).value_or(d.value);
        if (!(w > 0.0)) {
            return profileError(entity, "Width must be positive");
        }
        auto t = detail::readPositive(entity, 5, "Thickness");
        if (!t) return Result<Profile2D>::from(t);
        if (t.value >= w || t.value >= d.value) {
            return profileError(entity, "thickness exceeds the leg size");
        }
        double hw = w / 2.0, hd = d.value / 2.0, th = t.value;
        profile = Profile2D::polygon({
            Vector2(-hw, -hd), Vector2(hw, -hd), Vector2(hw, -hd + th),
            Vector2(-hw + th, -hd + th), Vector2(-hw + th, hd), Vector2(-hw, hd)
        });
    } else if (type == "IFCTSHAPEPROFILEDEF") {
        // (..., Depth, FlangeWidth, WebThickness, FlangeThickness, ...)
        auto d = detail::readPositive(entity, 3, "Depth");
        if (!d) return Result<Profile2D>::from(d);
        auto fw = detail::readPositive(entity, 4, "FlangeWidth");
        if (!fw) return Result<Profile2D>::from(fw);
        auto tw = detail::readPositive(entity, 5, "WebThickness");
        if (!tw) return Result<Profile2D>::from(tw);
        auto tf = detail::readPositive(entity, 6, "FlangeThickness");
        if (!tf) return Result<Profile2D>::from(tf);
        if (tw.value >= fw.value || tf.value >= d.value) {
            return profileError(entity, "web or flange thickness exceeds the section");
        }
        double hd = d.value / 2.0, hf = fw.value / 2.0, hw = tw.value / 2.0, f = tf.value;
        profile = Profile2D::polygon({
            Vector2(-hw, -hd), Vector2(hw, -hd), Vector2(hw, hd - f), Vector2(hf, hd - f),
            Vector2(hf, hd), Vector2(-hf, hd), Vector2(-hf, hd - f), Vector2(-hw, hd - f)
        });
    } else {
        auto r = Result<Profile2D>::error(ErrorCode::UnsupportedType,
            "Unsupported profile type " + type);
        r.entityId = entity.id;
        return r;
    }

    return placeProfile(std::move(profile), entity, resolver);
}

Result<Profile2D> readProfile(const step::DecodedEntity& entity, const step::EntityResolver& resolver,
                              int depth) {
    const std::string& type = entity.typeName;

    if (type == "IFCARBITRARYCLOSEDPROFILEDEF" || type == "IFCARBITRARYPROFILEDEFWITHVOIDS") {
        // (ProfileType, ProfileName, OuterCurve [, InnerCurves])
        auto outerRef = entity.getRef(2);
        if (!outerRef) {
            return Result<Profile2D>::invalidAttribute(2, "Missing OuterCurve").withEntity(entity.id);
        }
        auto outer = readClosedCurve(*outerRef, resolver);
        if (!outer) {
            return Result<Profile2D>::from(outer).withEntity(entity.id);
        }
        Profile2D profile = Profile2D::polygon(std::move(outer.value));
        if (type == "IFCARBITRARYPROFILEDEFWITHVOIDS") {
            for (EntityId innerRef : entity.getRefs(3)) {
                auto inner = readClosedCurve(innerRef, resolver);
                if (!inner) {
                    return Result<Profile2D>::from(inner).withEntity(entity.id);
                }
                profile.addHole(std::move(inner.value));
            }
        }
        return Result<Profile2D>::ok(std::move(profile));
    }

    if (type == "IFCDERIVEDPROFILEDEF") {
        // (ProfileType, ProfileName, ParentProfile, Operator, Label)
        if (depth >= kMaxDerivedDepth) {
            return profileError(entity, "derived profile nesting too deep");
        }
        auto parentEntity = resolver.resolveAttribute(entity, 2);
        if (!parentEntity) {
            return Result<Profile2D>::from(parentEntity).withEntity(entity.id);
        }
        auto parent = readProfile(*parentEntity.value, resolver, depth + 1);
        if (!parent) {
            return parent;
        }
        auto opEntity = resolver.resolveAttribute(entity, 3);
        if (!opEntity) {
            return Result<Profile2D>::from(opEntity).withEntity(entity.id);
        }
        auto op = detail::readTransformationOperator(*opEntity.value, resolver);
        if (!op) {
            return Result<Profile2D>::from(op).withEntity(entity.id);
        }
        Profile2D profile = std::move(parent.value);
        auto apply = [&op](Vector2& p) {
            Vector3 q = op.value.applyToPoint(Vector3(p.x, p.y, 0.0));
            p = Vector2(q.x, q.y);
        };
        for (auto& p : profile.outer) apply(p);
        for (auto& hole : profile.holes) {
            for (auto& p : hole) apply(p);
        }
        return Result<Profile2D>::ok(std::move(profile));
    }

    return readParameterized(entity, resolver);
}

} // anonymous namespace

Result<Profile2D> profileFromEntity(const step::DecodedEntity& entity,
                                    const step::EntityResolver& resolver) {
    return readProfile(entity, resolver, 0);
}

} // namespace ifccore::geom
