#pragma once

#include <cstdint>
#include <vector>
#include "../Types.hpp"
#include "../Vector3.hpp"
#include "../step/Resolver.hpp"

namespace ifccore::geom {

enum class ProfileType {
    Rectangle,
    Circle,
    Arbitrary
};

/**
 * @brief Triangulated profile: points of outer + holes and CCW indices
 */
struct ProfileTriangulation {
    std::vector<Vector2> points;
    std::vector<uint32_t> indices;
};

/**
 * @brief Planar cross-section: an outer loop with optional holes
 */
struct Profile2D {
    ProfileType type = ProfileType::Arbitrary;
    std::vector<Vector2> outer;
    std::vector<std::vector<Vector2>> holes;

    /**
     * @brief Axis-aligned rectangle centred on the origin
     */
    static Profile2D rectangle(double width, double height);

    /**
     * @brief Circle centred on the origin
     * @param segments 0 selects calculateCircleSegments(radius)
     */
    static Profile2D circle(double radius, size_t segments = 0);

    static Profile2D polygon(std::vector<Vector2> points);

    void addHole(std::vector<Vector2> hole) { holes.push_back(std::move(hole)); }

    /**
     * @brief Map from profile coordinates into a 2D placement
     * @param origin Placement location
     * @param xAxis Unit direction of the placed x axis
     */
    void applyPlacement(const Vector2& origin, const Vector2& xAxis);

    /**
     * @brief Outer CCW and holes CW, without repeated closing points
     */
    Profile2D normalized() const;

    /**
     * @brief Net area (outer minus holes)
     */
    double area() const;

    Result<ProfileTriangulation> triangulate() const;
};

/**
 * @brief Segment count for a circle: clamp(ceil(sqrt(r) * 8), 8, 32)
 */
size_t calculateCircleSegments(double radius);

/**
 * @brief Circle polygon centred on `center`, CCW
 */
std::vector<Vector2> circlePoints(const Vector2& center, double radius, size_t segments);

/**
 * @brief Opening cut into an extrusion, in the profile plane
 *
 * A through void spans the full depth and becomes a hole in both caps.
 * A partial void removes material only between depthStart and depthEnd.
 */
struct VoidInfo {
    std::vector<Vector2> contour;
    double depthStart = 0.0;
    double depthEnd = 0.0;
    bool isThrough = true;

    static VoidInfo through(std::vector<Vector2> contour, double depth);
    static VoidInfo partial(std::vector<Vector2> contour, double start, double end);
};

struct Profile2DWithVoids {
    Profile2D profile;
    std::vector<VoidInfo> voids;
};

/**
 * @brief Build a profile from an IfcProfileDef entity
 *
 * Supports rectangle, hollow rectangle, circle, hollow circle, I, L and T
 * shapes, arbitrary closed profiles and arbitrary profiles with voids.
 * Parameterized profiles have their Position placement applied.
 *
 * @return UNSUPPORTED_TYPE for other profile types, PROFILE_ERROR for
 * invalid dimensions
 */
Result<Profile2D> profileFromEntity(const step::DecodedEntity& entity,
                                    const step::EntityResolver& resolver);

} // namespace ifccore::geom
