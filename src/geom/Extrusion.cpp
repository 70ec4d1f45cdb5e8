#include "ifc-core/geom/Extrusion.hpp"
#include "ifc-core/geom/Triangulation.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace ifccore::geom {

namespace {

constexpr double kDepthTolerance = 1e-9;

struct Sweep {
    Vector3 direction;  // unit

    Vector3 at(const Vector2& p, double t) const {
        return Vector3(p.x, p.y, 0.0) + direction * t;
    }
};

/**
 * @brief Triangulated cap at sweep parameter t
 * @param up true for a cap facing +Z in profile space
 */
Result<bool> addCap(Mesh& mesh, const Profile2D& profile, const Sweep& sweep, double t, bool up) {
    auto tri = profile.triangulate();
    if (!tri) {
        return Result<bool>::from(tri);
    }
    Vector3 normal(0, 0, up ? 1.0 : -1.0);
    auto base = static_cast<uint32_t>(mesh.getVertexCount());
    for (const auto& p : tri.value.points) {
        mesh.addVertex(sweep.at(p, t), normal);
    }
    const auto& idx = tri.value.indices;
    for (size_t i = 0; i + 2 < idx.size(); i += 3) {
        if (up) {
            mesh.addTriangle(base + idx[i], base + idx[i + 1], base + idx[i + 2]);
        } else {
            mesh.addTriangle(base + idx[i], base + idx[i + 2], base + idx[i + 1]);
        }
    }
    return Result<bool>::ok(true);
}

// Side walls of one loop between t0 and t1. A CCW loop faces away from its
// interior, a CW loop faces into it.
void addWalls(Mesh& mesh, const std::vector<Vector2>& loop, const Sweep& sweep, double t0, double t1) {
    size_t n = loop.size();
    for (size_t i = 0; i < n; ++i) {
        const Vector2& a = loop[i];
        const Vector2& b = loop[(i + 1) % n];
        mesh.addFlatQuad(sweep.at(a, t0), sweep.at(b, t0), sweep.at(b, t1), sweep.at(a, t1));
    }
}

Result<Sweep> makeSweep(double depth, const Vector3& direction) {
    if (!(depth > 0.0)) {
        return Result<Sweep>::error(ErrorCode::Profile,
            "Extrusion depth must be positive, got " + std::to_string(depth));
    }
    Vector3 dir = direction.normalized();
    if (dir.length() == 0.0) {
        return Result<Sweep>::error(ErrorCode::Geometry, "Extrusion direction is a zero vector");
    }
    if (std::abs(dir.z) < 1e-9) {
        return Result<Sweep>::error(ErrorCode::Geometry,
            "Extrusion direction lies in the profile plane");
    }
    Sweep sweep;
    sweep.direction = dir;
    return Result<Sweep>::ok(sweep);
}

Result<Profile2D> normalizedProfile(const Profile2D& profile) {
    Profile2D p = profile.normalized();
    if (p.outer.size() < 3) {
        return Result<Profile2D>::error(ErrorCode::Profile,
            "Profile needs at least 3 points, got " + std::to_string(p.outer.size()));
    }
    return Result<Profile2D>::ok(std::move(p));
}

} // anonymous namespace

Result<Mesh> extrudeProfile(const Profile2D& profile, double depth, const Vector3& direction) {
    return extrudeProfileWithVoids(Profile2DWithVoids{profile, {}}, depth, direction);
}

Result<Mesh> extrudeProfileWithVoids(const Profile2DWithVoids& input, double depth,
                                     const Vector3& direction) {
    auto sweep = makeSweep(depth, direction);
    if (!sweep) {
        return Result<Mesh>::from(sweep);
    }
    auto base = normalizedProfile(input.profile);
    if (!base) {
        return Result<Mesh>::from(base);
    }

    // Classify voids by the caps they pierce
    Profile2D bottom = base.value;
    Profile2D top = base.value;
    struct Cavity {
        std::vector<Vector2> loop;  // CW
        double start;
        double end;
    };
    std::vector<Cavity> cavities;

    for (const auto& v : input.voids) {
        Profile2D loop = Profile2D::polygon(v.contour).normalized();
        if (loop.outer.size() < 3) {
            return Result<Mesh>::error(ErrorCode::Csg, "Void contour needs at least 3 points");
        }
        double start = v.isThrough ? 0.0 : v.depthStart;
        double end = v.isThrough ? depth : v.depthEnd;
        if (start < -kDepthTolerance || end > depth + kDepthTolerance || !(end - start > kDepthTolerance)) {
            return Result<Mesh>::error(ErrorCode::Csg,
                "Void depth range [" + std::to_string(start) + ", " + std::to_string(end) +
                "] is outside the extrusion depth " + std::to_string(depth));
        }
        std::vector<Vector2> hole(loop.outer.rbegin(), loop.outer.rend());
        bool pierceBottom = start <= kDepthTolerance;
        bool pierceTop = end >= depth - kDepthTolerance;
        if (pierceBottom) {
            bottom.addHole(hole);
        }
        if (pierceTop) {
            top.addHole(hole);
        }
        cavities.push_back({std::move(hole), std::max(start, 0.0), std::min(end, depth)});
    }

    Mesh mesh;
    mesh.reserve(bottom.outer.size() * 6, bottom.outer.size() * 4);

    auto bottomCap = addCap(mesh, bottom, sweep.value, 0.0, false);
    if (!bottomCap) {
        return Result<Mesh>::from(bottomCap);
    }
    auto topCap = addCap(mesh, top, sweep.value, depth, true);
    if (!topCap) {
        return Result<Mesh>::from(topCap);
    }

    addWalls(mesh, base.value.outer, sweep.value, 0.0, depth);
    for (const auto& hole : base.value.holes) {
        addWalls(mesh, hole, sweep.value, 0.0, depth);
    }

    for (const auto& cavity : cavities) {
        addWalls(mesh, cavity.loop, sweep.value, cavity.start, cavity.end);

        // Internal caps face into the cavity
        std::vector<Vector2> ccw(cavity.loop.rbegin(), cavity.loop.rend());
        Profile2D floor = Profile2D::polygon(ccw);
        if (cavity.start > kDepthTolerance) {
            auto cap = addCap(mesh, floor, sweep.value, cavity.start, true);
            if (!cap) {
                return Result<Mesh>::from(cap);
            }
        }
        if (cavity.end < depth - kDepthTolerance) {
            auto cap = addCap(mesh, floor, sweep.value, cavity.end, false);
            if (!cap) {
                return Result<Mesh>::from(cap);
            }
        }
    }

    // Sweeping towards -Z mirrors the orientation of every face
    if (sweep.value.direction.z < 0.0) {
        mesh.flipWinding();
    }
    return Result<Mesh>::ok(std::move(mesh));
}

} // namespace ifccore::geom
