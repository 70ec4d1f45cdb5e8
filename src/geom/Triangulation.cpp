#include "ifc-core/geom/Triangulation.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace ifccore::geom {

namespace {

constexpr size_t kFanLimit = 8;

double cross(const Vector2& o, const Vector2& a, const Vector2& b) {
    return (a - o).cross(b - o);
}

double ringArea(const std::vector<uint32_t>& ring, const std::vector<Vector2>& pts) {
    double area = 0.0;
    for (size_t i = 0; i < ring.size(); ++i) {
        const Vector2& a = pts[ring[i]];
        const Vector2& b = pts[ring[(i + 1) % ring.size()]];
        area += a.cross(b);
    }
    return area * 0.5;
}

/**
 * @brief Drop consecutive coincident points, including a repeated closing point
 */
void removeDuplicates(std::vector<uint32_t>& ring, const std::vector<Vector2>& pts) {
    std::vector<uint32_t> cleaned;
    cleaned.reserve(ring.size());
    for (uint32_t index : ring) {
        if (!cleaned.empty() && pts[cleaned.back()] == pts[index]) {
            continue;
        }
        cleaned.push_back(index);
    }
    while (cleaned.size() > 1 && pts[cleaned.front()] == pts[cleaned.back()]) {
        cleaned.pop_back();
    }
    ring.swap(cleaned);
}

/**
 * @brief Area tolerance relative to the polygon extent
 */
double areaTolerance(const std::vector<Vector2>& pts) {
    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();
    for (const auto& p : pts) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }
    double extent = std::max(maxX - minX, maxY - minY);
    return 1e-12 * std::max(1e-6, extent * extent);
}

bool pointInTriangle(const Vector2& p, const Vector2& a, const Vector2& b, const Vector2& c, double eps) {
    double d1 = cross(a, b, p);
    double d2 = cross(b, c, p);
    double d3 = cross(c, a, p);
    bool hasNeg = d1 < -eps || d2 < -eps || d3 < -eps;
    bool hasPos = d1 > eps || d2 > eps || d3 > eps;
    return !(hasNeg && hasPos);
}

/**
 * @brief Is direction p->m inside the polygon interior wedge at p?
 */
bool inWedge(const Vector2& prev, const Vector2& p, const Vector2& next, const Vector2& m) {
    Vector2 a = next - p;
    Vector2 b = prev - p;
    Vector2 d = m - p;
    if (a.cross(b) > 0.0) {
        return a.cross(d) >= 0.0 && d.cross(b) >= 0.0;
    }
    return !(b.cross(d) > 0.0 && d.cross(a) > 0.0);
}

class EarClipper {
public:
    EarClipper(const std::vector<Vector2>& pts, double eps)
        : pts_(pts), eps_(eps) {}

    /**
     * @brief Splice a CW hole into the CCW ring (Eberly's bridge)
     */
    void bridgeHole(std::vector<uint32_t>& ring, const std::vector<uint32_t>& hole) const {
        size_t mPos = 0;
        for (size_t i = 1; i < hole.size(); ++i) {
            if (pts_[hole[i]].x > pts_[hole[mPos]].x) {
                mPos = i;
            }
        }
        const Vector2 M = pts_[hole[mPos]];

        // Cast a ray from M toward +x and find the closest ring edge
        size_t n = ring.size();
        double bestX = std::numeric_limits<double>::max();
        size_t bestEdge = n;
        for (size_t e = 0; e < n; ++e) {
            const Vector2& a = pts_[ring[e]];
            const Vector2& b = pts_[ring[(e + 1) % n]];
            bool crosses = (a.y <= M.y && b.y > M.y) || (b.y <= M.y && a.y > M.y);
            if (!crosses) {
                continue;
            }
            double t = (M.y - a.y) / (b.y - a.y);
            double ix = a.x + t * (b.x - a.x);
            if (ix >= M.x && ix < bestX) {
                bestX = ix;
                bestEdge = e;
            }
        }

        size_t pPos = 0;
        if (bestEdge == n) {
            // No hit (hole touching or outside the ring): nearest vertex
            double bestDist = std::numeric_limits<double>::max();
            for (size_t i = 0; i < n; ++i) {
                double dist = (pts_[ring[i]] - M).length();
                if (dist < bestDist) {
                    bestDist = dist;
                    pPos = i;
                }
            }
        } else {
            const Vector2 I(bestX, M.y);
            size_t aPos = bestEdge;
            size_t bPos = (bestEdge + 1) % n;
            if (pts_[ring[aPos]] == I) {
                pPos = aPos;
            } else if (pts_[ring[bPos]] == I) {
                pPos = bPos;
            } else {
                pPos = pts_[ring[aPos]].x > pts_[ring[bPos]].x ? aPos : bPos;
                const Vector2 P = pts_[ring[pPos]];

                // A reflex vertex inside triangle (M, I, P) may block the view
                double bestTan = std::numeric_limits<double>::max();
                double bestDist = std::numeric_limits<double>::max();
                for (size_t r = 0; r < n; ++r) {
                    if (r == pPos) {
                        continue;
                    }
                    const Vector2& v = pts_[ring[r]];
                    if (v.x <= M.x) {
                        continue;
                    }
                    const Vector2& prev = pts_[ring[(r + n - 1) % n]];
                    const Vector2& next = pts_[ring[(r + 1) % n]];
                    bool reflex = cross(prev, v, next) < 0.0;
                    if (!reflex || !pointInTriangle(v, M, I, P, eps_)) {
                        continue;
                    }
                    double tanAngle = std::abs(v.y - M.y) / (v.x - M.x);
                    double dist = (v - M).length();
                    if (tanAngle < bestTan || (tanAngle == bestTan && dist < bestDist)) {
                        bestTan = tanAngle;
                        bestDist = dist;
                        pPos = r;
                    }
                }
            }
        }

        // A bridge vertex can occur twice; use the occurrence that sees M
        uint32_t pIndex = ring[pPos];
        for (size_t q = 0; q < n; ++q) {
            if (ring[q] != pIndex) {
                continue;
            }
            const Vector2& prev = pts_[ring[(q + n - 1) % n]];
            const Vector2& next = pts_[ring[(q + 1) % n]];
            if (inWedge(prev, pts_[pIndex], next, M)) {
                pPos = q;
                break;
            }
        }

        std::vector<uint32_t> splice;
        splice.reserve(hole.size() + 2);
        for (size_t k = 0; k <= hole.size(); ++k) {
            splice.push_back(hole[(mPos + k) % hole.size()]);
        }
        splice.push_back(pIndex);
        ring.insert(ring.begin() + static_cast<std::ptrdiff_t>(pPos + 1), splice.begin(), splice.end());
    }

    void clip(std::vector<uint32_t> ring, std::vector<uint32_t>& out) const {
        size_t cursor = 0;
        while (ring.size() > 3) {
            size_t n = ring.size();
            size_t chosen = n;

            for (size_t k = 0; k < n; ++k) {
                size_t i = (cursor + k) % n;
                if (isEar(ring, i)) {
                    chosen = i;
                    break;
                }
            }

            if (chosen == n) {
                // Relax: drop a collinear vertex without emitting anything
                for (size_t i = 0; i < n; ++i) {
                    if (std::abs(turn(ring, i)) <= eps_) {
                        ring.erase(ring.begin() + static_cast<std::ptrdiff_t>(i));
                        cursor = i;
                        break;
                    }
                }
                if (ring.size() < n) {
                    continue;
                }
                // Relax further: any convex vertex, ignoring containment
                for (size_t i = 0; i < n; ++i) {
                    if (turn(ring, i) > eps_) {
                        chosen = i;
                        break;
                    }
                }
                if (chosen == n) {
                    chosen = 0;
                }
            }

            emit(ring, chosen, out);
            ring.erase(ring.begin() + static_cast<std::ptrdiff_t>(chosen));
            cursor = chosen % ring.size();
        }
        if (ring.size() == 3) {
            emit(ring, 1, out);
        }
    }

private:
    double turn(const std::vector<uint32_t>& ring, size_t i) const {
        size_t n = ring.size();
        return cross(pts_[ring[(i + n - 1) % n]], pts_[ring[i]], pts_[ring[(i + 1) % n]]);
    }

    void emit(const std::vector<uint32_t>& ring, size_t i, std::vector<uint32_t>& out) const {
        size_t n = ring.size();
        if (turn(ring, i) <= eps_) {
            return;
        }
        out.push_back(ring[(i + n - 1) % n]);
        out.push_back(ring[i]);
        out.push_back(ring[(i + 1) % n]);
    }

    bool isEar(const std::vector<uint32_t>& ring, size_t i) const {
        size_t n = ring.size();
        size_t prev = (i + n - 1) % n;
        size_t next = (i + 1) % n;
        const Vector2& a = pts_[ring[prev]];
        const Vector2& b = pts_[ring[i]];
        const Vector2& c = pts_[ring[next]];
        if (cross(a, b, c) <= eps_) {
            return false;
        }
        for (size_t j = 0; j < n; ++j) {
            if (j == prev || j == i || j == next) {
                continue;
            }
            const Vector2& p = pts_[ring[j]];
            if (p == a || p == b || p == c) {
                continue;
            }
            // Points on the ear's own edges are fine; on the diagonal they are not
            if (cross(a, b, p) > eps_ && cross(b, c, p) > eps_ && cross(c, a, p) >= -eps_) {
                return false;
            }
        }
        return true;
    }

    const std::vector<Vector2>& pts_;
    double eps_;
};

} // anonymous namespace

double signedArea(const std::vector<Vector2>& polygon) {
    double area = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Vector2& a = polygon[i];
        const Vector2& b = polygon[(i + 1) % polygon.size()];
        area += a.cross(b);
    }
    return area * 0.5;
}

Result<std::vector<uint32_t>> triangulatePolygon(const std::vector<Vector2>& polygon) {
    return triangulatePolygonWithHoles(polygon, {});
}

Result<std::vector<uint32_t>> triangulatePolygonWithHoles(
    const std::vector<Vector2>& outer,
    const std::vector<std::vector<Vector2>>& holes) {

    if (outer.size() < 3) {
        return Result<std::vector<uint32_t>>::error(ErrorCode::Triangulation,
            "Polygon needs at least 3 points, got " + std::to_string(outer.size()));
    }

    std::vector<Vector2> pts(outer);
    for (const auto& hole : holes) {
        pts.insert(pts.end(), hole.begin(), hole.end());
    }
    const double eps = areaTolerance(outer);

    std::vector<uint32_t> ring(outer.size());
    for (size_t i = 0; i < outer.size(); ++i) {
        ring[i] = static_cast<uint32_t>(i);
    }
    removeDuplicates(ring, pts);

    double area = ring.size() >= 3 ? ringArea(ring, pts) : 0.0;
    if (ring.size() < 3 || std::abs(area) <= eps) {
        return Result<std::vector<uint32_t>>::error(ErrorCode::Triangulation,
            "Polygon has zero area");
    }
    if (area < 0.0) {
        std::reverse(ring.begin(), ring.end());
    }

    std::vector<uint32_t> triangles;

    // Fast paths for small convex polygons
    if (holes.empty() && ring.size() <= kFanLimit) {
        bool convex = true;
        for (size_t i = 0; i < ring.size() && convex; ++i) {
            size_t n = ring.size();
            convex = cross(pts[ring[(i + n - 1) % n]], pts[ring[i]], pts[ring[(i + 1) % n]]) >= -eps;
        }
        if (convex) {
            for (size_t i = 1; i + 1 < ring.size(); ++i) {
                if (cross(pts[ring[0]], pts[ring[i]], pts[ring[i + 1]]) <= eps) {
                    continue;
                }
                triangles.push_back(ring[0]);
                triangles.push_back(ring[i]);
                triangles.push_back(ring[i + 1]);
            }
            return Result<std::vector<uint32_t>>::ok(std::move(triangles));
        }
    }

    // Holes as CW rings, bridged in order of decreasing max x
    struct HoleRing {
        std::vector<uint32_t> indices;
        double maxX;
    };
    std::vector<HoleRing> holeRings;
    size_t offset = outer.size();
    for (const auto& hole : holes) {
        HoleRing h;
        for (size_t i = 0; i < hole.size(); ++i) {
            h.indices.push_back(static_cast<uint32_t>(offset + i));
        }
        offset += hole.size();
        removeDuplicates(h.indices, pts);
        if (h.indices.size() < 3) {
            continue;
        }
        double holeArea = ringArea(h.indices, pts);
        if (std::abs(holeArea) <= eps) {
            continue;
        }
        if (holeArea > 0.0) {
            std::reverse(h.indices.begin(), h.indices.end());
        }
        h.maxX = std::numeric_limits<double>::lowest();
        for (uint32_t index : h.indices) {
            h.maxX = std::max(h.maxX, pts[index].x);
        }
        holeRings.push_back(std::move(h));
    }
    std::stable_sort(holeRings.begin(), holeRings.end(),
                     [](const HoleRing& a, const HoleRing& b) { return a.maxX > b.maxX; });

    EarClipper clipper(pts, eps);
    for (const auto& hole : holeRings) {
        clipper.bridgeHole(ring, hole.indices);
    }

    triangles.reserve((ring.size() - 2) * 3);
    clipper.clip(std::move(ring), triangles);

    if (triangles.empty()) {
        return Result<std::vector<uint32_t>>::error(ErrorCode::Triangulation,
            "Ear clipping produced no triangles");
    }
    return Result<std::vector<uint32_t>>::ok(std::move(triangles));
}

Vector3 calculatePolygonNormal(const std::vector<Vector3>& points) {
    Vector3 normal;
    size_t n = points.size();
    if (n < 3) {
        return normal;
    }
    for (size_t i = 0; i < n; ++i) {
        const Vector3& cur = points[i];
        const Vector3& next = points[(i + 1) % n];
        normal.x += (cur.y - next.y) * (cur.z + next.z);
        normal.y += (cur.z - next.z) * (cur.x + next.x);
        normal.z += (cur.x - next.x) * (cur.y + next.y);
    }
    if (normal.length() < 1e-12) {
        return Vector3();
    }
    return normal.normalized();
}

PlaneBasis makePlaneBasis(const Vector3& normal, const Vector3& origin) {
    PlaneBasis basis;
    basis.origin = origin;
    basis.normal = normal.normalized();

    const Vector3& n = basis.normal;
    Vector3 reference;
    double ax = std::abs(n.x);
    double ay = std::abs(n.y);
    double az = std::abs(n.z);
    if (ax <= ay && ax <= az) {
        reference = Vector3(1, 0, 0);
    } else if (ay <= az) {
        reference = Vector3(0, 1, 0);
    } else {
        reference = Vector3(0, 0, 1);
    }

    basis.uAxis = (n % reference).normalized();
    basis.vAxis = n % basis.uAxis;
    return basis;
}

std::vector<Vector2> projectTo2DWithBasis(const std::vector<Vector3>& points, const PlaneBasis& basis) {
    std::vector<Vector2> projected;
    projected.reserve(points.size());
    for (const auto& p : points) {
        Vector3 d = p - basis.origin;
        projected.emplace_back(d * basis.uAxis, d * basis.vAxis);
    }
    return projected;
}

std::vector<Vector2> projectTo2D(const std::vector<Vector3>& points, const Vector3& normal,
                                 PlaneBasis* basisOut) {
    PlaneBasis basis = makePlaneBasis(normal, points.empty() ? Vector3() : points.front());
    if (basisOut) {
        *basisOut = basis;
    }
    return projectTo2DWithBasis(points, basis);
}

Result<std::vector<uint32_t>> triangulatePolygon3D(
    const std::vector<Vector3>& outer,
    const std::vector<std::vector<Vector3>>& holes) {

    Vector3 normal = calculatePolygonNormal(outer);
    if (normal.length() < 0.5) {
        return Result<std::vector<uint32_t>>::error(ErrorCode::Triangulation,
            "Face is degenerate (no well-defined normal)");
    }

    PlaneBasis basis;
    std::vector<Vector2> outer2D = projectTo2D(outer, normal, &basis);
    std::vector<std::vector<Vector2>> holes2D;
    holes2D.reserve(holes.size());
    for (const auto& hole : holes) {
        holes2D.push_back(projectTo2DWithBasis(hole, basis));
    }
    return triangulatePolygonWithHoles(outer2D, holes2D);
}

} // namespace ifccore::geom
