#pragma once

#include <string>
#include "../Types.hpp"
#include "../step/Resolver.hpp"
#include "Mesh.hpp"

namespace ifccore::geom {

// ===========================================================================
// Geometry Processors
// ===========================================================================

/**
 * @brief Turns one geometric representation item into a mesh
 *
 * Processors are stateless apart from their construction parameters and
 * may be shared between threads. Output is in the item's own coordinate
 * system and file length units.
 */
class GeometryProcessor {
public:
    virtual ~GeometryProcessor() = default;

    /**
     * @brief Mesh the given entity, resolving references through `resolver`
     */
    virtual Result<Mesh> process(const step::DecodedEntity& entity,
                                 const step::EntityResolver& resolver) const = 0;

    /**
     * @brief Upper-case IFC type name handled by this processor
     */
    virtual const char* typeName() const = 0;
};

/**
 * @brief IfcExtrudedAreaSolid: profile swept along a direction
 *
 * (SweptArea, Position, ExtrudedDirection, Depth). The direction is given
 * in the Position coordinate system and may be oblique.
 */
class ExtrudedAreaSolidProcessor : public GeometryProcessor {
public:
    Result<Mesh> process(const step::DecodedEntity& entity,
                         const step::EntityResolver& resolver) const override;
    const char* typeName() const override { return "IFCEXTRUDEDAREASOLID"; }
};

/**
 * @brief IfcRevolvedAreaSolid: profile rotated about an axis
 *
 * (SweptArea, Position, Axis, Angle). Angle is in radians. Partial
 * revolutions are closed with start and end caps.
 */
class RevolvedAreaSolidProcessor : public GeometryProcessor {
public:
    explicit RevolvedAreaSolidProcessor(size_t fullCircleSegments = 24);

    Result<Mesh> process(const step::DecodedEntity& entity,
                         const step::EntityResolver& resolver) const override;
    const char* typeName() const override { return "IFCREVOLVEDAREASOLID"; }

private:
    size_t fullCircleSegments;
};

/**
 * @brief IfcSweptDiskSolid: circular tube along a directrix curve
 *
 * (Directrix, Radius, InnerRadius, StartParam, EndParam). A positive inner
 * radius produces a hollow tube with annular end caps.
 */
class SweptDiskSolidProcessor : public GeometryProcessor {
public:
    explicit SweptDiskSolidProcessor(size_t segments = 12);

    Result<Mesh> process(const step::DecodedEntity& entity,
                         const step::EntityResolver& resolver) const override;
    const char* typeName() const override { return "IFCSWEPTDISKSOLID"; }

private:
    size_t segments;
};

/**
 * @brief IfcFacetedBrep and IfcFacetedBrepWithVoids
 *
 * Each IfcFace is triangulated in its own plane. Faces that cannot be
 * triangulated (collinear or repeated points) are skipped.
 */
class FacetedBrepProcessor : public GeometryProcessor {
public:
    Result<Mesh> process(const step::DecodedEntity& entity,
                         const step::EntityResolver& resolver) const override;
    const char* typeName() const override { return "IFCFACETEDBREP"; }
};

/**
 * @brief IfcTriangulatedFaceSet: explicit indexed triangles
 *
 * (Coordinates, Normals, Closed, CoordIndex, PnIndex). Indices are 1-based.
 */
class TriangulatedFaceSetProcessor : public GeometryProcessor {
public:
    Result<Mesh> process(const step::DecodedEntity& entity,
                         const step::EntityResolver& resolver) const override;
    const char* typeName() const override { return "IFCTRIANGULATEDFACESET"; }
};

} // namespace ifccore::geom
