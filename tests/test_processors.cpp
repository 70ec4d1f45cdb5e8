#include <gtest/gtest.h>
#include <cmath>
#include "ifc-core/geom/Processors.hpp"
#include "ifc-core/step/Model.hpp"
#include "StepFixtures.hpp"

using namespace ifccore;
using namespace ifccore::geom;

namespace {

constexpr double kPi = 3.14159265358979323846;

Result<Mesh> run(const GeometryProcessor& processor, const std::string& records, EntityId id) {
    auto model = test::parseOrFail(test::stepFile(records));
    if (!model) {
        return Result<Mesh>::error(ErrorCode::ParseError, "fixture did not parse");
    }
    auto entity = model->get(id);
    EXPECT_TRUE(entity.success) << entity.errorMessage;
    EXPECT_EQ(entity.value->typeName, processor.typeName());
    return processor.process(*entity.value, *model);
}

// Unit square centred at (3, 0) revolved about the Y axis
std::string revolveRecords(const std::string& angle) {
    return "#1=IFCCARTESIANPOINT((3.,0.));\n"
           "#2=IFCAXIS2PLACEMENT2D(#1,$);\n"
           "#3=IFCRECTANGLEPROFILEDEF(.AREA.,$,#2,1.,1.);\n"
           "#4=IFCCARTESIANPOINT((0.,0.,0.));\n"
           "#5=IFCDIRECTION((0.,1.,0.));\n"
           "#6=IFCAXIS1PLACEMENT(#4,#5);\n"
           "#7=IFCAXIS2PLACEMENT3D(#4,$,$);\n"
           "#8=IFCREVOLVEDAREASOLID(#3,#7,#6," + angle + ");\n";
}

std::string sweptDiskRecords(const std::string& radius, const std::string& innerRadius) {
    return "#1=IFCCARTESIANPOINT((0.,0.,0.));\n"
           "#2=IFCCARTESIANPOINT((10.,0.,0.));\n"
           "#3=IFCPOLYLINE((#1,#2));\n"
           "#4=IFCSWEPTDISKSOLID(#3," + radius + "," + innerRadius + ",$,$);\n";
}

const char* kCubeBrepRecords =
    "#1=IFCCARTESIANPOINT((0.,0.,0.));\n"
    "#2=IFCCARTESIANPOINT((1.,0.,0.));\n"
    "#3=IFCCARTESIANPOINT((1.,1.,0.));\n"
    "#4=IFCCARTESIANPOINT((0.,1.,0.));\n"
    "#5=IFCCARTESIANPOINT((0.,0.,1.));\n"
    "#6=IFCCARTESIANPOINT((1.,0.,1.));\n"
    "#7=IFCCARTESIANPOINT((1.,1.,1.));\n"
    "#8=IFCCARTESIANPOINT((0.,1.,1.));\n"
    "#11=IFCPOLYLOOP((#1,#4,#3,#2));\n"
    "#12=IFCPOLYLOOP((#5,#6,#7,#8));\n"
    "#13=IFCPOLYLOOP((#1,#2,#6,#5));\n"
    "#14=IFCPOLYLOOP((#3,#4,#8,#7));\n"
    "#15=IFCPOLYLOOP((#1,#5,#8,#4));\n"
    "#16=IFCPOLYLOOP((#2,#3,#7,#6));\n"
    "#21=IFCFACEOUTERBOUND(#11,.T.);\n"
    "#22=IFCFACEOUTERBOUND(#12,.T.);\n"
    "#23=IFCFACEOUTERBOUND(#13,.T.);\n"
    "#24=IFCFACEOUTERBOUND(#14,.T.);\n"
    "#25=IFCFACEOUTERBOUND(#15,.T.);\n"
    "#26=IFCFACEOUTERBOUND(#16,.T.);\n"
    "#31=IFCFACE((#21));\n"
    "#32=IFCFACE((#22));\n"
    "#33=IFCFACE((#23));\n"
    "#34=IFCFACE((#24));\n"
    "#35=IFCFACE((#25));\n"
    "#36=IFCFACE((#26));\n"
    "#40=IFCCLOSEDSHELL((#31,#32,#33,#34,#35,#36));\n"
    "#41=IFCFACETEDBREP(#40);\n";

std::string tetrahedronRecords(const std::string& coordIndex) {
    return "#1=IFCCARTESIANPOINTLIST3D(((0.,0.,0.),(1.,0.,0.),(0.,1.,0.),(0.,0.,1.)));\n"
           "#2=IFCTRIANGULATEDFACESET(#1,$,.T.," + coordIndex + ",$);\n";
}

} // namespace

// ============================================================================
// IfcExtrudedAreaSolid
// ============================================================================

TEST(ExtrudedAreaSolid, RectangleBox) {
    ExtrudedAreaSolidProcessor processor;
    auto mesh = run(processor, test::kBoxRecords, 5);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    EXPECT_EQ(mesh.value.getTriangleCount(), 12u);
    EXPECT_TRUE(mesh.value.isWatertight());
    EXPECT_NEAR(mesh.value.getVolume(), 6.0, 1e-9);

    BoundingBox box = mesh.value.getBoundingBox();
    EXPECT_NEAR(box.volume(), 6.0, 1e-9);
    EXPECT_NEAR(box.min.z, 0.0, 1e-12);
    EXPECT_NEAR(box.max.z, 3.0, 1e-12);

    MeshData data = mesh.value.toMeshData();
    EXPECT_EQ(data.indices.size(), 36u);
    EXPECT_EQ(data.positions.size(), mesh.value.getVertexCount() * 3);
}

TEST(ExtrudedAreaSolid, PositionMovesSolid) {
    std::string records =
        "#1=IFCCARTESIANPOINT((5.,0.,2.));\n"
        "#2=IFCDIRECTION((0.,0.,1.));\n"
        "#3=IFCAXIS2PLACEMENT3D(#1,$,$);\n"
        "#4=IFCRECTANGLEPROFILEDEF(.AREA.,$,$,2.,1.);\n"
        "#5=IFCEXTRUDEDAREASOLID(#4,#3,#2,3.);\n";
    ExtrudedAreaSolidProcessor processor;
    auto mesh = run(processor, records, 5);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    BoundingBox box = mesh.value.getBoundingBox();
    EXPECT_NEAR(box.min.x, 4.0, 1e-12);
    EXPECT_NEAR(box.max.x, 6.0, 1e-12);
    EXPECT_NEAR(box.min.z, 2.0, 1e-12);
    EXPECT_NEAR(box.max.z, 5.0, 1e-12);
}

TEST(ExtrudedAreaSolid, ErrorsNameTheSolid) {
    std::string zeroDepth =
        "#1=IFCCARTESIANPOINT((0.,0.,0.));\n"
        "#2=IFCDIRECTION((0.,0.,1.));\n"
        "#3=IFCAXIS2PLACEMENT3D(#1,$,$);\n"
        "#4=IFCRECTANGLEPROFILEDEF(.AREA.,$,$,2.,1.);\n"
        "#5=IFCEXTRUDEDAREASOLID(#4,#3,#2,0.);\n";
    ExtrudedAreaSolidProcessor processor;
    auto depth = run(processor, zeroDepth, 5);
    EXPECT_FALSE(depth.success);
    EXPECT_EQ(depth.errorCode, ErrorCode::Profile);
    EXPECT_EQ(depth.entityId, 5u);

    std::string missingProfile =
        "#2=IFCDIRECTION((0.,0.,1.));\n"
        "#5=IFCEXTRUDEDAREASOLID(#4,$,#2,1.);\n";
    auto missing = run(processor, missingProfile, 5);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.errorCode, ErrorCode::EntityNotFound);
}

// ============================================================================
// IfcRevolvedAreaSolid
// ============================================================================

TEST(RevolvedAreaSolid, FullRevolutionIsClosedTorus) {
    RevolvedAreaSolidProcessor processor;
    auto mesh = run(processor, revolveRecords("6.283185307179586"), 8);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    // 4 profile edges, 24 segments, 2 triangles per quad
    EXPECT_EQ(mesh.value.getTriangleCount(), 4u * 24u * 2u);
    EXPECT_TRUE(mesh.value.isWatertight());
    // Pappus: 2 pi * 3 * 1, reduced by the polygonal approximation
    EXPECT_NEAR(mesh.value.getSignedVolume(), 2.0 * kPi * 3.0, 0.5);
    EXPECT_GT(mesh.value.getSignedVolume(), 0.0);
}

TEST(RevolvedAreaSolid, QuarterRevolutionHasCaps) {
    RevolvedAreaSolidProcessor processor;
    auto mesh = run(processor, revolveRecords("1.5707963267948966"), 8);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    EXPECT_TRUE(mesh.value.isWatertight());
    EXPECT_NEAR(mesh.value.getSignedVolume(), 2.0 * kPi * 3.0 / 4.0, 0.2);

    BoundingBox box = mesh.value.getBoundingBox();
    EXPECT_NEAR(box.min.y, -0.5, 1e-9);
    EXPECT_NEAR(box.max.y, 0.5, 1e-9);
}

TEST(RevolvedAreaSolid, ZeroAngleIsGeometryError) {
    RevolvedAreaSolidProcessor processor;
    auto mesh = run(processor, revolveRecords("0."), 8);
    EXPECT_FALSE(mesh.success);
    EXPECT_EQ(mesh.errorCode, ErrorCode::Geometry);
    EXPECT_EQ(mesh.entityId, 8u);
}

TEST(RevolvedAreaSolid, SegmentCountIsConfigurable) {
    RevolvedAreaSolidProcessor processor(8);
    auto mesh = run(processor, revolveRecords("6.283185307179586"), 8);
    ASSERT_TRUE(mesh.success);
    EXPECT_EQ(mesh.value.getTriangleCount(), 4u * 8u * 2u);
}

// ============================================================================
// IfcSweptDiskSolid
// ============================================================================

TEST(SweptDiskSolid, SolidTube) {
    SweptDiskSolidProcessor processor;
    auto mesh = run(processor, sweptDiskRecords("0.5", "$"), 4);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    EXPECT_TRUE(mesh.value.isWatertight());
    // 12-gon of circumradius r has area 3 r^2
    EXPECT_NEAR(mesh.value.getSignedVolume(), 3.0 * 0.25 * 10.0, 1e-9);

    BoundingBox box = mesh.value.getBoundingBox();
    EXPECT_NEAR(box.min.x, 0.0, 1e-12);
    EXPECT_NEAR(box.max.x, 10.0, 1e-12);
    EXPECT_NEAR(box.max.z, 0.5, 1e-9);
}

TEST(SweptDiskSolid, HollowTube) {
    SweptDiskSolidProcessor processor;
    auto mesh = run(processor, sweptDiskRecords("0.5", "0.25"), 4);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    EXPECT_TRUE(mesh.value.isWatertight());
    EXPECT_NEAR(mesh.value.getSignedVolume(), 3.0 * (0.25 - 0.0625) * 10.0, 1e-9);
}

TEST(SweptDiskSolid, InnerRadiusMustBeSmaller) {
    SweptDiskSolidProcessor processor;
    auto mesh = run(processor, sweptDiskRecords("0.5", "0.5"), 4);
    EXPECT_FALSE(mesh.success);
    EXPECT_EQ(mesh.errorCode, ErrorCode::Geometry);
    EXPECT_EQ(mesh.entityId, 4u);
    EXPECT_EQ(mesh.attributeIndex, std::optional<size_t>(2));

    auto negative = run(processor, sweptDiskRecords("0.5", "-0.1"), 4);
    EXPECT_EQ(negative.errorCode, ErrorCode::Geometry);
}

TEST(SweptDiskSolid, RadiusMustBePositive) {
    SweptDiskSolidProcessor processor;
    auto mesh = run(processor, sweptDiskRecords("0.", "$"), 4);
    EXPECT_FALSE(mesh.success);
    EXPECT_EQ(mesh.errorCode, ErrorCode::Geometry);
    EXPECT_EQ(mesh.entityId, 4u);
    EXPECT_EQ(mesh.attributeIndex, std::optional<size_t>(1));
}

TEST(SweptDiskSolid, BentDirectrixStaysClosed) {
    std::string records =
        "#1=IFCCARTESIANPOINT((0.,0.,0.));\n"
        "#2=IFCCARTESIANPOINT((5.,0.,0.));\n"
        "#3=IFCCARTESIANPOINT((5.,5.,0.));\n"
        "#4=IFCPOLYLINE((#1,#2,#3));\n"
        "#5=IFCSWEPTDISKSOLID(#4,0.1,$,$,$);\n";
    SweptDiskSolidProcessor processor(16);
    auto mesh = run(processor, records, 5);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;
    EXPECT_TRUE(mesh.value.isWatertight());
    EXPECT_GT(mesh.value.getSignedVolume(), 0.0);
}

// ============================================================================
// IfcFacetedBrep
// ============================================================================

TEST(FacetedBrep, UnitCube) {
    FacetedBrepProcessor processor;
    auto mesh = run(processor, kCubeBrepRecords, 41);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    EXPECT_EQ(mesh.value.getTriangleCount(), 12u);
    EXPECT_TRUE(mesh.value.isWatertight());
    EXPECT_NEAR(mesh.value.getSignedVolume(), 1.0, 1e-12);
    EXPECT_NEAR(mesh.value.getSurfaceArea(), 6.0, 1e-12);
}

TEST(FacetedBrep, ReversedBoundIsFlipped) {
    // Bottom face listed clockwise from outside, marked with Orientation .F.
    std::string records = kCubeBrepRecords;
    std::string from = "#11=IFCPOLYLOOP((#1,#4,#3,#2));\n";
    records.replace(records.find(from), from.size(), "#11=IFCPOLYLOOP((#2,#3,#4,#1));\n");
    from = "#21=IFCFACEOUTERBOUND(#11,.T.);\n";
    records.replace(records.find(from), from.size(), "#21=IFCFACEOUTERBOUND(#11,.F.);\n");

    FacetedBrepProcessor processor;
    auto mesh = run(processor, records, 41);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;
    EXPECT_NEAR(mesh.value.getSignedVolume(), 1.0, 1e-12);
}

TEST(FacetedBrep, DegenerateFacesAreSkipped) {
    std::string records =
        "#1=IFCCARTESIANPOINT((0.,0.,0.));\n"
        "#2=IFCCARTESIANPOINT((1.,0.,0.));\n"
        "#3=IFCCARTESIANPOINT((2.,0.,0.));\n"
        "#4=IFCPOLYLOOP((#1,#2,#3));\n"
        "#5=IFCFACEOUTERBOUND(#4,.T.);\n"
        "#6=IFCFACE((#5));\n"
        "#7=IFCCLOSEDSHELL((#6));\n"
        "#8=IFCFACETEDBREP(#7);\n";
    FacetedBrepProcessor processor;
    auto mesh = run(processor, records, 8);
    EXPECT_FALSE(mesh.success);
    EXPECT_EQ(mesh.errorCode, ErrorCode::Geometry);
    EXPECT_EQ(mesh.entityId, 8u);
}

// ============================================================================
// IfcTriangulatedFaceSet
// ============================================================================

TEST(TriangulatedFaceSet, Tetrahedron) {
    TriangulatedFaceSetProcessor processor;
    auto mesh = run(processor, tetrahedronRecords("((1,3,2),(1,2,4),(1,4,3),(2,3,4))"), 2);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    EXPECT_EQ(mesh.value.getVertexCount(), 4u);
    EXPECT_EQ(mesh.value.getTriangleCount(), 4u);
    EXPECT_TRUE(mesh.value.isWatertight());
    EXPECT_NEAR(mesh.value.getSignedVolume(), 1.0 / 6.0, 1e-12);

    for (const auto& n : mesh.value.getNormals()) {
        EXPECT_NEAR(n.length(), 1.0, 1e-9);
    }
}

TEST(TriangulatedFaceSet, IndexOutOfRange) {
    TriangulatedFaceSetProcessor processor;
    auto mesh = run(processor, tetrahedronRecords("((1,3,2),(1,2,5))"), 2);
    EXPECT_FALSE(mesh.success);
    EXPECT_EQ(mesh.errorCode, ErrorCode::InvalidAttribute);
    EXPECT_EQ(mesh.entityId, 2u);
    EXPECT_EQ(mesh.attributeIndex, std::optional<size_t>(3));

    auto zero = run(processor, tetrahedronRecords("((0,1,2))"), 2);
    EXPECT_EQ(zero.errorCode, ErrorCode::InvalidAttribute);
}

TEST(TriangulatedFaceSet, PnIndexRemapsPoints) {
    std::string records =
        "#1=IFCCARTESIANPOINTLIST3D(((0.,0.,0.),(9.,9.,9.),(1.,0.,0.),(0.,1.,0.)));\n"
        "#2=IFCTRIANGULATEDFACESET(#1,$,$,((1,2,3)),(1,3,4));\n";
    TriangulatedFaceSetProcessor processor;
    auto mesh = run(processor, records, 2);
    ASSERT_TRUE(mesh.success) << mesh.errorMessage;

    EXPECT_EQ(mesh.value.getVertexCount(), 3u);
    EXPECT_NEAR(mesh.value.getSurfaceArea(), 0.5, 1e-12);
    EXPECT_NEAR(mesh.value.getBoundingBox().max.x, 1.0, 1e-12);
}
