#pragma once

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "ifc-core/step/Model.hpp"

namespace ifccore::test {

// ===========================================================================
// In-memory STEP files shared by the test suites
// ===========================================================================

/**
 * @brief Wrap DATA records in a minimal IFC4 envelope
 */
inline std::string stepFile(const std::string& data, const std::string& schema = "IFC4") {
    return "ISO-10303-21;\n"
           "HEADER;\n"
           "FILE_DESCRIPTION(('ViewDefinition [CoordinationView]'),'2;1');\n"
           "FILE_NAME('fixture.ifc','2024-05-01T10:00:00',('Jane Doe'),('ACME'),"
           "'ifc-core','unit tests','');\n"
           "FILE_SCHEMA(('" + schema + "'));\n"
           "ENDSEC;\n"
           "DATA;\n" +
           data +
           "ENDSEC;\n"
           "END-ISO-10303-21;\n";
}

/**
 * @brief A 2 x 1 x 3 box extruded from a rectangle profile
 */
inline const char* kBoxRecords =
    "#1=IFCCARTESIANPOINT((0.,0.,0.));\n"
    "#2=IFCDIRECTION((0.,0.,1.));\n"
    "#3=IFCAXIS2PLACEMENT3D(#1,$,$);\n"
    "#4=IFCRECTANGLEPROFILEDEF(.AREA.,'2x1',$,2.,1.);\n"
    "#5=IFCEXTRUDEDAREASOLID(#4,#3,#2,3.);\n";

/**
 * @brief Project with two storeys, a wall with a body and properties, and a
 * slab without geometry. Lengths are in millimetres.
 */
inline const char* kBuildingRecords =
    "#1=IFCCARTESIANPOINT((0.,0.,0.));\n"
    "#2=IFCDIRECTION((0.,0.,1.));\n"
    "#3=IFCDIRECTION((1.,0.,0.));\n"
    "#4=IFCAXIS2PLACEMENT3D(#1,#2,#3);\n"
    "#5=IFCSIUNIT(*,.LENGTHUNIT.,.MILLI.,.METRE.);\n"
    "#6=IFCSIUNIT(*,.AREAUNIT.,$,.SQUARE_METRE.);\n"
    "#7=IFCUNITASSIGNMENT((#5,#6));\n"
    "#8=IFCGEOMETRICREPRESENTATIONCONTEXT($,'Model',3,1.E-05,#4,$);\n"
    "#10=IFCPROJECT('0YvctVUKr0kugbFTf53O9L',$,'Demo Project',$,$,$,$,(#8),#7);\n"
    "#11=IFCLOCALPLACEMENT($,#4);\n"
    "#12=IFCCARTESIANPOINT((1000.,0.,0.));\n"
    "#13=IFCAXIS2PLACEMENT3D(#12,$,$);\n"
    "#14=IFCLOCALPLACEMENT(#11,#13);\n"
    "#20=IFCSITE('1xS3BCk291UvhgP2dvNMKI',$,'Site',$,$,#11,$,$,.ELEMENT.,$,$,$,$,$);\n"
    "#30=IFCBUILDING('2FCZDorxHDT8NI01kdXi8P',$,'Building A',$,$,#11,$,$,.ELEMENT.,$,$,$);\n"
    "#40=IFCBUILDINGSTOREY('3Rf1XsM0D4Bv9YdGz7g0wp',$,'Ground Floor',$,$,#11,$,$,.ELEMENT.,0.);\n"
    "#41=IFCBUILDINGSTOREY('0pLNbEVGz5mOB$hkC3Bx7r',$,'First Floor',$,$,#11,$,$,.ELEMENT.,3000.);\n"
    "#50=IFCRECTANGLEPROFILEDEF(.AREA.,$,$,2000.,1000.);\n"
    "#51=IFCEXTRUDEDAREASOLID(#50,#4,#2,3000.);\n"
    "#52=IFCSHAPEREPRESENTATION(#8,'Body','SweptSolid',(#51));\n"
    "#53=IFCPRODUCTDEFINITIONSHAPE($,$,(#52));\n"
    "#60=IFCWALL('2O2Fr$t4X7Zf8NOew3FLOH',$,'Wall A','Exterior wall','Basic Wall',#14,#53,'W-01',$);\n"
    "#61=IFCSLAB('1Kkv6pYqH0dvW2_oBgHs1e',$,'Slab',$,$,#11,$,$,$);\n"
    "#62=IFCSPACE('0ecb7ay9P5ExHgUXyDjY3F',$,'Office',$,$,#11,$,$,.ELEMENT.,$,$);\n"
    "#63=IFCFURNITURE('2kkk0ZUL59eOHf6c6cG5NW',$,'Desk',$,$,#11,$,$,$);\n"
    "#70=IFCRELAGGREGATES('3ECTkwBdn4ixWIOLp4Ca1U',$,$,$,#10,(#20));\n"
    "#71=IFCRELAGGREGATES('1bzkEZiZv0cggcsp0ynspk',$,$,$,#20,(#30));\n"
    "#72=IFCRELAGGREGATES('0Ii2mVuJT0Oxn3Tb7RkPSd',$,$,$,#30,(#40,#41));\n"
    "#73=IFCRELAGGREGATES('2ztbaSsnz3Q8MuWGVR6A8i',$,$,$,#40,(#62));\n"
    "#74=IFCRELCONTAINEDINSPATIALSTRUCTURE('0Wp1S8tZ5EnBw7K_YNI7Ly',$,$,$,(#60),#40);\n"
    "#75=IFCRELCONTAINEDINSPATIALSTRUCTURE('2NwtJ0jQP0Bf0Dv0A7QUS3',$,$,$,(#61),#41);\n"
    "#76=IFCRELCONTAINEDINSPATIALSTRUCTURE('1Tq5VnnUj4Ev0Jb6dtuO8l',$,$,$,(#63),#62);\n"
    "#80=IFCPROPERTYSINGLEVALUE('IsExternal',$,IFCBOOLEAN(.T.),$);\n"
    "#81=IFCPROPERTYSINGLEVALUE('FireRating',$,IFCLABEL('REI60'),$);\n"
    "#82=IFCPROPERTYSINGLEVALUE('ThermalTransmittance',$,IFCTHERMALTRANSMITTANCEMEASURE(0.24),$);\n"
    "#83=IFCPROPERTYSET('2WJ4ow0Z5CHgSiSYYr3n6Z',$,'Pset_WallCommon',$,(#80,#81,#82));\n"
    "#84=IFCQUANTITYLENGTH('Length',$,$,2000.,$);\n"
    "#85=IFCQUANTITYAREA('NetSideArea',$,#6,6.,$);\n"
    "#86=IFCELEMENTQUANTITY('0dDDqOfnb5ZAIzZJrg5mBe',$,'Qto_WallBaseQuantities',$,$,(#84,#85));\n"
    "#87=IFCRELDEFINESBYPROPERTIES('1gqwQw5O5Dz9KXuW4OPl9m',$,$,$,(#60),#83);\n"
    "#88=IFCRELDEFINESBYPROPERTIES('3c2r8Ag9n8OQpeVh0dFZYQ',$,$,$,(#60),#86);\n";

/**
 * @brief Parse text and fail the calling test on error
 */
inline std::shared_ptr<step::Model> parseOrFail(const std::string& content,
                                                const step::ParseOptions& options = step::ParseOptions()) {
    auto result = step::Model::parse(content, options);
    EXPECT_TRUE(result.success) << result.errorCode << ": " << result.errorMessage;
    return result.value;
}

} // namespace ifccore::test
