#include <gtest/gtest.h>
#include <algorithm>
#include "ifc-core/step/Model.hpp"
#include "StepFixtures.hpp"

using namespace ifccore;
using namespace ifccore::step;

namespace {

class SpatialTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        model = test::parseOrFail(test::stepFile(test::kBuildingRecords));
        ASSERT_TRUE(model);
        tree = model->spatialTree();
        ASSERT_NE(tree, nullptr);
    }

    std::shared_ptr<Model> model;
    const SpatialTree* tree = nullptr;
};

std::vector<EntityId> sorted(std::vector<EntityId> ids) {
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace

TEST_F(SpatialTreeTest, RootIsProject) {
    ASSERT_TRUE(tree->root().has_value());
    EXPECT_EQ(*tree->root(), 10u);
    const SpatialNode* root = tree->node(10);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->type, SpatialNodeType::Project);
    EXPECT_EQ(root->name, "Demo Project");
    EXPECT_FALSE(tree->parent(10).has_value());
}

TEST_F(SpatialTreeTest, FollowsAggregationAndContainment) {
    EXPECT_EQ(tree->children(10), (std::vector<EntityId>{20}));
    EXPECT_EQ(tree->children(20), (std::vector<EntityId>{30}));
    EXPECT_EQ(tree->children(30), (std::vector<EntityId>{40, 41}));
    // Aggregated space first, then contained elements
    EXPECT_EQ(tree->children(40), (std::vector<EntityId>{62, 60}));
    EXPECT_EQ(tree->children(62), (std::vector<EntityId>{63}));
    EXPECT_TRUE(tree->children(60).empty());
    EXPECT_TRUE(tree->children(12345).empty());

    EXPECT_EQ(tree->parent(60), std::optional<EntityId>(40));
    EXPECT_EQ(tree->parent(63), std::optional<EntityId>(62));
}

TEST_F(SpatialTreeTest, NodesCarryTypeNameAndGeometryFlag) {
    const SpatialNode* wall = tree->node(60);
    ASSERT_NE(wall, nullptr);
    EXPECT_EQ(wall->type, SpatialNodeType::Element);
    EXPECT_EQ(wall->entityType, "IFCWALL");
    EXPECT_EQ(wall->name, "Wall A");
    EXPECT_TRUE(wall->hasGeometry);

    const SpatialNode* slab = tree->node(61);
    ASSERT_NE(slab, nullptr);
    EXPECT_FALSE(slab->hasGeometry);

    EXPECT_EQ(tree->node(20)->type, SpatialNodeType::Site);
    EXPECT_EQ(tree->node(30)->type, SpatialNodeType::Building);
    EXPECT_EQ(tree->node(62)->type, SpatialNodeType::Space);

    const SpatialNode* upper = tree->node(41);
    ASSERT_NE(upper, nullptr);
    EXPECT_EQ(upper->type, SpatialNodeType::Storey);
    ASSERT_TRUE(upper->elevation.has_value());
    EXPECT_DOUBLE_EQ(*upper->elevation, 3000.0);

    EXPECT_EQ(tree->node(1), nullptr);
}

TEST_F(SpatialTreeTest, StoreysSortedByElevation) {
    const auto& storeys = tree->storeys();
    ASSERT_EQ(storeys.size(), 2u);
    EXPECT_EQ(storeys[0].id, 40u);
    EXPECT_EQ(storeys[0].name, "Ground Floor");
    EXPECT_DOUBLE_EQ(storeys[0].elevation, 0.0);
    EXPECT_EQ(storeys[0].elementCount, 2u);
    EXPECT_EQ(storeys[1].id, 41u);
    EXPECT_EQ(storeys[1].elementCount, 1u);
}

TEST_F(SpatialTreeTest, ElementsInStoreyIncludeSpaceContents) {
    EXPECT_EQ(sorted(tree->elementsInStorey(40)), (std::vector<EntityId>{60, 63}));
    EXPECT_EQ(tree->elementsInStorey(41), (std::vector<EntityId>{61}));
    EXPECT_EQ(tree->containingStorey(63), std::optional<EntityId>(40));
    EXPECT_EQ(tree->containingStorey(61), std::optional<EntityId>(41));
    EXPECT_FALSE(tree->containingStorey(10).has_value());
}

TEST_F(SpatialTreeTest, SearchMatchesNameOrTypeCaseInsensitively) {
    EXPECT_EQ(tree->search("wall"), (std::vector<EntityId>{60}));
    EXPECT_EQ(tree->search("FLOOR"), (std::vector<EntityId>{40, 41}));
    EXPECT_EQ(tree->search("ifcfurn"), (std::vector<EntityId>{63}));
    EXPECT_TRUE(tree->search("").empty());
    EXPECT_TRUE(tree->search("nothing-like-this").empty());
}

TEST_F(SpatialTreeTest, DepthFirstOrder) {
    EXPECT_EQ(tree->depthFirst(), (std::vector<EntityId>{10, 20, 30, 40, 62, 63, 60, 41, 61}));
    EXPECT_EQ(tree->nodeCount(), 9u);
    EXPECT_EQ(tree->duplicateParentClaims(), 0u);
}

TEST(SpatialTree, FirstParentClaimWins) {
    std::string data =
        "#1=IFCPROJECT('p',$,'P',$,$,$,$,$,$);\n"
        "#2=IFCBUILDINGSTOREY('a',$,'A',$,$,$,$,$,.ELEMENT.,0.);\n"
        "#3=IFCBUILDINGSTOREY('b',$,'B',$,$,$,$,$,.ELEMENT.,3.);\n"
        "#4=IFCWALL('w',$,'W',$,$,$,$,$,$);\n"
        "#5=IFCRELAGGREGATES('r1',$,$,$,#1,(#2,#3));\n"
        "#6=IFCRELCONTAINEDINSPATIALSTRUCTURE('r2',$,$,$,(#4),#3);\n"
        "#7=IFCRELCONTAINEDINSPATIALSTRUCTURE('r3',$,$,$,(#4),#2);\n";
    auto model = test::parseOrFail(test::stepFile(data));
    ASSERT_TRUE(model);
    const SpatialTree* tree = model->spatialTree();
    ASSERT_NE(tree, nullptr);

    EXPECT_EQ(tree->parent(4), std::optional<EntityId>(3));
    EXPECT_EQ(tree->children(3), (std::vector<EntityId>{4}));
    EXPECT_TRUE(tree->children(2).empty());
    EXPECT_EQ(tree->duplicateParentClaims(), 1u);
}

TEST(SpatialTree, AggregationObservedBeforeContainment) {
    std::string data =
        "#1=IFCPROJECT('p',$,'P',$,$,$,$,$,$);\n"
        "#2=IFCBUILDINGSTOREY('a',$,'A',$,$,$,$,$,.ELEMENT.,0.);\n"
        "#3=IFCBUILDINGSTOREY('b',$,'B',$,$,$,$,$,.ELEMENT.,3.);\n"
        "#4=IFCRELAGGREGATES('r1',$,$,$,#1,(#2,#3));\n"
        "#5=IFCRELCONTAINEDINSPATIALSTRUCTURE('r2',$,$,$,(#6),#2);\n"
        "#6=IFCSPACE('s',$,'Room',$,$,$,$,$,.ELEMENT.,$,$);\n"
        "#7=IFCRELAGGREGATES('r3',$,$,$,#3,(#6));\n";
    auto model = test::parseOrFail(test::stepFile(data));
    ASSERT_TRUE(model);
    const SpatialTree* tree = model->spatialTree();
    ASSERT_NE(tree, nullptr);

    EXPECT_EQ(tree->parent(6), std::optional<EntityId>(3));
    EXPECT_EQ(tree->duplicateParentClaims(), 1u);
}

TEST(SpatialTree, ReferenceCycleDoesNotLoop) {
    std::string data =
        "#1=IFCPROJECT('p',$,'P',$,$,$,$,$,$);\n"
        "#2=IFCSITE('s',$,'S',$,$,$,$,$,.ELEMENT.,$,$,$,$,$);\n"
        "#3=IFCRELAGGREGATES('r1',$,$,$,#1,(#2));\n"
        "#4=IFCRELAGGREGATES('r2',$,$,$,#2,(#1));\n";
    auto model = test::parseOrFail(test::stepFile(data));
    ASSERT_TRUE(model);
    const SpatialTree* tree = model->spatialTree();
    ASSERT_NE(tree, nullptr);

    EXPECT_FALSE(tree->parent(1).has_value());
    EXPECT_EQ(tree->depthFirst(), (std::vector<EntityId>{1, 2}));
    EXPECT_EQ(tree->duplicateParentClaims(), 1u);
}

TEST(SpatialTree, DisabledByOptions) {
    ParseOptions options;
    options.buildSpatialTree = false;
    auto model = test::parseOrFail(test::stepFile(test::kBuildingRecords), options);
    ASSERT_TRUE(model);
    EXPECT_EQ(model->spatialTree(), nullptr);
}

TEST(SpatialTree, ClassifiesFacilities) {
    EXPECT_EQ(spatialNodeTypeFor("IFCBRIDGE"), SpatialNodeType::Facility);
    EXPECT_EQ(spatialNodeTypeFor("IFCROADPART"), SpatialNodeType::FacilityPart);
    EXPECT_EQ(spatialNodeTypeFor("IFCDOOR"), SpatialNodeType::Element);
    EXPECT_STREQ(toString(SpatialNodeType::Storey), "Storey");
}
