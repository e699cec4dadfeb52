#include <gtest/gtest.h>

#include <algorithm>

#include "TestLayouts.hpp"
#include "layout/processing/HierarchyResolver.hpp"

using namespace test_layouts;

namespace
{
Structure MakeStructure(const std::string& name, std::vector<Element> elements)
{
    return Structure {name, std::move(elements)};
}

std::vector<double> SortedFirstXs(const ResolvedElementList& resolved)
{
    std::vector<double> xs;
    for (const ResolvedElement& item : resolved) {
        xs.push_back(FirstPoint(item.element).x_ax);
    }
    std::sort(xs.begin(), xs.end());
    return xs;
}
}  // namespace

TEST(HierarchyResolverTest, IdentityReferenceReproducesChildGeometry)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("CHILD", {MakeRect(0, 0, 2, 3), MakePath({{0, 0}, {5, 0}}, 1.0)}),
        MakeStructure("TOP", {MakeSRef("CHILD", {{0, 0}})}),
    });

    HierarchyResolver resolver;
    ResolvedElementList const kLocal = resolver.Resolve(kLibrary, "CHILD");
    ResolvedElementList const kViaReference = resolver.Resolve(kLibrary, "TOP");

    ASSERT_EQ(kViaReference.size(), kLocal.size());
    for (size_t i = 0; i < kLocal.size(); ++i) {
        EXPECT_EQ(kViaReference[i].element.bounds, kLocal[i].element.bounds);
        EXPECT_EQ(kViaReference[i].source_structure, "CHILD");
        EXPECT_EQ(kViaReference[i].source_index, i);
    }
}

TEST(HierarchyResolverTest, RotationMagnificationAndTranslationCompose)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("DOT", {MakeBoundary({{1, 1}, {1, 1}, {1, 1}})}),
        MakeStructure("TOP", {MakeSRef("DOT", {{100, 100}}, 90.0, 2.0)}),
    });

    HierarchyResolver resolver;
    ResolvedElementList const kResolved = resolver.Resolve(kLibrary, "TOP");
    ASSERT_EQ(kResolved.size(), 1U);
    Vec2 const kPoint = FirstPoint(kResolved.front().element);
    EXPECT_NEAR(kPoint.x_ax, 98.0, 1e-9);
    EXPECT_NEAR(kPoint.y_ax, 102.0, 1e-9);
}

TEST(HierarchyResolverTest, GridReferenceExpandsRowsTimesColumns)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("UNIT", {MakeRect(0, 0, 1, 1)}),
        MakeStructure("TOP", {MakeARef("UNIT", {0, 0}, {30, 0}, {0, 10}, 3, 1)}),
    });

    HierarchyResolver resolver;
    ResolvedElementList const kResolved = resolver.Resolve(kLibrary, "TOP");
    ASSERT_EQ(kResolved.size(), 3U);
    EXPECT_EQ(SortedFirstXs(kResolved), (std::vector<double> {0.0, 10.0, 20.0}));
}

TEST(HierarchyResolverTest, TwoDimensionalGrid)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("UNIT", {MakeRect(0, 0, 1, 1)}),
        MakeStructure("TOP", {MakeARef("UNIT", {0, 0}, {20, 0}, {0, 15}, 4, 3)}),
    });

    HierarchyResolver resolver;
    ResolvedElementList const kResolved = resolver.Resolve(kLibrary, "TOP");
    ASSERT_EQ(kResolved.size(), 12U);
    std::optional<BBox> bounds;
    for (const ResolvedElement& item : kResolved) {
        bbox_utils::MergeInto(bounds, *item.element.bounds);
    }
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(*bounds, BBox(0, 0, 16, 11));
}

TEST(HierarchyResolverTest, CycleTerminatesAndIsReported)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("A", {MakeRect(0, 0, 1, 1), MakeSRef("B", {{5, 0}})}),
        MakeStructure("B", {MakeRect(0, 0, 2, 2), MakeSRef("A", {{0, 5}})}),
    });

    HierarchyResolver resolver;
    ResolvedElementList const kResolved = resolver.Resolve(kLibrary, "A");
    // A's own rect plus B's rect; the B -> A edge contributes nothing.
    EXPECT_EQ(kResolved.size(), 2U);

    ASSERT_EQ(resolver.GetCycles().size(), 1U);
    EXPECT_EQ(resolver.GetCycles().front(), (ReferenceCycle {"A", "B", "A"}));
    EXPECT_EQ(resolver.GetStatistics().cycles_found, 1U);
}

TEST(HierarchyResolverTest, CycleMembersResolveIndependentlyOfOrder)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("A", {MakeRect(0, 0, 1, 1), MakeSRef("B", {{5, 0}})}),
        MakeStructure("B", {MakeRect(0, 0, 2, 2), MakeSRef("A", {{0, 5}})}),
    });

    HierarchyResolver fresh;
    ResolvedElementList const kExpected = fresh.Resolve(kLibrary, "B");
    ASSERT_EQ(kExpected.size(), 2U);

    // Resolving A first assembles B with its edge back to A cut; that result must not be reused.
    HierarchyResolver warmed;
    warmed.Resolve(kLibrary, "A");
    ResolvedElementList const kResolved = warmed.Resolve(kLibrary, "B");
    ASSERT_EQ(kResolved.size(), kExpected.size());
    for (size_t i = 0; i < kResolved.size(); ++i) {
        EXPECT_EQ(kResolved[i].source_structure, kExpected[i].source_structure);
        EXPECT_EQ(FirstPoint(kResolved[i].element), FirstPoint(kExpected[i].element));
    }
    EXPECT_EQ(FirstPoint(kResolved[1].element), Vec2(0, 5));
}

TEST(HierarchyResolverTest, DetectCyclesWithoutResolving)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("A", {MakeSRef("B", {{0, 0}})}),
        MakeStructure("B", {MakeSRef("A", {{0, 0}})}),
        MakeStructure("C", {MakeSRef("C", {{0, 0}})}),
    });

    std::vector<ReferenceCycle> const kCycles = HierarchyResolver::DetectCycles(kLibrary);
    ASSERT_EQ(kCycles.size(), 2U);
    EXPECT_EQ(kCycles[0], (ReferenceCycle {"A", "B", "A"}));
    EXPECT_EQ(kCycles[1], (ReferenceCycle {"C", "C"}));
}

TEST(HierarchyResolverTest, DeepChainDoesNotExhaustStack)
{
    std::vector<Structure> structures;
    constexpr int kDepth = 5000;
    for (int i = 0; i < kDepth; ++i) {
        std::vector<Element> elements;
        if (i + 1 < kDepth) {
            elements.push_back(MakeSRef("S" + std::to_string(i + 1), {{1, 0}}));
        } else {
            elements.push_back(MakeRect(0, 0, 1, 1));
        }
        structures.push_back(MakeStructure("S" + std::to_string(i), std::move(elements)));
    }
    Library const kLibrary = MakeLibrary(std::move(structures));

    HierarchyResolver resolver;
    ResolvedElementList const kResolved = resolver.Resolve(kLibrary, "S0");
    ASSERT_EQ(kResolved.size(), 1U);
    EXPECT_NEAR(FirstPoint(kResolved.front().element).x_ax, kDepth - 1.0, 1e-9);
}

TEST(HierarchyResolverTest, MissingReferenceIsSkipped)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("TOP", {MakeRect(0, 0, 1, 1), MakeSRef("GHOST", {{0, 0}}), MakeARef("GHOST", {0, 0}, {2, 0}, {0, 2}, 2, 2)}),
    });

    HierarchyResolver resolver;
    ResolvedElementList const kResolved = resolver.Resolve(kLibrary, "TOP");
    EXPECT_EQ(kResolved.size(), 1U);
    EXPECT_EQ(resolver.GetStatistics().missing_references, 2U);
    EXPECT_TRUE(resolver.Resolve(kLibrary, "NOPE").empty());
}

TEST(HierarchyResolverTest, CachedStructureHonoursEachPlacementTransform)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("UNIT", {MakeRect(0, 0, 1, 1)}),
        MakeStructure("LEFT", {MakeSRef("UNIT", {{0, 0}})}),
        MakeStructure("RIGHT", {MakeSRef("UNIT", {{100, 0}}, 0.0, 3.0)}),
        MakeStructure("TOP", {MakeSRef("LEFT", {{0, 0}}), MakeSRef("RIGHT", {{0, 0}})}),
    });

    HierarchyResolver resolver;
    ResolvedElementList const kResolved = resolver.Resolve(kLibrary, "TOP");
    ASSERT_EQ(kResolved.size(), 2U);
    EXPECT_EQ(*kResolved[0].element.bounds, BBox(0, 0, 1, 1));
    EXPECT_EQ(*kResolved[1].element.bounds, BBox(100, 0, 103, 3));

    // A second resolve with a caller transform reuses the cache without corrupting it.
    ResolvedElementList const kShifted = resolver.Resolve(kLibrary, "LEFT", Transform::Translation(Vec2(50, 50)));
    ASSERT_EQ(kShifted.size(), 1U);
    EXPECT_EQ(*kShifted[0].element.bounds, BBox(50, 50, 51, 51));
    EXPECT_EQ(*resolver.Resolve(kLibrary, "LEFT")[0].element.bounds, BBox(0, 0, 1, 1));
}

TEST(HierarchyResolverTest, TopStructuresAndLibraryBounds)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("CHILD", {MakeBoundary({{0, 0}, {10, 0}, {10, 10}, {0, 10}})}),
        MakeStructure("TOP", {MakeSRef("CHILD", {{0, 0}})}),
    });

    EXPECT_EQ(HierarchyResolver::FindTopStructures(kLibrary), (std::vector<std::string> {"TOP"}));

    HierarchyResolver resolver;
    std::optional<BBox> const kBounds = resolver.ComputeLibraryBounds(kLibrary);
    ASSERT_TRUE(kBounds.has_value());
    EXPECT_EQ(*kBounds, BBox(0, 0, 10, 10));
}

TEST(HierarchyResolverTest, EmptyLibraryHasNoBounds)
{
    Library const kLibrary = MakeLibrary({MakeStructure("EMPTY", {})});
    HierarchyResolver resolver;
    EXPECT_FALSE(resolver.ComputeLibraryBounds(kLibrary).has_value());
}

TEST(HierarchyResolverTest, ExtractLayersIsSortedAndUnique)
{
    Library const kLibrary = MakeLibrary({
        MakeStructure("A", {MakeRect(0, 0, 1, 1, 5), MakeRect(0, 0, 1, 1, 1, 2), MakeRect(0, 0, 1, 1, 1, 0)}),
        MakeStructure("B", {MakeRect(0, 0, 1, 1, 5), MakeSRef("A", {{0, 0}})}),
    });
    std::vector<LayerKey> const kLayers = HierarchyResolver::ExtractLayers(kLibrary);
    ASSERT_EQ(kLayers.size(), 3U);
    EXPECT_EQ(kLayers[0], (LayerKey {1, 0}));
    EXPECT_EQ(kLayers[1], (LayerKey {1, 2}));
    EXPECT_EQ(kLayers[2], (LayerKey {5, 0}));
}
