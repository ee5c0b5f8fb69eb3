/**
 * @file test_geometry.cpp
 * @brief Unit tests of the geometry helpers, the grid snapping and the boundary classification
 * @author Keren Zhu
 * @date 10/19/2019
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "db/Cell.h"
#include "place/alignGrid.h"
#include "place/BoundaryFilter.h"
#include "place/OverlapDetector.h"

using namespace PROJECT_NAMESPACE;

TEST(BoxTest, OverlapNeedsPositiveArea)
{
    Box<LocType> a(0, 0, 10, 10);
    EXPECT_TRUE(a.overlap(Box<LocType>(5, 0, 15, 10)));
    EXPECT_FALSE(a.overlap(Box<LocType>(10, 0, 20, 10)));
    EXPECT_FALSE(a.overlap(Box<LocType>(0, 10, 10, 20)));
    EXPECT_FALSE(a.overlap(Box<LocType>(10, 10, 20, 20)));
    EXPECT_TRUE(a.overlap(a));
}

TEST(BoxTest, IntersectionAndContain)
{
    Box<LocType> a(0, 0, 10, 10);
    EXPECT_EQ(a.intersection(Box<LocType>(5, 2, 15, 20)), Box<LocType>(5, 2, 10, 10));
    Box<LocType> boundary(0, 0, 100, 100);
    EXPECT_TRUE(boundary.contain(a));
    EXPECT_TRUE(boundary.contain(Box<LocType>(90, 90, 100, 100)));
    EXPECT_FALSE(boundary.contain(Box<LocType>(95, 0, 105, 10)));
    EXPECT_FALSE(boundary.contain(Box<LocType>(-1, 0, 9, 10)));
}

TEST(BoxTest, ManhattanDistance)
{
    EXPECT_EQ(manhattanDistance(XY<LocType>(0, 0), XY<LocType>(-5, 0)), 5);
    EXPECT_EQ(manhattanDistance(XY<LocType>(3, -4), XY<LocType>(-3, 4)), 14);
    EXPECT_EQ(manhattanDistance(XY<LocType>(7, 7), XY<LocType>(7, 7)), 0);
}

TEST(PositionHistoryTest, SeedIsRemembered)
{
    PositionHistory history;
    history.reset(4, XY<LocType>(5, 0));
    EXPECT_EQ(history.size(), 1u);
    EXPECT_EQ(history.depth(), 4u);
    EXPECT_TRUE(history.contains(XY<LocType>(5, 0)));
    EXPECT_FALSE(history.contains(XY<LocType>(0, 5)));
}

TEST(PositionHistoryTest, OldestIsOverwrittenWhenFull)
{
    PositionHistory history;
    history.reset(2, XY<LocType>(0, 0));
    history.push(XY<LocType>(10, 0));
    EXPECT_EQ(history.size(), 2u);
    EXPECT_TRUE(history.contains(XY<LocType>(0, 0)));
    history.push(XY<LocType>(20, 0));
    EXPECT_EQ(history.size(), 2u);
    EXPECT_FALSE(history.contains(XY<LocType>(0, 0)));
    EXPECT_TRUE(history.contains(XY<LocType>(10, 0)));
    EXPECT_TRUE(history.contains(XY<LocType>(20, 0)));
}

TEST(PositionHistoryTest, ResetForgetsEverything)
{
    PositionHistory history;
    history.reset(3, XY<LocType>(0, 0));
    history.push(XY<LocType>(10, 0));
    history.reset(3, XY<LocType>(0, 20));
    EXPECT_EQ(history.size(), 1u);
    EXPECT_FALSE(history.contains(XY<LocType>(10, 0)));
    EXPECT_TRUE(history.contains(XY<LocType>(0, 20)));
}

TEST(CellTest, DeadlockRevertsToAnchor)
{
    Cell cell;
    cell.setShape(0, 3, 10, 10);
    cell.setYLoc(0);
    cell.anchor(4);
    EXPECT_EQ(cell.anchorLoc(), XY<LocType>(0, 0));
    cell.setXLoc(15);
    EXPECT_EQ(cell.displacement(), 18);
    cell.markDeadlocked();
    EXPECT_TRUE(cell.isDeadlocked());
    EXPECT_EQ(cell.loc(), XY<LocType>(0, 0));
    EXPECT_EQ(cell.displacement(), 3);
    cell.resetToInput();
    EXPECT_FALSE(cell.isDeadlocked());
    EXPECT_EQ(cell.loc(), XY<LocType>(0, 3));
}

TEST(AlignGridTest, SnapToNearestLine)
{
    EXPECT_EQ(snapToGrid(0, 10), 0);
    EXPECT_EQ(snapToGrid(4, 10), 0);
    EXPECT_EQ(snapToGrid(6, 10), 10);
    EXPECT_EQ(snapToGrid(16, 10), 20);
    EXPECT_EQ(snapToGrid(1330, 20), 1320);
    EXPECT_EQ(snapToGrid(1335, 20), 1340);
}

TEST(AlignGridTest, SnapTieGoesLower)
{
    EXPECT_EQ(snapToGrid(5, 10), 0);
    EXPECT_EQ(snapToGrid(15, 10), 10);
    EXPECT_EQ(snapToGrid(50, 20), 40);
    EXPECT_EQ(snapToGrid(-5, 10), -10);
}

TEST(AlignGridTest, SnapNegative)
{
    EXPECT_EQ(snapToGrid(-4, 10), 0);
    EXPECT_EQ(snapToGrid(-6, 10), -10);
    EXPECT_EQ(snapToGrid(-20, 10), -20);
}

TEST(AlignGridTest, CeilToGrid)
{
    EXPECT_EQ(ceilToGrid(0, 10), 0);
    EXPECT_EQ(ceilToGrid(5, 10), 10);
    EXPECT_EQ(ceilToGrid(10, 10), 10);
    EXPECT_EQ(ceilToGrid(11, 10), 20);
    EXPECT_EQ(ceilToGrid(4, 10), 10);
}

TEST(AlignGridTest, NonPositiveStepThrows)
{
    EXPECT_THROW(snapToGrid(5, 0), std::invalid_argument);
    EXPECT_THROW(snapToGrid(5, -10), std::invalid_argument);
    EXPECT_THROW(ceilToGrid(5, 0), std::invalid_argument);
}

TEST(AlignGridTest, GridLineOutOfRangeThrows)
{
    EXPECT_EQ(snapToGrid(LOC_TYPE_MAX - 3, 10), 2147483640);
    EXPECT_THROW(snapToGrid(LOC_TYPE_MAX - 1, 10), std::overflow_error);
    EXPECT_THROW(snapToGrid(LOC_TYPE_MIN, 10), std::overflow_error);
    EXPECT_THROW(ceilToGrid(LOC_TYPE_MAX - 1, 10), std::overflow_error);
}

TEST(AlignGridTest, AlignerSnapsYOnly)
{
    Database db;
    db.parameters().setBoundaryConstraint(0, 0, 100, 100);
    db.parameters().setGridStep(10);
    IndexType idx = db.allocateCell();
    db.cell(idx).setShape(13, 27, 10, 10);
    GridAligner aligner(db);
    EXPECT_TRUE(aligner.align());
    EXPECT_EQ(db.cell(idx).xLoc(), 13);
    EXPECT_EQ(db.cell(idx).yLoc(), 30);
    EXPECT_EQ(db.cell(idx).inputLoc(), XY<LocType>(13, 27));
}

TEST(AlignGridTest, AlignerRejectsMissingStep)
{
    Database db;
    db.allocateCell();
    GridAligner aligner(db);
    EXPECT_FALSE(aligner.align());
}

TEST(BoundaryFilterTest, Classify)
{
    Box<LocType> boundary(0, 0, 100, 100);
    std::vector<Box<LocType>> blockages = { Box<LocType>(0, 50, 20, 100) };
    EXPECT_EQ(BoundaryFilter::classify(Box<LocType>(10, 10, 20, 20), boundary, blockages), BoundaryClassType::INSIDE);
    // Touching the boundary or a blockage is inside
    EXPECT_EQ(BoundaryFilter::classify(Box<LocType>(90, 90, 100, 100), boundary, blockages), BoundaryClassType::INSIDE);
    EXPECT_EQ(BoundaryFilter::classify(Box<LocType>(20, 60, 30, 70), boundary, blockages), BoundaryClassType::INSIDE);
    EXPECT_EQ(BoundaryFilter::classify(Box<LocType>(95, 0, 105, 10), boundary, blockages), BoundaryClassType::OUTSIDE);
    EXPECT_EQ(BoundaryFilter::classify(Box<LocType>(200, 200, 210, 210), boundary, blockages), BoundaryClassType::OUTSIDE);
    EXPECT_EQ(BoundaryFilter::classify(Box<LocType>(15, 60, 25, 70), boundary, blockages), BoundaryClassType::OUTSIDE);
}

TEST(BoundaryFilterTest, FilterBuildsLayout)
{
    Database db;
    db.parameters().setBoundaryConstraint(0, 0, 100, 100);
    db.parameters().setGridStep(10);
    db.cell(db.allocateCell()).setShape(0, 0, 10, 10);
    db.cell(db.allocateCell()).setShape(95, 0, 10, 10);
    db.cell(db.allocateCell()).setShape(50, 50, 10, 10);
    BoundaryFilter filter(db);
    EXPECT_EQ(filter.filter(), 1u);
    EXPECT_EQ(db.layoutCells(), (std::vector<IndexType>{0, 2}));
    EXPECT_EQ(db.excludedCells(), (std::vector<IndexType>{1}));
    EXPECT_TRUE(db.cell(1).isExcluded());
    EXPECT_FALSE(db.cell(0).isExcluded());
}

TEST(OverlapDetectorTest, OutsidePart)
{
    Box<LocType> boundary(0, 0, 100, 100);
    Box<LocType> outside;
    EXPECT_FALSE(OverlapDetector::outsidePart(Box<LocType>(0, 0, 100, 100), boundary, outside));
    EXPECT_TRUE(OverlapDetector::outsidePart(Box<LocType>(95, 0, 105, 10), boundary, outside));
    EXPECT_EQ(outside, Box<LocType>(100, 0, 105, 10));
    EXPECT_TRUE(OverlapDetector::outsidePart(Box<LocType>(-5, -5, 5, 5), boundary, outside));
    EXPECT_EQ(outside, Box<LocType>(-5, -5, 5, 5));
}
