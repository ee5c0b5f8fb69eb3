/**
 * @file test_engine.cpp
 * @brief Tests of the CellLegal engine interface
 * @author Keren Zhu
 * @date 10/19/2019
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "main/CellLegal.h"

using namespace PROJECT_NAMESPACE;

namespace
{
    class CellLegalTest : public ::testing::Test
    {
        protected:
            void SetUp() override
            {
                _legal.logScreenOff();
            }
            void TearDown() override
            {
                _legal.logScreenOn();
            }

            CellLegal _legal;
    };

    /// @brief 30 cells in a 1000 x 2000 block with a notch on the top left and a notch on the top right
    void loadBenchmark(CellLegal &legal)
    {
        struct Rect { LocType xLo, yLo, xHi, yHi; };
        const Rect rects[] = {
            {50, 50, 150, 90},      {140, 60, 260, 120},    {250, 100, 370, 140},   {350, 80, 470, 160},
            {50, 300, 170, 360},    {160, 320, 310, 400},   {280, 280, 430, 360},   {400, 300, 550, 380},
            {90, 500, 210, 580},    {200, 540, 330, 600},   {320, 520, 470, 600},   {50, 700, 170, 760},
            {160, 720, 320, 800},   {300, 750, 460, 820},   {450, 770, 600, 860},   {100, 900, 240, 980},
            {220, 930, 380, 1000},  {350, 920, 500, 1000},  {50, 1100, 180, 1160},  {160, 1120, 300, 1200},
            {280, 1150, 420, 1220}, {400, 1170, 550, 1260}, {100, 1300, 250, 1360}, {220, 1330, 370, 1400},
            {350, 1320, 500, 1400}, {50, 1500, 200, 1580},  {160, 1520, 320, 1600}, {300, 1550, 450, 1620},
            {450, 1570, 600, 1660}, {100, 1700, 250, 1780}
        };
        legal.setBoundaryConstraint(0, 0, 1000, 2000);
        legal.addBlockage(0, 1000, 100, 2000);
        legal.addBlockage(400, 1500, 800, 2000);
        legal.setGridStep(20);
        IndexType num = 0;
        for (const auto &rect : rects)
        {
            ++num;
            legal.addCell("c" + std::to_string(num), rect.xLo, rect.yLo, rect.xHi - rect.xLo, rect.yHi - rect.yLo);
        }
    }
}

TEST_F(CellLegalTest, SolveSingleOverlap)
{
    _legal.setBoundaryConstraint(-100, -100, 100, 100);
    _legal.setGridStep(10);
    IndexType a = _legal.addCell("A", 0, 0, 10, 10);
    IndexType b = _legal.addCell("B", 5, 0, 10, 10);
    ASSERT_TRUE(_legal.solve());
    EXPECT_EQ(_legal.xCellLoc(a), -5);
    EXPECT_EQ(_legal.yCellLoc(a), 0);
    EXPECT_EQ(_legal.xCellLoc(b), 5);
    const auto &rpt = _legal.report();
    EXPECT_TRUE(rpt.isLegal());
    EXPECT_EQ(rpt.maxDisplacement(), 5);
    EXPECT_EQ(rpt.maxDisplacementCellName(), "A");
    EXPECT_EQ(rpt.totalDisplacement(), 5);
    EXPECT_DOUBLE_EQ(rpt.averageDisplacement(), 2.5);
    EXPECT_EQ(_legal.cellIdxName("B"), b);
    EXPECT_EQ(_legal.cellIdxName("nope"), INDEX_TYPE_MAX);
}

TEST_F(CellLegalTest, SnapCountsAsDisplacement)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    IndexType a = _legal.addCell("A", 0, 5, 10, 10);
    IndexType b = _legal.addCell("B", 50, 16, 10, 10);
    ASSERT_TRUE(_legal.solve());
    EXPECT_EQ(_legal.yCellLoc(a), 0);
    EXPECT_EQ(_legal.yCellLoc(b), 20);
    const auto &rpt = _legal.report();
    EXPECT_EQ(rpt.status(), LegalizeStatusType::LEGAL);
    EXPECT_EQ(rpt.numPasses(), 0u);
    EXPECT_EQ(rpt.totalDisplacement(), 9);
    EXPECT_EQ(rpt.maxDisplacement(), 5);
    EXPECT_EQ(rpt.maxDisplacementCell(), a);
}

TEST_F(CellLegalTest, MaxDisplacementTieGoesToLowestIndex)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    _legal.addCell("A", 0, 5, 10, 10);
    _legal.addCell("B", 50, 15, 10, 10);
    ASSERT_TRUE(_legal.solve());
    EXPECT_EQ(_legal.report().maxDisplacement(), 5);
    EXPECT_EQ(_legal.report().maxDisplacementCell(), 0u);
}

TEST_F(CellLegalTest, ExcludedCellsStayOut)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    IndexType in = _legal.addCell("IN", 0, 0, 10, 10);
    IndexType out = _legal.addCell("OUT", 200, 203, 10, 10);
    ASSERT_TRUE(_legal.solve());
    EXPECT_FALSE(_legal.isCellExcluded(in));
    EXPECT_TRUE(_legal.isCellExcluded(out));
    // Snapped, never moved
    EXPECT_EQ(_legal.xCellLoc(out), 200);
    EXPECT_EQ(_legal.yCellLoc(out), 200);
    const auto &rpt = _legal.report();
    EXPECT_EQ(rpt.excludedCells(), (std::vector<IndexType>{out}));
    ASSERT_EQ(rpt.numMovements(), 1u);
    EXPECT_EQ(rpt.movement(0).cellIdx, in);
}

TEST_F(CellLegalTest, PartialLegalization)
{
    _legal.setBoundaryConstraint(0, 0, 25, 10);
    _legal.setGridStep(10);
    _legal.addCell("A", 0, 0, 10, 10);
    _legal.addCell("B", 5, 0, 10, 10);
    _legal.addCell("C", 10, 0, 10, 10);
    ASSERT_TRUE(_legal.solve());
    EXPECT_EQ(_legal.report().status(), LegalizeStatusType::DEADLOCKED_CELLS);
    EXPECT_TRUE(_legal.isCellDeadlocked(0));
    EXPECT_TRUE(_legal.isCellDeadlocked(1));
    EXPECT_FALSE(_legal.isCellDeadlocked(2));
    EXPECT_EQ(_legal.xCellLoc(2), 15);
}

TEST_F(CellLegalTest, SolveAgainStartsFromInput)
{
    _legal.setBoundaryConstraint(-100, -100, 100, 100);
    _legal.setGridStep(10);
    _legal.addCell("A", 0, 0, 10, 10);
    _legal.addCell("B", 5, 0, 10, 10);
    ASSERT_TRUE(_legal.solve());
    ASSERT_TRUE(_legal.solve());
    EXPECT_EQ(_legal.xCellLoc(0), -5);
    EXPECT_EQ(_legal.xCellLoc(1), 5);
    EXPECT_EQ(_legal.report().numPasses(), 1u);
    EXPECT_EQ(_legal.report().totalDisplacement(), 5);
}

TEST_F(CellLegalTest, RejectMissingBoundary)
{
    _legal.setGridStep(10);
    _legal.addCell("A", 0, 0, 10, 10);
    EXPECT_FALSE(_legal.solve());
    EXPECT_EQ(_legal.report().status(), LegalizeStatusType::CONFIG_ERROR);
    EXPECT_EQ(_legal.xCellLoc(0), 0);
}

TEST_F(CellLegalTest, RejectMalformedBoundary)
{
    _legal.setBoundaryConstraint(100, 0, 0, 100);
    _legal.setGridStep(10);
    EXPECT_FALSE(_legal.solve());
}

TEST_F(CellLegalTest, RejectNonPositiveGridStep)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.addCell("A", 0, 3, 10, 10);
    _legal.setGridStep(0);
    EXPECT_FALSE(_legal.solve());
    EXPECT_EQ(_legal.yCellLoc(0), 3);
    _legal.setGridStep(-10);
    EXPECT_FALSE(_legal.solve());
}

TEST_F(CellLegalTest, RejectBadLoopSettings)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    _legal.setMaxIterations(0);
    EXPECT_FALSE(_legal.solve());
    _legal.setMaxIterations(10);
    _legal.setHistoryDepth(LEGALIZE_MIN_HISTORY_DEPTH - 1);
    EXPECT_FALSE(_legal.solve());
    _legal.setHistoryDepth(LEGALIZE_MAX_HISTORY_DEPTH + 1);
    EXPECT_FALSE(_legal.solve());
    _legal.setHistoryDepth(LEGALIZE_MAX_HISTORY_DEPTH);
    EXPECT_TRUE(_legal.solve());
}

TEST_F(CellLegalTest, RejectBadCells)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    _legal.addCell("A", 0, 0, 0, 10);
    EXPECT_FALSE(_legal.solve());
    _legal.setCellShape(0, 0, 0, 10, 10);
    EXPECT_TRUE(_legal.solve());
    _legal.addCell("A", 50, 50, 10, 10);
    EXPECT_FALSE(_legal.solve());
}

TEST_F(CellLegalTest, RejectMalformedBlockage)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    _legal.addBlockage(50, 50, 40, 60);
    EXPECT_FALSE(_legal.solve());
}

TEST_F(CellLegalTest, RejectCellsOutOfCoordinateRange)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    IndexType idx = _legal.addCell("A", 0, LOC_TYPE_MAX - 3, 1, 1);
    EXPECT_FALSE(_legal.solve());
    EXPECT_EQ(_legal.report().status(), LegalizeStatusType::CONFIG_ERROR);
    EXPECT_EQ(_legal.yCellLoc(idx), LOC_TYPE_MAX - 3);
    _legal.setCellShape(idx, LEGALIZE_MAX_COORDINATE - 5, 0, 10, 10);
    EXPECT_FALSE(_legal.solve());
    _legal.setCellShape(idx, -LEGALIZE_MAX_COORDINATE - 1, 0, 10, 10);
    EXPECT_FALSE(_legal.solve());
    _legal.setCellShape(idx, 200, 200, 10, 10);
    ASSERT_TRUE(_legal.solve());
    EXPECT_TRUE(_legal.isCellExcluded(idx));
}

TEST_F(CellLegalTest, RejectParametersOutOfCoordinateRange)
{
    _legal.setBoundaryConstraint(0, 0, LEGALIZE_MAX_COORDINATE + 1, 100);
    _legal.setGridStep(10);
    EXPECT_FALSE(_legal.solve());
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(LEGALIZE_MAX_COORDINATE + 1);
    EXPECT_FALSE(_legal.solve());
    _legal.setGridStep(10);
    EXPECT_TRUE(_legal.solve());
    _legal.addBlockage(-LEGALIZE_MAX_COORDINATE - 1, 0, 10, 10);
    EXPECT_FALSE(_legal.solve());
}

TEST_F(CellLegalTest, SolveAtTheCoordinateLimit)
{
    const LocType lim = LEGALIZE_MAX_COORDINATE;
    _legal.setBoundaryConstraint(-lim, -lim, lim, lim);
    _legal.setGridStep(16);
    IndexType a = _legal.addCell("A", lim - 16, lim - 16, 16, 16);
    IndexType b = _legal.addCell("B", lim - 24, lim - 16, 16, 16);
    ASSERT_TRUE(_legal.solve());
    EXPECT_TRUE(_legal.report().isLegal());
    // East and north leave the block, south is shorter than west
    EXPECT_EQ(_legal.xCellLoc(a), lim - 16);
    EXPECT_EQ(_legal.yCellLoc(a), lim - 32);
    EXPECT_EQ(_legal.xCellLoc(b), lim - 24);
    EXPECT_EQ(_legal.yCellLoc(b), lim - 16);
}

TEST_F(CellLegalTest, EmptyDesign)
{
    _legal.setBoundaryConstraint(0, 0, 100, 100);
    _legal.setGridStep(10);
    ASSERT_TRUE(_legal.solve());
    EXPECT_TRUE(_legal.report().isLegal());
    EXPECT_EQ(_legal.report().numMovements(), 0u);
    EXPECT_EQ(_legal.report().maxDisplacementCell(), INDEX_TYPE_MAX);
}

TEST_F(CellLegalTest, BenchmarkFiltersNotchedCells)
{
    loadBenchmark(_legal);
    ASSERT_TRUE(_legal.solve());
    std::vector<IndexType> excluded = {
        _legal.cellIdxName("c19"), _legal.cellIdxName("c26"),
        _legal.cellIdxName("c28"), _legal.cellIdxName("c29")
    };
    EXPECT_EQ(_legal.report().excludedCells(), excluded);
    EXPECT_EQ(_legal.report().numMovements(), 26u);
}

TEST_F(CellLegalTest, BenchmarkInvariants)
{
    loadBenchmark(_legal);
    ASSERT_TRUE(_legal.solve());
    const auto &db = _legal.db();
    const auto &rpt = _legal.report();
    EXPECT_NE(rpt.status(), LegalizeStatusType::CONFIG_ERROR);
    const auto &unresolved = rpt.unresolvedCells();
    auto isUnresolved = [&](IndexType idx)
    {
        return std::find(unresolved.begin(), unresolved.end(), idx) != unresolved.end();
    };
    for (IndexType cellIdx : db.layoutCells())
    {
        const auto box = db.cell(cellIdx).cellBBox();
        EXPECT_EQ(box.yLo() % 20, 0) << db.cell(cellIdx).name();
        EXPECT_TRUE(db.boundary().contain(box)) << db.cell(cellIdx).name();
        if (isUnresolved(cellIdx))
        {
            continue;
        }
        for (IndexType other : db.layoutCells())
        {
            if (other != cellIdx)
            {
                EXPECT_FALSE(box.overlap(db.cell(other).cellBBox()))
                    << db.cell(cellIdx).name() << " " << db.cell(other).name();
            }
        }
        for (const auto &blockage : db.vBlockageArray())
        {
            EXPECT_FALSE(box.overlap(blockage)) << db.cell(cellIdx).name();
        }
    }
    for (IndexType cellIdx : rpt.deadlockedCells())
    {
        EXPECT_EQ(db.cell(cellIdx).loc(), db.cell(cellIdx).anchorLoc());
    }
}

TEST_F(CellLegalTest, BenchmarkIsDeterministic)
{
    loadBenchmark(_legal);
    ASSERT_TRUE(_legal.solve());
    std::vector<XY<LocType>> first;
    for (IndexType cellIdx = 0; cellIdx < _legal.numCells(); ++cellIdx)
    {
        first.emplace_back(_legal.xCellLoc(cellIdx), _legal.yCellLoc(cellIdx));
    }
    auto firstStatus = _legal.report().status();
    auto firstTotal = _legal.report().totalDisplacement();

    CellLegal other;
    loadBenchmark(other);
    ASSERT_TRUE(other.solve());
    for (IndexType cellIdx = 0; cellIdx < other.numCells(); ++cellIdx)
    {
        EXPECT_EQ(other.xCellLoc(cellIdx), first.at(cellIdx).x());
        EXPECT_EQ(other.yCellLoc(cellIdx), first.at(cellIdx).y());
    }
    EXPECT_EQ(other.report().status(), firstStatus);
    EXPECT_EQ(other.report().totalDisplacement(), firstTotal);
}
