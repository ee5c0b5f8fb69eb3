#include "MovementReporter.h"

PROJECT_NAMESPACE_BEGIN

MovementReport MovementReporter::report(const ResolveResult &result) const
{
    MovementReport rpt;
    for (IndexType cellIdx : _db.layoutCells())
    {
        const auto &cell = _db.cell(cellIdx);
        CellMovement movement;
        movement.cellIdx = cellIdx;
        movement.name = cell.name();
        movement.from = cell.inputLoc();
        movement.to = cell.loc();
        movement.displacement = cell.displacement();
        movement.deadlocked = cell.isDeadlocked();
        rpt._totalDisplacement += movement.displacement;
        // The lowest index wins a tie
        if (rpt._maxDisplacementCell == INDEX_TYPE_MAX || movement.displacement > rpt._maxDisplacement)
        {
            rpt._maxDisplacement = movement.displacement;
            rpt._maxDisplacementCell = cellIdx;
            rpt._maxDisplacementCellName = cell.name();
        }
        rpt._movements.emplace_back(movement);
    }
    if (!rpt._movements.empty())
    {
        rpt._averageDisplacement = static_cast<RealType>(rpt._totalDisplacement) / rpt._movements.size();
    }
    rpt._status = result.status;
    rpt._numPasses = result.numPasses;
    rpt._numMoves = result.numMoves;
    rpt._deadlockedCells = result.deadlockedCells;
    rpt._unresolvedCells = result.unresolvedCells;
    rpt._excludedCells = _db.excludedCells();
    return rpt;
}

PROJECT_NAMESPACE_END
