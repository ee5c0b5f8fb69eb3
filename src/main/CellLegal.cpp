#include "CellLegal.h"
#include "place/alignGrid.h"
#include "place/BoundaryFilter.h"

PROJECT_NAMESPACE_BEGIN

bool CellLegal::solve()
{
    _report = MovementReport();
    _db.resetPlacement();
    if (!_db.checkInput())
    {
        ERR("CellLegal::%s invalid input, legalization is not started \n", __FUNCTION__);
        return false;
    }
    auto stopWatch = WATCH_CREATE_NEW("legalization");
    stopWatch->start();
    INF("CellLegal::%s legalize %u cells, block %s, grid step %d \n", __FUNCTION__,
        _db.numCells(), _db.boundary().toStr().c_str(), _db.parameters().gridStep());

    GridAligner aligner(_db);
    if (!aligner.align())
    {
        return false;
    }
    BoundaryFilter(_db).filter();

    ConflictResolver resolver(_db);
    auto result = resolver.run();
    _report = MovementReporter(_db).report(result);
    stopWatch->stop();

    if (!_report.isLegal())
    {
        WRN("CellLegal::%s partial legalization: %s, %u deadlocked, %u unresolved \n", __FUNCTION__,
            legalizeStatus2Str(_report.status()).c_str(),
            static_cast<IndexType>(_report.deadlockedCells().size()),
            static_cast<IndexType>(_report.unresolvedCells().size()));
    }
    INF("CellLegal::%s total displacement %d, max displacement %d by %s, %lu us \n", __FUNCTION__,
        _report.totalDisplacement(), _report.maxDisplacement(),
        _report.maxDisplacementCellName().c_str(),
        static_cast<unsigned long>(runtimeLegalization()));
    return true;
}

PROJECT_NAMESPACE_END
