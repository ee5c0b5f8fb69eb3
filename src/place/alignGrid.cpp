#include "alignGrid.h"
#include <cstdint>
#include <stdexcept>
#include <string>

PROJECT_NAMESPACE_BEGIN

template<typename T>
T floorDif(T n, T stepSize)
{
    throw std::invalid_argument("Unsupport argument types. Need to be integer");
}
/// @brief the distance to the grid line at or below n
template<>
IntType floorDif(IntType n, IntType stepSize)
{
    IntType dif = n % stepSize;
    return dif < 0 ? dif + stepSize : dif;
}

template<typename T>
T ceilDif(T n, T stepSize)
{
    throw std::invalid_argument("Unsupport argument types. Need to be integer");
}
/// @brief the distance to the grid line strictly above n
template<>
IntType ceilDif(IntType n, IntType stepSize)
{
    return stepSize - floorDif(n, stepSize);
}

/// @brief narrow a grid line computed in 64 bits back to LocType
static LocType gridLine(std::int64_t line, const char *caller)
{
    if (line > LOC_TYPE_MAX || line < LOC_TYPE_MIN)
    {
        throw std::overflow_error(std::string(caller) + ": grid line out of the coordinate range");
    }
    return static_cast<LocType>(line);
}

LocType snapToGrid(LocType n, LocType stepSize)
{
    if (stepSize <= 0)
    {
        throw std::invalid_argument("snapToGrid: grid step must be positive");
    }
    LocType dif = floorDif(n, stepSize);
    // Tie goes to the lower grid line
    if (2 * static_cast<std::int64_t>(dif) > stepSize)
    {
        return gridLine(static_cast<std::int64_t>(n) + ceilDif(n, stepSize), "snapToGrid");
    }
    return gridLine(static_cast<std::int64_t>(n) - dif, "snapToGrid");
}

LocType ceilToGrid(LocType n, LocType stepSize)
{
    if (stepSize <= 0)
    {
        throw std::invalid_argument("ceilToGrid: grid step must be positive");
    }
    if (floorDif(n, stepSize) == 0)
    {
        return n;
    }
    return gridLine(static_cast<std::int64_t>(n) + ceilDif(n, stepSize), "ceilToGrid");
}

bool GridAligner::align()
{
    if (!_db.parameters().hasGridStep())
    {
        ERR("GridAligner::%s invalid grid step %d \n", __FUNCTION__, _db.parameters().gridStep());
        return false;
    }
    _stepSize = _db.parameters().gridStep();
    IndexType numSnapped = 0;
    for (IndexType cellIdx = 0; cellIdx < _db.numCells(); ++cellIdx)
    {
        LocType before = _db.cell(cellIdx).yLoc();
        alignCell(cellIdx);
        if (_db.cell(cellIdx).yLoc() != before)
        {
            ++numSnapped;
        }
    }
    INF("GridAligner::%s grid step %d, %u of %u cells snapped \n", __FUNCTION__, _stepSize, numSnapped, _db.numCells());
    return true;
}

void GridAligner::alignCell(IndexType cellIdx)
{
    auto &cell = _db.cell(cellIdx);
    cell.setYLoc(snapToGrid(cell.yLoc(), _stepSize));
}

PROJECT_NAMESPACE_END
