/**
 * @file alignGrid.h
 * @brief Align the cells to the rows of the grid
 * @author Keren Zhu
 * @date 01/10/2020
 */

#ifndef CELLLEGAL_ALIGN_GRID_H_
#define CELLLEGAL_ALIGN_GRID_H_

#include "db/Database.h"

PROJECT_NAMESPACE_BEGIN

/// @brief snap a coordinate to the nearest multiple of the step size.
/// A coordinate exactly half way between two grid lines goes to the lower one.
/// @throw std::invalid_argument if stepSize <= 0
/// @throw std::overflow_error if the grid line is not representable in LocType
LocType snapToGrid(LocType n, LocType stepSize);

/// @brief round a non-negative distance up to a multiple of the step size
/// @throw std::invalid_argument if stepSize <= 0
/// @throw std::overflow_error if the result is not representable in LocType
LocType ceilToGrid(LocType n, LocType stepSize);

/// @class CELLLEGAL::GridAligner
/// @brief snap the y coordinates of the cells to the grid lines
class GridAligner
{
    public:
        explicit GridAligner(Database &db) : _db(db) {}
        /// @brief snap every cell to the grid of the parameters
        /// @return false if there is no valid grid step
        bool align();
        /// @brief snap one cell
        void alignCell(IndexType cellIdx);
    private:
        Database &_db;
        LocType _stepSize = -1;
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_ALIGN_GRID_H_
