/**
 * @file BoundaryFilter.h
 * @brief Keep the cells inside the block and drop the others from the layout
 * @author Keren Zhu
 * @date 01/12/2020
 */

#ifndef CELLLEGAL_BOUNDARY_FILTER_H_
#define CELLLEGAL_BOUNDARY_FILTER_H_

#include "db/Database.h"

PROJECT_NAMESPACE_BEGIN

/// @brief the class of a cell with respect to the block
enum class BoundaryClassType
{
    INSIDE = 0,
    OUTSIDE = 1
};

/// @class CELLLEGAL::BoundaryFilter
/// @brief classify the cells against the block boundary and the placement blockages.
/// A cell partially outside is dropped as a whole, never clipped or pushed in.
class BoundaryFilter
{
    public:
        explicit BoundaryFilter(Database &db) : _db(db) {}
        /// @brief classify a rectangle
        /// @param first: the cell rectangle
        /// @param second: the block boundary
        /// @param third: the placement blockages
        static BoundaryClassType classify(const Box<LocType> &cellBox,
                                          const Box<LocType> &boundary,
                                          const std::vector<Box<LocType>> &blockages);
        /// @brief classify every cell and build the layout of the database with the INSIDE ones
        /// @return the number of cells excluded
        IndexType filter();
    private:
        Database &_db;
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_BOUNDARY_FILTER_H_
