/**
 * @file OverlapDetector.h
 * @brief Find what a cell overlaps: other cells, placement blockages and the block boundary
 * @author Keren Zhu
 * @date 01/12/2020
 */

#ifndef CELLLEGAL_OVERLAP_DETECTOR_H_
#define CELLLEGAL_OVERLAP_DETECTOR_H_

#include <boost/geometry/index/rtree.hpp>
#include "db/Database.h"

PROJECT_NAMESPACE_BEGIN

/// @brief one conflict of a cell
struct Conflict
{
    ConflictKindType kind = ConflictKindType::CELL;
    IndexType idx = INDEX_TYPE_MAX; ///< The other cell or the blockage. INDEX_TYPE_MAX for the boundary
    Box<LocType> rect; ///< The overlapping part. For the boundary, the bounding box of the part outside
};

/// @class CELLLEGAL::OverlapDetector
/// @brief Overlap queries over the layout.
/// Two rectangles overlap only if the overlap has positive width and height.
/// The rtree mirrors the cell locations and needs update() after each move.
class OverlapDetector
{
    public:
        using ValueType = std::pair<Box<LocType>, IndexType>;
        using RtreeType = boost::geometry::index::rtree<ValueType, boost::geometry::index::rstar<16>>;

        explicit OverlapDetector(const Database &db) : _db(db) {}
        /// @brief index the layout cells and the blockages at their current locations
        void build();
        /// @brief re-index a cell after it moved
        void update(IndexType cellIdx);
        /// @brief all conflicts of a cell at its current location.
        /// Cells by ascending index first, then blockages, then the boundary
        std::vector<Conflict> conflicts(IndexType cellIdx) const;
        /// @brief whether a cell has any conflict
        bool hasConflict(IndexType cellIdx) const { return !conflicts(cellIdx).empty(); }
        /// @brief the bounding box of the part of a rectangle outside the boundary
        /// @return false if the rectangle is inside the boundary
        static bool outsidePart(const Box<LocType> &box, const Box<LocType> &boundary, Box<LocType> &outside);
    private:
        const Database &_db;
        RtreeType _cellRtree; ///< The layout cells
        RtreeType _blockageRtree; ///< The placement blockages
        std::vector<Box<LocType>> _indexedBoxes; ///< The box of each cell currently in _cellRtree
        std::vector<char> _isIndexed;
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_OVERLAP_DETECTOR_H_
