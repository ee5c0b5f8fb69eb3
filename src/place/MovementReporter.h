/**
 * @file MovementReporter.h
 * @brief Summarize how far the cells moved
 * @author Keren Zhu
 * @date 01/15/2020
 */

#ifndef CELLLEGAL_MOVEMENT_REPORTER_H_
#define CELLLEGAL_MOVEMENT_REPORTER_H_

#include "place/ConflictResolver.h"

PROJECT_NAMESPACE_BEGIN

/// @brief the movement of one cell
struct CellMovement
{
    IndexType cellIdx = INDEX_TYPE_MAX;
    std::string name;
    XY<LocType> from; ///< The input location
    XY<LocType> to; ///< The final location
    LocType displacement = 0; ///< Manhattan distance
    bool deadlocked = false;
};

/// @class CELLLEGAL::MovementReport
/// @brief the read-only summary of a legalization, for the reporting and plotting tools
class MovementReport
{
    friend class MovementReporter;
    public:
        explicit MovementReport() = default;
        /// @brief the movements of the layout cells, ascending in cell index
        const std::vector<CellMovement> &movements() const { return _movements; }
        IndexType numMovements() const { return _movements.size(); }
        const CellMovement &movement(IndexType idx) const { return AT(_movements, idx); }
        /// @brief the largest displacement
        LocType maxDisplacement() const { return _maxDisplacement; }
        /// @brief the cell with the largest displacement. INDEX_TYPE_MAX if the layout is empty
        IndexType maxDisplacementCell() const { return _maxDisplacementCell; }
        /// @brief the name of the cell with the largest displacement. Empty if the layout is empty
        const std::string &maxDisplacementCellName() const { return _maxDisplacementCellName; }
        LocType totalDisplacement() const { return _totalDisplacement; }
        RealType averageDisplacement() const { return _averageDisplacement; }
        LegalizeStatusType status() const { return _status; }
        /// @brief whether there is nothing left to report as an anomaly
        bool isLegal() const { return _status == LegalizeStatusType::LEGAL; }
        IndexType numPasses() const { return _numPasses; }
        IndexType numMoves() const { return _numMoves; }
        const std::vector<IndexType> &deadlockedCells() const { return _deadlockedCells; }
        const std::vector<IndexType> &unresolvedCells() const { return _unresolvedCells; }
        /// @brief the cells dropped by the boundary filter
        const std::vector<IndexType> &excludedCells() const { return _excludedCells; }
    private:
        std::vector<CellMovement> _movements;
        LocType _maxDisplacement = 0;
        IndexType _maxDisplacementCell = INDEX_TYPE_MAX;
        std::string _maxDisplacementCellName;
        LocType _totalDisplacement = 0;
        RealType _averageDisplacement = 0.0;
        LegalizeStatusType _status = LegalizeStatusType::CONFIG_ERROR;
        IndexType _numPasses = 0;
        IndexType _numMoves = 0;
        std::vector<IndexType> _deadlockedCells;
        std::vector<IndexType> _unresolvedCells;
        std::vector<IndexType> _excludedCells;
};

/// @class CELLLEGAL::MovementReporter
/// @brief build the MovementReport from the final layout
class MovementReporter
{
    public:
        explicit MovementReporter(const Database &db) : _db(db) {}
        /// @brief summarize the layout
        /// @param the outcome of the legalization loop
        MovementReport report(const ResolveResult &result) const;
    private:
        const Database &_db;
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_MOVEMENT_REPORTER_H_
