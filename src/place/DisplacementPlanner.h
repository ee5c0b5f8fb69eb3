/**
 * @file DisplacementPlanner.h
 * @brief Choose the single-axis move clearing all the conflicts of a cell
 * @author Keren Zhu
 * @date 01/13/2020
 */

#ifndef CELLLEGAL_DISPLACEMENT_PLANNER_H_
#define CELLLEGAL_DISPLACEMENT_PLANNER_H_

#include <array>
#include "place/OverlapDetector.h"

PROJECT_NAMESPACE_BEGIN

/// @brief The magnitude of an infeasible direction
constexpr LocType DISPLACEMENT_INFEASIBLE = LOC_TYPE_MAX;

/// @brief The result of planning one move
struct DisplacementPlan
{
    /// @brief the magnitudes indexed by Direction2DType. DISPLACEMENT_INFEASIBLE if not possible
    std::array<LocType, 4> magnitudes = {{DISPLACEMENT_INFEASIBLE, DISPLACEMENT_INFEASIBLE,
                                          DISPLACEMENT_INFEASIBLE, DISPLACEMENT_INFEASIBLE}};
    Direction2DType direction = Direction2DType::NONE; ///< The chosen direction
    LocType magnitude = DISPLACEMENT_INFEASIBLE; ///< The magnitude of the chosen direction
    /// @brief whether a direction clears every conflict
    bool feasible() const { return direction != Direction2DType::NONE; }
    LocType magnitudeOf(Direction2DType dir) const { return magnitudes.at(static_cast<IndexType>(dir)); }
};

/// @class CELLLEGAL::DisplacementPlanner
/// @brief For each of LEFT, RIGHT, UP and DOWN, find the smallest shift that clears all
/// the conflicts at once while keeping the cell inside the block. Vertical shifts are
/// rounded up to the grid step. The smallest shift wins, ties by LEFT > RIGHT > UP > DOWN.
class DisplacementPlanner
{
    public:
        explicit DisplacementPlanner(Database &db) : _db(db) {}
        /// @brief plan the move of a cell
        /// @param first: the cell index
        /// @param second: the conflicts of the cell at its current location
        DisplacementPlan plan(IndexType cellIdx, const std::vector<Conflict> &conflicts) const;
        /// @brief move the cell as planned and re-snap it if the move is vertical
        void apply(IndexType cellIdx, const DisplacementPlan &plan);
        /// @brief the location after moving by a magnitude in a direction
        static XY<LocType> shiftedLoc(const XY<LocType> &loc, Direction2DType dir, LocType magnitude);
    private:
        /// @brief the shift for one conflict in every direction
        std::array<LocType, 4> conflictShifts(const Box<LocType> &cellBox, const Conflict &conflict) const;
        /// @brief the rectangle the conflict asks the cell to clear
        Box<LocType> obstacle(const Conflict &conflict) const;
    private:
        Database &_db;
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_DISPLACEMENT_PLANNER_H_
