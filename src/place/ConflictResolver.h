/**
 * @file ConflictResolver.h
 * @brief The iterative legalization loop with oscillation detection
 * @author Keren Zhu
 * @date 01/14/2020
 */

#ifndef CELLLEGAL_CONFLICT_RESOLVER_H_
#define CELLLEGAL_CONFLICT_RESOLVER_H_

#include "place/DisplacementPlanner.h"

PROJECT_NAMESPACE_BEGIN

/// @brief The outcome of one run of the legalization loop
struct ResolveResult
{
    LegalizeStatusType status = LegalizeStatusType::CONFIG_ERROR;
    IndexType numPasses = 0; ///< The resolving passes run
    IndexType numMoves = 0; ///< The moves kept, reverts of deadlocked cells excluded
    std::vector<IndexType> deadlockedCells; ///< Reverted to their anchors, ascending
    std::vector<IndexType> unresolvedCells; ///< Still in conflict at the end, deadlocked ones included, ascending
};

/// @class CELLLEGAL::ConflictResolver
/// @brief The legalization loop over the layout of the database.
///
/// Each pass first scans the active cells; if none is in conflict the loop is done.
/// Otherwise it visits the active cells in ascending index, re-detects the conflicts
/// of each one at its turn and applies at most one planned move per cell.
/// A cell moving back to a position kept in its history is deadlocked: it returns
/// to its anchor and never moves again, while still blocking the others.
/// The loop stops at the pass cap, or when a pass changes nothing.
class ConflictResolver
{
    public:
        explicit ConflictResolver(Database &db) : _db(db), _detector(db), _planner(db) {}
        /// @brief legalize the layout, starting from the current locations
        /// @return the outcome. The database holds the final locations
        ResolveResult run();
    private:
        /// @brief anchor the cells and build the index
        void prepare();
        /// @brief the active cells with conflicts
        std::vector<IndexType> scan() const;
        /// @brief one resolving pass
        /// @param the outcome to update
        /// @return whether any cell moved or deadlocked
        bool resolvePass(ResolveResult &result);
        /// @brief revert a cell and freeze it
        void deadlock(IndexType cellIdx);
        /// @brief fill the lists of the result
        void collect(ResolveResult &result) const;
    private:
        Database &_db;
        OverlapDetector _detector;
        DisplacementPlanner _planner;
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_CONFLICT_RESOLVER_H_
