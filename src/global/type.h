/**
 * @file type.h
 * @brief Define some the types being used globally
 * @author Keren Zhu
 * @date 09/30/2019
 */

#ifndef CELLLEGAL_TYPE_H_
#define CELLLEGAL_TYPE_H_

#include <cstdint>
#include <string>
#include <sstream>
#include "namespace.h"

PROJECT_NAMESPACE_BEGIN
// Built-in type aliases
using IndexType  = std::uint32_t;
using IntType    = std::int32_t;
using RealType   = double;
using LocType    = std::int32_t; // Location/design unit
// Built-in type constants
constexpr IndexType INDEX_TYPE_MAX  = UINT32_MAX;
constexpr LocType LOC_TYPE_MAX      = INT32_MAX;
constexpr LocType LOC_TYPE_MIN      = INT32_MIN;


// Enums

/// @brief The direction of a single-axis move. The order of the enumerators is the tie-break priority
enum class Direction2DType
{
    WEST = 0,
    EAST = 1,
    NORTH = 2,
    SOUTH  = 3,
    NONE = 4
};

/// @brief The legalization status of a cell
enum class CellStatusType
{
    ACTIVE = 0,
    DEADLOCKED = 1
};

/// @brief What a cell is in conflict with
enum class ConflictKindType
{
    CELL = 0,
    BLOCKAGE = 1,
    BOUNDARY = 2
};

/// @brief How the legalization loop terminated
enum class LegalizeStatusType
{
    LEGAL = 0, ///< No conflict left and no cell deadlocked
    DEADLOCKED_CELLS = 1, ///< No active cell in conflict, but some cells were reverted
    ITERATION_LIMIT = 2, ///< The pass cap was reached with conflicts left
    /// A pass made no progress, conflicts left. Stands in for ITERATION_LIMIT: a pass without a move
    /// leaves the layout unchanged, so running on to the cap would end in the same layout
    STALLED = 3,
    CONFIG_ERROR = 4 ///< Never started
};

inline std::string direction2Str(Direction2DType dir)
{
    switch (dir)
    {
        case Direction2DType::WEST: return "LEFT";
        case Direction2DType::EAST: return "RIGHT";
        case Direction2DType::NORTH: return "UP";
        case Direction2DType::SOUTH: return "DOWN";
        default: return "NONE";
    }
}

inline std::string legalizeStatus2Str(LegalizeStatusType status)
{
    switch (status)
    {
        case LegalizeStatusType::LEGAL: return "LEGAL";
        case LegalizeStatusType::DEADLOCKED_CELLS: return "DEADLOCKED_CELLS";
        case LegalizeStatusType::ITERATION_LIMIT: return "ITERATION_LIMIT";
        case LegalizeStatusType::STALLED: return "STALLED";
        default: return "CONFIG_ERROR";
    }
}

PROJECT_NAMESPACE_END

#endif // CELLLEGAL_TYPE_H_
