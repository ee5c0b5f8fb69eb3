/**
 * @file parameter.h
 * @brief Define some hyperparameters
 * @author Keren Zhu
 * @date 09/30/2019
 */

#ifndef CELLLEGAL_PARAMETER_H_
#define CELLLEGAL_PARAMETER_H_

#include "type.h"

PROJECT_NAMESPACE_BEGIN

/* Legalization loop */
constexpr IndexType LEGALIZE_DEFAULT_MAX_ITERATIONS = 1000; ///< The default cap on the number of resolving passes
constexpr IndexType LEGALIZE_DEFAULT_HISTORY_DEPTH = 4; ///< The default number of positions remembered per cell for oscillation detection
constexpr IndexType LEGALIZE_MIN_HISTORY_DEPTH = 2; ///< Oscillation between two positions needs at least two entries
constexpr IndexType LEGALIZE_MAX_HISTORY_DEPTH = 16; ///< The capacity of the per-cell position ring buffer

/* Coordinates */
constexpr LocType LEGALIZE_MAX_COORDINATE = 1 << 28; ///< Input coordinates and the grid step lie in [-LEGALIZE_MAX_COORDINATE, LEGALIZE_MAX_COORDINATE], which keeps every shifted cell corner inside LocType

PROJECT_NAMESPACE_END

#endif ///CELLLEGAL_PARAMETER_H_
