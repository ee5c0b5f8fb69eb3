/**
 * @file Parameters.h
 * @brief The legalization parameters
 * @author Keren Zhu
 * @date 10/16/2019
 */

#ifndef CELLLEGAL_PARAMETERS_H_
#define CELLLEGAL_PARAMETERS_H_

#include "global/global.h"

PROJECT_NAMESPACE_BEGIN

/// @class CELLLEGAL::Parameters
/// @brief The legalization engine parameters
class Parameters {
public:
  /// @brief default constrcutor
  explicit Parameters();
  /*------------------------------*/
  /* Set the parameters           */
  /*------------------------------*/
  /// @brief set the boundry constraints
  /// @param the placement boundry
  void setBoundaryConstraint(const Box<LocType> &boundaryConstraint) {
    _boundaryConstraint = boundaryConstraint;
    _boundarySet = true;
  }
  /// @brief set the boundary constraint
  void setBoundaryConstraint(LocType xLo, LocType yLo, LocType xHi,
                             LocType yHi) {
    _boundaryConstraint.setBounds(xLo, yLo, xHi, yHi);
    _boundarySet = true;
  }
  /// @brief set the grid step constraint, i.e. the row height
  void setGridStep(LocType gridStep) { _gridStep = gridStep; }
  /// @brief set the cap on the number of resolving passes
  void setMaxIterations(IndexType maxIterations) {
    _maxIterations = maxIterations;
  }
  /// @brief set the number of past positions kept per cell for oscillation
  /// detection
  void setHistoryDepth(IndexType historyDepth) { _historyDepth = historyDepth; }
  /*------------------------------*/
  /* Query the parameters         */
  /*------------------------------*/
  /// @brief whether the boundry constraint is set
  bool isBoundaryConstraintSet() const { return _boundarySet; }
  /// @brief get the boundry constraint
  /// @return the boundry constraint
  const Box<LocType> &boundaryConstraint() const { return _boundaryConstraint; }
  /// @brief get the grid step
  LocType gridStep() const { return _gridStep; }
  /// @brief get wether there is grid step constraint
  bool hasGridStep() const { return _gridStep > 0; }
  IndexType maxIterations() const { return _maxIterations; }
  IndexType historyDepth() const { return _historyDepth; }
  /// @brief check the parameters before legalization. Print the problems
  /// @return true if the legalization can start
  bool check() const;
  /// @brief whether a box lies in [-LEGALIZE_MAX_COORDINATE, LEGALIZE_MAX_COORDINATE] on both axes
  static bool inCoordinateRange(const Box<LocType> &box) {
    return box.xLo() >= -LEGALIZE_MAX_COORDINATE and
           box.yLo() >= -LEGALIZE_MAX_COORDINATE and
           box.xHi() <= LEGALIZE_MAX_COORDINATE and
           box.yHi() <= LEGALIZE_MAX_COORDINATE;
  }

private:
  Box<LocType> _boundaryConstraint =
      Box<LocType>(LOC_TYPE_MAX, LOC_TYPE_MAX, LOC_TYPE_MIN, LOC_TYPE_MIN);
  bool _boundarySet;       ///< Whether the block boundary is given
  LocType _gridStep;       ///< The row height
  IndexType _maxIterations; ///< The cap on the resolving passes
  IndexType _historyDepth; ///< The size of the per-cell position ring buffer
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_PARAMETERS_H_
