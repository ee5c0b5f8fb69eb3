#include "Parameters.h"

PROJECT_NAMESPACE_BEGIN

Parameters::Parameters()
    : _boundarySet(false), _gridStep(-1),
      _maxIterations(LEGALIZE_DEFAULT_MAX_ITERATIONS),
      _historyDepth(LEGALIZE_DEFAULT_HISTORY_DEPTH) {}

bool Parameters::check() const {
  bool pass = true;
  if (not _boundarySet) {
    ERR("Parameters::%s block boundary is not set \n", __FUNCTION__);
    pass = false;
  } else if (not _boundaryConstraint.valid()) {
    ERR("Parameters::%s malformed block boundary %s: min is larger than max "
        "\n",
        __FUNCTION__, _boundaryConstraint.toStr().c_str());
    pass = false;
  }
  if (_boundarySet and not inCoordinateRange(_boundaryConstraint)) {
    ERR("Parameters::%s block boundary %s exceeds the coordinate range [%d, %d] "
        "\n",
        __FUNCTION__, _boundaryConstraint.toStr().c_str(),
        -LEGALIZE_MAX_COORDINATE, LEGALIZE_MAX_COORDINATE);
    pass = false;
  }
  if (not hasGridStep()) {
    ERR("Parameters::%s grid step must be positive, got %d \n", __FUNCTION__,
        _gridStep);
    pass = false;
  } else if (_gridStep > LEGALIZE_MAX_COORDINATE) {
    ERR("Parameters::%s grid step %d exceeds the coordinate range %d \n",
        __FUNCTION__, _gridStep, LEGALIZE_MAX_COORDINATE);
    pass = false;
  }
  if (_maxIterations == 0) {
    ERR("Parameters::%s the iteration cap must be at least 1 \n",
        __FUNCTION__);
    pass = false;
  }
  if (_historyDepth < LEGALIZE_MIN_HISTORY_DEPTH or
      _historyDepth > LEGALIZE_MAX_HISTORY_DEPTH) {
    ERR("Parameters::%s history depth %u is out of [%u, %u] \n", __FUNCTION__,
        _historyDepth, LEGALIZE_MIN_HISTORY_DEPTH, LEGALIZE_MAX_HISTORY_DEPTH);
    pass = false;
  }
  return pass;
}

PROJECT_NAMESPACE_END
