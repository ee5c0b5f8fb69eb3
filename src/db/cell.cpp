#include "Cell.h"

PROJECT_NAMESPACE_BEGIN

void PositionHistory::reset(IndexType depth, const XY<LocType> &seed) {
  Assert(depth >= LEGALIZE_MIN_HISTORY_DEPTH and depth <= LEGALIZE_MAX_HISTORY_DEPTH);
  _depth = depth;
  _head = 0;
  _size = 0;
  push(seed);
}

void PositionHistory::push(const XY<LocType> &loc) {
  _ring.at(_head) = loc;
  _head = (_head + 1) % _depth;
  _size = std::min(_size + 1, _depth);
}

bool PositionHistory::contains(const XY<LocType> &loc) const {
  for (IndexType idx = 0; idx < _size; ++idx) {
    if (_ring.at(idx) == loc) {
      return true;
    }
  }
  return false;
}

void Cell::anchor(IndexType historyDepth) {
  _anchorLoc = _loc;
  _status = CellStatusType::ACTIVE;
  _history.reset(historyDepth, _loc);
}

void Cell::markDeadlocked() {
  _loc = _anchorLoc;
  _status = CellStatusType::DEADLOCKED;
}

void Cell::resetToInput() {
  _loc = _inputLoc;
  _anchorLoc = _inputLoc;
  _status = CellStatusType::ACTIVE;
  _excluded = false;
}

PROJECT_NAMESPACE_END
