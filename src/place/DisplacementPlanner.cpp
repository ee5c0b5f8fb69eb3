#include "DisplacementPlanner.h"
#include "place/alignGrid.h"

PROJECT_NAMESPACE_BEGIN

namespace {
constexpr IndexType WEST = static_cast<IndexType>(Direction2DType::WEST);
constexpr IndexType EAST = static_cast<IndexType>(Direction2DType::EAST);
constexpr IndexType NORTH = static_cast<IndexType>(Direction2DType::NORTH);
constexpr IndexType SOUTH = static_cast<IndexType>(Direction2DType::SOUTH);
}

Box<LocType> DisplacementPlanner::obstacle(const Conflict &conflict) const {
  switch (conflict.kind) {
    case ConflictKindType::CELL: return _db.cell(conflict.idx).cellBBox();
    case ConflictKindType::BLOCKAGE: return _db.blockage(conflict.idx);
    default: return _db.boundary();
  }
}

std::array<LocType, 4> DisplacementPlanner::conflictShifts(const Box<LocType> &cellBox, const Conflict &conflict) const {
  std::array<LocType, 4> shifts;
  const auto other = obstacle(conflict);
  if (conflict.kind == ConflictKindType::BOUNDARY) {
    // Bring the crossing edges back. Whether this clears the conflict is left to the containment check
    shifts.at(WEST) = std::max<LocType>(0, cellBox.xHi() - other.xHi());
    shifts.at(EAST) = std::max<LocType>(0, other.xLo() - cellBox.xLo());
    shifts.at(NORTH) = std::max<LocType>(0, other.yLo() - cellBox.yLo());
    shifts.at(SOUTH) = std::max<LocType>(0, cellBox.yHi() - other.yHi());
    return shifts;
  }
  shifts.at(WEST) = cellBox.xHi() - other.xLo();
  shifts.at(EAST) = other.xHi() - cellBox.xLo();
  shifts.at(NORTH) = other.yHi() - cellBox.yLo();
  shifts.at(SOUTH) = cellBox.yHi() - other.yLo();
  return shifts;
}

DisplacementPlan DisplacementPlanner::plan(IndexType cellIdx, const std::vector<Conflict> &conflicts) const {
  DisplacementPlan plan;
  if (conflicts.empty()) {
    return plan;
  }
  const auto &cell = _db.cell(cellIdx);
  const auto cellBox = cell.cellBBox();
  const LocType gridStep = _db.parameters().gridStep();
  std::array<LocType, 4> required = {{0, 0, 0, 0}};
  for (const auto &conflict : conflicts) {
    auto shifts = conflictShifts(cellBox, conflict);
    for (IndexType dir = 0; dir < 4; ++dir) {
      required.at(dir) = std::max(required.at(dir), shifts.at(dir));
    }
  }
  required.at(NORTH) = ceilToGrid(required.at(NORTH), gridStep);
  required.at(SOUTH) = ceilToGrid(required.at(SOUTH), gridStep);
  for (IndexType dir = 0; dir < 4; ++dir) {
    auto direction = static_cast<Direction2DType>(dir);
    if (required.at(dir) <= 0) {
      // Moving this way does not clear anything
      continue;
    }
    auto target = cell.cellBBoxAt(shiftedLoc(cell.loc(), direction, required.at(dir)));
    if (not _db.boundary().contain(target)) {
      continue;
    }
    // A boundary conflict is only cleared if the shifted cell is back inside, checked above
    plan.magnitudes.at(dir) = required.at(dir);
  }
  // Strict comparison keeps the first direction on ties: LEFT > RIGHT > UP > DOWN
  for (IndexType dir = 0; dir < 4; ++dir) {
    if (plan.magnitudes.at(dir) < plan.magnitude) {
      plan.magnitude = plan.magnitudes.at(dir);
      plan.direction = static_cast<Direction2DType>(dir);
    }
  }
  return plan;
}

XY<LocType> DisplacementPlanner::shiftedLoc(const XY<LocType> &loc, Direction2DType dir, LocType magnitude) {
  switch (dir) {
    case Direction2DType::WEST: return XY<LocType>(loc.x() - magnitude, loc.y());
    case Direction2DType::EAST: return XY<LocType>(loc.x() + magnitude, loc.y());
    case Direction2DType::NORTH: return XY<LocType>(loc.x(), loc.y() + magnitude);
    case Direction2DType::SOUTH: return XY<LocType>(loc.x(), loc.y() - magnitude);
    default: return loc;
  }
}

void DisplacementPlanner::apply(IndexType cellIdx, const DisplacementPlan &plan) {
  Assert(plan.feasible());
  auto &cell = _db.cell(cellIdx);
  DBG("DisplacementPlanner::%s cell %s %s by %d from %s \n", __FUNCTION__, cell.name().c_str(),
      direction2Str(plan.direction).c_str(), plan.magnitude, cell.loc().toStr().c_str());
  cell.setLoc(shiftedLoc(cell.loc(), plan.direction, plan.magnitude));
  if (plan.direction == Direction2DType::NORTH or plan.direction == Direction2DType::SOUTH) {
    cell.setYLoc(snapToGrid(cell.yLoc(), _db.parameters().gridStep()));
  }
}

PROJECT_NAMESPACE_END
