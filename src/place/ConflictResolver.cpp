#include "ConflictResolver.h"

PROJECT_NAMESPACE_BEGIN

void ConflictResolver::prepare() {
  const IndexType historyDepth = _db.parameters().historyDepth();
  for (IndexType cellIdx : _db.layoutCells()) {
    _db.cell(cellIdx).anchor(historyDepth);
  }
  _detector.build();
}

std::vector<IndexType> ConflictResolver::scan() const {
  std::vector<IndexType> conflicting;
  for (IndexType cellIdx : _db.layoutCells()) {
    if (_db.cell(cellIdx).isDeadlocked()) {
      continue;
    }
    if (_detector.hasConflict(cellIdx)) {
      conflicting.emplace_back(cellIdx);
    }
  }
  return conflicting;
}

ResolveResult ConflictResolver::run() {
  ResolveResult result;
  prepare();
  const IndexType maxIterations = _db.parameters().maxIterations();
  while (true) {
    auto conflicting = scan();
    if (conflicting.empty()) {
      result.status = LegalizeStatusType::LEGAL;
      break;
    }
    if (result.numPasses >= maxIterations) {
      result.status = LegalizeStatusType::ITERATION_LIMIT;
      WRN("ConflictResolver::%s reach the iteration cap %u with %u cells in "
          "conflict \n",
          __FUNCTION__, maxIterations,
          static_cast<IndexType>(conflicting.size()));
      break;
    }
    ++result.numPasses;
    DBG("ConflictResolver::%s pass %u, %u cells in conflict \n", __FUNCTION__,
        result.numPasses, static_cast<IndexType>(conflicting.size()));
    if (not resolvePass(result)) {
      result.status = LegalizeStatusType::STALLED;
      WRN("ConflictResolver::%s stalled at pass %u: none of the %u cells in "
          "conflict can move \n",
          __FUNCTION__, result.numPasses,
          static_cast<IndexType>(conflicting.size()));
      break;
    }
  }
  collect(result);
  if (result.status == LegalizeStatusType::LEGAL and
      not result.deadlockedCells.empty()) {
    result.status = LegalizeStatusType::DEADLOCKED_CELLS;
  }
  INF("ConflictResolver::%s %s after %u passes, %u moves, %u deadlocked, %u "
      "unresolved \n",
      __FUNCTION__, legalizeStatus2Str(result.status).c_str(),
      result.numPasses, result.numMoves,
      static_cast<IndexType>(result.deadlockedCells.size()),
      static_cast<IndexType>(result.unresolvedCells.size()));
  return result;
}

bool ConflictResolver::resolvePass(ResolveResult &result) {
  bool progress = false;
  for (IndexType cellIdx : _db.layoutCells()) {
    auto &cell = _db.cell(cellIdx);
    if (cell.isDeadlocked()) {
      continue;
    }
    // Earlier moves of this pass may have changed the conflicts
    auto conflicts = _detector.conflicts(cellIdx);
    if (conflicts.empty()) {
      continue;
    }
    auto plan = _planner.plan(cellIdx, conflicts);
    if (not plan.feasible()) {
      DBG("ConflictResolver::%s cell %s has no single-axis move, retry next "
          "pass \n",
          __FUNCTION__, cell.name().c_str());
      continue;
    }
    _planner.apply(cellIdx, plan);
    _detector.update(cellIdx);
    progress = true;
    if (cell.history().contains(cell.loc())) {
      deadlock(cellIdx);
      continue;
    }
    cell.history().push(cell.loc());
    ++result.numMoves;
  }
  return progress;
}

void ConflictResolver::deadlock(IndexType cellIdx) {
  auto &cell = _db.cell(cellIdx);
  WRN("ConflictResolver::%s cell %s oscillates back to %s, revert to %s \n",
      __FUNCTION__, cell.name().c_str(), cell.loc().toStr().c_str(),
      cell.anchorLoc().toStr().c_str());
  cell.markDeadlocked();
  _detector.update(cellIdx);
}

void ConflictResolver::collect(ResolveResult &result) const {
  result.deadlockedCells = _db.deadlockedCells();
  result.unresolvedCells.clear();
  for (IndexType cellIdx : _db.layoutCells()) {
    if (_detector.hasConflict(cellIdx)) {
      result.unresolvedCells.emplace_back(cellIdx);
    }
  }
}

PROJECT_NAMESPACE_END
