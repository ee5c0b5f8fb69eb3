#include "BoundaryFilter.h"

PROJECT_NAMESPACE_BEGIN

BoundaryClassType BoundaryFilter::classify(const Box<LocType> &cellBox,
                                           const Box<LocType> &boundary,
                                           const std::vector<Box<LocType>> &blockages) {
  if (not boundary.contain(cellBox)) {
    return BoundaryClassType::OUTSIDE;
  }
  for (const auto &blockage : blockages) {
    if (cellBox.overlap(blockage)) {
      return BoundaryClassType::OUTSIDE;
    }
  }
  return BoundaryClassType::INSIDE;
}

IndexType BoundaryFilter::filter() {
  std::vector<IndexType> layoutCells;
  IndexType numExcluded = 0;
  for (IndexType cellIdx = 0; cellIdx < _db.numCells(); ++cellIdx) {
    auto &cell = _db.cell(cellIdx);
    auto cls = classify(cell.cellBBox(), _db.boundary(), _db.vBlockageArray());
    if (cls == BoundaryClassType::INSIDE) {
      cell.setExcluded(false);
      layoutCells.emplace_back(cellIdx);
    } else {
      cell.setExcluded(true);
      ++numExcluded;
      INF("BoundaryFilter::%s exclude cell %s %s: not inside the block \n",
          __FUNCTION__, cell.name().c_str(), cell.cellBBox().toStr().c_str());
    }
  }
  _db.setLayoutCells(std::move(layoutCells));
  INF("BoundaryFilter::%s %u cells inside the block, %u excluded \n",
      __FUNCTION__, static_cast<IndexType>(_db.layoutCells().size()),
      numExcluded);
  return numExcluded;
}

PROJECT_NAMESPACE_END
