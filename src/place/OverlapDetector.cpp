#include "OverlapDetector.h"
#include <algorithm>
#include <iterator>

PROJECT_NAMESPACE_BEGIN

namespace bgi = boost::geometry::index;

void OverlapDetector::build() {
  _cellRtree.clear();
  _blockageRtree.clear();
  _indexedBoxes.assign(_db.numCells(), Box<LocType>());
  _isIndexed.assign(_db.numCells(), false);
  std::vector<ValueType> values;
  values.reserve(_db.layoutCells().size());
  for (IndexType cellIdx : _db.layoutCells()) {
    auto box = _db.cell(cellIdx).cellBBox();
    values.emplace_back(box, cellIdx);
    _indexedBoxes.at(cellIdx) = box;
    _isIndexed.at(cellIdx) = true;
  }
  // Bulk loading
  _cellRtree = RtreeType(values);
  std::vector<ValueType> blockages;
  for (IndexType blockageIdx = 0; blockageIdx < _db.numBlockages(); ++blockageIdx) {
    blockages.emplace_back(_db.blockage(blockageIdx), blockageIdx);
  }
  _blockageRtree = RtreeType(blockages);
}

void OverlapDetector::update(IndexType cellIdx) {
  Assert(_isIndexed.at(cellIdx));
  auto box = _db.cell(cellIdx).cellBBox();
  if (box == _indexedBoxes.at(cellIdx)) {
    return;
  }
  auto removed = _cellRtree.remove(ValueType(_indexedBoxes.at(cellIdx), cellIdx));
  AssertMsg(removed == 1, "OverlapDetector::%s cell %u is missing in the rtree \n", __FUNCTION__, cellIdx);
  _cellRtree.insert(ValueType(box, cellIdx));
  _indexedBoxes.at(cellIdx) = box;
}

std::vector<Conflict> OverlapDetector::conflicts(IndexType cellIdx) const {
  std::vector<Conflict> result;
  const auto box = _db.cell(cellIdx).cellBBox();
  // The rtree query includes touching boxes. Keep the positive-area overlaps only
  std::vector<ValueType> queryResults;
  _cellRtree.query(bgi::intersects(box), std::back_inserter(queryResults));
  std::sort(queryResults.begin(), queryResults.end(),
            [](const ValueType &lhs, const ValueType &rhs) { return lhs.second < rhs.second; });
  for (const auto &value : queryResults) {
    if (value.second == cellIdx or not box.overlap(value.first)) {
      continue;
    }
    Conflict conflict;
    conflict.kind = ConflictKindType::CELL;
    conflict.idx = value.second;
    conflict.rect = box.intersection(value.first);
    result.emplace_back(conflict);
  }
  queryResults.clear();
  _blockageRtree.query(bgi::intersects(box), std::back_inserter(queryResults));
  std::sort(queryResults.begin(), queryResults.end(),
            [](const ValueType &lhs, const ValueType &rhs) { return lhs.second < rhs.second; });
  for (const auto &value : queryResults) {
    if (not box.overlap(value.first)) {
      continue;
    }
    Conflict conflict;
    conflict.kind = ConflictKindType::BLOCKAGE;
    conflict.idx = value.second;
    conflict.rect = box.intersection(value.first);
    result.emplace_back(conflict);
  }
  Box<LocType> outside;
  if (outsidePart(box, _db.boundary(), outside)) {
    Conflict conflict;
    conflict.kind = ConflictKindType::BOUNDARY;
    conflict.rect = outside;
    result.emplace_back(conflict);
  }
  return result;
}

bool OverlapDetector::outsidePart(const Box<LocType> &box, const Box<LocType> &boundary, Box<LocType> &outside) {
  if (boundary.contain(box)) {
    return false;
  }
  outside = Box<LocType>(LOC_TYPE_MAX, LOC_TYPE_MAX, LOC_TYPE_MIN, LOC_TYPE_MIN);
  if (box.xLo() < boundary.xLo()) {
    outside.unionBox(Box<LocType>(box.xLo(), box.yLo(), std::min(box.xHi(), boundary.xLo()), box.yHi()));
  }
  if (box.xHi() > boundary.xHi()) {
    outside.unionBox(Box<LocType>(std::max(box.xLo(), boundary.xHi()), box.yLo(), box.xHi(), box.yHi()));
  }
  if (box.yLo() < boundary.yLo()) {
    outside.unionBox(Box<LocType>(box.xLo(), box.yLo(), box.xHi(), std::min(box.yHi(), boundary.yLo())));
  }
  if (box.yHi() > boundary.yHi()) {
    outside.unionBox(Box<LocType>(box.xLo(), std::max(box.yLo(), boundary.yHi()), box.xHi(), box.yHi()));
  }
  return true;
}

PROJECT_NAMESPACE_END
