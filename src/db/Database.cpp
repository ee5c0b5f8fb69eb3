#include "Database.h"
#include <cstdint>
#include <unordered_map>

PROJECT_NAMESPACE_BEGIN

IndexType Database::cellIdxName(const std::string &name) const {
  for (IndexType cellIdx = 0; cellIdx < this->numCells(); ++cellIdx) {
    if (_cellArray.at(cellIdx).name() == name) {
      return cellIdx;
    }
  }
  return INDEX_TYPE_MAX;
}

std::vector<IndexType> Database::excludedCells() const {
  std::vector<IndexType> excluded;
  for (IndexType cellIdx = 0; cellIdx < this->numCells(); ++cellIdx) {
    if (_cellArray.at(cellIdx).isExcluded()) {
      excluded.emplace_back(cellIdx);
    }
  }
  return excluded;
}

std::vector<IndexType> Database::deadlockedCells() const {
  std::vector<IndexType> deadlocked;
  for (IndexType cellIdx : _layoutCells) {
    if (_cellArray.at(cellIdx).isDeadlocked()) {
      deadlocked.emplace_back(cellIdx);
    }
  }
  return deadlocked;
}

namespace {
/// @brief the input rectangle of a cell lies in the coordinate range. The far
/// corner is computed in 64 bits so that it cannot wrap
bool inCoordinateRange(const Cell &cell) {
  const std::int64_t xLo = cell.inputLoc().x();
  const std::int64_t yLo = cell.inputLoc().y();
  return xLo >= -LEGALIZE_MAX_COORDINATE and yLo >= -LEGALIZE_MAX_COORDINATE and
         xLo + cell.width() <= LEGALIZE_MAX_COORDINATE and
         yLo + cell.height() <= LEGALIZE_MAX_COORDINATE;
}
} // namespace

bool Database::checkInput() const {
  bool pass = _para.check();
  std::unordered_map<std::string, IndexType> nameToIdx;
  for (IndexType cellIdx = 0; cellIdx < this->numCells(); ++cellIdx) {
    const auto &cell = _cellArray.at(cellIdx);
    if (cell.width() <= 0 or cell.height() <= 0) {
      ERR("Database::%s cell %s (index %u) has non-positive size %d x %d \n",
          __FUNCTION__, cell.name().c_str(), cellIdx, cell.width(),
          cell.height());
      pass = false;
    } else if (not inCoordinateRange(cell)) {
      ERR("Database::%s cell %s (index %u) at %s size %d x %d exceeds the "
          "coordinate range [%d, %d] \n",
          __FUNCTION__, cell.name().c_str(), cellIdx,
          cell.inputLoc().toStr().c_str(), cell.width(), cell.height(),
          -LEGALIZE_MAX_COORDINATE, LEGALIZE_MAX_COORDINATE);
      pass = false;
    }
    if (cell.name().empty()) {
      continue;
    }
    auto inserted = nameToIdx.emplace(cell.name(), cellIdx);
    if (not inserted.second) {
      ERR("Database::%s duplicated cell name %s at index %u and %u \n",
          __FUNCTION__, cell.name().c_str(), inserted.first->second, cellIdx);
      pass = false;
    }
  }
  for (IndexType blockageIdx = 0; blockageIdx < this->numBlockages();
       ++blockageIdx) {
    const auto &box = _blockageArray.at(blockageIdx);
    if (not box.valid()) {
      ERR("Database::%s malformed blockage %u %s \n", __FUNCTION__,
          blockageIdx, box.toStr().c_str());
      pass = false;
    } else if (not Parameters::inCoordinateRange(box)) {
      ERR("Database::%s blockage %u %s exceeds the coordinate range [%d, %d] "
          "\n",
          __FUNCTION__, blockageIdx, box.toStr().c_str(),
          -LEGALIZE_MAX_COORDINATE, LEGALIZE_MAX_COORDINATE);
      pass = false;
    }
  }
  return pass;
}

void Database::resetPlacement() {
  for (auto &cell : _cellArray) {
    cell.resetToInput();
  }
  _layoutCells.clear();
}

PROJECT_NAMESPACE_END
