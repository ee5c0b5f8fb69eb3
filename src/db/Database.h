/**
 * @file Database.h
 * @brief The placement database data structure
 * @author Keren Zhu
 * @date 10/02/2019
 */

#ifndef CELLLEGAL_DATABASE_H_
#define CELLLEGAL_DATABASE_H_

#include "Cell.h"
#include "Parameters.h"

#include <utility>
#include <vector>

PROJECT_NAMESPACE_BEGIN

/// @class CELLLEGAL::Database
/// @brief the database class of the legalization engine. It owns the cells,
/// the placement blockages and the layout, i.e. the cells kept by the boundary
/// filter
class Database {
public:
  /// @brief default database
  explicit Database() = default;
  /*------------------------------*/
  /* Getters                      */
  /*------------------------------*/
  /// @brief get the placement parameter wrapper
  /// @return the placement parameter wrapper
  const Parameters &parameters() const { return _para; }
  /// @brief get the placement parameter wrapper
  /// @return the placement parameter wrapper
  Parameters &parameters() { return _para; }
  /// @brief get the block boundary
  const Box<LocType> &boundary() const { return _para.boundaryConstraint(); }
  /*------------------------------*/
  /* Vector operations            */
  /*------------------------------*/
  /// @brief get the number of cells
  /// @return the number of cells
  IndexType numCells() const { return _cellArray.size(); }
  /// @brief get one cell from the array
  /// @param the index of the cell
  /// @return the cell of the index
  const Cell &cell(IndexType cellIdx) const { return AT(_cellArray, cellIdx); }
  /// @brief get one cell from the array
  /// @param the index of the cell
  /// @return the cell of the index
  Cell &cell(IndexType cellIdx) { return AT(_cellArray, cellIdx); }
  /// @brief allocate a new cell in the array
  /// @return the index of the new cell
  IndexType allocateCell() {
    _cellArray.emplace_back(Cell());
    return _cellArray.size() - 1;
  }
  /// @brief set name of cell
  /// @param first: cellIdx
  /// @param second: cellName
  void setCellName(IndexType cellIdx, const std::string &name) {
    _cellArray.at(cellIdx).setName(name);
  }
  /// @brief find a cell by its name
  /// @return the index of the cell. INDEX_TYPE_MAX if not found
  IndexType cellIdxName(const std::string &name) const;
  /// @brief get the number of placement blockages
  IndexType numBlockages() const { return _blockageArray.size(); }
  /// @brief get a placement blockage
  const Box<LocType> &blockage(IndexType blockageIdx) const {
    return AT(_blockageArray, blockageIdx);
  }
  /// @brief add a placement blockage, a region inside the block no cell may
  /// overlap
  /// @return the index of the blockage
  IndexType addBlockage(const Box<LocType> &box) {
    _blockageArray.emplace_back(box);
    return _blockageArray.size() - 1;
  }
  const std::vector<Box<LocType>> &vBlockageArray() const {
    return _blockageArray;
  }
  /*------------------------------*/
  /* Layout                       */
  /*------------------------------*/
  /// @brief the indices of the cells kept in the layout, ascending
  const std::vector<IndexType> &layoutCells() const { return _layoutCells; }
  /// @brief set the cells of the layout
  void setLayoutCells(std::vector<IndexType> layoutCells) {
    _layoutCells = std::move(layoutCells);
  }
  /// @brief the indices of the cells removed by the boundary filter, ascending
  std::vector<IndexType> excludedCells() const;
  /// @brief the indices of the deadlocked cells, ascending
  std::vector<IndexType> deadlockedCells() const;
  /*------------------------------*/
  /* Misc.                        */
  /*------------------------------*/
  /// @brief check the parameters and the cells before the legalization. Print
  /// every problem found
  /// @return true if the legalization can start
  bool checkInput() const;
  /// @brief restore every cell to its input location and empty the layout
  void resetPlacement();

private:
  Parameters _para;                       ///< The parameters
  std::vector<Cell> _cellArray;           ///< The cells
  std::vector<Box<LocType>> _blockageArray; ///< The placement blockages
  std::vector<IndexType> _layoutCells;    ///< The cells kept in the layout
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_DATABASE_H_
