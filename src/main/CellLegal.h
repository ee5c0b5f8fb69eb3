/**
 * @file CellLegal.h
 * @brief wrapper of Everything
 * @author Keren Zhu
 * @date 10/02/2019
 */

#ifndef CELLLEGAL_CELLLEGAL_H_
#define CELLLEGAL_CELLLEGAL_H_

#include "db/Database.h"
/* Solver */
#include "place/MovementReporter.h"

PROJECT_NAMESPACE_BEGIN

/// @class CELLLEGAL::CellLegal
/// @brief the main wrapper for the legalization engine
class CellLegal {
public:
  /// @brief default constructor
  explicit CellLegal() = default;
  /// @brief run the legalization: snap to grid, filter by the block, resolve
  /// the overlaps and summarize. Always starts from the input locations
  /// @return false if the input or the parameters are invalid. A partial
  /// legalization still returns true, see report()
  bool solve();
  /*------------------------------*/
  /* paramters                    */
  /*------------------------------*/
  /// @brief set the boundary constraint.
  void setBoundaryConstraint(LocType xLo, LocType yLo, LocType xHi,
                             LocType yHi) {
    _db.parameters().setBoundaryConstraint(xLo, yLo, xHi, yHi);
  }
  /// @brief set the row height
  void setGridStep(LocType gridStep) { _db.parameters().setGridStep(gridStep); }
  /// @brief set the cap on the resolving passes
  void setMaxIterations(IndexType maxIterations) {
    _db.parameters().setMaxIterations(maxIterations);
  }
  /// @brief set the number of past positions kept per cell
  void setHistoryDepth(IndexType historyDepth) {
    _db.parameters().setHistoryDepth(historyDepth);
  }
  /// @brief add a placement blockage
  /// @return the index of the blockage
  IndexType addBlockage(LocType xLo, LocType yLo, LocType xHi, LocType yHi) {
    return _db.addBlockage(Box<LocType>(xLo, yLo, xHi, yHi));
  }
  /*------------------------------*/
  /* Standard input interface     */
  /*------------------------------*/
  /// @brief add a new cell
  /// @return the index for that cell
  IndexType allocateCell() { return _db.allocateCell(); }
  /// @brief set cell name
  /// @param first cellIdx
  /// @param second cell name
  void setCellName(IndexType cellIdx, const std::string &name) {
    _db.setCellName(cellIdx, name);
  }
  /// @brief set the input rectangle of a cell
  /// @param first: the cell index
  /// @param second: x of the lower-left corner
  /// @param third: y of the lower-left corner
  /// @param fourth: width
  /// @param fifth: height
  void setCellShape(IndexType cellIdx, LocType x, LocType y, LocType width,
                    LocType height) {
    _db.cell(cellIdx).setShape(x, y, width, height);
  }
  /// @brief add a cell with its name and rectangle
  /// @return the index for that cell
  IndexType addCell(const std::string &name, LocType x, LocType y,
                    LocType width, LocType height) {
    IndexType cellIdx = allocateCell();
    setCellName(cellIdx, name);
    setCellShape(cellIdx, x, y, width, height);
    return cellIdx;
  }
  /*------------------------------*/
  /* Standard output interface    */
  /*------------------------------*/
  /// @brief get the x coordinate for a cell
  /// @param  the cell index
  /// @return the x coordinate
  LocType xCellLoc(IndexType cellIdx) const { return _db.cell(cellIdx).xLoc(); }
  /// @brief get the y coordinate for a cell
  /// @param  the cell index
  /// @return the y coordinate
  LocType yCellLoc(IndexType cellIdx) const { return _db.cell(cellIdx).yLoc(); }
  /// @brief get the index of the cell based on name
  /// @param cell name
  /// @return the cellIdx. INDEX_TYPE_MAX if there is no such cell
  IndexType cellIdxName(const std::string &name) const {
    return _db.cellIdxName(name);
  }
  /// @brief return cell name
  /// @param first cellIdx
  /// @return cell name
  std::string cellName(IndexType cellIdx) const {
    return _db.cell(cellIdx).name();
  }
  /// @brief return number of cells
  /// @return number of cells
  IndexType numCells() const { return _db.numCells(); }
  /// @brief whether the cell was dropped for not being inside the block
  bool isCellExcluded(IndexType cellIdx) const {
    return _db.cell(cellIdx).isExcluded();
  }
  /// @brief whether the cell was reverted for oscillating
  bool isCellDeadlocked(IndexType cellIdx) const {
    return _db.cell(cellIdx).isDeadlocked();
  }
  /// @brief the summary of the last solve()
  const MovementReport &report() const { return _report; }
  /// @brief the database
  const Database &db() const { return _db; }
  /* Run time */
  /// @brief get the the run time for legalization
  /// @return time in us
  decltype(auto) runtimeLegalization() const {
    return WATCH_LOOK_RECORD_TIME("legalization");
  }

  /*------------------------------*/
  /* Log option                   */
  /*------------------------------*/
  void logScreenOn() { MsgPrinter::screenOn(); }
  void logScreenOff() { MsgPrinter::screenOff(); }
  void openLogFile(const std::string &file) { MsgPrinter::openLogFile(file); }
  void closeLogFile() { MsgPrinter::closeLogFile(); }

protected:
  Database _db; ///< The placement engine database
  MovementReport _report; ///< The summary of the last run
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_CELLLEGAL_H_
