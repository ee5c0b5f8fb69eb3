/**
 * @file Cell.h
 * @brief The standard cell of the placement database
 * @author Keren Zhu
 * @date 10/02/2019
 */

#ifndef CELLLEGAL_DATABASE_CELL_H_
#define CELLLEGAL_DATABASE_CELL_H_

#include <array>
#include "global/global.h"

PROJECT_NAMESPACE_BEGIN

/// @class CELLLEGAL::PositionHistory
/// @brief fixed-capacity ring buffer of the positions a cell has occupied
class PositionHistory
{
    public:
        explicit PositionHistory() = default;
        /// @brief clear and seed the history
        /// @param first: the number of positions kept, in [LEGALIZE_MIN_HISTORY_DEPTH, LEGALIZE_MAX_HISTORY_DEPTH]
        /// @param second: the first position
        void reset(IndexType depth, const XY<LocType> &seed);
        /// @brief remember a position. Overwrite the oldest one if full
        void push(const XY<LocType> &loc);
        /// @brief whether a position is remembered
        bool contains(const XY<LocType> &loc) const;
        /// @brief the number of remembered positions
        IndexType size() const { return _size; }
        /// @brief the capacity in use
        IndexType depth() const { return _depth; }
    private:
        std::array<XY<LocType>, LEGALIZE_MAX_HISTORY_DEPTH> _ring;
        IndexType _depth = LEGALIZE_DEFAULT_HISTORY_DEPTH;
        IndexType _head = 0; ///< The slot to write next
        IndexType _size = 0;
};

/// @class CELLLEGAL::Cell
/// @brief a rectangular standard cell. The location is the lower-left corner
class Cell
{
    public:
        explicit Cell() = default;
        /*------------------------------*/
        /* Getters                      */
        /*------------------------------*/
        const std::string &name() const { return _name; }
        LocType width() const { return _width; }
        LocType height() const { return _height; }
        /// @brief the current location
        const XY<LocType> &loc() const { return _loc; }
        LocType xLoc() const { return _loc.x(); }
        LocType yLoc() const { return _loc.y(); }
        LocType xLo() const { return _loc.x(); }
        LocType yLo() const { return _loc.y(); }
        LocType xHi() const { return _loc.x() + _width; }
        LocType yHi() const { return _loc.y() + _height; }
        /// @brief the location given by the input, before any snapping or move
        const XY<LocType> &inputLoc() const { return _inputLoc; }
        /// @brief the location at the start of the legalization. A deadlocked cell goes back here
        const XY<LocType> &anchorLoc() const { return _anchorLoc; }
        /// @brief the cell rectangle at the current location
        Box<LocType> cellBBox() const { return cellBBoxAt(_loc); }
        /// @brief the cell rectangle if the cell were at a location
        Box<LocType> cellBBoxAt(const XY<LocType> &loc) const
        {
            return Box<LocType>(loc.x(), loc.y(), loc.x() + _width, loc.y() + _height);
        }
        /// @brief the Manhattan distance from the input location to the current one
        LocType displacement() const { return manhattanDistance(_inputLoc, _loc); }
        CellStatusType status() const { return _status; }
        bool isDeadlocked() const { return _status == CellStatusType::DEADLOCKED; }
        /// @brief whether the boundary filter has removed this cell from the layout
        bool isExcluded() const { return _excluded; }
        const PositionHistory &history() const { return _history; }
        PositionHistory &history() { return _history; }
        /*------------------------------*/
        /* Setters                      */
        /*------------------------------*/
        void setName(const std::string &name) { _name = name; }
        /// @brief set the input rectangle. The current location follows the input one
        void setShape(LocType x, LocType y, LocType width, LocType height)
        {
            _inputLoc.setXY(x, y);
            _loc = _inputLoc;
            _anchorLoc = _inputLoc;
            _width = width;
            _height = height;
        }
        void setXLoc(LocType x) { _loc.setX(x); }
        void setYLoc(LocType y) { _loc.setY(y); }
        void setLoc(const XY<LocType> &loc) { _loc = loc; }
        /// @brief take the current location as the anchor and restart the history from it
        void anchor(IndexType historyDepth);
        /// @brief go back to the anchor and stop moving
        void markDeadlocked();
        void setExcluded(bool excluded) { _excluded = excluded; }
        /// @brief restore the input location and the initial states
        void resetToInput();
    private:
        std::string _name = "";
        LocType _width = 0;
        LocType _height = 0;
        XY<LocType> _inputLoc;
        XY<LocType> _anchorLoc;
        XY<LocType> _loc;
        CellStatusType _status = CellStatusType::ACTIVE;
        bool _excluded = false;
        PositionHistory _history;
};

PROJECT_NAMESPACE_END

#endif /// CELLLEGAL_DATABASE_CELL_H_
