/**
 * @file box.hpp
 * @brief The 2D point and axis-aligned box, registered to boost::geometry
 * @author Keren Zhu
 * @date 10/02/2019
 */

#ifndef CELLLEGAL_BOX_HPP_
#define CELLLEGAL_BOX_HPP_

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <boost/geometry.hpp>
#include <boost/mpl/int.hpp>
#include "global/namespace.h"

PROJECT_NAMESPACE_BEGIN

/// @class CELLLEGAL::XY
/// @brief a 2D point
template<typename T>
class XY
{
    public:
        XY() = default;
        explicit XY(T x, T y) : _x(x), _y(y) {}
        T x() const { return _x; }
        T y() const { return _y; }
        void setX(T x) { _x = x; }
        void setY(T y) { _y = y; }
        void setXY(T x, T y) { _x = x; _y = y; }
        bool operator==(const XY<T> &rhs) const { return _x == rhs._x && _y == rhs._y; }
        bool operator!=(const XY<T> &rhs) const { return !(*this == rhs); }
        std::string toStr() const
        {
            return "(" + std::to_string(_x) + ", " + std::to_string(_y) + ")";
        }
    private:
        T _x = 0;
        T _y = 0;
};

/// @brief the Manhattan distance of two points
template<typename T>
inline T manhattanDistance(const XY<T> &lhs, const XY<T> &rhs)
{
    return std::abs(lhs.x() - rhs.x()) + std::abs(lhs.y() - rhs.y());
}

/// @class CELLLEGAL::Box
/// @brief an axis-aligned rectangle [xLo, xHi] x [yLo, yHi]
template<typename T>
class Box
{
    public:
        /// @brief default constructor. An invalid box
        Box() = default;
        explicit Box(T xLo, T yLo, T xHi, T yHi) : _ll(xLo, yLo), _ur(xHi, yHi) {}
        /*------------------------------*/
        /* Getters                      */
        /*------------------------------*/
        T xLo() const { return _ll.x(); }
        T yLo() const { return _ll.y(); }
        T xHi() const { return _ur.x(); }
        T yHi() const { return _ur.y(); }
        T xLen() const { return _ur.x() - _ll.x(); }
        T yLen() const { return _ur.y() - _ll.y(); }
        /// @brief whether the lower-left is not above or right of the upper-right
        bool valid() const { return _ll.x() <= _ur.x() && _ll.y() <= _ur.y(); }
        /*------------------------------*/
        /* Setters                      */
        /*------------------------------*/
        void setXL(T xl) { _ll.setX(xl); }
        void setYL(T yl) { _ll.setY(yl); }
        void setXH(T xh) { _ur.setX(xh); }
        void setYH(T yh) { _ur.setY(yh); }
        void setBounds(T xLo, T yLo, T xHi, T yHi)
        {
            _ll.setXY(xLo, yLo);
            _ur.setXY(xHi, yHi);
        }
        /// @brief grow this box to include another one
        void unionBox(const Box<T> &other)
        {
            _ll.setXY(std::min(_ll.x(), other.xLo()), std::min(_ll.y(), other.yLo()));
            _ur.setXY(std::max(_ur.x(), other.xHi()), std::max(_ur.y(), other.yHi()));
        }
        /*------------------------------*/
        /* Geometric queries            */
        /*------------------------------*/
        /// @brief whether two boxes share a positive-area region. Touching boxes do not overlap
        bool overlap(const Box<T> &other) const
        {
            return std::max(xLo(), other.xLo()) < std::min(xHi(), other.xHi())
                && std::max(yLo(), other.yLo()) < std::min(yHi(), other.yHi());
        }
        /// @brief the intersection of two boxes. Only meaningful if they overlap
        Box<T> intersection(const Box<T> &other) const
        {
            return Box<T>(std::max(xLo(), other.xLo()), std::max(yLo(), other.yLo()),
                          std::min(xHi(), other.xHi()), std::min(yHi(), other.yHi()));
        }
        /// @brief whether the other box lies entirely in this one. Shared edges count as inside
        bool contain(const Box<T> &other) const
        {
            return xLo() <= other.xLo() && yLo() <= other.yLo()
                && xHi() >= other.xHi() && yHi() >= other.yHi();
        }
        bool operator==(const Box<T> &rhs) const { return _ll == rhs._ll && _ur == rhs._ur; }
        bool operator!=(const Box<T> &rhs) const { return !(*this == rhs); }
        std::string toStr() const
        {
            return "[" + _ll.toStr() + " " + _ur.toStr() + "]";
        }
    private:
        XY<T> _ll; ///< Lower-left corner
        XY<T> _ur; ///< Upper-right corner
};

PROJECT_NAMESPACE_END

/* Register XY and Box to boost::geometry so they can be stored in the rtree */
namespace boost { namespace geometry { namespace traits {

template<typename T>
struct tag<PROJECT_NAMESPACE::XY<T>> { typedef point_tag type; };
template<typename T>
struct coordinate_type<PROJECT_NAMESPACE::XY<T>> { typedef T type; };
template<typename T>
struct coordinate_system<PROJECT_NAMESPACE::XY<T>> { typedef cs::cartesian type; };
template<typename T>
struct dimension<PROJECT_NAMESPACE::XY<T>> : boost::mpl::int_<2> {};

template<typename T>
struct access<PROJECT_NAMESPACE::XY<T>, 0>
{
    static T get(const PROJECT_NAMESPACE::XY<T> &p) { return p.x(); }
    static void set(PROJECT_NAMESPACE::XY<T> &p, const T &value) { p.setX(value); }
};
template<typename T>
struct access<PROJECT_NAMESPACE::XY<T>, 1>
{
    static T get(const PROJECT_NAMESPACE::XY<T> &p) { return p.y(); }
    static void set(PROJECT_NAMESPACE::XY<T> &p, const T &value) { p.setY(value); }
};

template<typename T>
struct tag<PROJECT_NAMESPACE::Box<T>> { typedef box_tag type; };
template<typename T>
struct point_type<PROJECT_NAMESPACE::Box<T>> { typedef PROJECT_NAMESPACE::XY<T> type; };

template<typename T>
struct indexed_access<PROJECT_NAMESPACE::Box<T>, min_corner, 0>
{
    static T get(const PROJECT_NAMESPACE::Box<T> &b) { return b.xLo(); }
    static void set(PROJECT_NAMESPACE::Box<T> &b, const T &value) { b.setXL(value); }
};
template<typename T>
struct indexed_access<PROJECT_NAMESPACE::Box<T>, min_corner, 1>
{
    static T get(const PROJECT_NAMESPACE::Box<T> &b) { return b.yLo(); }
    static void set(PROJECT_NAMESPACE::Box<T> &b, const T &value) { b.setYL(value); }
};
template<typename T>
struct indexed_access<PROJECT_NAMESPACE::Box<T>, max_corner, 0>
{
    static T get(const PROJECT_NAMESPACE::Box<T> &b) { return b.xHi(); }
    static void set(PROJECT_NAMESPACE::Box<T> &b, const T &value) { b.setXH(value); }
};
template<typename T>
struct indexed_access<PROJECT_NAMESPACE::Box<T>, max_corner, 1>
{
    static T get(const PROJECT_NAMESPACE::Box<T> &b) { return b.yHi(); }
    static void set(PROJECT_NAMESPACE::Box<T> &b, const T &value) { b.setYH(value); }
};

}}} // namespace boost::geometry::traits

#endif /// CELLLEGAL_BOX_HPP_
