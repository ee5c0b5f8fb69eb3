/**
 * @file geoApi.cpp
 * @brief The pybind11 interface for the point and box
 * @author Keren Zhu
 * @date 12/16/2019
 */

#include "global/global.h"
#include <pybind11/pybind11.h>
#include <pybind11/operators.h>

namespace py = pybind11;

void initPointAPI(py::module &m) {
  using PointType = PROJECT_NAMESPACE::XY<PROJECT_NAMESPACE::LocType>;
  py::class_<PointType>(m, "Point")
      .def(py::init<>())
      .def(py::init<PROJECT_NAMESPACE::LocType, PROJECT_NAMESPACE::LocType>())
      .def("x", &PointType::x, "Get x")
      .def("y", &PointType::y, "Get y")
      .def("setX", &PointType::setX, "Set x")
      .def("setY", &PointType::setY, "Set y")
      .def(py::self == py::self)
      .def("__repr__", &PointType::toStr);
}

void initBoxAPI(py::module &m) {
  using BoxType = PROJECT_NAMESPACE::Box<PROJECT_NAMESPACE::LocType>;
  py::class_<BoxType>(m, "Box")
      .def(py::init<>())
      .def(py::init<PROJECT_NAMESPACE::LocType, PROJECT_NAMESPACE::LocType,
                    PROJECT_NAMESPACE::LocType, PROJECT_NAMESPACE::LocType>())
      .def("xLo", &BoxType::xLo, "Get the lower x")
      .def("yLo", &BoxType::yLo, "Get the lower y")
      .def("xHi", &BoxType::xHi, "Get the higher x")
      .def("yHi", &BoxType::yHi, "Get the higher y")
      .def("xLen", &BoxType::xLen, "Get the width")
      .def("yLen", &BoxType::yLen, "Get the height")
      .def("overlap", &BoxType::overlap,
           "Whether two boxes share a positive-area region")
      .def("contain", &BoxType::contain,
           "Whether the other box is entirely inside this one")
      .def(py::self == py::self)
      .def("__repr__", &BoxType::toStr);
}
