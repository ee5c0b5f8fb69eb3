/**
 * @file CellLegalAPI.cpp
 * @brief The pybind11 interface for the core legalization engine api
 * @author Keren Zhu
 * @date 12/16/2019
 */

#include "main/CellLegal.h"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

void initCellLegalAPI(py::module &m) {
  py::class_<PROJECT_NAMESPACE::CellLegal>(m, "CellLegal")
      .def(py::init<>())
      .def("solve", &PROJECT_NAMESPACE::CellLegal::solve,
           "Legalize the cells. Return false on invalid input")
      .def("setBoundaryConstraint",
           &PROJECT_NAMESPACE::CellLegal::setBoundaryConstraint,
           "Set the block boundary. params: xLo, yLo, xHi, yHi")
      .def("setGridStep", &PROJECT_NAMESPACE::CellLegal::setGridStep,
           "Set the grid step, i.e. the row height")
      .def("setMaxIterations", &PROJECT_NAMESPACE::CellLegal::setMaxIterations,
           "Set the cap on the resolving passes")
      .def("setHistoryDepth", &PROJECT_NAMESPACE::CellLegal::setHistoryDepth,
           "Set the number of past positions kept per cell")
      .def("addBlockage", &PROJECT_NAMESPACE::CellLegal::addBlockage,
           "Add a placement blockage. params: xLo, yLo, xHi, yHi")
      .def("allocateCell", &PROJECT_NAMESPACE::CellLegal::allocateCell,
           "Allocate a new cell, return the index of the cell")
      .def("setCellName", &PROJECT_NAMESPACE::CellLegal::setCellName,
           "Set the name of a cell")
      .def("setCellShape", &PROJECT_NAMESPACE::CellLegal::setCellShape,
           "Set the input rectangle of a cell. params: cellIdx, x, y, width, "
           "height")
      .def("addCell", &PROJECT_NAMESPACE::CellLegal::addCell,
           "Add a cell. params: name, x, y, width, height")
      .def("numCells", &PROJECT_NAMESPACE::CellLegal::numCells,
           "Get the number of cells")
      .def("cellIdxName", &PROJECT_NAMESPACE::CellLegal::cellIdxName,
           "Get the index based on cell name")
      .def("cellName", &PROJECT_NAMESPACE::CellLegal::cellName,
           "Get the cell name")
      .def("xCellLoc", &PROJECT_NAMESPACE::CellLegal::xCellLoc,
           "Get x coordinate of a cell location")
      .def("yCellLoc", &PROJECT_NAMESPACE::CellLegal::yCellLoc,
           "Get y coordinate of a cell location")
      .def("isCellExcluded", &PROJECT_NAMESPACE::CellLegal::isCellExcluded,
           "Whether the cell was dropped for not being inside the block")
      .def("isCellDeadlocked", &PROJECT_NAMESPACE::CellLegal::isCellDeadlocked,
           "Whether the cell was reverted for oscillating")
      .def("report", &PROJECT_NAMESPACE::CellLegal::report,
           py::return_value_policy::reference_internal,
           "Get the summary of the last solve")
      .def("runtimeLegalization",
           &PROJECT_NAMESPACE::CellLegal::runtimeLegalization,
           "Get the run time of the last solve in us")
      .def("logScreenOn", &PROJECT_NAMESPACE::CellLegal::logScreenOn)
      .def("logScreenOff", &PROJECT_NAMESPACE::CellLegal::logScreenOff)
      .def("openLogFile", &PROJECT_NAMESPACE::CellLegal::openLogFile)
      .def("closeLogFile", &PROJECT_NAMESPACE::CellLegal::closeLogFile);
}
