/**
 * @file reportApi.cpp
 * @brief The pybind11 interface for the legalization summary
 * @author Keren Zhu
 * @date 04/12/2021
 */

#include "place/MovementReporter.h"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

void initReportAPI(py::module &m) {
  using STATUS = PROJECT_NAMESPACE::LegalizeStatusType;
  py::enum_<STATUS>(m, "LegalizeStatus")
      .value("LEGAL", STATUS::LEGAL)
      .value("DEADLOCKED_CELLS", STATUS::DEADLOCKED_CELLS)
      .value("ITERATION_LIMIT", STATUS::ITERATION_LIMIT)
      .value("STALLED", STATUS::STALLED)
      .value("CONFIG_ERROR", STATUS::CONFIG_ERROR);

  using MOVE = PROJECT_NAMESPACE::CellMovement;
  py::class_<MOVE>(m, "CellMovement")
      .def_readonly("cellIdx", &MOVE::cellIdx)
      .def_readonly("name", &MOVE::name)
      .def_readonly("origin", &MOVE::from)
      .def_readonly("final", &MOVE::to)
      .def_readonly("displacement", &MOVE::displacement)
      .def_readonly("deadlocked", &MOVE::deadlocked);

  using REPORT = PROJECT_NAMESPACE::MovementReport;
  py::class_<REPORT>(m, "MovementReport")
      .def("movements", &REPORT::movements, "Per-cell movements")
      .def("maxDisplacement", &REPORT::maxDisplacement,
           "The largest Manhattan displacement")
      .def("maxDisplacementCell", &REPORT::maxDisplacementCell,
           "The index of the cell with the largest displacement")
      .def("maxDisplacementCellName", &REPORT::maxDisplacementCellName,
           "The name of the cell with the largest displacement")
      .def("totalDisplacement", &REPORT::totalDisplacement)
      .def("averageDisplacement", &REPORT::averageDisplacement)
      .def("status", &REPORT::status, "How the legalization terminated")
      .def("isLegal", &REPORT::isLegal)
      .def("numPasses", &REPORT::numPasses)
      .def("numMoves", &REPORT::numMoves)
      .def("deadlockedCells", &REPORT::deadlockedCells,
           "Cells reverted to their start location for oscillating")
      .def("unresolvedCells", &REPORT::unresolvedCells,
           "Cells still in conflict")
      .def("excludedCells", &REPORT::excludedCells,
           "Cells dropped for not being inside the block");
}
