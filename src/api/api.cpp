/**
 * @file api.cpp
 * @brief The top level cpp for initialize the pybind module
 * @author Keren Zhu
 * @date 12/16/2019
 */

#include "global/global.h"
#include <pybind11/pybind11.h>

namespace py = pybind11;

void initCellLegalAPI(py::module &);
void initPointAPI(py::module &);
void initBoxAPI(py::module &);
void initReportAPI(py::module &);

PYBIND11_MODULE(CellLegalPy, m) {
  m.doc() = "Standard cell overlap legalization";
  initPointAPI(m);
  initBoxAPI(m);
  initReportAPI(m);
  initCellLegalAPI(m);
}
