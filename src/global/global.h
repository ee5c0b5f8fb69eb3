/**
 * @file global.h
 * @brief The header including everything needed globally
 * @author Keren Zhu
 * @date 09/30/2019
 */

#ifndef CELLLEGAL_GLOBAL_H_
#define CELLLEGAL_GLOBAL_H_

#include "type.h"
#include "define.h"
#include "parameter.h"
#include "util/MsgPrinter.h"
#include "util/Assert.h"
#include "util/StopWatch.hpp"
#include "util/box.hpp"

#endif /// CELLLEGAL_GLOBAL_H_
