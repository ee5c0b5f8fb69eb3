/**
 * @file Assert.h
 * @brief Assertions that print the failed condition through the message printer
 * @author Keren Zhu
 * @date 09/30/2019
 */

#ifndef CELLLEGAL_ASSERT_H_
#define CELLLEGAL_ASSERT_H_

#include <cassert>
#include "MsgPrinter.h"

#ifndef NDEBUG
#define Assert(cond) \
    do { \
        if (!(cond)) { \
            ERR("Assertion failed: %s, file %s, line %d \n", #cond, __FILE__, __LINE__); \
            assert(cond); \
        } \
    } while (false)

#define AssertMsg(cond, ...) \
    do { \
        if (!(cond)) { \
            ERR(__VA_ARGS__); \
            ERR("Assertion failed: %s, file %s, line %d \n", #cond, __FILE__, __LINE__); \
            assert(cond); \
        } \
    } while (false)
#else
#define Assert(cond) do { (void)sizeof(cond); } while (false)
#define AssertMsg(cond, ...) do { (void)sizeof(cond); } while (false)
#endif /// NDEBUG

#endif /// CELLLEGAL_ASSERT_H_
