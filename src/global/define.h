/**
 * @file define.h
 * @brief Define the flags
 * @author Keren Zhu
 * @date 09/30/2019
 */

#ifndef CELLLEGAL_DEFINE_H_
#define CELLLEGAL_DEFINE_H_

//#define NODEBUG
//#define DEBUG_LEGALIZE

#ifdef NODEBUG
#define AT(vec, idx) vec[idx]
#else
#define AT(vec, idx) vec.at(idx)
#endif /// NODEBUG

#endif /// CELLLEGAL_DEFINE_H_
