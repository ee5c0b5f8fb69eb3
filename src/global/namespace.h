/**
 * @file namespace.h
 * @brief Define the project namespace macros
 * @author Keren Zhu
 * @date 09/30/2019
 */

#ifndef CELLLEGAL_NAMESPACE_H_
#define CELLLEGAL_NAMESPACE_H_

#define PROJECT_NAMESPACE CELLLEGAL
#define PROJECT_NAMESPACE_BEGIN namespace PROJECT_NAMESPACE {
#define PROJECT_NAMESPACE_END }

#endif /// CELLLEGAL_NAMESPACE_H_
