/**
 * @file MsgPrinter.h
 * @brief Message printer with time stamp and message type
 * @author Keren Zhu
 * @date 09/30/2019
 */

#ifndef CELLLEGAL_MSG_PRINTER_H_
#define CELLLEGAL_MSG_PRINTER_H_

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <string>
#include "global/namespace.h"

PROJECT_NAMESPACE_BEGIN

/// @brief The types of messages
enum class MsgType
{
    INF,
    WRN,
    ERR,
    DBG
};

/// @class CELLLEGAL::MsgPrinter
/// @brief printf-style logger. Messages go to the screen (stderr) and, if opened, to a log file
class MsgPrinter
{
    public:
        /// @brief print to screen
        static void screenOn() { _screenOutStream = stderr; }
        /// @brief stop printing to screen
        static void screenOff() { _screenOutStream = nullptr; }
        /// @brief open a log file. Any opened log file is closed first
        /// @param the name of the log file
        static void openLogFile(const std::string &file);
        /// @brief close the log file if there is one
        static void closeLogFile();
        static void inf(const char *rawFormat, ...);
        static void wrn(const char *rawFormat, ...);
        static void err(const char *rawFormat, ...);
        static void dbg(const char *rawFormat, ...);

    private:
        static void print(MsgType type, const char *rawFormat, va_list args);
        static std::string messageTypeString(MsgType type);

    private:
        static std::time_t _startTime; ///< The reference time, the program start
        static FILE *_screenOutStream; ///< The screen stream, nullptr if screen is off
        static FILE *_logOutStream; ///< The log file stream, nullptr if no log file
        static std::string _logFileName; ///< The name of the log file
};

PROJECT_NAMESPACE_END

#define INF(...) PROJECT_NAMESPACE::MsgPrinter::inf(__VA_ARGS__)
#define WRN(...) PROJECT_NAMESPACE::MsgPrinter::wrn(__VA_ARGS__)
#define ERR(...) PROJECT_NAMESPACE::MsgPrinter::err(__VA_ARGS__)
#ifdef DEBUG_LEGALIZE
#define DBG(...) PROJECT_NAMESPACE::MsgPrinter::dbg(__VA_ARGS__)
#else
#define DBG(...) do {} while (false)
#endif

#endif /// CELLLEGAL_MSG_PRINTER_H_
