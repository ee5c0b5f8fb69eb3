#include "MsgPrinter.h"

PROJECT_NAMESPACE_BEGIN

std::time_t MsgPrinter::_startTime = std::time(nullptr);
FILE * MsgPrinter::_screenOutStream = stderr;
FILE * MsgPrinter::_logOutStream = nullptr;
std::string MsgPrinter::_logFileName = "";

void MsgPrinter::openLogFile(const std::string &file)
{
    closeLogFile();
    _logFileName = file;
    _logOutStream = std::fopen(file.c_str(), "w");
    if (_logOutStream == nullptr)
    {
        err("MsgPrinter::%s cannot open log file %s \n", __FUNCTION__, file.c_str());
    }
}

void MsgPrinter::closeLogFile()
{
    if (_logOutStream != nullptr)
    {
        std::fclose(_logOutStream);
        _logOutStream = nullptr;
    }
    _logFileName.clear();
}

void MsgPrinter::inf(const char *rawFormat, ...)
{
    va_list args;
    va_start(args, rawFormat);
    print(MsgType::INF, rawFormat, args);
    va_end(args);
}

void MsgPrinter::wrn(const char *rawFormat, ...)
{
    va_list args;
    va_start(args, rawFormat);
    print(MsgType::WRN, rawFormat, args);
    va_end(args);
}

void MsgPrinter::err(const char *rawFormat, ...)
{
    va_list args;
    va_start(args, rawFormat);
    print(MsgType::ERR, rawFormat, args);
    va_end(args);
}

void MsgPrinter::dbg(const char *rawFormat, ...)
{
    va_list args;
    va_start(args, rawFormat);
    print(MsgType::DBG, rawFormat, args);
    va_end(args);
}

void MsgPrinter::print(MsgType type, const char *rawFormat, va_list args)
{
    std::time_t now = std::time(nullptr);
    double elapsed = std::difftime(now, _startTime);
    std::string format = messageTypeString(type);
    char header[64];
    std::snprintf(header, sizeof(header), "[%-5s | %8.0fs] ", format.c_str(), elapsed);

    if (_screenOutStream != nullptr)
    {
        va_list screenArgs;
        va_copy(screenArgs, args);
        std::fputs(header, _screenOutStream);
        std::vfprintf(_screenOutStream, rawFormat, screenArgs);
        std::fflush(_screenOutStream);
        va_end(screenArgs);
    }
    if (_logOutStream != nullptr)
    {
        va_list logArgs;
        va_copy(logArgs, args);
        std::fputs(header, _logOutStream);
        std::vfprintf(_logOutStream, rawFormat, logArgs);
        std::fflush(_logOutStream);
        va_end(logArgs);
    }
}

std::string MsgPrinter::messageTypeString(MsgType type)
{
    switch (type)
    {
        case MsgType::INF: return "INFO";
        case MsgType::WRN: return "WARN";
        case MsgType::ERR: return "ERROR";
        case MsgType::DBG: return "DEBUG";
        default: return "";
    }
}

PROJECT_NAMESPACE_END
