#pragma once

#include <algorithm>
#include <iostream>
#include <fstream>
#include <string>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <sstream>

using namespace std;

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Most important - always show
        WARNING = 1, // Important - usually show
        INFO = 2,    // Normal - sometimes show
        DEBUG = 3    // Least important - rarely show
    };

    // Global settings, shared by every translation unit
    inline LogLevel globalLogLevel = LogLevel::WARNING; // Default: show ERROR and WARNING only
    inline bool showTimestamp = false;                  // Console timestamps off by default
    inline bool enableFileLogging = false;              // File logging off until --log-file
    inline string logFilePath = "logs/opendoorwatch.log";
    inline mutex logMutex; // HTTP handlers and stream threads log concurrently

    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    // Enable/disable file logging. Returns false when the file cannot be opened.
    inline bool setFileLogging(bool enable, const string &filepath = "logs/opendoorwatch.log")
    {
        lock_guard<mutex> lock(logMutex);
        enableFileLogging = enable;
        logFilePath = filepath;

        if (!enable)
            return true;

        ofstream logFile(logFilePath, ios::app);
        if (!logFile.is_open())
        {
            enableFileLogging = false;
            return false;
        }

        logFile << "\n========== OpenDoorwatch Session Started ==========\n";
        return true;
    }

    // Current time as HH:MM:SS.mmm
    inline string getCurrentTimestamp()
    {
        auto now = chrono::system_clock::now();
        auto time_t = chrono::system_clock::to_time_t(now);
        auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;

        tm local{};
        localtime_r(&time_t, &local);

        stringstream ss;
        ss << put_time(&local, "%H:%M:%S");
        ss << '.' << setfill('0') << setw(3) << ms.count();
        return ss.str();
    }

    inline string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNKNOWN";
        }
    }

// Highlight numbers in cyan
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")
// Highlight strings (paths, names) in cyan
#define log_string_src(value) ("\033[36m" + std::string(value) + "\033[0m")

    // "bool LiveSession::start()" -> "LIVESESSION", "void overlay::drawRoi(...)" -> "OVERLAY"
    inline string extractModuleName(const string &function)
    {
        if (function.find("logging::") != string::npos)
            return "SYSTEM";

        // Only look at the qualified name, not at the parameter list
        size_t parenPos = function.find('(');
        string signature = function.substr(0, parenPos);

        size_t colonPos = signature.rfind("::");
        if (colonPos == string::npos)
            return "SYSTEM";

        // Scope name is everything between the previous separator and the last ::
        size_t startPos = signature.find_last_of(" :*&", colonPos - 1);
        startPos = (startPos == string::npos) ? 0 : startPos + 1;

        string moduleName = signature.substr(startPos, colonPos - startPos);
        if (moduleName.empty())
            return "SYSTEM";

        transform(moduleName.begin(), moduleName.end(), moduleName.begin(), ::toupper);
        return moduleName;
    }

    // Strip ANSI color codes (for file logging)
    inline string stripColorCodes(const string &text)
    {
        string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos == string::npos)
                break;
            result.erase(pos, endPos - pos + 1);
        }

        return result;
    }

    inline void log(const string &message, LogLevel level = LogLevel::INFO, const string &moduleName = "SYSTEM")
    {
        if (level > globalLogLevel)
            return;

        string timestamp = getCurrentTimestamp();
        string levelStr = logLevelToString(level);

        string timestampColor = "\033[32m";
        string bracketColor = "\033[37m";
        string moduleColor = "\033[90m";
        string levelColor = "";
        string resetCode = "\033[0m";

        switch (level)
        {
        case LogLevel::ERROR:
            levelColor = "\033[91m";
            break;
        case LogLevel::WARNING:
            levelColor = "\033[33m";
            break;
        case LogLevel::INFO:
            levelColor = "\033[92m";
            break;
        case LogLevel::DEBUG:
            levelColor = "\033[34m";
            break;
        }

        string consoleMessage = "";

        if (showTimestamp)
        {
            consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
        }

        consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
        consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
        consoleMessage += " - " + message;

        lock_guard<mutex> lock(logMutex);
        cout << consoleMessage << endl;

        if (enableFileLogging)
        {
            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "[" << timestamp << "][" << levelStr << "][" << moduleName << "] - " << stripColorCodes(message) << endl;
            }
        }
    }

    inline void error(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::ERROR, module);
    }

    inline void warning(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::WARNING, module);
    }

    inline void info(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::INFO, module);
    }

    inline void debug(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::DEBUG, module);
    }

#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

}
