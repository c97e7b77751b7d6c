#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

using namespace std;

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Always shown
        WARNING = 1, // Recoverable problems (capture, persistence)
        INFO = 2,    // Turn lifecycle, darts, board state
        DEBUG = 3    // Per-frame detail
    };

    // Global settings
    inline LogLevel globalLogLevel = LogLevel::WARNING;
    inline bool showTimestamp = false;
    inline bool enableFileLogging = false; // Library users get console only, the executable turns this on
    inline string logFilePath = "debug_frames/dartsight.log";
    inline mutex logMutex; // The tracker loop and the event service log from different threads

    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    inline LogLevel getLogLevel()
    {
        return globalLogLevel;
    }

    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    inline void setFileLogging(bool enable, const string &filepath = "debug_frames/dartsight.log")
    {
        lock_guard<mutex> lock(logMutex);
        enableFileLogging = enable;
        logFilePath = filepath;

        if (!enable)
            return;

        filesystem::path parent = filesystem::path(logFilePath).parent_path();
        if (!parent.empty())
        {
            error_code ec;
            filesystem::create_directories(parent, ec);
            if (ec)
            {
                cerr << "[logging] cannot create " << parent << ": " << ec.message() << endl;
                enableFileLogging = false;
                return;
            }
        }

        ofstream logFile(logFilePath, ios::app);
        if (logFile.is_open())
        {
            logFile << "\n========== DartSight Session Started ==========\n";
        }
    }

    inline string getCurrentTimestamp()
    {
        auto now = chrono::system_clock::now();
        auto time_t = chrono::system_clock::to_time_t(now);
        auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;

        tm local_tm{};
        localtime_r(&time_t, &local_tm);

        stringstream ss;
        ss << put_time(&local_tm, "%H:%M:%S");
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

// Highlight a number in console output
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")

    // "namespace::function" -> "NAMESPACE", "Class::method" -> "CLASS"
    inline string extractModuleName(const string &function)
    {
        if (function.find("logging::") != string::npos)
        {
            return "SYSTEM";
        }

        size_t parenPos = function.find('(');
        string signature = parenPos == string::npos ? function : function.substr(0, parenPos);

        // Qualifier of the function name itself, not of its return type
        size_t lastColon = signature.rfind("::");
        if (lastColon == string::npos)
        {
            return "SYSTEM";
        }

        size_t startPos = 0;
        size_t spacePos = signature.rfind(' ', lastColon);
        if (spacePos != string::npos)
        {
            startPos = spacePos + 1;
        }

        size_t colonPos = signature.find("::", startPos);
        string moduleName = signature.substr(startPos, colonPos - startPos);
        transform(moduleName.begin(), moduleName.end(), moduleName.begin(), ::toupper);
        return moduleName.empty() ? "SYSTEM" : moduleName;
    }

    inline string stripColorCodes(const string &text)
    {
        string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos == string::npos)
            {
                break;
            }
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

        const string timestampColor = "\033[32m";
        const string bracketColor = "\033[37m";
        const string moduleColor = "\033[90m";
        const string resetCode = "\033[0m";
        string levelColor;

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

        string consoleMessage;
        if (showTimestamp)
        {
            consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
        }
        consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
        consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
        consoleMessage += " - " + message;

        lock_guard<mutex> lock(logMutex);
        cout << consoleMessage << endl;

        // File log always carries the timestamp and never colours
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

// Module name comes from the calling function's namespace or class
#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

}
