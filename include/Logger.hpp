#pragma once

#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel
{
    INFO,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    bool Init(const std::string& LogDir);
    void Log(LogLevel Level, const std::string& Message);
    void Info(const std::string& Message);
    void Error(const std::string& Message);
    void CleanupOldLogs(unsigned short int MaxLogFiles);

    bool IsOpen();

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::mutex LogWriteMutex;
    std::string CurrentLogDir;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    bool OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
