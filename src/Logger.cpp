#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

static const char* const LogFilePrefix = "Catalog_Log";

bool Logger::Init(const std::string& LogDir)
{
    std::error_code ec;
    if (!FS::exists(LogDir, ec))
    {
        FS::create_directories(LogDir, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << LogDir << " (" << ec.message() << ")\n";
            return false;
        }
    }

    CurrentLogDir = LogDir;
    CurrentLogFilePath = (FS::path(LogDir) / (std::string(LogFilePrefix) + GetTimestampForFilename() + ".txt")).string();

    if (!OpenLogFile(CurrentLogFilePath))
    {
        return false;
    }

    Info("Catalog Run Started at " + GetTimestamp());
    return true;
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("Catalog Run Finished at " + GetTimestamp());
        LogFile.close();
    }
}

bool Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
        return false;
    }
    return true;
}

bool Logger::IsOpen()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return LogFile.is_open();
}

// Keeps the newest MaxLogFiles logs. Names sort chronologically because of the timestamp suffix.
void Logger::CleanupOldLogs(unsigned short int MaxLogFiles)
{
    if (CurrentLogDir.empty())
    {
        return;
    }

    std::vector<FS::path> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(CurrentLogDir, ec))
    {
        std::error_code EntryError;
        if (Entry.is_regular_file(EntryError) && Entry.path().filename().string().find(LogFilePrefix) == 0)
        {
            Logs.push_back(Entry.path());
        }
    }
    if (ec)
    {
        Error("[Logger::CleanupOldLogs] Cannot list log directory: " + ec.message());
        return;
    }

    if (Logs.size() <= MaxLogFiles)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::path& A, const FS::path& B)
    {
        return A.filename().string() < B.filename().string();
    });

    size_t ToRemove = Logs.size() - MaxLogFiles;
    for (size_t i = 0; i < ToRemove; ++i)
    {
        std::error_code RemoveError;
        if (!FS::remove(Logs[i], RemoveError) && RemoveError)
        {
            Error("[Logger::CleanupOldLogs] Failed to remove " + Logs[i].string() + ": " + RemoveError.message());
        }
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
