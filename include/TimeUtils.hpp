#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

// UTC, ISO-8601 with seconds precision. Used for sessions.created_at.
inline std::string ToIsoTimestampUtc(std::chrono::system_clock::time_point TimePoint)
{
    std::time_t Time = std::chrono::system_clock::to_time_t(TimePoint);
    std::tm Utc{};

#ifdef _WIN32
    gmtime_s(&Utc, &Time);
#else
    gmtime_r(&Time, &Utc);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Utc, "%Y-%m-%dT%H:%M:%SZ");
    return Stream.str();
}
