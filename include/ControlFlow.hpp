#pragma once

#include <atomic>
#include <string>

#include "ConfigParser.hpp"
#include "CatalogEngine.hpp"

// Exit codes: 0 done, 1 config or run failure, 2 cancelled.
class ControlFlow
{
public:
    ControlFlow() = default;

    int Run(const std::string& ConfigFile, const std::atomic<bool>* CancelFlag = nullptr);

private:
    ConfigParser Parser;

    void LogSourcesExcludes();
    void PrintSummary(const CatalogEngine& Engine);
};
