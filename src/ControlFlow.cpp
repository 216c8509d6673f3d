#include <iostream>
#include <string>

#include "ControlFlow.hpp"
#include "Logger.hpp"

int ControlFlow::Run(const std::string& ConfigFile, const std::atomic<bool>* CancelFlag)
{
    std::cout << "Starting DupliCat \n";

    if (!Parser.Parse(ConfigFile))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
        }
        std::cerr << "Check Errors and Fix Them, Exiting Catalog Run\n";
        return 1;
    }

    const CatalogConfig& Config = Parser.GetConfig();
    if (!Log.Init(Config.LogDir))
    {
        std::cerr << "Failed to open log file in: " << Config.LogDir << "\n";
    }
    Log.CleanupOldLogs(Config.MaxLogFiles);

    Log.Info("Config Parsed Successfully.");
    std::cout << "Config Parsed Successfully.\n";
    for (const auto& Info : Parser.GetInfos())
    {
        std::cout << "Config Info: " << Info << "\n";
        Log.Info(Info);
    }
    LogSourcesExcludes();

    CatalogEngine Engine(Config, CancelFlag);
    if (Config.Verbose)
    {
        Engine.SetProgressCallback([](const CatalogSummary& Progress)
        {
            std::cout << "Progress: " << Progress.NewAdmitted << " new, " << Progress.Flushed << " stored\n";
        });
    }
    const EngineState Result = Engine.Run();

    PrintSummary(Engine);
    if (Log.IsOpen())
    {
        std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    }

    switch (Result)
    {
    case EngineState::Done:
        std::cout << "Catalog Complete \n";
        return 0;
    case EngineState::Cancelled:
        std::cout << "Catalog Cancelled. Flushed records were kept.\n";
        return 2;
    default:
        std::cerr << "Catalog FAILED: " << Engine.GetFailureReason() << "\n";
        return 1;
    }
}

void ControlFlow::LogSourcesExcludes()
{
    const CatalogConfig& Config = Parser.GetConfig();

    Log.Info("Sources:");
    for (const auto& Source : Config.SearchDirs)
    {
        Log.Info("  " + Source);
    }

    Log.Info("Store:");
    Log.Info("  " + Config.StorePath + " (" + ToString(Config.Policy) + ")");

    if (!Config.ExcludeDirs.empty())
    {
        Log.Info("Excludes:");
        for (const auto& Exclude : Config.ExcludeDirs)
        {
            Log.Info("  " + Exclude);
        }
    }
}

void ControlFlow::PrintSummary(const CatalogEngine& Engine)
{
    const CatalogSummary& Summary = Engine.GetSummary();

    std::cout << "Session ID         : " << Engine.GetSession().SessionId << "\n";
    std::cout << "Existing Loaded    : " << Summary.ExistingLoaded << "\n";
    std::cout << "New Admitted       : " << Summary.NewAdmitted << "\n";
    std::cout << "Already Known      : " << Summary.AlreadyKnown << "\n";
    std::cout << "Duplicates         : " << Summary.Duplicates << "\n";
    std::cout << "Records Flushed    : " << Summary.Flushed << "\n";
    std::cout << "Store Ignored      : " << Summary.StoreIgnored << "\n";
    std::cout << "Rehashed           : " << Summary.Rehashed << "\n";
    std::cout << "Unreadable Files   : " << Summary.IOSkips << "\n";
    std::cout << "Walk Skips         : " << Summary.WalkSkips << "\n";
    std::cout << "Import Rows Skipped: " << Summary.ImportSkips << "\n";
}
