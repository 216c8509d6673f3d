#include "CatalogEngine.hpp"
#include "CatalogErrors.hpp"
#include "CatalogExporter.hpp"
#include "DirectoryWalker.hpp"
#include "DuplicateDetector.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace FS = std::filesystem;

std::string ToString(EngineState State)
{
    switch (State)
    {
    case EngineState::Init:            return "Init";
    case EngineState::LoadingExisting: return "LoadingExisting";
    case EngineState::Walking:         return "Walking";
    case EngineState::Deduplicating:   return "Deduplicating";
    case EngineState::Flushing:        return "Flushing";
    case EngineState::Exporting:       return "Exporting";
    case EngineState::Done:            return "Done";
    case EngineState::Failed:          return "Failed";
    case EngineState::Cancelled:       return "Cancelled";
    default:                           return "Unknown";
    }
}

CatalogEngine::CatalogEngine(const CatalogConfig& Config, const std::atomic<bool>* CancelFlag)
    : Config(Config), CancelFlag(CancelFlag), Resolver(Config.Algorithm, Config.HashBufferSize, Config.ThreadCount)
{
}

CatalogEngine::~CatalogEngine() = default;

void CatalogEngine::SetProgressCallback(ProgressCallback Callback)
{
    OnProgress = std::move(Callback);
}

EngineState CatalogEngine::GetState() const
{
    return State;
}

const std::vector<FileRecord>& CatalogEngine::GetRecords() const
{
    return Records;
}

const CatalogSummary& CatalogEngine::GetSummary() const
{
    return Summary;
}

const CatalogSession& CatalogEngine::GetSession() const
{
    return Session;
}

const std::string& CatalogEngine::GetFailureReason() const
{
    return FailureReason;
}

void CatalogEngine::Transition(EngineState Next)
{
    Log.Info("[CatalogEngine] " + ToString(State) + " -> " + ToString(Next));
    State = Next;
}

bool CatalogEngine::CancelRequested() const
{
    return CancelFlag && CancelFlag->load();
}

EngineState CatalogEngine::Run()
{
    try
    {
        InitStore();

        Transition(EngineState::LoadingExisting);
        LoadExisting();

        Transition(EngineState::Walking);
        Walk();

        if (State != EngineState::Cancelled)
        {
            Transition(EngineState::Deduplicating);
            Deduplicate();

            Transition(EngineState::Flushing);
            FlushRemaining();

            Transition(EngineState::Exporting);
            Export();

            Transition(EngineState::Done);
        }
    }
    catch (const CatalogError& e)
    {
        FailureReason = e.what();
    }
    catch (const std::exception& e)
    {
        FailureReason = std::string("Unexpected error: ") + e.what();
    }

    if (!FailureReason.empty())
    {
        Log.Error("[CatalogEngine] Run failed in state " + ToString(State) + ": " + FailureReason);
        Transition(EngineState::Failed);
        // Teardown flushes whatever was admitted before the failure.
        Store.reset();
    }

    Summary.IOSkips = Resolver.GetSkipCount();
    if (Store)
    {
        Summary.Flushed = Store->GetFlushedCount();
        Summary.StoreIgnored = Store->GetIgnoredCount();
    }

    Log.Info("[CatalogEngine] Summary: existing=" + std::to_string(Summary.ExistingLoaded) +
        " new=" + std::to_string(Summary.NewAdmitted) +
        " known=" + std::to_string(Summary.AlreadyKnown) +
        " duplicates=" + std::to_string(Summary.Duplicates) +
        " flushed=" + std::to_string(Summary.Flushed) +
        " io_skips=" + std::to_string(Summary.IOSkips) +
        " walk_skips=" + std::to_string(Summary.WalkSkips) +
        " rehashed=" + std::to_string(Summary.Rehashed));
    return State;
}

void CatalogEngine::InitStore()
{
    ValidateConfig(Config);

    std::error_code ec;
    FS::path BaseDir = FS::absolute(Config.EffectiveBaseDir(), ec);
    if (ec)
    {
        throw FatalConfigError("Invalid base directory: " + Config.EffectiveBaseDir());
    }

    Session.SearchDirs = Config.SearchDirs;
    Session.BaseDir = BaseDir.lexically_normal().string();
    Session.Algorithm = Config.Algorithm;
    Session.BufferSize = Config.HashBufferSize;
    Session.FlushThreshold = Config.FlushThreshold;
    Session.CreatedAt = ToIsoTimestampUtc(std::chrono::system_clock::now());

    Store = std::make_unique<CatalogStore>(Config);
    Store->Open();

    Session.SessionId = Config.SessionId;
    while (Session.SessionId.empty() || (Config.SessionId.empty() && Store->HasSession(Session.SessionId)))
    {
        Session.SessionId = GenerateSessionId();
    }
    Store->BeginSession(Session);

    if (Config.Verbose)
    {
        std::cout << "Session ID: " << Session.SessionId << "\n";
    }
    Log.Info("[CatalogEngine] Session ID: " + Session.SessionId);
}

void CatalogEngine::LoadExisting()
{
    std::vector<FileRecord> Loaded = Store->LoadExisting();
    Summary.Rehashed = Store->GetRehashCount();
    Summary.ImportSkips = Store->GetImportSkipCount();

    // Content comparison needs a checksum for every record already in the catalog.
    if (Config.CheckContents)
    {
        std::vector<FileRecord*> Unresolved;
        for (FileRecord& Record : Loaded)
        {
            if (!Record.IdentityResolved)
            {
                Unresolved.push_back(&Record);
            }
        }
        Resolver.EnsureAll(Unresolved);
    }

    for (FileRecord& Record : Loaded)
    {
        if (IsKnown(Record))
        {
            Log.Info("[CatalogEngine::LoadExisting] Imported record repeats an earlier one: " + Record.AbsolutePath);
            continue;
        }
        Admit(std::move(Record));
        ++Summary.ExistingLoaded;
    }

    if (Config.Verbose)
    {
        std::cout << "Existing Files Loaded: " << Summary.ExistingLoaded << "\n";
    }
    Log.Info("[CatalogEngine::LoadExisting] Existing Files Loaded: " + std::to_string(Summary.ExistingLoaded));
}

void CatalogEngine::Walk()
{
    if (Config.Verbose)
    {
        std::cout << "Searching...\n";
    }

    DirectoryWalker Walker(Config.SearchDirs, Config.ExcludeDirs, CancelFlag);
    const FS::path BaseDir(Session.BaseDir);

    std::vector<FileRecord> Batch;
    Batch.reserve(Config.FlushThreshold);

    FS::path Path;
    bool StoppedAtFlush = false;
    while (Walker.Next(Path))
    {
        Batch.push_back(FileRecord::FromWalk(Path, BaseDir));
        if (Batch.size() >= Config.FlushThreshold)
        {
            AdmitBatch(Batch);
            Batch.clear();
            ReportProgress();
            if (CancelRequested())
            {
                StoppedAtFlush = true;
                break;
            }
        }
    }

    Summary.WalkSkips = Walker.GetSkipCount();

    if (StoppedAtFlush || Walker.WasCancelled())
    {
        Log.Info("[CatalogEngine::Walk] Cancelled with " + std::to_string(Batch.size()) + " unadmitted candidates discarded.");
        Store->Close();
        Summary.Flushed = Store->GetFlushedCount();
        Summary.StoreIgnored = Store->GetIgnoredCount();
        Transition(EngineState::Cancelled);
        return;
    }

    if (!Batch.empty())
    {
        AdmitBatch(Batch);
    }

    if (Config.Verbose)
    {
        std::cout << "New Files Loaded: " << Summary.NewAdmitted << "\n";
    }
    Log.Info("[CatalogEngine::Walk] New Files Loaded: " + std::to_string(Summary.NewAdmitted) +
        " across " + std::to_string(Walker.GetDirectoryCount()) + " directories.");
}

// Hashing of the batch may run in parallel, admission always follows traversal order.
void CatalogEngine::AdmitBatch(std::vector<FileRecord>& Candidates)
{
    if (Config.CheckContents)
    {
        std::vector<FileRecord*> Pending;
        Pending.reserve(Candidates.size());
        for (FileRecord& Candidate : Candidates)
        {
            Pending.push_back(&Candidate);
        }
        Resolver.EnsureAll(Pending);
    }

    const size_t FirstAdmitted = Records.size();
    for (FileRecord& Candidate : Candidates)
    {
        if (IsKnown(Candidate))
        {
            ++Summary.AlreadyKnown;
            continue;
        }
        Admit(std::move(Candidate));
    }

    if (!Config.CheckContents)
    {
        std::vector<FileRecord*> Pending;
        for (size_t i = FirstAdmitted; i < Records.size(); ++i)
        {
            Pending.push_back(&Records[i]);
        }
        Resolver.EnsureAll(Pending);
    }

    for (size_t i = FirstAdmitted; i < Records.size(); ++i)
    {
        if (Config.Verbose)
        {
            std::cout << Records[i].Name << "\n";
        }
        ++Summary.NewAdmitted;
        Store->Enqueue(Records[i]);
    }
}

void CatalogEngine::ReportProgress()
{
    if (!OnProgress)
    {
        return;
    }
    Summary.IOSkips = Resolver.GetSkipCount();
    Summary.Flushed = Store->GetFlushedCount();
    Summary.StoreIgnored = Store->GetIgnoredCount();
    OnProgress(Summary);
}

bool CatalogEngine::IsKnown(const FileRecord& Candidate) const
{
    if (!Config.CheckContents || !Candidate.Checksum)
    {
        return KnownRelativePaths.count(Candidate.RelativePath) != 0;
    }
    return KnownKeys.count(Candidate.FileKey) != 0 || UnidentifiedRelativePaths.count(Candidate.RelativePath) != 0;
}

void CatalogEngine::Admit(FileRecord&& Record)
{
    KnownRelativePaths.insert(Record.RelativePath);
    if (Record.Checksum)
    {
        KnownKeys.insert(Record.FileKey);
    }
    else
    {
        UnidentifiedRelativePaths.insert(Record.RelativePath);
    }
    Records.push_back(std::move(Record));
}

void CatalogEngine::Deduplicate()
{
    Summary.Duplicates = DuplicateDetector::Detect(Records, Config.CheckContents);
}

void CatalogEngine::FlushRemaining()
{
    Store->Flush();
    Summary.Flushed = Store->GetFlushedCount();
    Summary.StoreIgnored = Store->GetIgnoredCount();
    Store->Close();
}

void CatalogEngine::Export()
{
    if (Config.ExportPath.empty())
    {
        Log.Info("[CatalogEngine::Export] No export path configured.");
        return;
    }

    // With content check off, imported records are only hashed when their checksum is exported.
    std::vector<FileRecord*> Unresolved;
    for (FileRecord& Record : Records)
    {
        if (!Record.IdentityResolved)
        {
            Unresolved.push_back(&Record);
        }
    }
    Resolver.EnsureAll(Unresolved);

    CatalogExporter::Export(Records, Session, Config);
    if (Config.Verbose)
    {
        std::cout << "Catalog exported to: " << Config.ExportPath << "\n";
    }
}
