#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "CatalogConfig.hpp"
#include "CatalogStore.hpp"
#include "FileRecord.hpp"
#include "IdentityResolver.hpp"

enum class EngineState
{
    Init,
    LoadingExisting,
    Walking,
    Deduplicating,
    Flushing,
    Exporting,
    Done,
    Failed,
    Cancelled
};

std::string ToString(EngineState State);

struct CatalogSummary
{
    size_t ExistingLoaded = 0;
    size_t NewAdmitted = 0;
    size_t AlreadyKnown = 0;
    size_t IOSkips = 0;
    size_t WalkSkips = 0;
    size_t ImportSkips = 0;
    size_t Duplicates = 0;
    size_t Flushed = 0;
    size_t StoreIgnored = 0;
    size_t Rehashed = 0;
};

// One catalog run: Init -> LoadingExisting -> Walking -> Deduplicating -> Flushing -> Exporting -> Done.
// Any fatal CatalogError moves the engine to Failed. A cancel request during the walk ends in Cancelled
// after the buffered records have been flushed.
class CatalogEngine
{
public:
    explicit CatalogEngine(const CatalogConfig& Config, const std::atomic<bool>* CancelFlag = nullptr);
    ~CatalogEngine();

    // Called after each batch of walked files is admitted and queued for the store.
    using ProgressCallback = std::function<void(const CatalogSummary&)>;
    void SetProgressCallback(ProgressCallback Callback);

    CatalogEngine(const CatalogEngine&) = delete;
    CatalogEngine& operator=(const CatalogEngine&) = delete;

    EngineState Run();

    EngineState GetState() const;
    const std::vector<FileRecord>& GetRecords() const;
    const CatalogSummary& GetSummary() const;
    const CatalogSession& GetSession() const;
    const std::string& GetFailureReason() const;

private:
    const CatalogConfig& Config;
    const std::atomic<bool>* CancelFlag;
    ProgressCallback OnProgress;

    EngineState State = EngineState::Init;
    std::string FailureReason;

    CatalogSession Session;
    CatalogSummary Summary;
    std::unique_ptr<CatalogStore> Store;
    IdentityResolver Resolver;

    std::vector<FileRecord> Records;
    std::unordered_set<std::string> KnownKeys;
    std::unordered_set<std::string> KnownRelativePaths;
    std::unordered_set<std::string> UnidentifiedRelativePaths;

    void Transition(EngineState Next);
    bool CancelRequested() const;

    void InitStore();
    void LoadExisting();
    void Walk();
    void Deduplicate();
    void FlushRemaining();
    void Export();

    void AdmitBatch(std::vector<FileRecord>& Candidates);
    void ReportProgress();
    bool IsKnown(const FileRecord& Candidate) const;
    void Admit(FileRecord&& Record);
};
