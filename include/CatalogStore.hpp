#pragma once

#include <string>
#include <vector>

#include "CatalogConfig.hpp"
#include "FileRecord.hpp"

struct sqlite3;

struct CatalogSession
{
    std::string SessionId;
    std::vector<std::string> SearchDirs;
    std::string BaseDir;
    HashAlgorithm Algorithm = HashAlgorithm::Blake3;
    size_t BufferSize = 65536;
    size_t FlushThreshold = 100;
    std::string CreatedAt;
};

// Loads prior catalog state and persists newly admitted records in buffered batches.
// Single writer: the SQLite connection holds an exclusive lock until Close().
class CatalogStore
{
public:
    explicit CatalogStore(const CatalogConfig& Config);
    ~CatalogStore();

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    // Applies Config.Policy when the destination already exists. Throws StoreConflict or StoreError.
    void Open();
    void BeginSession(const CatalogSession& Session);
    bool HasSession(const std::string& SessionId);

    // Existing-origin records from the configured CSV catalog and/or prior store, in import order.
    std::vector<FileRecord> LoadExisting();
    std::vector<FileRecord> LoadFromTable(const std::string& CsvPath);
    std::vector<FileRecord> LoadFromStore(const std::string& StorePath, const std::string& SessionId);

    // Buffers a record and flushes once the threshold is reached. Returns true if a flush happened.
    bool Enqueue(const FileRecord& Record);

    // Writes the buffer as one transaction and clears it. Returns the number of records written.
    size_t Flush();

    // Flushes whatever is still buffered and releases the store.
    void Close();

    bool IsOpen() const;
    size_t GetBufferedCount() const;
    size_t GetFlushedCount() const;
    size_t GetIgnoredCount() const;
    size_t GetRehashCount() const;
    size_t GetImportSkipCount() const;
    size_t CountStoredFiles();

    static size_t CountFiles(const std::string& StorePath, const std::string& SessionId);

private:
    const CatalogConfig& Config;
    sqlite3* Db = nullptr;
    std::string CurrentSessionId;

    std::vector<FileRecord> Buffer;
    size_t FlushedCount = 0;
    size_t IgnoredCount = 0;
    size_t RehashCount = 0;
    size_t ImportSkipCount = 0;

    void CreateSchema();
    void AcceptChecksum(FileRecord& Record, uint64_t Size, const std::string& Checksum, const std::string& Algorithm);
};
