#pragma once

#include <string>
#include <vector>
#include <cstddef>

enum class StorePolicy
{
    Append,
    Overwrite,
    Error
};

enum class HashAlgorithm
{
    Blake3,
    Sha1,
    Sha256
};

std::string ToString(StorePolicy Policy);
std::string ToString(HashAlgorithm Algorithm);
bool ParseStorePolicy(const std::string& Value, StorePolicy& Out);
bool ParseHashAlgorithm(const std::string& Value, HashAlgorithm& Out);

// Built once by ConfigParser (or directly by tests) and handed to every component by const reference.
struct CatalogConfig
{
    std::vector<std::string> SearchDirs;
    std::string BaseDir;
    std::vector<std::string> ExcludeDirs;

    std::string ExistingCatalog;
    std::string ExistingStore;
    std::string ExistingSession;
    bool RequireExisting = true;

    std::string StorePath = "document_catalog.db";
    StorePolicy Policy = StorePolicy::Error;

    std::string ExportPath;
    bool AllowExportOverwrite = false;

    std::string SessionId;
    bool CheckContents = true;
    HashAlgorithm Algorithm = HashAlgorithm::Blake3;
    size_t HashBufferSize = 65536;
    size_t FlushThreshold = 100;
    unsigned short int ThreadCount = 2;
    bool Verbose = false;

    std::string LogDir = "Catalog_Logs";
    unsigned short int MaxLogFiles = 10;

    // BaseDir if set, otherwise the first search root.
    std::string EffectiveBaseDir() const;
};

// Throws FatalConfigError for settings that must abort the run before any work.
void ValidateConfig(const CatalogConfig& Config);

std::string GenerateSessionId();
