#include "CatalogConfig.hpp"
#include "CatalogErrors.hpp"

#include <filesystem>
#include <random>
#include <unordered_map>

namespace FS = std::filesystem;

std::string ToString(StorePolicy Policy)
{
    switch (Policy)
    {
    case StorePolicy::Append:    return "Append";
    case StorePolicy::Overwrite: return "Overwrite";
    case StorePolicy::Error:     return "Error";
    default:                     return "Unknown";
    }
}

std::string ToString(HashAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case HashAlgorithm::Blake3: return "blake3";
    case HashAlgorithm::Sha1:   return "sha1";
    case HashAlgorithm::Sha256: return "sha256";
    default:                    return "unknown";
    }
}

bool ParseStorePolicy(const std::string& Value, StorePolicy& Out)
{
    static const std::unordered_map<std::string, StorePolicy> PolicyMap = {
        { "Append",    StorePolicy::Append },
        { "Overwrite", StorePolicy::Overwrite },
        { "Error",     StorePolicy::Error }
    };

    auto it = PolicyMap.find(Value);
    if (it == PolicyMap.end())
    {
        return false;
    }
    Out = it->second;
    return true;
}

bool ParseHashAlgorithm(const std::string& Value, HashAlgorithm& Out)
{
    static const std::unordered_map<std::string, HashAlgorithm> AlgorithmMap = {
        { "blake3", HashAlgorithm::Blake3 },
        { "sha1",   HashAlgorithm::Sha1 },
        { "sha256", HashAlgorithm::Sha256 }
    };

    auto it = AlgorithmMap.find(Value);
    if (it == AlgorithmMap.end())
    {
        return false;
    }
    Out = it->second;
    return true;
}

std::string CatalogConfig::EffectiveBaseDir() const
{
    if (!BaseDir.empty())
    {
        return BaseDir;
    }
    if (!SearchDirs.empty())
    {
        return SearchDirs.front();
    }
    return {};
}

void ValidateConfig(const CatalogConfig& Config)
{
    if (Config.SearchDirs.empty())
    {
        throw FatalConfigError("No search directories configured.");
    }
    if (Config.FlushThreshold == 0)
    {
        throw FatalConfigError("Flush threshold must be greater than zero.");
    }
    if (Config.HashBufferSize == 0)
    {
        throw FatalConfigError("Hash buffer size must be greater than zero.");
    }
    if (Config.StorePath.empty())
    {
        throw FatalConfigError("No store destination configured.");
    }

    if (!Config.ExportPath.empty())
    {
        FS::path ExportPath(Config.ExportPath);
        if (ExportPath.extension() != ".csv")
        {
            throw FatalConfigError("Export path must have a .csv extension: " + Config.ExportPath);
        }
        std::error_code ec;
        if (FS::exists(ExportPath, ec) && !Config.AllowExportOverwrite)
        {
            throw FatalConfigError("Export file already exists and overwrite is not allowed: " + Config.ExportPath);
        }
        FS::path Parent = FS::absolute(ExportPath, ec).parent_path();
        if (!Parent.empty() && !FS::is_directory(Parent, ec))
        {
            throw FatalConfigError("Export directory does not exist: " + Parent.string());
        }
    }

    if (!Config.ExistingCatalog.empty())
    {
        std::error_code ec;
        if (!FS::is_regular_file(Config.ExistingCatalog, ec) && Config.RequireExisting)
        {
            throw FatalConfigError("Existing catalog file not found: " + Config.ExistingCatalog);
        }
    }

    if (!Config.ExistingStore.empty())
    {
        std::error_code ec;
        if (!FS::exists(Config.ExistingStore, ec) && Config.RequireExisting)
        {
            throw FatalConfigError("Existing store not found: " + Config.ExistingStore);
        }
    }

    if (!Config.ExistingStore.empty() && Config.Policy == StorePolicy::Overwrite)
    {
        std::error_code ec;
        FS::path Existing = FS::absolute(Config.ExistingStore, ec).lexically_normal();
        FS::path Destination = FS::absolute(Config.StorePath, ec).lexically_normal();
        if (Existing == Destination)
        {
            throw FatalConfigError("Store policy Overwrite would erase the existing store being imported: " + Config.StorePath);
        }
    }
}

std::string GenerateSessionId()
{
    static const char Letters[] = "abcdefghijklmnopqrstuvwxyz";
    std::random_device Device;
    std::mt19937 Generator(Device());
    std::uniform_int_distribution<int> Distribution(0, 25);

    std::string Id;
    for (int i = 0; i < 4; ++i)
    {
        Id += Letters[Distribution(Generator)];
    }
    return Id;
}
