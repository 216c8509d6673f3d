#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "CatalogErrors.hpp"

enum class RecordOrigin
{
    Existing,
    New
};

using ExtraAttributes = std::vector<std::pair<std::string, std::string>>;

struct FileRecord
{
    std::string AbsolutePath;
    std::string RelativePath;
    std::string Name;
    std::string Extension;
    uint64_t Size = 0;

    // Unset until the identity is resolved, and stays unset if the file could not be read.
    std::optional<std::string> Checksum;
    std::string ChecksumAlgorithm;
    std::string FileKey;
    bool IdentityResolved = false;
    IOStatus Status = IOStatus::Ok;

    bool IsDuplicate = false;
    RecordOrigin Origin = RecordOrigin::New;
    ExtraAttributes Extras;

    void SetIdentity(uint64_t NewSize, std::string NewChecksum, const std::string& Algorithm);
    void SetUnidentified(IOStatus Failure, uint64_t KnownSize);
    void ClearIdentity();

    std::vector<std::string> Subdirectories() const;
    std::string HumanReadableSize() const;

    static FileRecord FromWalk(const std::filesystem::path& Path, const std::filesystem::path& BaseDir);
    static FileRecord FromImportRow(const std::string& FilePath, const std::filesystem::path& BaseDir);
    static FileRecord FromStoreRow(const std::string& StoredBaseDir, const std::string& StoredRelativePath, const std::filesystem::path& BaseDir);
};

// BLAKE3 truncated to 16 bytes over AbsolutePath, a NUL separator and the checksum.
std::string ComputeFileKey(const std::string& AbsolutePath, const std::string& Checksum);

std::string HumanReadable(uint64_t Size, int Precision = 0);

std::string MakeRelativePath(const std::filesystem::path& Path, const std::filesystem::path& BaseDir);
