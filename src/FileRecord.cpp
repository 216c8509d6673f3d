#include "FileRecord.hpp"

#include <blake3.h>
#include <cstdio>

#include "HashAccumulator.hpp"

namespace FS = std::filesystem;

void FileRecord::SetIdentity(uint64_t NewSize, std::string NewChecksum, const std::string& Algorithm)
{
    Size = NewSize;
    Checksum = std::move(NewChecksum);
    ChecksumAlgorithm = Algorithm;
    FileKey = ComputeFileKey(AbsolutePath, *Checksum);
    IdentityResolved = true;
    Status = IOStatus::Ok;
}

void FileRecord::SetUnidentified(IOStatus Failure, uint64_t KnownSize)
{
    Size = KnownSize;
    Checksum.reset();
    ChecksumAlgorithm.clear();
    FileKey = ComputeFileKey(AbsolutePath, "");
    IdentityResolved = true;
    Status = Failure;
}

void FileRecord::ClearIdentity()
{
    Checksum.reset();
    ChecksumAlgorithm.clear();
    FileKey.clear();
    IdentityResolved = false;
    Status = IOStatus::Ok;
}

std::vector<std::string> FileRecord::Subdirectories() const
{
    std::vector<std::string> Parts;
    FS::path Parent = FS::path(RelativePath).lexically_normal().parent_path();
    for (const auto& Part : Parent)
    {
        std::string Component = Part.string();
        if (!Component.empty() && Component != ".")
        {
            Parts.push_back(std::move(Component));
        }
    }
    return Parts;
}

std::string FileRecord::HumanReadableSize() const
{
    return HumanReadable(Size);
}

FileRecord FileRecord::FromWalk(const FS::path& Path, const FS::path& BaseDir)
{
    FileRecord Record;
    std::error_code ec;
    FS::path Absolute = FS::absolute(Path, ec);
    if (ec)
    {
        Absolute = Path;
    }
    Absolute = Absolute.lexically_normal();

    Record.AbsolutePath = Absolute.string();
    Record.RelativePath = MakeRelativePath(Absolute, BaseDir);
    Record.Name = Absolute.filename().string();
    Record.Extension = Absolute.extension().string();
    Record.Origin = RecordOrigin::New;
    return Record;
}

FileRecord FileRecord::FromImportRow(const std::string& FilePath, const FS::path& BaseDir)
{
    FileRecord Record = FromWalk(FS::path(FilePath), BaseDir);
    Record.Origin = RecordOrigin::Existing;
    return Record;
}

FileRecord FileRecord::FromStoreRow(const std::string& StoredBaseDir, const std::string& StoredRelativePath, const FS::path& BaseDir)
{
    FileRecord Record = FromWalk(FS::path(StoredBaseDir) / StoredRelativePath, BaseDir);
    Record.Origin = RecordOrigin::Existing;
    return Record;
}

std::string ComputeFileKey(const std::string& AbsolutePath, const std::string& Checksum)
{
    uint8_t OutHash[16] = { 0 };
    const uint8_t Separator = 0;

    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);
    blake3_hasher_update(&Hasher, AbsolutePath.data(), AbsolutePath.size());
    blake3_hasher_update(&Hasher, &Separator, 1);
    blake3_hasher_update(&Hasher, Checksum.data(), Checksum.size());
    blake3_hasher_finalize(&Hasher, OutHash, sizeof(OutHash));

    return ToHex(OutHash, sizeof(OutHash));
}

std::string HumanReadable(uint64_t Size, int Precision)
{
    static const char* const Suffixes[] = { "B", "KB", "MB", "GB", "TB" };
    size_t SuffixIndex = 0;
    double Value = static_cast<double>(Size);

    while (Value > 1024.0 && SuffixIndex < 4)
    {
        ++SuffixIndex;
        Value /= 1024.0;
    }

    char Buffer[64];
    std::snprintf(Buffer, sizeof(Buffer), "%.*f%s", Precision, Value, Suffixes[SuffixIndex]);
    return Buffer;
}

std::string MakeRelativePath(const FS::path& Path, const FS::path& BaseDir)
{
    if (BaseDir.empty())
    {
        return Path.string();
    }

    std::error_code ec;
    FS::path Base = FS::absolute(BaseDir, ec);
    if (ec)
    {
        Base = BaseDir;
    }

    Base = Base.lexically_normal();
    if (Base.has_relative_path() && Base.filename().empty())
    {
        Base = Base.parent_path();
    }

    FS::path Relative = Path.lexically_normal().lexically_relative(Base);
    if (Relative.empty())
    {
        return Path.string();
    }
    return Relative.string();
}
