#include "IdentityResolver.hpp"
#include "HashAccumulator.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>

namespace FS = std::filesystem;

namespace
{
    struct FileCloser
    {
        void operator()(std::FILE* File) const { std::fclose(File); }
    };
}

IdentityResolver::IdentityResolver(HashAlgorithm Algorithm, size_t BufferSize, unsigned short int ThreadCount)
    : Algorithm(Algorithm), BufferSize(BufferSize), ThreadCount(ThreadCount)
{
}

IdentityResult IdentityResolver::Resolve(const std::string& Path, HashAlgorithm Algorithm, size_t BufferSize)
{
    IdentityResult Result;

    std::error_code ec;
    FS::file_status Status = FS::status(Path, ec);
    if (ec)
    {
        Result.Status = ToIOStatus(ec);
        return Result;
    }
    if (!FS::is_regular_file(Status))
    {
        Result.Status = FS::exists(Status) ? IOStatus::IOError : IOStatus::NotFound;
        return Result;
    }

    errno = 0;
    std::unique_ptr<std::FILE, FileCloser> File(std::fopen(Path.c_str(), "rb"));
    if (!File)
    {
        Result.Status = ToIOStatus(std::error_code(errno, std::generic_category()));
        if (Result.Status == IOStatus::Ok)
        {
            Result.Status = IOStatus::IOError;
        }
        return Result;
    }

    std::unique_ptr<HashAccumulator> Accumulator = HashAccumulator::Create(Algorithm);
    std::vector<uint8_t> Buffer(BufferSize);
    uint64_t TotalRead = 0;

    while (true)
    {
        size_t Read = std::fread(Buffer.data(), 1, Buffer.size(), File.get());
        if (Read > 0)
        {
            Accumulator->Update(Buffer.data(), Read);
            TotalRead += Read;
        }
        if (Read < Buffer.size())
        {
            if (std::ferror(File.get()))
            {
                Result.Status = IOStatus::IOError;
                return Result;
            }
            break;
        }
    }

    Result.Size = TotalRead;
    Result.Checksum = Accumulator->FinalizeHex();
    return Result;
}

bool IdentityResolver::Ensure(FileRecord& Record)
{
    if (Record.IdentityResolved)
    {
        return Record.Checksum.has_value();
    }

    IdentityResult Result = Resolve(Record.AbsolutePath, Algorithm, BufferSize);
    if (Result.Status != IOStatus::Ok)
    {
        std::error_code ec;
        uintmax_t KnownSize = FS::file_size(Record.AbsolutePath, ec);
        Record.SetUnidentified(Result.Status, ec ? 0 : static_cast<uint64_t>(KnownSize));
        ++SkipCount;
        Log.Error(std::string("[IdentityResolver::Ensure] Skipped unreadable file (") + IOStatusToString(Result.Status) + "): " + Record.AbsolutePath);
        return false;
    }

    Record.SetIdentity(Result.Size, std::move(*Result.Checksum), ToString(Algorithm));
    ++ResolvedCount;
    return true;
}

void IdentityResolver::EnsureAll(const std::vector<FileRecord*>& Records)
{
    std::vector<FileRecord*> Pending;
    for (FileRecord* Record : Records)
    {
        if (Record && !Record->IdentityResolved)
        {
            Pending.push_back(Record);
        }
    }
    if (Pending.empty())
    {
        return;
    }

    if (ThreadCount <= 1 || Pending.size() == 1)
    {
        for (FileRecord* Record : Pending)
        {
            Ensure(*Record);
        }
        return;
    }

    if (!HashPool)
    {
        HashPool = std::make_unique<ThreadPool>(ThreadCount);
        Log.Info(std::string("[IdentityResolver] Hashing with ") + std::to_string(ThreadCount) + " threads.");
    }

    // Every job owns one record, so workers never touch the same FileRecord.
    for (FileRecord* Record : Pending)
    {
        HashPool->Submit([this, Record]() { Ensure(*Record); });
    }
    HashPool->Join();
}

size_t IdentityResolver::GetResolvedCount() const
{
    return ResolvedCount.load();
}

size_t IdentityResolver::GetSkipCount() const
{
    return SkipCount.load();
}
