#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CatalogConfig.hpp"
#include "CatalogErrors.hpp"
#include "FileRecord.hpp"
#include "ThreadPool.hpp"

struct IdentityResult
{
    IOStatus Status = IOStatus::Ok;
    uint64_t Size = 0;
    std::optional<std::string> Checksum;
};

class IdentityResolver
{
public:
    IdentityResolver(HashAlgorithm Algorithm, size_t BufferSize, unsigned short int ThreadCount);

    // Streams the file through the accumulator one BufferSize chunk at a time.
    static IdentityResult Resolve(const std::string& Path, HashAlgorithm Algorithm, size_t BufferSize);

    // Memoized: a record is read at most once. Returns true when the checksum is known.
    bool Ensure(FileRecord& Record);

    // Resolves every unresolved record on the worker pool and waits for all of them.
    void EnsureAll(const std::vector<FileRecord*>& Records);

    size_t GetResolvedCount() const;
    size_t GetSkipCount() const;

private:
    HashAlgorithm Algorithm;
    size_t BufferSize;
    unsigned short int ThreadCount;
    std::unique_ptr<ThreadPool> HashPool;

    std::atomic<size_t> ResolvedCount{ 0 };
    std::atomic<size_t> SkipCount{ 0 };
};
