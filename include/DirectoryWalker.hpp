#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

// Lazy depth-first enumeration of regular files under a set of roots.
// Entries of a directory are visited in filename order, so the sequence is
// deterministic for an unchanged tree. The walker is single-pass.
class DirectoryWalker
{
public:
    DirectoryWalker(const std::vector<std::string>& Roots, const std::vector<std::string>& ExcludeNames, const std::atomic<bool>* CancelFlag = nullptr);

    // Produces the next candidate file. Returns false once the walk is exhausted or cancelled.
    bool Next(std::filesystem::path& OutPath);

    size_t GetSkipCount() const;
    size_t GetDirectoryCount() const;
    bool WasCancelled() const;

private:
    struct DirectoryFrame
    {
        std::vector<std::filesystem::directory_entry> Entries;
        size_t Index = 0;
    };

    std::vector<std::string> Roots;
    std::unordered_set<std::string> Excludes;
    const std::atomic<bool>* CancelFlag;

    size_t NextRoot = 0;
    std::vector<DirectoryFrame> DirStack;

    size_t SkipCount = 0;
    size_t DirectoryCount = 0;
    bool Cancelled = false;

    bool CancelRequested();
    bool IsExcluded(const std::filesystem::path& Directory) const;
    bool EnterDirectory(const std::filesystem::path& Directory);
    bool OpenNextRoot(std::filesystem::path& OutPath, bool& IsFile);
};
