#include <algorithm>
#include <iostream>

#include "DirectoryWalker.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

DirectoryWalker::DirectoryWalker(const std::vector<std::string>& Roots, const std::vector<std::string>& ExcludeNames, const std::atomic<bool>* CancelFlag)
    : Roots(Roots), Excludes(ExcludeNames.begin(), ExcludeNames.end()), CancelFlag(CancelFlag)
{
}

size_t DirectoryWalker::GetSkipCount() const
{
    return SkipCount;
}

size_t DirectoryWalker::GetDirectoryCount() const
{
    return DirectoryCount;
}

bool DirectoryWalker::WasCancelled() const
{
    return Cancelled;
}

bool DirectoryWalker::CancelRequested()
{
    if (!Cancelled && CancelFlag && CancelFlag->load())
    {
        Cancelled = true;
        Log.Info("[DirectoryWalker] Cancellation requested, walk stopped.");
    }
    return Cancelled;
}

// Exclusions match a directory name at any depth, not a full path.
bool DirectoryWalker::IsExcluded(const FS::path& Directory) const
{
    return Excludes.count(Directory.filename().string()) != 0;
}

bool DirectoryWalker::EnterDirectory(const FS::path& Directory)
{
    if (CancelRequested())
    {
        return false;
    }

    DirectoryFrame Frame;
    std::error_code ec;
    FS::directory_iterator It(Directory, ec);
    if (ec)
    {
        ++SkipCount;
        std::cerr << "Cannot open directory: " << Directory << " (" << ec.message() << ")\n";
        Log.Error(std::string("[DirectoryWalker] Cannot open directory: ") + Directory.string() + " (" + ec.message() + ")");
        return false;
    }

    for (; !ec && It != FS::directory_iterator(); It.increment(ec))
    {
        Frame.Entries.push_back(*It);
    }
    if (ec)
    {
        ++SkipCount;
        Log.Error(std::string("[DirectoryWalker] Error iterating directory: ") + Directory.string() + " (" + ec.message() + ")");
    }

    std::sort(Frame.Entries.begin(), Frame.Entries.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
        return A.path().filename().string() < B.path().filename().string();
    });

    DirStack.push_back(std::move(Frame));
    ++DirectoryCount;
    return true;
}

bool DirectoryWalker::OpenNextRoot(FS::path& OutPath, bool& IsFile)
{
    while (NextRoot < Roots.size())
    {
        if (CancelRequested())
        {
            return false;
        }

        FS::path Root(Roots[NextRoot++]);
        std::error_code ec;
        FS::file_status Status = FS::status(Root, ec);
        if (ec || !FS::exists(Status))
        {
            ++SkipCount;
            std::cerr << "Walk Error: Path does not exist: " << Root.string() << "\n";
            Log.Error("[DirectoryWalker] Path does not exist: " + Root.string());
            continue;
        }
        if (FS::is_regular_file(Status))
        {
            OutPath = Root;
            IsFile = true;
            return true;
        }
        if (!FS::is_directory(Status))
        {
            ++SkipCount;
            Log.Error("[DirectoryWalker] Path is neither a directory nor a file: " + Root.string());
            continue;
        }

        Log.Info("[DirectoryWalker] Walking root: " + Root.string());
        if (EnterDirectory(Root))
        {
            IsFile = false;
            return true;
        }
        if (Cancelled)
        {
            return false;
        }
    }
    return false;
}

bool DirectoryWalker::Next(FS::path& OutPath)
{
    while (true)
    {
        if (Cancelled)
        {
            DirStack.clear();
            return false;
        }

        if (DirStack.empty())
        {
            bool IsFile = false;
            if (!OpenNextRoot(OutPath, IsFile))
            {
                return false;
            }
            if (IsFile)
            {
                return true;
            }
            continue;
        }

        DirectoryFrame& Frame = DirStack.back();
        if (Frame.Index >= Frame.Entries.size())
        {
            DirStack.pop_back();
            continue;
        }

        // Copied out: entering a subdirectory below may reallocate DirStack.
        const FS::directory_entry Entry = Frame.Entries[Frame.Index++];

        std::error_code ec;
        FS::file_status LinkStatus = Entry.symlink_status(ec);
        if (ec)
        {
            ++SkipCount;
            Log.Error(std::string("[DirectoryWalker] Cannot stat entry: ") + Entry.path().string() + " (" + ec.message() + ")");
            continue;
        }

        if (FS::is_symlink(LinkStatus))
        {
            Log.Info(std::string("[DirectoryWalker] Skipping SymLink: ") + Entry.path().string());
            continue;
        }

        if (FS::is_directory(LinkStatus))
        {
            if (IsExcluded(Entry.path()))
            {
                Log.Info(std::string("[DirectoryWalker] Skipping Excluded Directory: ") + Entry.path().string());
                continue;
            }
            EnterDirectory(Entry.path());
            continue;
        }

        if (FS::is_regular_file(LinkStatus))
        {
            OutPath = Entry.path();
            return true;
        }

        Log.Info(std::string("[DirectoryWalker] Skipping non-regular file: ") + Entry.path().string());
    }
}
