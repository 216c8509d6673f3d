#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "DirectoryWalker.hpp"
#include "TestSupport.hpp"

namespace FS = std::filesystem;

static std::vector<std::string> WalkAll(DirectoryWalker& Walker, const FS::path& Root)
{
    std::vector<std::string> Found;
    FS::path Path;
    while (Walker.Next(Path))
    {
        Found.push_back(Path.lexically_relative(Root).generic_string());
    }
    return Found;
}

int main()
{
    ScratchDir Scratch("DupliCat_WalkerTest");
    Scratch.Write("b.txt", "b");
    Scratch.Write("a.txt", "a");
    Scratch.Write("sub/c.txt", "c");
    Scratch.Write("sub/node_modules/skip.js", "x");
    Scratch.Write("node_modules/skip2.js", "y");
    Scratch.Write("z/deep/d.txt", "d");

    std::cout << "[Test] Depth-first walk in filename order..." << std::endl;
    {
        DirectoryWalker Walker({ Scratch.Path().string() }, {}, nullptr);
        const std::vector<std::string> Found = WalkAll(Walker, Scratch.Path());
        const std::vector<std::string> Expected = {
            "a.txt", "b.txt", "node_modules/skip2.js", "sub/c.txt", "sub/node_modules/skip.js", "z/deep/d.txt"
        };
        assert(Found == Expected);
        assert(Walker.GetSkipCount() == 0);
        assert(Walker.GetDirectoryCount() == 6);

        // Same tree, same sequence.
        DirectoryWalker Again({ Scratch.Path().string() }, {}, nullptr);
        assert(WalkAll(Again, Scratch.Path()) == Expected);
    }
    std::cout << "[PASS] Depth-first walk in filename order" << std::endl;

    std::cout << "[Test] Excluded names are pruned at every depth..." << std::endl;
    {
        DirectoryWalker Walker({ Scratch.Path().string() }, { "node_modules" }, nullptr);
        const std::vector<std::string> Found = WalkAll(Walker, Scratch.Path());
        for (const auto& Entry : Found)
        {
            assert(Entry.find("node_modules") == std::string::npos);
        }
        assert(Found.size() == 4);
    }
    std::cout << "[PASS] Excluded names are pruned at every depth" << std::endl;

    std::cout << "[Test] Missing roots are counted, file roots are yielded..." << std::endl;
    {
        const std::string Missing = (Scratch.Path() / "does_not_exist").string();
        const std::string FileRoot = (Scratch.Path() / "a.txt").string();
        DirectoryWalker Walker({ Missing, FileRoot }, {}, nullptr);
        const std::vector<std::string> Found = WalkAll(Walker, Scratch.Path());
        assert(Found.size() == 1);
        assert(Found[0] == "a.txt");
        assert(Walker.GetSkipCount() == 1);
    }
    std::cout << "[PASS] Missing roots are counted, file roots are yielded" << std::endl;

    std::cout << "[Test] Symlinks are not followed..." << std::endl;
    {
        std::error_code ec;
        FS::create_directory_symlink(Scratch.Path() / "sub", Scratch.Path() / "z" / "link", ec);
        if (!ec)
        {
            DirectoryWalker Walker({ Scratch.Path().string() }, {}, nullptr);
            const std::vector<std::string> Found = WalkAll(Walker, Scratch.Path());
            for (const auto& Entry : Found)
            {
                assert(Entry.find("z/link") == std::string::npos);
            }
            FS::remove(Scratch.Path() / "z" / "link", ec);
        }
        else
        {
            std::cout << "[Test] Symlink creation not permitted here, skipped." << std::endl;
        }
    }
    std::cout << "[PASS] Symlinks are not followed" << std::endl;

    std::cout << "[Test] Cancellation stops the walk at a directory boundary..." << std::endl;
    {
        std::atomic<bool> Cancel{ false };
        DirectoryWalker Walker({ Scratch.Path().string() }, {}, &Cancel);
        FS::path Path;
        assert(Walker.Next(Path));
        assert(Path.filename() == "a.txt");
        Cancel.store(true);

        size_t Remaining = 0;
        while (Walker.Next(Path))
        {
            ++Remaining;
        }
        // Only files already listed in the open root directory can still appear.
        assert(Remaining <= 1);
        assert(Walker.WasCancelled());
    }
    std::cout << "[PASS] Cancellation stops the walk at a directory boundary" << std::endl;

    std::cout << "[PASS] All DirectoryWalker tests passed." << std::endl;
    return 0;
}
