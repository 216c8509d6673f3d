#include <cassert>
#include <iostream>

#include "FileRecord.hpp"

namespace FS = std::filesystem;

int main()
{
    std::cout << "[Test] FileKey is deterministic and depends on path and checksum..." << std::endl;
    {
        const std::string KeyA = ComputeFileKey("/data/a.txt", "abc123");
        assert(KeyA == ComputeFileKey("/data/a.txt", "abc123"));
        assert(KeyA.size() == 32);
        assert(KeyA != ComputeFileKey("/data/b.txt", "abc123"));
        assert(KeyA != ComputeFileKey("/data/a.txt", "abc124"));
        // The separator keeps path/checksum boundaries apart.
        assert(ComputeFileKey("/data/ab", "c") != ComputeFileKey("/data/a", "bc"));
    }
    std::cout << "[PASS] FileKey" << std::endl;

    std::cout << "[Test] Human readable sizes..." << std::endl;
    {
        assert(HumanReadable(0) == "0B");
        assert(HumanReadable(1024) == "1024B");
        assert(HumanReadable(1536) == "2KB");
        assert(HumanReadable(1536, 1) == "1.5KB");
        assert(HumanReadable(5ull * 1024 * 1024) == "5MB");
        assert(HumanReadable(3ull * 1024 * 1024 * 1024 * 1024 * 1024) == "3072TB");
    }
    std::cout << "[PASS] Human readable sizes" << std::endl;

    std::cout << "[Test] Records built from a walk..." << std::endl;
    {
        FileRecord Record = FileRecord::FromWalk(FS::path("/data/docs/2024/report.final.pdf"), FS::path("/data/"));
        assert(Record.AbsolutePath == FS::path("/data/docs/2024/report.final.pdf").string());
        assert(Record.RelativePath == (FS::path("docs") / "2024" / "report.final.pdf").string());
        assert(Record.Name == "report.final.pdf");
        assert(Record.Extension == ".pdf");
        assert(Record.Origin == RecordOrigin::New);
        assert(!Record.IdentityResolved);
        assert(!Record.Checksum);

        const std::vector<std::string> Parts = Record.Subdirectories();
        assert(Parts.size() == 2);
        assert(Parts[0] == "docs");
        assert(Parts[1] == "2024");

        FileRecord Outside = FileRecord::FromWalk(FS::path("/other/x.txt"), FS::path("/data"));
        assert(Outside.RelativePath == (FS::path("..") / "other" / "x.txt").string());

        FileRecord NoExtension = FileRecord::FromWalk(FS::path("/data/Makefile"), FS::path("/data"));
        assert(NoExtension.Extension.empty());
        assert(NoExtension.Subdirectories().empty());
    }
    std::cout << "[PASS] Records built from a walk" << std::endl;

    std::cout << "[Test] Identity transitions..." << std::endl;
    {
        FileRecord Record = FileRecord::FromImportRow("/data/a.txt", FS::path("/data"));
        assert(Record.Origin == RecordOrigin::Existing);

        Record.SetIdentity(42, "deadbeef", "blake3");
        assert(Record.IdentityResolved);
        assert(Record.Size == 42);
        assert(*Record.Checksum == "deadbeef");
        assert(Record.FileKey == ComputeFileKey(Record.AbsolutePath, "deadbeef"));

        Record.SetUnidentified(IOStatus::PermissionDenied, 7);
        assert(Record.IdentityResolved);
        assert(!Record.Checksum);
        assert(Record.Status == IOStatus::PermissionDenied);
        assert(Record.FileKey == ComputeFileKey(Record.AbsolutePath, ""));

        Record.ClearIdentity();
        assert(!Record.IdentityResolved);
        assert(Record.FileKey.empty());
    }
    std::cout << "[PASS] Identity transitions" << std::endl;

    std::cout << "[PASS] All FileRecord tests passed." << std::endl;
    return 0;
}
