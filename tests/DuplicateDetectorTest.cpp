#include <cassert>
#include <iostream>
#include <vector>

#include "DuplicateDetector.hpp"

namespace FS = std::filesystem;

static FileRecord MakeRecord(const std::string& Path, RecordOrigin Origin, const std::string& Checksum)
{
    FileRecord Record = FileRecord::FromWalk(FS::path(Path), FS::path("/data"));
    Record.Origin = Origin;
    if (Checksum.empty())
    {
        Record.SetUnidentified(IOStatus::PermissionDenied, 0);
    }
    else
    {
        Record.SetIdentity(10, Checksum, "blake3");
    }
    return Record;
}

int main()
{
    std::cout << "[Test] Existing records win the tie-break..." << std::endl;
    {
        std::vector<FileRecord> Records;
        // New record first in storage order, but the Existing pass runs first.
        Records.push_back(MakeRecord("/data/new/a.txt", RecordOrigin::New, "h1"));
        Records.push_back(MakeRecord("/data/old/a.txt", RecordOrigin::Existing, "h1"));
        Records.push_back(MakeRecord("/data/new/b.txt", RecordOrigin::New, "h2"));
        Records.push_back(MakeRecord("/data/new/c.txt", RecordOrigin::New, "h2"));

        const size_t Count = DuplicateDetector::Detect(Records, true);
        assert(Count == 2);
        assert(Records[0].IsDuplicate);
        assert(!Records[1].IsDuplicate);
        assert(!Records[2].IsDuplicate);
        assert(Records[3].IsDuplicate);
    }
    std::cout << "[PASS] Existing records win the tie-break" << std::endl;

    std::cout << "[Test] Unknown checksums are never duplicates..." << std::endl;
    {
        std::vector<FileRecord> Records;
        Records.push_back(MakeRecord("/data/x.txt", RecordOrigin::New, ""));
        Records.push_back(MakeRecord("/data/y.txt", RecordOrigin::New, ""));
        Records[1].IsDuplicate = true;

        assert(DuplicateDetector::Detect(Records, true) == 0);
        assert(!Records[0].IsDuplicate);
        assert(!Records[1].IsDuplicate);
    }
    std::cout << "[PASS] Unknown checksums are never duplicates" << std::endl;

    std::cout << "[Test] Detection is idempotent..." << std::endl;
    {
        std::vector<FileRecord> Records;
        Records.push_back(MakeRecord("/data/a.txt", RecordOrigin::Existing, "h"));
        Records.push_back(MakeRecord("/data/b.txt", RecordOrigin::Existing, "h"));
        assert(DuplicateDetector::Detect(Records, true) == 1);
        assert(DuplicateDetector::Detect(Records, true) == 1);
        assert(!Records[0].IsDuplicate && Records[1].IsDuplicate);
    }
    std::cout << "[PASS] Detection is idempotent" << std::endl;

    std::cout << "[Test] Disabled content check clears imported flags..." << std::endl;
    {
        std::vector<FileRecord> Records;
        Records.push_back(MakeRecord("/data/a.txt", RecordOrigin::Existing, "h"));
        Records.push_back(MakeRecord("/data/b.txt", RecordOrigin::Existing, "h"));
        Records.push_back(MakeRecord("/data/c.txt", RecordOrigin::New, "h"));
        Records[1].IsDuplicate = true;
        assert(DuplicateDetector::Detect(Records, false) == 0);
        assert(!Records[0].IsDuplicate && !Records[1].IsDuplicate && !Records[2].IsDuplicate);
    }
    std::cout << "[PASS] Disabled content check clears imported flags" << std::endl;

    std::cout << "[PASS] All DuplicateDetector tests passed." << std::endl;
    return 0;
}
