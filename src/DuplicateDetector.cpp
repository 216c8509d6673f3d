#include "DuplicateDetector.hpp"
#include "Logger.hpp"

#include <unordered_set>

size_t DuplicateDetector::Detect(std::vector<FileRecord>& Records, bool CheckContents)
{
    if (!CheckContents)
    {
        for (FileRecord& Record : Records)
        {
            Record.IsDuplicate = false;
        }
        Log.Info("[DuplicateDetector] Content check disabled, all duplicate flags cleared.");
        return 0;
    }

    std::unordered_set<std::string> SeenChecksums;
    size_t DuplicateCount = 0;

    auto Visit = [&SeenChecksums, &DuplicateCount](FileRecord& Record)
    {
        if (!Record.Checksum)
        {
            Record.IsDuplicate = false;
            return;
        }
        if (!SeenChecksums.insert(*Record.Checksum).second)
        {
            Record.IsDuplicate = true;
            ++DuplicateCount;
        }
        else
        {
            Record.IsDuplicate = false;
        }
    };

    for (FileRecord& Record : Records)
    {
        if (Record.Origin == RecordOrigin::Existing)
        {
            Visit(Record);
        }
    }
    for (FileRecord& Record : Records)
    {
        if (Record.Origin == RecordOrigin::New)
        {
            Visit(Record);
        }
    }

    Log.Info(std::string("[DuplicateDetector] Marked ") + std::to_string(DuplicateCount) + " duplicates across " + std::to_string(Records.size()) + " records.");
    return DuplicateCount;
}
