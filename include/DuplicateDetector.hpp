#pragma once

#include <vector>

#include "FileRecord.hpp"

class DuplicateDetector
{
public:
    // One sequential pass: Existing records in import order, then New records in traversal order.
    // The first record carrying a checksum is canonical, every later one is a duplicate.
    // Returns the number of records marked duplicate. With CheckContents off every flag is cleared,
    // including flags carried in from an imported catalog.
    static size_t Detect(std::vector<FileRecord>& Records, bool CheckContents);
};
