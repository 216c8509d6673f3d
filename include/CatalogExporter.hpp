#pragma once

#include <string>
#include <utility>
#include <vector>

#include "CatalogConfig.hpp"
#include "CatalogStore.hpp"
#include "FileRecord.hpp"

using ColumnValues = std::vector<std::pair<std::string, std::string>>;

class CatalogExporter
{
public:
    // File Path, [Base Directory], [Relative Path], Subdirectory 1..N, Filename, Extension,
    // File Size, Readable Size, Checksum, Duplicate, then the rest in first-encountered order.
    static std::vector<std::string> OrderedColumns(const std::vector<std::string>& Columns);

    static ColumnValues RecordColumns(const FileRecord& Record, const std::string& BaseDir);

    // Writes the Catalog table to Config.ExportPath and the Properties table beside it.
    static void Export(const std::vector<FileRecord>& Records, const CatalogSession& Session, const CatalogConfig& Config);

    static std::string PropertiesPathFor(const std::string& ExportPath);
};
