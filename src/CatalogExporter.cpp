#include "CatalogExporter.hpp"
#include "CatalogErrors.hpp"
#include "CsvTable.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <unordered_set>

namespace FS = std::filesystem;

namespace
{
    const char* const SubdirectoryPrefix = "Subdirectory ";

    bool IsSubdirectoryColumn(const std::string& Column)
    {
        return Column.rfind(SubdirectoryPrefix, 0) == 0;
    }

    unsigned long SubdirectoryNumber(const std::string& Column)
    {
        const std::string Digits = Column.substr(std::string(SubdirectoryPrefix).size());
        if (Digits.empty() || !std::all_of(Digits.begin(), Digits.end(), [](char Ch) { return Ch >= '0' && Ch <= '9'; }))
        {
            return 0;
        }
        return std::stoul(Digits);
    }

    void WriteFileOrThrow(const std::string& Path, const std::vector<std::vector<std::string>>& Rows)
    {
        std::ofstream File(Path, std::ios::binary | std::ios::trunc);
        if (!File.is_open())
        {
            throw CatalogError("Cannot open export file for writing: " + Path);
        }
        for (const auto& Row : Rows)
        {
            Csv::WriteRow(File, Row);
        }
        File.flush();
        if (!File)
        {
            throw CatalogError("Failed writing export file: " + Path);
        }
    }
}

std::vector<std::string> CatalogExporter::OrderedColumns(const std::vector<std::string>& Columns)
{
    std::vector<std::string> Ordered;
    std::unordered_set<std::string> Present(Columns.begin(), Columns.end());

    auto TakeIfPresent = [&Ordered, &Present](const std::string& Column)
    {
        if (Present.count(Column))
        {
            Ordered.push_back(Column);
        }
    };

    TakeIfPresent("File Path");
    TakeIfPresent("Base Directory");
    TakeIfPresent("Relative Path");

    std::vector<std::string> Subdirectories;
    for (const auto& Column : Columns)
    {
        if (IsSubdirectoryColumn(Column))
        {
            Subdirectories.push_back(Column);
        }
    }
    std::stable_sort(Subdirectories.begin(), Subdirectories.end(), [](const std::string& A, const std::string& B)
    {
        return SubdirectoryNumber(A) < SubdirectoryNumber(B);
    });
    Ordered.insert(Ordered.end(), Subdirectories.begin(), Subdirectories.end());

    for (const char* Goal : { "Filename", "Extension", "File Size", "Readable Size", "Checksum", "Duplicate" })
    {
        TakeIfPresent(Goal);
    }

    std::unordered_set<std::string> Taken(Ordered.begin(), Ordered.end());
    for (const auto& Column : Columns)
    {
        if (Taken.insert(Column).second)
        {
            Ordered.push_back(Column);
        }
    }
    return Ordered;
}

ColumnValues CatalogExporter::RecordColumns(const FileRecord& Record, const std::string& BaseDir)
{
    ColumnValues Values;
    Values.emplace_back("File Path", Record.AbsolutePath);

    if (!BaseDir.empty())
    {
        Values.emplace_back("Base Directory", BaseDir);
        Values.emplace_back("Relative Path", Record.RelativePath);
        const std::vector<std::string> Subdirectories = Record.Subdirectories();
        for (size_t i = 0; i < Subdirectories.size(); ++i)
        {
            Values.emplace_back(SubdirectoryPrefix + std::to_string(i + 1), Subdirectories[i]);
        }
    }

    Values.emplace_back("Filename", Record.Name);
    Values.emplace_back("Extension", Record.Extension);
    Values.emplace_back("File Size", std::to_string(Record.Size));
    Values.emplace_back("Readable Size", Record.HumanReadableSize());
    Values.emplace_back("Checksum", Record.Checksum.value_or(""));
    Values.emplace_back("Duplicate", Record.IsDuplicate ? "True" : "False");
    if (Record.Checksum)
    {
        Values.emplace_back("Hash Algorithm", Record.ChecksumAlgorithm);
    }

    for (const auto& Extra : Record.Extras)
    {
        Values.push_back(Extra);
    }
    return Values;
}

std::string CatalogExporter::PropertiesPathFor(const std::string& ExportPath)
{
    FS::path Path(ExportPath);
    return (Path.parent_path() / (Path.stem().string() + ".properties.csv")).string();
}

void CatalogExporter::Export(const std::vector<FileRecord>& Records, const CatalogSession& Session, const CatalogConfig& Config)
{
    if (Config.ExportPath.empty())
    {
        return;
    }

    std::vector<ColumnValues> RowValues;
    RowValues.reserve(Records.size());
    std::vector<std::string> Columns;
    std::unordered_set<std::string> SeenColumns;

    for (const FileRecord& Record : Records)
    {
        RowValues.push_back(RecordColumns(Record, Session.BaseDir));
        for (const auto& [Column, Value] : RowValues.back())
        {
            if (SeenColumns.insert(Column).second)
            {
                Columns.push_back(Column);
            }
        }
    }
    if (Columns.empty())
    {
        Columns = OrderedColumns({ "File Path", "Filename", "Extension", "File Size", "Readable Size", "Checksum", "Duplicate" });
    }

    const std::vector<std::string> Ordered = OrderedColumns(Columns);

    std::vector<std::vector<std::string>> Table;
    Table.reserve(RowValues.size() + 1);
    Table.push_back(Ordered);
    for (const ColumnValues& Values : RowValues)
    {
        std::unordered_map<std::string, std::string> Lookup(Values.begin(), Values.end());
        std::vector<std::string> Row;
        Row.reserve(Ordered.size());
        for (const auto& Column : Ordered)
        {
            auto it = Lookup.find(Column);
            Row.push_back(it != Lookup.end() ? it->second : std::string());
        }
        Table.push_back(std::move(Row));
    }
    WriteFileOrThrow(Config.ExportPath, Table);

    std::vector<std::vector<std::string>> Properties;
    Properties.push_back({ "Property", "Value" });
    for (const auto& Dir : Session.SearchDirs)
    {
        Properties.push_back({ "Search Directory", Dir });
    }
    for (const auto& Exclude : Config.ExcludeDirs)
    {
        Properties.push_back({ "Exclude Directory", Exclude });
    }
    if (!Config.ExistingCatalog.empty())
    {
        Properties.push_back({ "Existing Catalog", Config.ExistingCatalog });
    }
    if (!Config.ExistingStore.empty())
    {
        Properties.push_back({ "Existing Store", Config.ExistingStore });
    }
    Properties.push_back({ "Base Directory", Session.BaseDir });
    Properties.push_back({ "Store", Config.StorePath });
    Properties.push_back({ "Session ID", Session.SessionId });
    Properties.push_back({ "Created At", Session.CreatedAt });
    Properties.push_back({ "Hash Function", ToString(Session.Algorithm) });
    Properties.push_back({ "Buffer Size", std::to_string(Session.BufferSize) });
    Properties.push_back({ "Flush Threshold", std::to_string(Session.FlushThreshold) });
    Properties.push_back({ "Check Contents", Config.CheckContents ? "YES" : "NO" });
    WriteFileOrThrow(PropertiesPathFor(Config.ExportPath), Properties);

    Log.Info("[CatalogExporter::Export] Exported " + std::to_string(Records.size()) + " records to " + Config.ExportPath);
}
