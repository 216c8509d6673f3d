#include <cassert>
#include <iostream>
#include <vector>

#include "CatalogExporter.hpp"
#include "CsvTable.hpp"
#include "TestSupport.hpp"

namespace FS = std::filesystem;

int main()
{
    std::cout << "[Test] Column ordering..." << std::endl;
    {
        const std::vector<std::string> Ordered = CatalogExporter::OrderedColumns({
            "Owner", "Checksum", "Subdirectory 10", "Filename", "Subdirectory 2", "File Path",
            "Duplicate", "Relative Path", "Tag", "Base Directory", "Subdirectory 1"
        });
        const std::vector<std::string> Expected = {
            "File Path", "Base Directory", "Relative Path", "Subdirectory 1", "Subdirectory 2", "Subdirectory 10",
            "Filename", "Checksum", "Duplicate", "Owner", "Tag"
        };
        assert(Ordered == Expected);
    }
    std::cout << "[PASS] Column ordering" << std::endl;

    std::cout << "[Test] Record columns..." << std::endl;
    {
        FileRecord Record = FileRecord::FromWalk(FS::path("/data/a/b/c.txt"), FS::path("/data"));
        Record.SetIdentity(2048, "ff00", "sha256");
        Record.IsDuplicate = true;
        Record.Extras.emplace_back("Owner", "carol");

        const ColumnValues Values = CatalogExporter::RecordColumns(Record, "/data");
        auto Find = [&Values](const std::string& Column)
        {
            for (const auto& [Name, Value] : Values)
            {
                if (Name == Column)
                {
                    return Value;
                }
            }
            return std::string("<missing>");
        };
        assert(Find("Subdirectory 1") == "a");
        assert(Find("Subdirectory 2") == "b");
        assert(Find("Subdirectory 3") == "<missing>");
        assert(Find("Readable Size") == "2KB");
        assert(Find("Duplicate") == "True");
        assert(Find("Hash Algorithm") == "sha256");
        assert(Find("Owner") == "carol");

        const ColumnValues NoBase = CatalogExporter::RecordColumns(Record, "");
        for (const auto& Entry : NoBase)
        {
            assert(Entry.first != "Relative Path");
        }
    }
    std::cout << "[PASS] Record columns" << std::endl;

    std::cout << "[Test] Export writes catalog and properties tables..." << std::endl;
    {
        ScratchDir Scratch("DupliCat_ExportTest");

        CatalogConfig Config;
        Config.SearchDirs = { "/data" };
        Config.ExportPath = (Scratch.Path() / "catalog.csv").string();
        Config.ExcludeDirs = { ".git" };

        CatalogSession Session;
        Session.SessionId = "abcd";
        Session.SearchDirs = Config.SearchDirs;
        Session.BaseDir = "/data";
        Session.CreatedAt = "2024-05-01T10:00:00Z";

        std::vector<FileRecord> Records;
        Records.push_back(FileRecord::FromWalk(FS::path("/data/top.txt"), FS::path("/data")));
        Records.back().SetIdentity(1, "aa", "blake3");
        Records.push_back(FileRecord::FromWalk(FS::path("/data/x/y/deep,name.txt"), FS::path("/data")));
        Records.back().SetUnidentified(IOStatus::PermissionDenied, 0);

        CatalogExporter::Export(Records, Session, Config);

        CsvTable Catalog;
        std::string Error;
        assert(Csv::ReadFile(Config.ExportPath, Catalog, Error));
        assert(Catalog.Header[0] == "File Path");
        assert(Catalog.ColumnIndex("Subdirectory 2") == 4);
        assert(Catalog.Rows.size() == 2);
        assert(Catalog.Rows[1][Catalog.ColumnIndex("Filename")] == "deep,name.txt");
        assert(Catalog.Rows[0][Catalog.ColumnIndex("Subdirectory 1")].empty());
        assert(Catalog.Rows[1][Catalog.ColumnIndex("Checksum")].empty());
        assert(Catalog.Rows[1][Catalog.ColumnIndex("Duplicate")] == "False");

        const std::string PropertiesPath = CatalogExporter::PropertiesPathFor(Config.ExportPath);
        assert(PropertiesPath == (Scratch.Path() / "catalog.properties.csv").string());
        CsvTable Properties;
        assert(Csv::ReadFile(PropertiesPath, Properties, Error));
        bool SawSession = false;
        bool SawExclude = false;
        for (const auto& Row : Properties.Rows)
        {
            SawSession = SawSession || (Row[0] == "Session ID" && Row[1] == "abcd");
            SawExclude = SawExclude || (Row[0] == "Exclude Directory" && Row[1] == ".git");
        }
        assert(SawSession && SawExclude);
    }
    std::cout << "[PASS] Export writes catalog and properties tables" << std::endl;

    std::cout << "[PASS] All CatalogExporter tests passed." << std::endl;
    return 0;
}
