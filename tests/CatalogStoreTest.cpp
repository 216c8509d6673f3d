#include <cassert>
#include <iostream>
#include <vector>

#include "CatalogStore.hpp"
#include "TestSupport.hpp"

namespace FS = std::filesystem;

static CatalogSession MakeSession(const std::string& Id, const CatalogConfig& Config)
{
    CatalogSession Session;
    Session.SessionId = Id;
    Session.SearchDirs = Config.SearchDirs;
    Session.BaseDir = Config.EffectiveBaseDir();
    Session.Algorithm = Config.Algorithm;
    Session.CreatedAt = "2024-01-01T00:00:00Z";
    return Session;
}

static FileRecord MakeRecord(const FS::path& BaseDir, const std::string& Relative, const std::string& Checksum)
{
    FileRecord Record = FileRecord::FromWalk(BaseDir / Relative, BaseDir);
    Record.SetIdentity(5, Checksum, "blake3");
    return Record;
}

static bool ThrowsStoreConflict(CatalogStore& Store)
{
    try
    {
        Store.Open();
    }
    catch (const StoreConflict&)
    {
        return true;
    }
    return false;
}

int main()
{
    ScratchDir Scratch("DupliCat_StoreTest");
    const FS::path Base = Scratch.Path() / "root";
    FS::create_directories(Base);

    CatalogConfig Config;
    Config.SearchDirs = { Base.string() };
    Config.StorePath = (Scratch.Path() / "out" / "catalog.db").string();
    Config.FlushThreshold = 3;

    std::cout << "[Test] Records are flushed in batches of the threshold..." << std::endl;
    {
        CatalogStore Store(Config);
        Store.Open();
        Store.BeginSession(MakeSession("aaaa", Config));
        assert(Store.HasSession("aaaa"));
        assert(!Store.HasSession("zzzz"));

        assert(!Store.Enqueue(MakeRecord(Base, "1.txt", "c1")));
        assert(!Store.Enqueue(MakeRecord(Base, "2.txt", "c2")));
        assert(Store.GetBufferedCount() == 2);
        assert(Store.CountStoredFiles() == 0);

        assert(Store.Enqueue(MakeRecord(Base, "3.txt", "c3")));
        assert(Store.GetBufferedCount() == 0);
        assert(Store.GetFlushedCount() == 3);
        assert(Store.CountStoredFiles() == 3);

        Store.Enqueue(MakeRecord(Base, "4.txt", "c4"));
        FileRecord Unreadable = FileRecord::FromWalk(Base / "5.txt", Base);
        Unreadable.SetUnidentified(IOStatus::PermissionDenied, 0);
        Store.Enqueue(Unreadable);
        Store.Close();
        assert(!Store.IsOpen());
        assert(Store.GetFlushedCount() == 5);
    }
    assert(CatalogStore::CountFiles(Config.StorePath, "aaaa") == 5);
    std::cout << "[PASS] Records are flushed in batches of the threshold" << std::endl;

    std::cout << "[Test] Store policies..." << std::endl;
    {
        CatalogStore Conflicting(Config);
        assert(ThrowsStoreConflict(Conflicting));

        CatalogConfig AppendConfig = Config;
        AppendConfig.Policy = StorePolicy::Append;
        CatalogStore Appending(AppendConfig);
        Appending.Open();
        assert(Appending.HasSession("aaaa"));

        bool Duplicate = false;
        try
        {
            Appending.BeginSession(MakeSession("aaaa", AppendConfig));
        }
        catch (const StoreConflict&)
        {
            Duplicate = true;
        }
        assert(Duplicate);

        // Rows already stored by an earlier session are ignored by key.
        Appending.BeginSession(MakeSession("bbbb", AppendConfig));
        Appending.Enqueue(MakeRecord(Base, "1.txt", "c1"));
        Appending.Enqueue(MakeRecord(Base, "6.txt", "c6"));
        Appending.Flush();
        assert(Appending.GetIgnoredCount() == 1);
        assert(Appending.CountStoredFiles() == 1);

        // Loading without a session id reads every other session.
        std::vector<FileRecord> Previous = Appending.LoadFromStore(AppendConfig.StorePath, "");
        assert(Previous.size() == 5);
        assert(Previous[0].Origin == RecordOrigin::Existing);
        assert(Previous[0].Name == "1.txt");
        assert(*Previous[0].Checksum == "c1");
        assert(Previous[0].AbsolutePath == (Base / "1.txt").lexically_normal().string());
        assert(!Previous[4].Checksum);
        Appending.Close();

        CatalogConfig OverwriteConfig = Config;
        OverwriteConfig.Policy = StorePolicy::Overwrite;
        CatalogStore Overwriting(OverwriteConfig);
        Overwriting.Open();
        assert(!Overwriting.HasSession("aaaa"));
        Overwriting.Close();
    }
    std::cout << "[PASS] Store policies" << std::endl;

    std::cout << "[Test] Loading a prior store by session..." << std::endl;
    {
        CatalogConfig Prior = Config;
        Prior.StorePath = (Scratch.Path() / "prior.db").string();
        {
            CatalogStore Store(Prior);
            Store.Open();
            Store.BeginSession(MakeSession("old1", Prior));
            Store.Enqueue(MakeRecord(Base, "x.txt", "cx"));
            FileRecord Sha = FileRecord::FromWalk(Base / "y.txt", Base);
            Sha.SetIdentity(9, "abcd", "sha1");
            Store.Enqueue(Sha);
            Store.Close();
        }

        CatalogConfig Loader = Config;
        Loader.StorePath = (Scratch.Path() / "fresh.db").string();
        Loader.ExistingStore = Prior.StorePath;
        Loader.ExistingSession = "old1";
        CatalogStore Store(Loader);
        Store.Open();
        Store.BeginSession(MakeSession("new1", Loader));

        std::vector<FileRecord> Loaded = Store.LoadExisting();
        assert(Loaded.size() == 2);
        assert(Loaded[0].IdentityResolved);
        // Checksums from another algorithm are dropped so the file gets hashed again.
        assert(!Loaded[1].IdentityResolved);
        assert(!Loaded[1].Checksum);
        assert(Loaded[1].Size == 9);
        assert(Store.GetRehashCount() == 1);

        bool Missing = false;
        try
        {
            Store.LoadFromStore(Prior.StorePath, "nope");
        }
        catch (const SchemaError&)
        {
            Missing = true;
        }
        assert(Missing);
    }
    std::cout << "[PASS] Loading a prior store by session" << std::endl;

    std::cout << "[Test] Loading a CSV catalog..." << std::endl;
    {
        Scratch.Write("prev.csv",
            "File Path,Base Directory,Relative Path,Subdirectory 1,Filename,Extension,File Size,Readable Size,Checksum,Duplicate,Owner,\r\n"
            "/data/a.txt,/data,a.txt,,a.txt,.txt,12,12B,h1,False,alice,\r\n"
            ",,,,,,,,,,,\r\n"
            "/data/sub/b.txt,/data,sub/b.txt,sub,b.txt,.txt,,,,True,bob,\r\n");

        CatalogConfig CsvConfig = Config;
        CsvConfig.StorePath = (Scratch.Path() / "csv.db").string();
        CatalogStore Store(CsvConfig);
        std::vector<FileRecord> Loaded = Store.LoadFromTable((Scratch.Path() / "prev.csv").string());
        assert(Loaded.size() == 2);
        assert(Store.GetImportSkipCount() == 1);

        assert(Loaded[0].Origin == RecordOrigin::Existing);
        assert(Loaded[0].Size == 12);
        assert(*Loaded[0].Checksum == "h1");
        assert(Loaded[0].ChecksumAlgorithm == "blake3");
        assert(Loaded[0].Extras.size() == 1);
        assert(Loaded[0].Extras[0].first == "Owner");
        assert(Loaded[0].Extras[0].second == "alice");

        assert(Loaded[1].Size == 0);
        assert(!Loaded[1].Checksum);
        assert(Loaded[1].IsDuplicate);

        Scratch.Write("nopath.csv", "Name,Size\r\nx,1\r\n");
        bool Rejected = false;
        try
        {
            Store.LoadFromTable((Scratch.Path() / "nopath.csv").string());
        }
        catch (const SchemaError&)
        {
            Rejected = true;
        }
        assert(Rejected);

        CatalogConfig Optional = CsvConfig;
        Optional.RequireExisting = false;
        CatalogStore Lenient(Optional);
        assert(Lenient.LoadFromTable((Scratch.Path() / "absent.csv").string()).empty());

        CatalogStore Strict(CsvConfig);
        bool Fatal = false;
        try
        {
            Strict.LoadFromTable((Scratch.Path() / "absent.csv").string());
        }
        catch (const SchemaError&)
        {
            Fatal = true;
        }
        assert(Fatal);
    }
    std::cout << "[PASS] Loading a CSV catalog" << std::endl;

    std::cout << "[PASS] All CatalogStore tests passed." << std::endl;
    return 0;
}
