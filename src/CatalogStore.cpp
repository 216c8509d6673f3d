#include "CatalogStore.hpp"
#include "CatalogErrors.hpp"
#include "CsvTable.hpp"
#include "Logger.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <unordered_set>

namespace FS = std::filesystem;

namespace
{
    struct SqliteCloser
    {
        void operator()(sqlite3* Db) const { sqlite3_close(Db); }
    };

    // Prepared statement that is finalized when it goes out of scope.
    class SqliteStatement
    {
    public:
        SqliteStatement(sqlite3* Db, const std::string& Sql, const std::string& Purpose) : Db(Db), Purpose(Purpose)
        {
            int rc = sqlite3_prepare_v2(Db, Sql.c_str(), static_cast<int>(Sql.size()) + 1, &Stmt, nullptr);
            if (rc != SQLITE_OK)
            {
                throw StoreError("Cannot prepare SQLite statement to " + Purpose + " (" + sqlite3_errmsg(Db) + ")");
            }
        }

        ~SqliteStatement()
        {
            sqlite3_finalize(Stmt);
        }

        SqliteStatement(const SqliteStatement&) = delete;
        SqliteStatement& operator=(const SqliteStatement&) = delete;

        void BindText(int Index, const std::string& Value)
        {
            Check(sqlite3_bind_text(Stmt, Index, Value.c_str(), static_cast<int>(Value.size()), SQLITE_TRANSIENT));
        }

        void BindInt64(int Index, int64_t Value)
        {
            Check(sqlite3_bind_int64(Stmt, Index, Value));
        }

        void BindNull(int Index)
        {
            Check(sqlite3_bind_null(Stmt, Index));
        }

        int Step()
        {
            int rc = sqlite3_step(Stmt);
            if (rc != SQLITE_ROW && rc != SQLITE_DONE)
            {
                throw StoreError("Cannot " + Purpose + " (" + sqlite3_errmsg(Db) + ")");
            }
            return rc;
        }

        void Reset()
        {
            sqlite3_reset(Stmt);
            sqlite3_clear_bindings(Stmt);
        }

        std::string ColumnText(int Column) const
        {
            const unsigned char* Text = sqlite3_column_text(Stmt, Column);
            return Text ? reinterpret_cast<const char*>(Text) : std::string();
        }

        bool ColumnIsNull(int Column) const
        {
            return sqlite3_column_type(Stmt, Column) == SQLITE_NULL;
        }

        int64_t ColumnInt64(int Column) const
        {
            return sqlite3_column_int64(Stmt, Column);
        }

    private:
        sqlite3* Db;
        sqlite3_stmt* Stmt = nullptr;
        std::string Purpose;

        void Check(int rc)
        {
            if (rc != SQLITE_OK)
            {
                throw StoreError("Cannot bind parameter to " + Purpose + " (" + sqlite3_errstr(rc) + ")");
            }
        }
    };

    void Exec(sqlite3* Db, const std::string& Sql, const std::string& Purpose)
    {
        char* ErrorMessage = nullptr;
        if (sqlite3_exec(Db, Sql.c_str(), nullptr, nullptr, &ErrorMessage) != SQLITE_OK)
        {
            std::string Message = ErrorMessage ? ErrorMessage : sqlite3_errmsg(Db);
            sqlite3_free(ErrorMessage);
            throw StoreError("Cannot " + Purpose + " (" + Message + ")");
        }
    }

    bool HasColumn(sqlite3* Db, const std::string& Table, const std::string& Column)
    {
        SqliteStatement Info(Db, "PRAGMA table_info(" + Table + ")", "read table info for " + Table);
        while (Info.Step() == SQLITE_ROW)
        {
            if (Info.ColumnText(1) == Column)
            {
                return true;
            }
        }
        return false;
    }

    std::unique_ptr<sqlite3, SqliteCloser> OpenReadOnly(const std::string& StorePath)
    {
        sqlite3* Handle = nullptr;
        int rc = sqlite3_open_v2(StorePath.c_str(), &Handle, SQLITE_OPEN_READONLY, nullptr);
        std::unique_ptr<sqlite3, SqliteCloser> Guard(Handle);
        if (rc != SQLITE_OK)
        {
            throw StoreError("Cannot open store " + StorePath + " (" + (Handle ? sqlite3_errmsg(Handle) : sqlite3_errstr(rc)) + ")");
        }
        return Guard;
    }

    std::string JoinDirs(const std::vector<std::string>& Dirs)
    {
        std::string Joined;
        for (size_t i = 0; i < Dirs.size(); ++i)
        {
            if (i > 0)
            {
                Joined += ';';
            }
            Joined += Dirs[i];
        }
        return Joined;
    }

    bool ParseBool(const std::string& Value)
    {
        return Value == "True" || Value == "true" || Value == "TRUE" || Value == "1" || Value == "YES" || Value == "yes";
    }

    bool IsDerivedColumn(const std::string& Name)
    {
        static const std::unordered_set<std::string> Derived = {
            "Base Directory", "Relative Path", "Filename", "Extension", "Readable Size"
        };
        return Derived.count(Name) != 0 || Name.rfind("Subdirectory ", 0) == 0;
    }
}

CatalogStore::CatalogStore(const CatalogConfig& Config) : Config(Config)
{
}

CatalogStore::~CatalogStore()
{
    try
    {
        Close();
    }
    catch (const CatalogError& e)
    {
        std::cerr << "CatalogStore: Failed to flush on teardown: " << e.what() << "\n";
        Log.Error(std::string("[CatalogStore::~CatalogStore] Failed to flush on teardown: ") + e.what());
    }
}

void CatalogStore::Open()
{
    FS::path StorePath(Config.StorePath);
    std::error_code ec;

    if (FS::exists(StorePath, ec))
    {
        switch (Config.Policy)
        {
        case StorePolicy::Error:
            throw StoreConflict("Store already exists: " + Config.StorePath + " (set StorePolicy to Append or Overwrite)");
        case StorePolicy::Overwrite:
            for (const char* Suffix : { "", "-journal", "-wal", "-shm" })
            {
                std::error_code RemoveError;
                FS::remove(Config.StorePath + Suffix, RemoveError);
                if (RemoveError)
                {
                    throw StoreError("Cannot remove existing store " + Config.StorePath + Suffix + " (" + RemoveError.message() + ")");
                }
            }
            Log.Info("[CatalogStore::Open] Overwriting existing store: " + Config.StorePath);
            break;
        case StorePolicy::Append:
            Log.Info("[CatalogStore::Open] Appending to existing store: " + Config.StorePath);
            break;
        }
    }

    FS::path Parent = StorePath.parent_path();
    if (!Parent.empty() && !FS::exists(Parent, ec))
    {
        FS::create_directories(Parent, ec);
        if (ec)
        {
            throw StoreError("Cannot create store directory " + Parent.string() + " (" + ec.message() + ")");
        }
    }

    int rc = sqlite3_open_v2(Config.StorePath.c_str(), &Db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string Message = Db ? sqlite3_errmsg(Db) : sqlite3_errstr(rc);
        sqlite3_close(Db);
        Db = nullptr;
        throw StoreError("Cannot open store " + Config.StorePath + " (" + Message + ")");
    }

    try
    {
        // The exclusive lock taken by the first write transaction is held until the connection closes.
        Exec(Db, "PRAGMA locking_mode=EXCLUSIVE;", "set exclusive locking mode");
        Exec(Db, "PRAGMA foreign_keys=ON;", "enable foreign keys");
        CreateSchema();
    }
    catch (const StoreError&)
    {
        sqlite3_close(Db);
        Db = nullptr;
        throw;
    }

    Log.Info("[CatalogStore::Open] Store opened: " + Config.StorePath);
}

void CatalogStore::CreateSchema()
{
    Exec(Db, "BEGIN EXCLUSIVE;", "lock store (another session may be writing to it)");
    try
    {
        Exec(Db,
            "CREATE TABLE IF NOT EXISTS sessions ("
            "session_id TEXT PRIMARY KEY, "
            "search_dirs TEXT, "
            "base_dir TEXT, "
            "hash_algorithm TEXT, "
            "buffer_size INTEGER, "
            "created_at TEXT);",
            "create sessions table");

        Exec(Db,
            "CREATE TABLE IF NOT EXISTS files ("
            "relative_path TEXT, "
            "filename TEXT, "
            "extension TEXT, "
            "size_bytes INTEGER, "
            "human_readable_size TEXT, "
            "checksum TEXT, "
            "hash_algorithm TEXT, "
            "session_id TEXT REFERENCES sessions(session_id), "
            "file_key TEXT PRIMARY KEY);",
            "create files table");

        if (!HasColumn(Db, "files", "hash_algorithm"))
        {
            Exec(Db, "ALTER TABLE files ADD COLUMN hash_algorithm TEXT;", "add hash_algorithm column");
            Log.Info("[CatalogStore::CreateSchema] Added hash_algorithm column to files table.");
        }

        Exec(Db, "COMMIT;", "commit schema");
    }
    catch (const StoreError&)
    {
        sqlite3_exec(Db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

bool CatalogStore::HasSession(const std::string& SessionId)
{
    if (!Db)
    {
        throw StoreError("Store is not open.");
    }
    SqliteStatement Select(Db, "SELECT 1 FROM sessions WHERE session_id = ?", "look up session");
    Select.BindText(1, SessionId);
    return Select.Step() == SQLITE_ROW;
}

void CatalogStore::BeginSession(const CatalogSession& Session)
{
    if (!Db)
    {
        throw StoreError("Store is not open.");
    }
    if (HasSession(Session.SessionId))
    {
        throw StoreConflict("Session id already exists in store: " + Session.SessionId);
    }

    SqliteStatement Insert(Db,
        "INSERT INTO sessions (session_id, search_dirs, base_dir, hash_algorithm, buffer_size, created_at) VALUES (?, ?, ?, ?, ?, ?)",
        "insert session");
    Insert.BindText(1, Session.SessionId);
    Insert.BindText(2, JoinDirs(Session.SearchDirs));
    Insert.BindText(3, Session.BaseDir);
    Insert.BindText(4, ToString(Session.Algorithm));
    Insert.BindInt64(5, static_cast<int64_t>(Session.BufferSize));
    Insert.BindText(6, Session.CreatedAt);
    Insert.Step();

    CurrentSessionId = Session.SessionId;
    Log.Info("[CatalogStore::BeginSession] Session persisted: " + Session.SessionId);
}

std::vector<FileRecord> CatalogStore::LoadExisting()
{
    std::vector<FileRecord> Records;

    if (!Config.ExistingCatalog.empty())
    {
        std::vector<FileRecord> FromTable = LoadFromTable(Config.ExistingCatalog);
        Records.insert(Records.end(), std::make_move_iterator(FromTable.begin()), std::make_move_iterator(FromTable.end()));
    }

    if (!Config.ExistingStore.empty())
    {
        std::vector<FileRecord> FromStore = LoadFromStore(Config.ExistingStore, Config.ExistingSession);
        Records.insert(Records.end(), std::make_move_iterator(FromStore.begin()), std::make_move_iterator(FromStore.end()));
    }

    return Records;
}

void CatalogStore::AcceptChecksum(FileRecord& Record, uint64_t Size, const std::string& Checksum, const std::string& Algorithm)
{
    const std::string Configured = ToString(Config.Algorithm);
    if (Algorithm != Configured)
    {
        // Left unresolved so the file is hashed again with the configured algorithm.
        Record.Size = Size;
        ++RehashCount;
        Log.Info("[CatalogStore] Checksum computed with " + Algorithm + " instead of " + Configured + ", will rehash: " + Record.AbsolutePath);
        return;
    }
    Record.SetIdentity(Size, Checksum, Algorithm);
}

std::vector<FileRecord> CatalogStore::LoadFromTable(const std::string& CsvPath)
{
    std::vector<FileRecord> Records;
    std::error_code ec;

    if (!FS::is_regular_file(CsvPath, ec))
    {
        if (Config.RequireExisting)
        {
            throw SchemaError("Existing catalog not found: " + CsvPath);
        }
        Log.Error("[CatalogStore::LoadFromTable] No existing catalog at " + CsvPath + ", starting empty.");
        std::cerr << "Warning: existing catalog not found, starting empty: " << CsvPath << "\n";
        return Records;
    }

    CsvTable Table;
    std::string Error;
    if (!Csv::ReadFile(CsvPath, Table, Error))
    {
        throw SchemaError(Error);
    }

    const int PathColumn = Table.ColumnIndex("File Path");
    if (PathColumn < 0)
    {
        throw SchemaError("Existing catalog is missing the 'File Path' column: " + CsvPath);
    }
    const int SizeColumn = Table.ColumnIndex("File Size");
    const int ChecksumColumn = Table.ColumnIndex("Checksum");
    const int DuplicateColumn = Table.ColumnIndex("Duplicate");
    const int AlgorithmColumn = Table.ColumnIndex("Hash Algorithm");

    std::vector<size_t> ExtraColumns;
    for (size_t i = 0; i < Table.Header.size(); ++i)
    {
        const int Column = static_cast<int>(i);
        if (Column == PathColumn || Column == SizeColumn || Column == ChecksumColumn || Column == DuplicateColumn || Column == AlgorithmColumn)
        {
            continue;
        }
        if (Table.Header[i].empty() || IsDerivedColumn(Table.Header[i]))
        {
            continue;
        }
        ExtraColumns.push_back(i);
    }

    const FS::path BaseDir(Config.EffectiveBaseDir());
    size_t RowNumber = 1;

    for (auto& Row : Table.Rows)
    {
        ++RowNumber;
        if (Row.size() < Table.Header.size())
        {
            Row.resize(Table.Header.size());
        }

        const std::string& Path = Row[PathColumn];
        if (Path.empty())
        {
            ++ImportSkipCount;
            Log.Error("[CatalogStore::LoadFromTable] Row " + std::to_string(RowNumber) + " has an empty 'File Path', skipped.");
            continue;
        }

        FileRecord Record = FileRecord::FromImportRow(Path, BaseDir);

        uint64_t Size = 0;
        if (SizeColumn >= 0 && !Row[SizeColumn].empty())
        {
            try
            {
                Size = std::stoull(Row[SizeColumn]);
            }
            catch (const std::exception&)
            {
                Log.Error("[CatalogStore::LoadFromTable] Row " + std::to_string(RowNumber) + " has an invalid 'File Size': " + Row[SizeColumn]);
            }
        }
        Record.Size = Size;

        if (ChecksumColumn >= 0 && !Row[ChecksumColumn].empty())
        {
            std::string Algorithm = (AlgorithmColumn >= 0 && !Row[AlgorithmColumn].empty()) ? Row[AlgorithmColumn] : ToString(Config.Algorithm);
            AcceptChecksum(Record, Size, Row[ChecksumColumn], Algorithm);
        }

        if (DuplicateColumn >= 0)
        {
            Record.IsDuplicate = ParseBool(Row[DuplicateColumn]);
        }

        for (size_t Column : ExtraColumns)
        {
            Record.Extras.emplace_back(Table.Header[Column], Row[Column]);
        }

        Records.push_back(std::move(Record));
    }

    Log.Info("[CatalogStore::LoadFromTable] Loaded " + std::to_string(Records.size()) + " records from " + CsvPath);
    return Records;
}

std::vector<FileRecord> CatalogStore::LoadFromStore(const std::string& StorePath, const std::string& SessionId)
{
    std::vector<FileRecord> Records;
    std::error_code ec;

    if (!FS::exists(StorePath, ec))
    {
        if (Config.RequireExisting)
        {
            throw SchemaError("Existing store not found: " + StorePath);
        }
        Log.Error("[CatalogStore::LoadFromStore] No existing store at " + StorePath + ", starting empty.");
        std::cerr << "Warning: existing store not found, starting empty: " << StorePath << "\n";
        return Records;
    }

    // The destination connection holds an exclusive lock, so a store that is also the destination is read through it.
    std::unique_ptr<sqlite3, SqliteCloser> Owned;
    sqlite3* Source = nullptr;
    if (Db && FS::equivalent(StorePath, Config.StorePath, ec))
    {
        Source = Db;
    }
    else
    {
        Owned = OpenReadOnly(StorePath);
        Source = Owned.get();
    }

    {
        SqliteStatement Tables(Source, "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name IN ('sessions', 'files')", "inspect store schema");
        Tables.Step();
        if (Tables.ColumnInt64(0) != 2)
        {
            throw SchemaError("Existing store has no sessions/files tables: " + StorePath);
        }
    }

    if (!SessionId.empty())
    {
        SqliteStatement Select(Source, "SELECT 1 FROM sessions WHERE session_id = ?", "look up session");
        Select.BindText(1, SessionId);
        if (Select.Step() != SQLITE_ROW)
        {
            throw SchemaError("Session " + SessionId + " not found in store " + StorePath);
        }
    }

    const std::string AlgorithmExpr = HasColumn(Source, "files", "hash_algorithm") ? "COALESCE(f.hash_algorithm, s.hash_algorithm)" : "s.hash_algorithm";
    const std::string Filter = SessionId.empty() ? "f.session_id <> ?" : "f.session_id = ?";

    SqliteStatement Select(Source,
        "SELECT s.base_dir, f.relative_path, f.filename, f.extension, f.size_bytes, f.checksum, " + AlgorithmExpr + ", f.file_key "
        "FROM files f INNER JOIN sessions s ON f.session_id = s.session_id "
        "WHERE " + Filter + " ORDER BY f.rowid",
        "load files from store");
    Select.BindText(1, SessionId.empty() ? CurrentSessionId : SessionId);

    const FS::path BaseDir(Config.EffectiveBaseDir());
    while (Select.Step() == SQLITE_ROW)
    {
        FileRecord Record = FileRecord::FromStoreRow(Select.ColumnText(0), Select.ColumnText(1), BaseDir);
        Record.Name = Select.ColumnText(2);
        Record.Extension = Select.ColumnText(3);
        Record.Size = static_cast<uint64_t>(Select.ColumnInt64(4));

        if (!Select.ColumnIsNull(5))
        {
            AcceptChecksum(Record, Record.Size, Select.ColumnText(5), Select.ColumnText(6));
        }

        Records.push_back(std::move(Record));
    }

    Log.Info("[CatalogStore::LoadFromStore] Loaded " + std::to_string(Records.size()) + " records from " + StorePath +
        (SessionId.empty() ? std::string(" (all sessions)") : " (session " + SessionId + ")"));
    return Records;
}

bool CatalogStore::Enqueue(const FileRecord& Record)
{
    Buffer.push_back(Record);
    if (Buffer.size() >= Config.FlushThreshold)
    {
        Flush();
        return true;
    }
    return false;
}

size_t CatalogStore::Flush()
{
    if (Buffer.empty())
    {
        return 0;
    }
    if (!Db)
    {
        throw StoreError("Store is not open.");
    }

    size_t Ignored = 0;
    Exec(Db, "BEGIN;", "begin batch");
    try
    {
        SqliteStatement Insert(Db,
            "INSERT OR IGNORE INTO files (relative_path, filename, extension, size_bytes, human_readable_size, checksum, hash_algorithm, session_id, file_key) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
            "insert file");

        for (const FileRecord& Record : Buffer)
        {
            Insert.BindText(1, Record.RelativePath);
            Insert.BindText(2, Record.Name);
            Insert.BindText(3, Record.Extension);
            Insert.BindInt64(4, static_cast<int64_t>(Record.Size));
            Insert.BindText(5, Record.HumanReadableSize());
            if (Record.Checksum)
            {
                Insert.BindText(6, *Record.Checksum);
                Insert.BindText(7, Record.ChecksumAlgorithm);
            }
            else
            {
                Insert.BindNull(6);
                Insert.BindNull(7);
            }
            Insert.BindText(8, CurrentSessionId);
            Insert.BindText(9, Record.FileKey.empty() ? ComputeFileKey(Record.AbsolutePath, "") : Record.FileKey);
            Insert.Step();

            if (sqlite3_changes(Db) == 0)
            {
                ++Ignored;
                Log.Info("[CatalogStore::Flush] Already stored by an earlier session: " + Record.AbsolutePath);
            }
            Insert.Reset();
        }

        Exec(Db, "COMMIT;", "commit batch");
    }
    catch (const StoreError&)
    {
        sqlite3_exec(Db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    const size_t Written = Buffer.size();
    FlushedCount += Written;
    IgnoredCount += Ignored;
    Buffer.clear();

    Log.Info("[CatalogStore::Flush] Flushed batch of " + std::to_string(Written) + " records (" + std::to_string(Ignored) + " already stored).");
    return Written;
}

void CatalogStore::Close()
{
    if (!Db)
    {
        return;
    }
    Flush();
    sqlite3_close(Db);
    Db = nullptr;
    Log.Info("[CatalogStore::Close] Store closed: " + Config.StorePath);
}

bool CatalogStore::IsOpen() const
{
    return Db != nullptr;
}

size_t CatalogStore::GetBufferedCount() const
{
    return Buffer.size();
}

size_t CatalogStore::GetFlushedCount() const
{
    return FlushedCount;
}

size_t CatalogStore::GetIgnoredCount() const
{
    return IgnoredCount;
}

size_t CatalogStore::GetRehashCount() const
{
    return RehashCount;
}

size_t CatalogStore::GetImportSkipCount() const
{
    return ImportSkipCount;
}

size_t CatalogStore::CountStoredFiles()
{
    if (!Db)
    {
        throw StoreError("Store is not open.");
    }
    SqliteStatement Count(Db, "SELECT COUNT(*) FROM files WHERE session_id = ?", "count stored files");
    Count.BindText(1, CurrentSessionId);
    Count.Step();
    return static_cast<size_t>(Count.ColumnInt64(0));
}

size_t CatalogStore::CountFiles(const std::string& StorePath, const std::string& SessionId)
{
    auto Handle = OpenReadOnly(StorePath);
    SqliteStatement Count(Handle.get(), "SELECT COUNT(*) FROM files WHERE session_id = ?", "count stored files");
    Count.BindText(1, SessionId);
    Count.Step();
    return static_cast<size_t>(Count.ColumnInt64(0));
}
