#include <iostream>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "ConfigParser.hpp"

namespace FS = std::filesystem;

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

const CatalogConfig& ConfigParser::GetConfig() const
{
    return Config;
}

void ConfigParser::Reset()
{
    Config = CatalogConfig();
    BaseDirSet = false;
    StoreSet = false;
    Errors.clear();
    Infos.clear();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path)
{
#ifdef _WIN32
    if (Path.size() >= 3 && std::isalpha(static_cast<unsigned char>(Path[0])) && Path[1] == ':' && (Path[2] == '\\' || Path[2] == '/'))
    {
        return true;
    }

    if (Path.size() >= 2 && Path[0] == '\\' && Path[1] == '\\')
    {
        return true;
    }
    return false;
#else
    return !Path.empty() && Path[0] == '/';
#endif
}

bool ConfigParser::IsParentDirectory(const std::string& Parent, const std::string& Child)
{
    std::error_code ec;
    auto ParentAbs = FS::absolute(FS::path(Parent), ec).lexically_normal();
    if (ec)
    {
        return false;
    }
    auto ChildAbs = FS::absolute(FS::path(Child), ec).lexically_normal();
    if (ec)
    {
        return false;
    }

    auto ParentIt = ParentAbs.begin();
    auto ChildIt = ChildAbs.begin();

    for (; ParentIt != ParentAbs.end() && ChildIt != ChildAbs.end(); ++ParentIt, ++ChildIt)
    {
        // A trailing separator shows up as an empty final element.
        if (ParentIt->empty())
        {
            break;
        }
        if (*ParentIt != *ChildIt)
            return false;
    }

    // Parent must be used up, otherwise Child is the shorter path.
    if (ParentIt != ParentAbs.end() && ParentIt->empty())
    {
        ++ParentIt;
    }
    return ParentIt == ParentAbs.end();
}

bool ConfigParser::ParseYesNo(const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input. Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned long long& Out)
{
    try
    {
        if (Value.empty() || !std::all_of(Value.begin(), Value.end(), [](char Ch) { return std::isdigit(static_cast<unsigned char>(Ch)); }))
        {
            AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
            return false;
        }
        unsigned long long ValueNum = std::stoull(Value);
        if (ValueNum == 0)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must be greater than zero.");
            return false;
        }
        Out = ValueNum;
        return true;
    }
    catch (const std::out_of_range&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Number out of range for " + Key + ".");
        return false;
    }
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    if (!std::filesystem::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        // Trim leading whitespace
        Line.erase(Line.begin(), std::find_if(Line.begin(), Line.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        // Trim trailing whitespace
        Line.erase(std::find_if(Line.rbegin(), Line.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Line.end());

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);

        Key.erase(std::remove_if(Key.begin(), Key.end(),[](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        Value.erase(Value.begin(), std::find_if(Value.begin(), Value.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Value.erase(std::find_if(Value.rbegin(), Value.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Value.end());

        const std::string LinePrefix = "Line " + std::to_string(LineNumber) + ": ";

        if (Key == "Source")
        {
            if (!IsAbsolutePath(Value))
            {
                AddError(LinePrefix + "Source path is not absolute.");
                continue;
            }
            std::error_code ec;
            if (!FS::exists(Value, ec))
            {
                AddInfo(LinePrefix + "Source path '" + Value + "' does not exist. It will be counted as skipped.");
            }

            if (std::find(Config.SearchDirs.begin(), Config.SearchDirs.end(), Value) != Config.SearchDirs.end())
            {
                AddInfo(LinePrefix + "Duplicate source path '" + Value + "'. Ignored.");
                continue;
            }

            bool ConflictFound = false;
            for (const auto& ExistingSource : Config.SearchDirs)
            {
                if (IsParentDirectory(ExistingSource, Value))
                {
                    AddInfo(LinePrefix + "Skipping source '" + Value + "' because parent directory '" + ExistingSource + "' is already added.");
                    ConflictFound = true;
                    break;
                }
            }
            if (ConflictFound)
            {
                continue;
            }

            // A new parent replaces the nested roots already added, at the position of the first one.
            bool Replaced = false;
            size_t InsertAt = 0;
            for (size_t i = 0; i < Config.SearchDirs.size();)
            {
                if (IsParentDirectory(Value, Config.SearchDirs[i]))
                {
                    AddInfo(LinePrefix + "Replacing nested source '" + Config.SearchDirs[i] + "' with its parent directory '" + Value + "'.");
                    Config.SearchDirs.erase(Config.SearchDirs.begin() + static_cast<std::ptrdiff_t>(i));
                    if (!Replaced)
                    {
                        InsertAt = i;
                        Replaced = true;
                    }
                    continue;
                }
                ++i;
            }
            if (Replaced)
            {
                Config.SearchDirs.insert(Config.SearchDirs.begin() + static_cast<std::ptrdiff_t>(InsertAt), Value);
                continue;
            }
            Config.SearchDirs.push_back(Value);
        }

        else if (Key == "BaseDir")
        {
            if (BaseDirSet)
            {
                AddError(LinePrefix + "Multiple BaseDir entries found.");
                continue;
            }
            Config.BaseDir = Value;
            BaseDirSet = true;
        }

        else if (Key == "Exclude")
        {
            if (Value.empty() || Value.find('/') != std::string::npos || Value.find('\\') != std::string::npos)
            {
                AddError(LinePrefix + "Exclude must be a single directory name.");
                continue;
            }
            if (std::find(Config.ExcludeDirs.begin(), Config.ExcludeDirs.end(), Value) != Config.ExcludeDirs.end())
            {
                AddInfo(LinePrefix + "Duplicate exclude '" + Value + "'. Ignored.");
                continue;
            }
            Config.ExcludeDirs.push_back(Value);
        }

        else if (Key == "ExistingCatalog")
        {
            Config.ExistingCatalog = Value;
            AddInfo("Existing catalog: " + Value);
        }

        else if (Key == "ExistingStore")
        {
            Config.ExistingStore = Value;
            AddInfo("Existing store: " + Value);
        }

        else if (Key == "ExistingSession")
        {
            Config.ExistingSession = Value;
        }

        else if (Key == "RequireExisting")
        {
            ParseYesNo(Value, LineNumber, Config.RequireExisting);
        }

        else if (Key == "Store")
        {
            if (StoreSet)
            {
                AddError(LinePrefix + "Multiple Store entries found.");
                continue;
            }
            if (Value.empty())
            {
                AddError(LinePrefix + "Store path is empty.");
                continue;
            }
            Config.StorePath = Value;
            StoreSet = true;
        }

        else if (Key == "StorePolicy")
        {
            if (!ParseStorePolicy(Value, Config.Policy))
            {
                AddError(LinePrefix + "Invalid StorePolicy. Use 'Append' or 'Overwrite' or 'Error'.");
                continue;
            }
            if (Config.Policy == StorePolicy::Overwrite)
            {
                AddInfo("IMPORTANT - ! StorePolicy Overwrite replaces an existing store !");
            }
        }

        else if (Key == "Export")
        {
            Config.ExportPath = Value;
        }

        else if (Key == "AllowExportOverwrite")
        {
            ParseYesNo(Value, LineNumber, Config.AllowExportOverwrite);
        }

        else if (Key == "SessionId")
        {
            if (Value.empty())
            {
                AddError(LinePrefix + "SessionId is empty.");
                continue;
            }
            Config.SessionId = Value;
        }

        else if (Key == "CheckContents")
        {
            if (ParseYesNo(Value, LineNumber, Config.CheckContents) && !Config.CheckContents)
            {
                AddInfo("Content check disabled. Files are compared by relative path.");
            }
        }

        else if (Key == "HashAlgorithm")
        {
            if (!ParseHashAlgorithm(Value, Config.Algorithm))
            {
                AddError(LinePrefix + "Invalid HashAlgorithm. Use 'blake3' or 'sha1' or 'sha256'.");
            }
        }

        else if (Key == "HashBufferSize")
        {
            unsigned long long ValueNum = 0;
            if (ParseCount(Key, Value, LineNumber, ValueNum))
            {
                Config.HashBufferSize = static_cast<size_t>(ValueNum);
                AddInfo("HashBufferSize set to " + std::to_string(ValueNum));
            }
        }

        else if (Key == "FlushThreshold")
        {
            unsigned long long ValueNum = 0;
            if (ParseCount(Key, Value, LineNumber, ValueNum))
            {
                Config.FlushThreshold = static_cast<size_t>(ValueNum);
                AddInfo("FlushThreshold set to " + std::to_string(ValueNum));
            }
        }

        else if (Key == "ThreadCount")
        {
            unsigned long long ValueNum = 0;
            if (ParseCount(Key, Value, LineNumber, ValueNum))
            {
                if (ValueNum > 65535)
                {
                    AddError(LinePrefix + "Invalid number for ThreadCount. Select between 1 and 65,535");
                    continue;
                }
                Config.ThreadCount = static_cast<unsigned short int>(ValueNum);
                AddInfo("ThreadCount set to " + std::to_string(ValueNum));
            }
        }

        else if (Key == "Verbose")
        {
            ParseYesNo(Value, LineNumber, Config.Verbose);
        }

        else if (Key == "LogDir")
        {
            if (Value.empty())
            {
                AddError(LinePrefix + "LogDir is empty.");
                continue;
            }
            Config.LogDir = Value;
        }

        else if (Key == "MaxLogFiles")
        {
            unsigned long long ValueNum = 0;
            if (ParseCount(Key, Value, LineNumber, ValueNum))
            {
                if (ValueNum > 65535)
                {
                    AddError(LinePrefix + "Invalid number for MaxLogFiles. Select between 1 and 65,535");
                    continue;
                }
                Config.MaxLogFiles = static_cast<unsigned short int>(ValueNum);
                AddInfo("MaxLogFiles set to " + std::to_string(ValueNum));
            }
        }

        else
        {
            AddError(LinePrefix + "Unknown key '" + Key + "'.");
            continue;
        }
    }

    if (Config.SearchDirs.empty())
    {
        AddError("No source paths provided.");
    }

    if (!Config.ExistingSession.empty() && Config.ExistingStore.empty())
    {
        AddError("ExistingSession given without ExistingStore.");
    }

    return Errors.empty();  // Return false only if fatal errors present
}
