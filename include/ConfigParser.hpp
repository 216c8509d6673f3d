#pragma once

#include <string>
#include <vector>

#include "CatalogConfig.hpp"

// Reads a "Key = Value" config file into a CatalogConfig.
// Problems are collected rather than thrown so every bad line can be reported at once.
class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const CatalogConfig& GetConfig() const;
    void Reset();

    static bool IsAbsolutePath(const std::string& Path);
    static bool IsParentDirectory(const std::string& Parent, const std::string& Child);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool ParseYesNo(const std::string& Value, int LineNumber, bool& Out);
    bool ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned long long& Out);

    CatalogConfig Config;
    bool BaseDirSet = false;
    bool StoreSet = false;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
